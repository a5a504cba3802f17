#pragma once

#include <QString>
#include <QStringList>

struct DirectoryEntry;

namespace IconClassifier {

enum class Glyph {
    Folder,
    Text,
    RichText,
    Book,
    Photo,
    Music,
    Video,
    Archive,
    Spreadsheet,
    Presentation,
    Code,
    Unknown
};

Glyph classify(const DirectoryEntry &entry);
Glyph glyphForExtension(const QString &extension);
QString glyphName(Glyph glyph);
QString imageSource(Glyph glyph);
bool glyphFromName(const QString &name, Glyph *glyph);
QStringList themeIconNames(Glyph glyph);

} // namespace IconClassifier
