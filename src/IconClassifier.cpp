/************************************************************************\

    Spatial Folders - Spatial file browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "IconClassifier.h"

#include <QHash>
#include <initializer_list>

#include "DirectoryEntry.h"

namespace IconClassifier {

namespace {

struct GlyphNameEntry {
    Glyph glyph;
    const char *name;
};

const GlyphNameEntry glyphNames[] = {
    {Glyph::Folder, "folder"},
    {Glyph::Text, "text"},
    {Glyph::RichText, "richtext"},
    {Glyph::Book, "book"},
    {Glyph::Photo, "photo"},
    {Glyph::Music, "music"},
    {Glyph::Video, "video"},
    {Glyph::Archive, "archive"},
    {Glyph::Spreadsheet, "spreadsheet"},
    {Glyph::Presentation, "presentation"},
    {Glyph::Code, "code"},
    {Glyph::Unknown, "unknown"},
};

/**
 * @brief Returns the static extension to glyph table.
 * @return Map from lowercase extension to glyph.
 */
const QHash<QString, Glyph> &extensionTable()
{
    static const QHash<QString, Glyph> table = []() {
        QHash<QString, Glyph> map;
        const auto add = [&map](Glyph glyph, std::initializer_list<const char *> extensions) {
            for (const char *extension : extensions) {
                map.insert(QLatin1String(extension), glyph);
            }
        };
        add(Glyph::Text, {"txt", "md"});
        add(Glyph::RichText, {"rtf", "pdf", "doc", "docx", "odt"});
        add(Glyph::Book, {"epub", "mobi"});
        add(Glyph::Photo, {"png", "jpg", "jpeg", "gif", "tiff", "heic", "webp", "bmp", "svg"});
        add(Glyph::Music, {"mp3", "wav", "aac", "m4a", "m4b", "aiff", "wma", "flac", "opus"});
        add(Glyph::Video, {"mp4", "mov", "avi", "mkv", "webm", "m4v", "flv", "wmv", "ogg"});
        add(Glyph::Archive, {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "iso", "dmg"});
        add(Glyph::Spreadsheet, {"xls", "xlsx", "ods", "csv"});
        add(Glyph::Presentation, {"ppt", "pptx", "odp"});
        add(Glyph::Code, {"swift", "js", "py", "html", "css", "json", "xml", "cpp", "h", "qml"});
        return map;
    }();
    return table;
}

} // namespace

/**
 * @brief Maps an entry to its display glyph.
 * @param entry Entry to classify.
 * @return Folder glyph for folders and bundle placeholders, extension glyph for files.
 */
Glyph classify(const DirectoryEntry &entry)
{
    if (entry.isDir) {
        return Glyph::Folder;
    }
    return glyphForExtension(entry.suffix());
}

Glyph glyphForExtension(const QString &extension)
{
    return extensionTable().value(extension.toLower(), Glyph::Unknown);
}

QString glyphName(Glyph glyph)
{
    for (const GlyphNameEntry &entry : glyphNames) {
        if (entry.glyph == glyph) {
            return QLatin1String(entry.name);
        }
    }
    return QStringLiteral("unknown");
}

QString imageSource(Glyph glyph)
{
    return QStringLiteral("image://glyph/") + glyphName(glyph);
}

bool glyphFromName(const QString &name, Glyph *glyph)
{
    for (const GlyphNameEntry &entry : glyphNames) {
        if (name == QLatin1String(entry.name)) {
            if (glyph) {
                *glyph = entry.glyph;
            }
            return true;
        }
    }
    return false;
}

/**
 * @brief Returns freedesktop icon theme names for a glyph, most specific first.
 * @param glyph Glyph to look up.
 * @return Candidate theme icon names.
 */
QStringList themeIconNames(Glyph glyph)
{
    switch (glyph) {
    case Glyph::Folder:
        return {QStringLiteral("folder")};
    case Glyph::Text:
        return {QStringLiteral("text-x-generic")};
    case Glyph::RichText:
        return {QStringLiteral("x-office-document"), QStringLiteral("text-x-generic")};
    case Glyph::Book:
        return {QStringLiteral("accessories-dictionary"), QStringLiteral("x-office-document")};
    case Glyph::Photo:
        return {QStringLiteral("image-x-generic")};
    case Glyph::Music:
        return {QStringLiteral("audio-x-generic")};
    case Glyph::Video:
        return {QStringLiteral("video-x-generic")};
    case Glyph::Archive:
        return {QStringLiteral("package-x-generic")};
    case Glyph::Spreadsheet:
        return {QStringLiteral("x-office-spreadsheet")};
    case Glyph::Presentation:
        return {QStringLiteral("x-office-presentation")};
    case Glyph::Code:
        return {QStringLiteral("text-x-script"), QStringLiteral("text-x-generic")};
    case Glyph::Unknown:
        break;
    }
    return {QStringLiteral("unknown"), QStringLiteral("dialog-question")};
}

} // namespace IconClassifier
