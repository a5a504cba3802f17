#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

class QFileInfo;

struct DirectoryEntry {
    QString path;
    QString name;
    bool isDir = false;
    bool isBundle = false;

    QString suffix() const;

    static DirectoryEntry fromFileInfo(const QFileInfo &info, const QStringList &bundleExtensions);
    static bool isBundleInfo(const QFileInfo &info, const QStringList &bundleExtensions);
};

using FolderSnapshot = QVector<DirectoryEntry>;

Q_DECLARE_METATYPE(DirectoryEntry)
