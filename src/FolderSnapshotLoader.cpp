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

#include "FolderSnapshotLoader.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <algorithm>

#include "OperationError.h"

namespace FolderSnapshotLoader {

namespace {

bool failWith(const QString &path, const char *reason, OperationError *error)
{
    if (error) {
        *error = OperationError::filesystem(path, QCoreApplication::translate("FolderSnapshotLoader", reason));
    }
    return false;
}

} // namespace

/**
 * @brief Checks whether a file name is hidden by the platform convention.
 * @param name File name without path.
 * @return True when the name starts with a dot.
 */
bool isHiddenName(const QString &name)
{
    return name.startsWith(QLatin1Char('.'));
}

/**
 * @brief Sorts entries with folders first, then by name.
 * @param entries Entries to sort in place.
 * @param caseSensitivity Case handling for name comparison.
 */
void sortEntries(FolderSnapshot &entries, Qt::CaseSensitivity caseSensitivity)
{
    std::sort(entries.begin(), entries.end(), [caseSensitivity](const DirectoryEntry &left, const DirectoryEntry &right) {
        if (left.isDir != right.isDir) {
            return left.isDir;
        }
        const int result = QString::compare(left.name, right.name, caseSensitivity);
        if (result != 0) {
            return result < 0;
        }
        return QString::compare(left.name, right.name, Qt::CaseSensitive) < 0;
    });
}

/**
 * @brief Lists the immediate children of a folder into a sorted snapshot.
 * @param path Folder to list.
 * @param snapshot Output snapshot, untouched on failure.
 * @param error Optional output error describing the failure.
 * @param options Bundle detection and sorting options.
 * @return True when the folder was listed, false otherwise.
 */
bool load(const QString &path, FolderSnapshot *snapshot, OperationError *error, const LoadOptions &options)
{
    if (path.isEmpty()) {
        return failWith(path, QT_TRANSLATE_NOOP("FolderSnapshotLoader", "Path is empty"), error);
    }
    const QFileInfo folderInfo(path);
    if (!folderInfo.exists()) {
        return failWith(path, QT_TRANSLATE_NOOP("FolderSnapshotLoader", "Folder not found"), error);
    }
    if (!folderInfo.isDir()) {
        return failWith(path, QT_TRANSLATE_NOOP("FolderSnapshotLoader", "Not a folder"), error);
    }
    if (!folderInfo.isReadable() || !folderInfo.isExecutable()) {
        return failWith(path, QT_TRANSLATE_NOOP("FolderSnapshotLoader", "Permission denied"), error);
    }

    const QDir dir(folderInfo.absoluteFilePath());
    const QFileInfoList infos = dir.entryInfoList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot, QDir::NoSort);

    FolderSnapshot entries;
    entries.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        if (isHiddenName(info.fileName())) {
            continue;
        }
        entries.append(DirectoryEntry::fromFileInfo(info, options.bundleExtensions));
    }
    sortEntries(entries, options.caseSensitivity);

    if (snapshot) {
        *snapshot = entries;
    }
    return true;
}

} // namespace FolderSnapshotLoader
