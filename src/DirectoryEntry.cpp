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

#include "DirectoryEntry.h"

#include <QFileInfo>

/**
 * @brief Returns the lowercased extension of the entry name.
 * @return Text after the last dot, or an empty string.
 */
QString DirectoryEntry::suffix() const
{
    const int dot = name.lastIndexOf(QLatin1Char('.'));
    if (dot <= 0 || dot == name.size() - 1) {
        return QString();
    }
    return name.mid(dot + 1).toLower();
}

/**
 * @brief Builds an entry from a file info snapshot.
 * @param info File info describing the entry.
 * @param bundleExtensions Lowercase directory suffixes treated as application bundles.
 * @return Directory entry value.
 */
DirectoryEntry DirectoryEntry::fromFileInfo(const QFileInfo &info, const QStringList &bundleExtensions)
{
    DirectoryEntry entry;
    entry.path = info.absoluteFilePath();
    entry.name = info.fileName();
    entry.isDir = info.isDir();
    entry.isBundle = isBundleInfo(info, bundleExtensions);
    return entry;
}

/**
 * @brief Checks whether a file info entry is an application bundle.
 * @param info File info to inspect.
 * @param bundleExtensions Lowercase directory suffixes treated as application bundles.
 * @return True for directories carrying a bundle suffix.
 */
bool DirectoryEntry::isBundleInfo(const QFileInfo &info, const QStringList &bundleExtensions)
{
    if (!info.isDir()) {
        return false;
    }
    const QString suffix = info.suffix().toLower();
    if (suffix.isEmpty()) {
        return false;
    }
    return bundleExtensions.contains(suffix);
}
