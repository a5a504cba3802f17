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

#include "DropTargetResolver.h"

namespace DropTargetResolver {

/**
 * @brief Checks whether items can be dropped into an entry.
 * @param entry Entry under the cursor.
 * @return True for plain folders, false for files and bundles.
 */
bool isDropIntoTarget(const DirectoryEntry &entry)
{
    return entry.isDir && !entry.isBundle;
}

/**
 * @brief Resolves the folder under a drop location.
 * @param location Drop point in grid content coordinates.
 * @param snapshot Entries in display order.
 * @param params Layout parameters used to draw the grid.
 * @return Row of the folder under the point, or -1 when the drop lands elsewhere.
 */
int resolveTargetRow(const QPointF &location, const FolderSnapshot &snapshot, const GridLayoutParams &params)
{
    const int row = GridLayout::indexAt(location, snapshot.size(), params);
    if (row < 0) {
        return -1;
    }
    return isDropIntoTarget(snapshot.at(row)) ? row : -1;
}

} // namespace DropTargetResolver
