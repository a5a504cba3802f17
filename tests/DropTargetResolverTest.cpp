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

#include <gtest/gtest.h>

#include "DropTargetResolver.h"

namespace {

DirectoryEntry makeEntry(const QString &name, bool isDir, bool isBundle = false)
{
    DirectoryEntry entry;
    entry.name = name;
    entry.path = QStringLiteral("/d/") + name;
    entry.isDir = isDir;
    entry.isBundle = isBundle;
    return entry;
}

GridLayoutParams twoColumns()
{
    GridLayoutParams params;
    params.viewWidth = 260.0;
    return params;
}

} // namespace

TEST(DropTargetResolverTest, OnlyPlainFoldersAcceptDrops)
{
    EXPECT_TRUE(DropTargetResolver::isDropIntoTarget(makeEntry("folder", true)));
    EXPECT_FALSE(DropTargetResolver::isDropIntoTarget(makeEntry("Tool.app", true, true)));
    EXPECT_FALSE(DropTargetResolver::isDropIntoTarget(makeEntry("file.txt", false)));
}

TEST(DropTargetResolverTest, ResolvesEachCellByKind)
{
    FolderSnapshot snapshot;
    snapshot.append(makeEntry("folder", true));
    snapshot.append(makeEntry("Tool.app", true, true));
    snapshot.append(makeEntry("file.txt", false));

    const GridLayoutParams params = twoColumns();
    for (int row = 0; row < snapshot.size(); ++row) {
        QRectF rect;
        ASSERT_TRUE(GridLayout::cellRect(row, snapshot.size(), params, &rect));
        const int expected = DropTargetResolver::isDropIntoTarget(snapshot.at(row)) ? row : -1;
        EXPECT_EQ(DropTargetResolver::resolveTargetRow(rect.center(), snapshot, params), expected);
    }

    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(60, 60), snapshot, params), 0);
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(180, 60), snapshot, params), -1);
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(60, 180), snapshot, params), -1);
}

TEST(DropTargetResolverTest, BackgroundResolvesToNothing)
{
    FolderSnapshot snapshot;
    snapshot.append(makeEntry("folder", true));

    const GridLayoutParams params = twoColumns();
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(180, 60), snapshot, params), -1);
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(120, 60), snapshot, params), -1);
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(60, 400), snapshot, params), -1);
}

TEST(DropTargetResolverTest, UnknownViewWidthResolvesToNothing)
{
    FolderSnapshot snapshot;
    snapshot.append(makeEntry("folder", true));

    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(60, 60), snapshot, GridLayoutParams()), -1);
}

TEST(DropTargetResolverTest, EmptySnapshotResolvesToNothing)
{
    EXPECT_EQ(DropTargetResolver::resolveTargetRow(QPointF(60, 60), FolderSnapshot(), twoColumns()), -1);
}
