#pragma once

#include <QPointF>

#include "DirectoryEntry.h"
#include "GridLayout.h"

namespace DropTargetResolver {

bool isDropIntoTarget(const DirectoryEntry &entry);
int resolveTargetRow(const QPointF &location, const FolderSnapshot &snapshot, const GridLayoutParams &params);

} // namespace DropTargetResolver
