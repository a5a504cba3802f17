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

#include "GridLayout.h"

#include <cmath>

namespace {

struct GridLayoutConstants {
    static constexpr int noColumns = 0;
    static constexpr int minimumColumns = 1;
    static constexpr int invalidIndex = -1;
};

qreal columnStride(const GridLayoutParams &params)
{
    return params.cellWidth + params.spacing;
}

qreal rowStride(const GridLayoutParams &params)
{
    return params.cellHeight + params.spacing;
}

} // namespace

bool GridLayoutParams::hasViewWidth() const
{
    return viewWidth >= 0.0;
}

namespace GridLayout {

/**
 * @brief Computes how many cells fit on one row.
 * @param params Layout parameters.
 * @return Column count, at least one, or zero when the view width is unknown.
 */
int columnsPerRow(const GridLayoutParams &params)
{
    if (!params.hasViewWidth() || columnStride(params) <= 0.0) {
        return GridLayoutConstants::noColumns;
    }
    const int columns = static_cast<int>(std::floor((params.viewWidth - params.margin) / columnStride(params)));
    return columns < GridLayoutConstants::minimumColumns ? GridLayoutConstants::minimumColumns : columns;
}

/**
 * @brief Computes the on-screen rectangle of a cell.
 * @param index Cell index in snapshot order.
 * @param count Number of cells in the grid.
 * @param params Layout parameters.
 * @param rect Output rectangle in content coordinates.
 * @return True when the index is valid and the view width is known.
 */
bool cellRect(int index, int count, const GridLayoutParams &params, QRectF *rect)
{
    if (index < 0 || index >= count) {
        return false;
    }
    const int columns = columnsPerRow(params);
    if (columns == GridLayoutConstants::noColumns) {
        return false;
    }

    const int row = index / columns;
    const int column = index % columns;
    const qreal inset = params.margin / 2.0;
    const qreal x = inset + column * columnStride(params);
    const qreal y = inset + row * rowStride(params);
    if (rect) {
        *rect = QRectF(x, y, params.cellWidth, params.cellHeight);
    }
    return true;
}

/**
 * @brief Finds the cell containing a location.
 * @param location Point in content coordinates.
 * @param count Number of cells in the grid.
 * @param params Layout parameters.
 * @return Cell index, or -1 when the point falls between cells or outside the grid.
 */
int indexAt(const QPointF &location, int count, const GridLayoutParams &params)
{
    const int columns = columnsPerRow(params);
    if (columns == GridLayoutConstants::noColumns || count <= 0) {
        return GridLayoutConstants::invalidIndex;
    }

    const qreal inset = params.margin / 2.0;
    const qreal localX = location.x() - inset;
    const qreal localY = location.y() - inset;
    if (localX < 0.0 || localY < 0.0) {
        return GridLayoutConstants::invalidIndex;
    }

    const int column = static_cast<int>(std::floor(localX / columnStride(params)));
    const int row = static_cast<int>(std::floor(localY / rowStride(params)));
    if (column >= columns) {
        return GridLayoutConstants::invalidIndex;
    }

    const int index = row * columns + column;
    QRectF rect;
    if (!cellRect(index, count, params, &rect) || !rect.contains(location)) {
        return GridLayoutConstants::invalidIndex;
    }
    return index;
}

} // namespace GridLayout
