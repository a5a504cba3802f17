#pragma once

#include <QPointF>
#include <QRectF>
#include <QtGlobal>

struct GridLayoutParams {
    // Negative until the view reports its width.
    qreal viewWidth = -1.0;
    qreal cellWidth = 100.0;
    qreal cellHeight = 100.0;
    qreal spacing = 20.0;
    qreal margin = 20.0;

    bool hasViewWidth() const;
};

namespace GridLayout {

int columnsPerRow(const GridLayoutParams &params);
bool cellRect(int index, int count, const GridLayoutParams &params, QRectF *rect);
int indexAt(const QPointF &location, int count, const GridLayoutParams &params);

} // namespace GridLayout
