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

#include "IconImageProviders.h"

#include <QFont>
#include <QGuiApplication>
#include <QIcon>
#include <QPainter>
#include <QPalette>
#include <QPen>

#include "BundleIcons.h"
#include "IconClassifier.h"

namespace {

struct IconProviderConstants {
    static constexpr int defaultEdge = 64;
    static constexpr qreal cornerRatio = 0.12;
    static constexpr qreal insetRatio = 0.1;
};

QSize effectiveSize(const QSize &requestedSize)
{
    const int width = requestedSize.width() > 0 ? requestedSize.width() : IconProviderConstants::defaultEdge;
    const int height = requestedSize.height() > 0 ? requestedSize.height() : width;
    return QSize(width, height);
}

/**
 * @brief Paints a neutral page or folder shape when the icon theme has no match.
 * @param glyph Glyph to draw.
 * @param size Pixmap size.
 * @return Painted pixmap.
 */
QPixmap paintFallback(IconClassifier::Glyph glyph, const QSize &size)
{
    QPixmap pixmap(size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    const QColor accent = QGuiApplication::palette().color(QPalette::Highlight);
    painter.setPen(QPen(accent, qMax(1.0, size.width() * 0.04)));
    painter.setBrush(accent.lighter(170));

    const qreal inset = size.width() * IconProviderConstants::insetRatio;
    const QRectF bounds = QRectF(QPointF(0, 0), QSizeF(size)).adjusted(inset, inset, -inset, -inset);
    const qreal radius = bounds.width() * IconProviderConstants::cornerRatio;
    if (glyph == IconClassifier::Glyph::Folder) {
        const QRectF tab(bounds.left(), bounds.top() + bounds.height() * 0.1, bounds.width() * 0.4, bounds.height() * 0.2);
        painter.drawRoundedRect(tab, radius, radius);
        painter.drawRoundedRect(bounds.adjusted(0, bounds.height() * 0.2, 0, 0), radius, radius);
    } else {
        const QRectF page = bounds.adjusted(bounds.width() * 0.12, 0, -bounds.width() * 0.12, 0);
        painter.drawRoundedRect(page, radius, radius);
        const QString label = IconClassifier::glyphName(glyph).left(3).toUpper();
        QFont font = painter.font();
        font.setPixelSize(qMax(6, static_cast<int>(page.height() * 0.2)));
        font.setBold(true);
        painter.setFont(font);
        painter.drawText(page, Qt::AlignCenter, label);
    }
    return pixmap;
}

} // namespace

GlyphImageProvider::GlyphImageProvider()
    : QQuickImageProvider(QQuickImageProvider::Pixmap)
{
}

/**
 * @brief Renders a glyph from the desktop icon theme.
 * @param id Glyph name as produced by IconClassifier::glyphName.
 * @param size Output size of the returned pixmap.
 * @param requestedSize Size requested by QML, or an invalid size.
 * @return Glyph pixmap.
 */
QPixmap GlyphImageProvider::requestPixmap(const QString &id, QSize *size, const QSize &requestedSize)
{
    IconClassifier::Glyph glyph = IconClassifier::Glyph::Unknown;
    if (!IconClassifier::glyphFromName(id, &glyph)) {
        glyph = IconClassifier::Glyph::Unknown;
    }

    const QSize target = effectiveSize(requestedSize);
    QPixmap pixmap;
    for (const QString &name : IconClassifier::themeIconNames(glyph)) {
        const QIcon icon = QIcon::fromTheme(name);
        if (!icon.isNull()) {
            pixmap = icon.pixmap(target);
            break;
        }
    }
    if (pixmap.isNull()) {
        pixmap = paintFallback(glyph, target);
    }

    if (size) {
        *size = pixmap.size();
    }
    return pixmap;
}

BundleIconProvider::BundleIconProvider()
    : QQuickImageProvider(QQuickImageProvider::Image)
{
}

/**
 * @brief Serves a bundle icon previously loaded into the shared cache.
 * @param id Percent-encoded bundle path.
 * @param size Output size of the returned image.
 * @param requestedSize Size requested by QML, or an invalid size.
 * @return Cached icon, or a null image when it is not loaded.
 */
QImage BundleIconProvider::requestImage(const QString &id, QSize *size, const QSize &requestedSize)
{
    QImage image = BundleIconCache::instance().image(BundleIcons::bundlePathFromImageId(id));
    if (!image.isNull() && requestedSize.width() > 0 && requestedSize.height() > 0) {
        image = image.scaled(requestedSize, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
    if (size) {
        *size = image.size();
    }
    return image;
}
