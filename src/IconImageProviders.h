#pragma once

#include <QQuickImageProvider>

class GlyphImageProvider : public QQuickImageProvider
{
public:
    GlyphImageProvider();

    QPixmap requestPixmap(const QString &id, QSize *size, const QSize &requestedSize) override;
};

class BundleIconProvider : public QQuickImageProvider
{
public:
    BundleIconProvider();

    QImage requestImage(const QString &id, QSize *size, const QSize &requestedSize) override;
};
