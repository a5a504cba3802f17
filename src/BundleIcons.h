#pragma once

#include <QHash>
#include <QImage>
#include <QMutex>
#include <QString>

namespace BundleIcons {

QString iconPath(const QString &bundlePath);
QImage loadIcon(const QString &bundlePath, int maximumSize);
QString imageSource(const QString &bundlePath);
QString bundlePathFromImageId(const QString &id);

} // namespace BundleIcons

// Shared between the UI thread, which fills it, and the QML image loader threads.
// Each view holding an icon owns one reference; the image goes with the last one.
class BundleIconCache
{
public:
    static BundleIconCache &instance();

    void acquire(const QString &bundlePath, const QImage &image);
    void release(const QString &bundlePath);
    QImage image(const QString &bundlePath) const;
    int size() const;

private:
    BundleIconCache() = default;

    mutable QMutex m_mutex;
    struct Slot {
        QImage image;
        int references = 0;
    };

    QHash<QString, Slot> m_slots;
};
