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

#include "BundleIcons.h"

#include <QDir>
#include <QFileInfo>
#include <QImageReader>
#include <QMutexLocker>
#include <QSize>
#include <QUrl>

namespace {

const char appDirIconName[] = ".DirIcon";
const char appBundleResources[] = "Contents/Resources";
const char preferredAppIcon[] = "AppIcon.icns";

/**
 * @brief Returns the first file in a folder matching one of the patterns.
 * @param folder Folder to search.
 * @param patterns Name filters, tried in order.
 * @return Absolute file path, or an empty string.
 */
QString firstMatch(const QString &folder, const QStringList &patterns)
{
    const QDir dir(folder);
    if (!dir.exists()) {
        return QString();
    }
    for (const QString &pattern : patterns) {
        const QFileInfoList matches = dir.entryInfoList({pattern}, QDir::Files | QDir::Readable, QDir::Name);
        if (!matches.isEmpty()) {
            return matches.first().absoluteFilePath();
        }
    }
    return QString();
}

} // namespace

namespace BundleIcons {

/**
 * @brief Finds the icon file shipped inside an application bundle.
 * @param bundlePath Bundle folder.
 * @return Icon file path, or an empty string when the bundle has none.
 */
QString iconPath(const QString &bundlePath)
{
    const QDir bundle(bundlePath);

    const QFileInfo dirIcon(bundle.filePath(QLatin1String(appDirIconName)));
    if (dirIcon.isFile()) {
        return dirIcon.canonicalFilePath();
    }

    const QString resources = bundle.filePath(QLatin1String(appBundleResources));
    const QFileInfo preferred(QDir(resources).filePath(QLatin1String(preferredAppIcon)));
    if (preferred.isFile()) {
        return preferred.absoluteFilePath();
    }
    const QString resourceIcon = firstMatch(resources, {QStringLiteral("*.icns"), QStringLiteral("*.png")});
    if (!resourceIcon.isEmpty()) {
        return resourceIcon;
    }

    return firstMatch(bundlePath, {QStringLiteral("*.png"), QStringLiteral("*.svg")});
}

/**
 * @brief Reads a bundle icon scaled down to a maximum edge length.
 * @param bundlePath Bundle folder.
 * @param maximumSize Largest edge of the returned image, in pixels.
 * @return Icon image, or a null image when none could be read.
 */
QImage loadIcon(const QString &bundlePath, int maximumSize)
{
    const QString path = iconPath(bundlePath);
    if (path.isEmpty()) {
        return QImage();
    }

    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QSize size = reader.size();
    if (size.isValid() && maximumSize > 0
        && (size.width() > maximumSize || size.height() > maximumSize)) {
        reader.setScaledSize(size.scaled(maximumSize, maximumSize, Qt::KeepAspectRatio));
    }
    return reader.read();
}

/**
 * @brief Builds the QML image URL serving a cached bundle icon.
 * @param bundlePath Bundle folder.
 * @return image://bundle/ URL with the percent-encoded path as id.
 */
QString imageSource(const QString &bundlePath)
{
    return QStringLiteral("image://bundle/") + QString::fromLatin1(QUrl::toPercentEncoding(bundlePath));
}

QString bundlePathFromImageId(const QString &id)
{
    return QUrl::fromPercentEncoding(id.toUtf8());
}

} // namespace BundleIcons

BundleIconCache &BundleIconCache::instance()
{
    static BundleIconCache cache;
    return cache;
}

/**
 * @brief Stores an icon and takes one reference on it.
 * @param bundlePath Bundle folder the icon belongs to.
 * @param image Loaded icon; replaces the stored one.
 */
void BundleIconCache::acquire(const QString &bundlePath, const QImage &image)
{
    QMutexLocker locker(&m_mutex);
    Slot &slot = m_slots[bundlePath];
    slot.image = image;
    slot.references += 1;
}

/**
 * @brief Drops one reference, evicting the icon when none is left.
 * @param bundlePath Bundle folder the icon belongs to.
 */
void BundleIconCache::release(const QString &bundlePath)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_slots.find(bundlePath);
    if (it == m_slots.end()) {
        return;
    }
    it->references -= 1;
    if (it->references <= 0) {
        m_slots.erase(it);
    }
}

QImage BundleIconCache::image(const QString &bundlePath) const
{
    QMutexLocker locker(&m_mutex);
    return m_slots.value(bundlePath).image;
}

int BundleIconCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_slots.size();
}
