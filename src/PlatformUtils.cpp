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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDesktopServices>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QUrl>

namespace PlatformUtils {

namespace {

struct BundleLauncherNames {
    static constexpr const char *appRun = "AppRun";
};

bool failWith(const char *message, QString *error)
{
    if (error) {
        *error = QCoreApplication::translate("PlatformUtils", message);
    }
    return false;
}

} // namespace

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward separators.
 */
QString normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path);
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Checks whether a path equals an ancestor path or lies below it.
 * @param path Path to test.
 * @param ancestor Candidate ancestor folder.
 * @return True when path is ancestor itself or one of its descendants.
 */
bool isSameOrInside(const QString &path, const QString &ancestor)
{
    const QString normalizedPath = normalizePath(path);
    const QString normalizedAncestor = normalizePath(ancestor);
    if (normalizedPath == normalizedAncestor) {
        return true;
    }
    const QChar separator = QLatin1Char('/');
    const QString prefix = normalizedAncestor.endsWith(separator) ? normalizedAncestor : normalizedAncestor + separator;
    return normalizedPath.startsWith(prefix);
}

/**
 * @brief Deletes a file or folder without going through the trash.
 * @param path File or folder path to remove.
 * @param error Optional output error message.
 * @return True if removal succeeds, false otherwise.
 */
bool deletePermanently(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Path is empty"), error);
    }
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Source not found"), error);
    }
    bool ok = false;
    if (info.isDir() && !info.isSymLink()) {
        QDir dir(path);
        ok = dir.removeRecursively();
    } else {
        ok = QFile::remove(path);
    }
    if (!ok) {
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Failed to delete"), error);
    }
    return true;
}

/**
 * @brief Opens a file with the handler registered by the desktop.
 * @param path File to open.
 * @param error Optional output error message.
 * @return True if the desktop accepted the request, false otherwise.
 */
bool openWithDefaultHandler(const QString &path, QString *error)
{
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Item not found"), error);
    }
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
        qWarning() << "No handler accepted" << path;
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "No application can open this item"), error);
    }
    return true;
}

/**
 * @brief Launches an application bundle.
 * @param path Bundle folder to launch.
 * @param error Optional output error message.
 * @return True if the application was started, false otherwise.
 */
bool launchBundle(const QString &path, QString *error)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isDir()) {
        return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Application not found"), error);
    }

    const QFileInfo appRun(QDir(path).filePath(QLatin1String(BundleLauncherNames::appRun)));
    if (appRun.isFile() && appRun.isExecutable()) {
        if (!QProcess::startDetached(appRun.absoluteFilePath(), {}, info.absoluteFilePath())) {
            qWarning() << "Failed to start" << appRun.absoluteFilePath();
            return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Application failed to start"), error);
        }
        return true;
    }

#ifdef Q_OS_MACOS
    if (QDesktopServices::openUrl(QUrl::fromLocalFile(info.absoluteFilePath()))) {
        return true;
    }
    qWarning() << "Launch services refused" << info.absoluteFilePath();
    return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "Application failed to start"), error);
#else
    return failWith(QT_TRANSLATE_NOOP("PlatformUtils", "No launcher found in application bundle"), error);
#endif
}

} // namespace PlatformUtils
