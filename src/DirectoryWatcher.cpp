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

#include "DirectoryWatcher.h"

#include <QDebug>
#include <QFileInfo>

namespace {

struct DirectoryWatcherConstants {
    static constexpr int defaultDebounceMs = 150;
};

} // namespace

/**
 * @brief Constructs an idle watcher.
 * @param parent Parent QObject for ownership.
 */
DirectoryWatcher::DirectoryWatcher(QObject *parent)
    : QObject(parent)
{
    m_debounceTimer.setInterval(DirectoryWatcherConstants::defaultDebounceMs);
    m_debounceTimer.setSingleShot(true);
    connect(&m_debounceTimer, &QTimer::timeout, this, &DirectoryWatcher::deliverChange);
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged, this, &DirectoryWatcher::handleDirectoryChanged);
}

DirectoryWatcher::~DirectoryWatcher()
{
    stop();
}

/**
 * @brief Starts watching a folder, replacing any previous subscription.
 * @param path Folder to watch.
 * @param error Optional output error message.
 * @return True when the folder is being watched, false otherwise.
 */
bool DirectoryWatcher::start(const QString &path, QString *error)
{
    stop();

    const QFileInfo info(path);
    if (path.isEmpty() || !info.isDir()) {
        if (error) {
            *error = tr("Folder not found");
        }
        return false;
    }

    if (!m_watcher.addPath(info.absoluteFilePath())) {
        if (error) {
            *error = tr("The system refused to watch this folder");
        }
        return false;
    }

    m_path = info.absoluteFilePath();
    m_active = true;
    return true;
}

/**
 * @brief Stops watching and releases the system watch immediately.
 */
void DirectoryWatcher::stop()
{
    m_debounceTimer.stop();
    releasePaths();
    m_active = false;
    m_path.clear();
    m_parentPath.clear();
}

bool DirectoryWatcher::isActive() const
{
    return m_active;
}

QString DirectoryWatcher::path() const
{
    return m_path;
}

int DirectoryWatcher::debounceInterval() const
{
    return m_debounceTimer.interval();
}

void DirectoryWatcher::setDebounceInterval(int msec)
{
    m_debounceTimer.setInterval(msec < 0 ? 0 : msec);
}

/**
 * @brief Coalesces raw change notifications into one delivery.
 *
 * While the folder is missing only its parent is watched, and parent changes
 * count only once the folder exists again or the parent itself is gone.
 *
 * @param path Folder reported by the system watcher.
 */
void DirectoryWatcher::handleDirectoryChanged(const QString &path)
{
    if (!m_active) {
        return;
    }
    if (!m_parentPath.isEmpty() && path == m_parentPath
        && !QFileInfo(m_path).isDir() && QFileInfo(m_parentPath).isDir()) {
        return;
    }
    if (!m_debounceTimer.isActive()) {
        m_debounceTimer.start();
    }
}

void DirectoryWatcher::deliverChange()
{
    if (!m_active) {
        return;
    }
    rearmIfDropped();
    if (!m_active) {
        return;
    }
    emit directoryChanged(m_path);
}

/**
 * @brief Restores the watch after the system dropped it.
 *
 * The system drops a watch when the folder is removed or replaced. The parent
 * folder is watched until the path is a folder again. When neither can be
 * watched the subscription ends and watchLost is emitted.
 */
void DirectoryWatcher::rearmIfDropped()
{
    const QStringList watched = m_watcher.directories();
    const bool folderExists = QFileInfo(m_path).isDir();

    if (watched.contains(m_path) && folderExists) {
        return;
    }
    if (watched.contains(m_path)) {
        m_watcher.removePath(m_path);
    }

    if (folderExists) {
        if (m_watcher.addPath(m_path)) {
            if (!m_parentPath.isEmpty()) {
                m_watcher.removePath(m_parentPath);
                m_parentPath.clear();
            }
            qDebug() << "Watch restored on" << m_path;
            return;
        }
        qWarning() << "Could not re-arm watch on" << m_path;
    } else if (!m_parentPath.isEmpty() && watched.contains(m_parentPath) && QFileInfo(m_parentPath).isDir()) {
        return;
    } else {
        if (!m_parentPath.isEmpty()) {
            if (watched.contains(m_parentPath)) {
                m_watcher.removePath(m_parentPath);
            }
            m_parentPath.clear();
        }
        const QString parentPath = QFileInfo(m_path).absolutePath();
        if (QFileInfo(parentPath).isDir() && m_watcher.addPath(parentPath)) {
            qDebug() << "Watched folder is gone for now, waiting in" << parentPath;
            m_parentPath = parentPath;
            return;
        }
        qWarning() << "Watched folder is gone and its parent cannot be watched:" << m_path;
    }

    const QString lostPath = m_path;
    stop();
    emit watchLost(lostPath, tr("The system refused to watch this folder"));
}

void DirectoryWatcher::releasePaths()
{
    const QStringList watched = m_watcher.directories();
    if (!watched.isEmpty()) {
        m_watcher.removePaths(watched);
    }
}
