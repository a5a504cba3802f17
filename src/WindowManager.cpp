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

#include "WindowManager.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QQmlComponent>
#include <QQmlEngine>
#include <QQuickWindow>
#include <QVariantMap>

/**
 * @brief Constructs the window manager.
 * @param engine QML engine creating the folder windows.
 * @param windowUrl QML file of a folder window.
 * @param parent Parent QObject for ownership.
 */
WindowManager::WindowManager(QQmlEngine *engine, const QUrl &windowUrl, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_component(new QQmlComponent(engine, windowUrl, QQmlComponent::PreferSynchronous, this))
{
}

int WindowManager::windowCount() const
{
    return m_windows.size();
}

/**
 * @brief Opens a new independent folder window.
 * @param path Folder shown by the window.
 * @return True when the window was created, false otherwise.
 */
bool WindowManager::openFolder(const QString &path)
{
    const QFileInfo info(path);
    if (!info.isDir()) {
        qWarning() << "Cannot open window on missing folder" << path;
        return false;
    }

    if (m_component->isError()) {
        qWarning() << "Folder window component failed:" << m_component->errorString();
        return false;
    }

    const QVariantMap properties{
        {QStringLiteral("directoryPath"), QDir::cleanPath(info.absoluteFilePath())}
    };
    QObject *object = m_component->createWithInitialProperties(properties, m_engine->rootContext());
    auto *window = qobject_cast<QQuickWindow *>(object);
    if (!window) {
        qWarning() << "Folder window could not be created:" << m_component->errorString();
        if (object) {
            object->deleteLater();
        }
        return false;
    }

    // Open windows go away with the manager, before the engine.
    object->setParent(this);
    QQmlEngine::setObjectOwnership(window, QQmlEngine::CppOwnership);
    connect(window, &QWindow::visibleChanged, this, [this, window](bool visible) {
        if (!visible) {
            releaseWindow(window);
        }
    });

    m_windows.append(window);
    emit windowCountChanged();

    window->show();
    window->raise();
    window->requestActivate();
    return true;
}

void WindowManager::releaseWindow(QQuickWindow *window)
{
    m_windows.removeAll(window);
    window->deleteLater();
    emit windowCountChanged();
}
