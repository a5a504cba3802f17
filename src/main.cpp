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

#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QtQml/QQmlExtensionPlugin>

#include "AppSettings.h"
#include "IconImageProviders.h"
#include "WindowManager.h"

Q_IMPORT_QML_PLUGIN(SpatialFoldersPlugin)

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("SpatialFolders"));
    QCoreApplication::setApplicationName(QStringLiteral("SpatialFolders"));

    QQmlApplicationEngine engine;
    engine.addImageProvider(QStringLiteral("glyph"), new GlyphImageProvider);
    engine.addImageProvider(QStringLiteral("bundle"), new BundleIconProvider);

    const QUrl url(u"qrc:/SpatialFolders/qml/App/FolderWindow.qml"_qs);
    WindowManager windowManager(&engine, url);
    engine.rootContext()->setContextProperty("windowManager", &windowManager);

    const AppSettings settings = AppSettings::load();
    if (!windowManager.openFolder(settings.startDirectory)) {
        return -1;
    }

    return app.exec();
}
