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

#include "AppSettings.h"

#include <QDir>
#include <QSettings>

namespace
{
const char organizationName[] = "SpatialFolders";
const char applicationName[] = "SpatialFolders";

const char startDirectoryKey[] = "startDirectory";
const char cellWidthKey[] = "grid/cellWidth";
const char cellHeightKey[] = "grid/cellHeight";
const char spacingKey[] = "grid/spacing";
const char marginKey[] = "grid/margin";
const char caseSensitiveKey[] = "sorting/caseSensitive";
const char debounceKey[] = "watcher/debounceMs";
const char bundleExtensionsKey[] = "bundles/extensions";

qreal positiveOr(const QSettings &settings, const char *key, qreal fallback)
{
    bool ok = false;
    const qreal value = settings.value(QLatin1String(key), fallback).toReal(&ok);
    return ok && value > 0.0 ? value : fallback;
}

qreal nonNegativeOr(const QSettings &settings, const char *key, qreal fallback)
{
    bool ok = false;
    const qreal value = settings.value(QLatin1String(key), fallback).toReal(&ok);
    return ok && value >= 0.0 ? value : fallback;
}

QStringList normalizeExtensions(const QStringList &values)
{
    QStringList result;
    for (const QString &value : values) {
        QString extension = value.trimmed().toLower();
        while (extension.startsWith(QLatin1Char('.'))) {
            extension.remove(0, 1);
        }
        if (!extension.isEmpty() && !result.contains(extension)) {
            result.append(extension);
        }
    }
    return result;
}
} // namespace

AppSettings::AppSettings()
    : startDirectory(QDir::homePath())
    , bundleExtensions({QStringLiteral("app"), QStringLiteral("appdir")})
{
}

/**
 * @brief Reads settings from the user-scope INI file.
 * @return Settings with defaults applied for missing or invalid values.
 */
AppSettings AppSettings::load()
{
    const QSettings settings(QSettings::IniFormat, QSettings::UserScope, organizationName, applicationName);
    return load(settings);
}

/**
 * @brief Reads settings from an existing settings store.
 * @param settings Settings store to read from.
 * @return Settings with defaults applied for missing or invalid values.
 */
AppSettings AppSettings::load(const QSettings &settings)
{
    AppSettings result;

    const QString startDirectory = settings.value(QLatin1String(startDirectoryKey)).toString();
    if (!startDirectory.isEmpty() && QDir(startDirectory).exists()) {
        result.startDirectory = QDir(startDirectory).absolutePath();
    }

    result.cellWidth = positiveOr(settings, cellWidthKey, result.cellWidth);
    result.cellHeight = positiveOr(settings, cellHeightKey, result.cellHeight);
    result.spacing = nonNegativeOr(settings, spacingKey, result.spacing);
    result.margin = nonNegativeOr(settings, marginKey, result.margin);
    result.caseSensitiveSort = settings.value(QLatin1String(caseSensitiveKey), result.caseSensitiveSort).toBool();

    bool ok = false;
    const int debounce = settings.value(QLatin1String(debounceKey), result.watcherDebounceMs).toInt(&ok);
    if (ok && debounce >= 0) {
        result.watcherDebounceMs = debounce;
    }

    const QStringList extensions = normalizeExtensions(settings.value(QLatin1String(bundleExtensionsKey)).toStringList());
    if (!extensions.isEmpty()) {
        result.bundleExtensions = extensions;
    }

    return result;
}
