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

#include "OperationError.h"

#include <QCoreApplication>
#include <QFileInfo>

namespace {

OperationError makeError(OperationError::Kind kind,
                         const QString &path,
                         const QString &destination,
                         const QString &reason)
{
    OperationError error;
    error.kind = kind;
    error.path = path;
    error.destination = destination;
    error.reason = reason;
    return error;
}

QString displayName(const QString &path)
{
    const QString name = QFileInfo(path).fileName();
    return name.isEmpty() ? path : name;
}

} // namespace

OperationError OperationError::filesystem(const QString &path, const QString &reason)
{
    return makeError(Kind::Filesystem, path, QString(), reason);
}

OperationError OperationError::move(const QString &source, const QString &destination, const QString &reason)
{
    return makeError(Kind::Move, source, destination, reason);
}

OperationError OperationError::replace(const QString &source, const QString &destination, const QString &reason)
{
    return makeError(Kind::Replace, source, destination, reason);
}

OperationError OperationError::open(const QString &path, const QString &reason)
{
    return makeError(Kind::Open, path, QString(), reason);
}

OperationError OperationError::watchSetup(const QString &path, const QString &reason)
{
    return makeError(Kind::WatchSetup, path, QString(), reason);
}

/**
 * @brief Returns a stable identifier for the error kind, used by QML.
 * @return Kind identifier string.
 */
QString OperationError::kindKey() const
{
    switch (kind) {
    case Kind::Filesystem:
        return QStringLiteral("filesystem");
    case Kind::Move:
        return QStringLiteral("move");
    case Kind::Replace:
        return QStringLiteral("replace");
    case Kind::Open:
        return QStringLiteral("open");
    case Kind::WatchSetup:
        return QStringLiteral("watchSetup");
    }
    return QString();
}

QString OperationError::title() const
{
    switch (kind) {
    case Kind::Filesystem:
        return QCoreApplication::translate("OperationError", "Cannot Load Folder");
    case Kind::Move:
        return QCoreApplication::translate("OperationError", "Cannot Move Item");
    case Kind::Replace:
        return QCoreApplication::translate("OperationError", "Cannot Replace Item");
    case Kind::Open:
        return QCoreApplication::translate("OperationError", "Cannot Open Item");
    case Kind::WatchSetup:
        return QCoreApplication::translate("OperationError", "Live Updates Unavailable");
    }
    return QCoreApplication::translate("OperationError", "Error");
}

/**
 * @brief Builds the user-facing message for the error.
 * @return Translated message naming the affected item and the reason.
 */
QString OperationError::message() const
{
    QString text;
    switch (kind) {
    case Kind::Filesystem:
        text = QCoreApplication::translate("OperationError", "Error loading folder contents of \"%1\".")
                   .arg(displayName(path));
        break;
    case Kind::Move:
        text = QCoreApplication::translate("OperationError", "Error moving \"%1\" to \"%2\".")
                   .arg(displayName(path), destination);
        break;
    case Kind::Replace:
        text = QCoreApplication::translate("OperationError", "Error replacing \"%1\" with \"%2\".")
                   .arg(displayName(destination), displayName(path));
        break;
    case Kind::Open:
        text = QCoreApplication::translate("OperationError", "Error opening \"%1\".")
                   .arg(displayName(path));
        break;
    case Kind::WatchSetup:
        text = QCoreApplication::translate("OperationError", "Changes to \"%1\" will not appear automatically.")
                   .arg(displayName(path));
        break;
    }
    if (!reason.isEmpty()) {
        text += QLatin1Char(' ') + reason;
    }
    return text;
}

QVariantMap OperationError::toVariantMap() const
{
    QVariantMap map;
    map.insert("kind", kindKey());
    map.insert("title", title());
    map.insert("message", message());
    map.insert("path", path);
    map.insert("destination", destination);
    map.insert("reason", reason);
    return map;
}
