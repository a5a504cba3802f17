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

#include "FileOperationUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>

#include "PlatformUtils.h"

namespace FileOperationUtils {

namespace {

const QDir::Filters everyEntry = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;

bool failWith(const char *context, const char *message, QString *error)
{
    if (error) {
        *error = QCoreApplication::translate(context, message);
    }
    return false;
}

QString backupNameFor(const QString &fileName)
{
    return QStringLiteral(".%1.replaced-%2").arg(fileName).arg(QDateTime::currentMSecsSinceEpoch());
}

} // namespace

void applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        qWarning() << "Could not carry file times over to" << targetPath;
        return;
    }
    targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    const QDateTime birthTime = sourceInfo.birthTime();
    if (birthTime.isValid()) {
        targetFile.setFileTime(birthTime, QFileDevice::FileBirthTime);
    }
    targetFile.close();
}

bool copyFolderRecursive(const QString &sourcePath, const QString &targetPath, const char *context, QString *error)
{
    const QDir sourceDir(sourcePath);
    if (!sourceDir.exists()) {
        return failWith(context, QT_TR_NOOP("Source not found"), error);
    }
    if (QFileInfo::exists(targetPath)) {
        return failWith(context, QT_TR_NOOP("Target already exists"), error);
    }
    if (!QDir().mkpath(targetPath)) {
        return failWith(context, QT_TR_NOOP("Cannot create target folder"), error);
    }

    const QFileInfoList entries = sourceDir.entryInfoList(everyEntry, QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        const QString entryPath = entry.absoluteFilePath();
        const QString targetEntryPath = QDir(targetPath).filePath(entry.fileName());
        if (entry.isDir() && !entry.isSymLink()) {
            if (!copyFolderRecursive(entryPath, targetEntryPath, context, error)) {
                return false;
            }
        } else {
            if (QFileInfo::exists(targetEntryPath)) {
                return failWith(context, QT_TR_NOOP("Target already exists"), error);
            }
            if (!QFile::copy(entryPath, targetEntryPath)) {
                return failWith(context, QT_TR_NOOP("Copy failed"), error);
            }
            applyFileTimes(entry, targetEntryPath);
        }
    }
    return true;
}

/**
 * @brief Moves a file or folder to a path that does not exist yet.
 * @param sourcePath Existing file or folder.
 * @param targetPath Full destination path, including the item name.
 * @param context Translation context for error messages.
 * @param error Optional output error message.
 * @return True if the item now lives at targetPath, false otherwise.
 */
bool movePath(const QString &sourcePath, const QString &targetPath, const char *context, QString *error)
{
    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists() && !sourceInfo.isSymLink()) {
        return failWith(context, QT_TR_NOOP("Source not found"), error);
    }
    if (QFileInfo::exists(targetPath)) {
        return failWith(context, QT_TR_NOOP("Target already exists"), error);
    }
    if (!QFileInfo(targetPath).dir().exists()) {
        return failWith(context, QT_TR_NOOP("Target folder not found"), error);
    }

    if (!sourceInfo.isDir() || sourceInfo.isSymLink()) {
        if (!QFile::rename(sourcePath, targetPath)) {
            return failWith(context, QT_TR_NOOP("Move failed"), error);
        }
        return true;
    }

    if (QDir().rename(sourcePath, targetPath)) {
        return true;
    }

    // Folders cannot be renamed across devices: copy, then drop the source.
    QString copyError;
    if (!copyFolderRecursive(sourcePath, targetPath, context, &copyError)) {
        if (QFileInfo::exists(targetPath) && !QDir(targetPath).removeRecursively()) {
            qWarning() << "Could not clean up partial copy" << targetPath;
        }
        if (error) {
            *error = copyError;
        }
        return false;
    }
    QString removeError;
    if (!PlatformUtils::deletePermanently(sourcePath, &removeError)) {
        qWarning() << "Moved" << sourcePath << "by copy but could not remove it:" << removeError;
        return failWith(context, QT_TR_NOOP("Copied, but the original could not be removed"), error);
    }
    return true;
}

/**
 * @brief Replaces an existing item with another one.
 *
 * The existing item is first renamed to a hidden backup next to it. If moving the
 * source into place fails, the backup is renamed back so the destination is left
 * as it was. A replaced regular file keeps the permissions of the item it replaces.
 *
 * @param sourcePath Item that takes the place of targetPath.
 * @param targetPath Existing item to replace.
 * @param context Translation context for error messages.
 * @param error Optional output error message.
 * @return True if targetPath now holds the source item, false otherwise.
 */
bool replacePath(const QString &sourcePath, const QString &targetPath, const char *context, QString *error)
{
    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists() && !sourceInfo.isSymLink()) {
        return failWith(context, QT_TR_NOOP("Source not found"), error);
    }
    const QFileInfo targetInfo(targetPath);
    if (!targetInfo.exists() && !targetInfo.isSymLink()) {
        return movePath(sourcePath, targetPath, context, error);
    }
    if (PlatformUtils::isSameOrInside(sourcePath, targetPath)) {
        return failWith(context, QT_TR_NOOP("An item cannot replace the folder that contains it"), error);
    }

    QDir parentDir = targetInfo.dir();
    const QString backupName = backupNameFor(targetInfo.fileName());
    const QString backupPath = parentDir.filePath(backupName);
    const QFileDevice::Permissions targetPermissions = targetInfo.permissions();
    const bool keepPermissions = targetInfo.isFile() && sourceInfo.isFile();

    if (!parentDir.rename(targetInfo.fileName(), backupName)) {
        return failWith(context, QT_TR_NOOP("Cannot set the existing item aside"), error);
    }

    QString moveError;
    if (!movePath(sourcePath, targetPath, context, &moveError)) {
        if (!parentDir.rename(backupName, targetInfo.fileName())) {
            qWarning() << "Could not restore" << targetPath << "from" << backupPath;
        }
        if (error) {
            *error = moveError;
        }
        return false;
    }

    if (keepPermissions && !QFile::setPermissions(targetPath, targetPermissions)) {
        qWarning() << "Could not carry permissions over to" << targetPath;
    }

    QString removeError;
    if (!PlatformUtils::deletePermanently(backupPath, &removeError)) {
        qWarning() << "Replaced" << targetPath << "but left backup" << backupPath << ":" << removeError;
    }
    return true;
}

} // namespace FileOperationUtils
