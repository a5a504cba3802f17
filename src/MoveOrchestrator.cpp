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

#include "MoveOrchestrator.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include "FileOperationUtils.h"
#include "PlatformUtils.h"

/**
 * @brief Constructs an idle orchestrator.
 * @param parent Parent QObject for ownership.
 */
MoveOrchestrator::MoveOrchestrator(QObject *parent)
    : QObject(parent)
{
}

MoveOrchestrator::State MoveOrchestrator::state() const
{
    return m_state;
}

PendingMove MoveOrchestrator::pendingMove() const
{
    return m_pending;
}

/**
 * @brief Computes where a dropped item lands inside a folder.
 * @param sourcePath Dropped item.
 * @param targetDirectory Folder receiving the item.
 * @return Full destination path keeping the item name.
 */
QString MoveOrchestrator::destinationFor(const QString &sourcePath, const QString &targetDirectory)
{
    const QString name = QFileInfo(QDir::cleanPath(sourcePath)).fileName();
    return QDir::cleanPath(QDir(targetDirectory).filePath(name));
}

/**
 * @brief Starts handling a dropped item.
 * @param sourcePath Dropped item.
 * @param targetDirectory Folder the item was dropped into.
 * @return Outcome of the drop; AwaitingConfirmation leaves the move pending.
 */
MoveOrchestrator::DropResult MoveOrchestrator::submitDrop(const QString &sourcePath, const QString &targetDirectory)
{
    if (m_state != State::Idle) {
        qWarning() << "Drop rejected: another drop is still pending for" << m_pending.destinationPath;
        return DropResult::Rejected;
    }
    if (sourcePath.isEmpty() || targetDirectory.isEmpty()) {
        return DropResult::Rejected;
    }

    m_pending.sourcePath = QDir::cleanPath(sourcePath);
    m_pending.destinationPath = destinationFor(sourcePath, targetDirectory);
    setState(State::ResolvingDestination);

    if (PlatformUtils::normalizePath(m_pending.sourcePath) == PlatformUtils::normalizePath(m_pending.destinationPath)) {
        qInfo() << "Drag cancelled: item dropped in the same location:" << m_pending.sourcePath;
        resetMoveState();
        return DropResult::Cancelled;
    }

    if (PlatformUtils::isSameOrInside(m_pending.destinationPath, m_pending.sourcePath)) {
        const OperationError error = OperationError::move(m_pending.sourcePath,
            m_pending.destinationPath,
            tr("A folder cannot be moved into itself."));
        qWarning() << "Move refused:" << m_pending.sourcePath << "into" << m_pending.destinationPath;
        resetMoveState();
        emit operationFailed(error);
        return DropResult::Failed;
    }

    const QFileInfo destinationInfo(m_pending.destinationPath);
    if (destinationInfo.exists() || destinationInfo.isSymLink()) {
        setState(State::AwaitingConfirmation);
        emit replaceConfirmationRequested(destinationInfo.fileName(), m_pending.destinationPath);
        return DropResult::AwaitingConfirmation;
    }

    return performMove();
}

/**
 * @brief Replaces the conflicting item with the pending one.
 * @return True when the replace succeeded, false when it failed or nothing was pending.
 */
bool MoveOrchestrator::confirmReplace()
{
    if (m_state != State::AwaitingConfirmation) {
        return false;
    }
    return performReplace();
}

/**
 * @brief Drops the pending move without touching the filesystem.
 */
void MoveOrchestrator::cancelReplace()
{
    if (m_state != State::AwaitingConfirmation) {
        return;
    }
    qInfo() << "Replace declined for" << m_pending.destinationPath;
    resetMoveState();
}

MoveOrchestrator::DropResult MoveOrchestrator::performMove()
{
    setState(State::Moving);
    const PendingMove move = m_pending;

    QString error;
    const bool ok = FileOperationUtils::movePath(move.sourcePath, move.destinationPath, "MoveOrchestrator", &error);
    resetMoveState();

    if (!ok) {
        qWarning() << "Move failed:" << move.sourcePath << "->" << move.destinationPath << error;
        emit operationFailed(OperationError::move(move.sourcePath, move.destinationPath, error));
        return DropResult::Failed;
    }
    emit contentsChanged();
    return DropResult::Moved;
}

bool MoveOrchestrator::performReplace()
{
    setState(State::Replacing);
    const PendingMove move = m_pending;

    QString error;
    const bool ok = FileOperationUtils::replacePath(move.sourcePath, move.destinationPath, "MoveOrchestrator", &error);
    resetMoveState();

    if (!ok) {
        qWarning() << "Replace failed:" << move.destinationPath << "with" << move.sourcePath << error;
        emit operationFailed(OperationError::replace(move.sourcePath, move.destinationPath, error));
        return false;
    }
    emit contentsChanged();
    return true;
}

void MoveOrchestrator::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged();
}

void MoveOrchestrator::resetMoveState()
{
    m_pending = PendingMove();
    setState(State::Idle);
}
