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

#include "FolderViewModel.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QImage>
#include <QtConcurrent>

#include "BundleIcons.h"
#include "DirectoryWatcher.h"
#include "DropTargetResolver.h"
#include "FolderSnapshotLoader.h"
#include "IconClassifier.h"
#include "MoveOrchestrator.h"
#include "PlatformUtils.h"

namespace {

struct FolderViewConstants {
    static constexpr int invalidRow = -1;
};

} // namespace

/**
 * @brief Constructs the folder view model with settings read from disk.
 * @param parent Parent QObject for ownership.
 */
FolderViewModel::FolderViewModel(QObject *parent)
    : FolderViewModel(AppSettings::load(), parent)
{
}

/**
 * @brief Constructs the folder view model and wires its watcher and move handling.
 * @param settings Grid, sorting, watcher and bundle settings.
 * @param parent Parent QObject for ownership.
 */
FolderViewModel::FolderViewModel(const AppSettings &settings, QObject *parent)
    : QAbstractListModel(parent)
    , m_settings(settings)
    , m_watcher(new DirectoryWatcher(this))
    , m_orchestrator(new MoveOrchestrator(this))
{
    m_watcher->setDebounceInterval(m_settings.watcherDebounceMs);
    connect(m_watcher, &DirectoryWatcher::directoryChanged, this, [this](const QString &) {
        refresh();
    });
    connect(m_watcher, &DirectoryWatcher::watchLost, this, &FolderViewModel::handleWatchLost);

    connect(m_orchestrator, &MoveOrchestrator::contentsChanged, this, &FolderViewModel::refresh);
    connect(m_orchestrator, &MoveOrchestrator::operationFailed, this, &FolderViewModel::reportError);
    connect(m_orchestrator, &MoveOrchestrator::replaceConfirmationRequested,
            this, &FolderViewModel::handleReplaceConfirmationRequested);
    connect(m_orchestrator, &MoveOrchestrator::stateChanged, this, [this]() {
        if (!awaitingConfirmation() && !m_pendingConflictName.isEmpty()) {
            m_pendingConflictName.clear();
            emit awaitingConfirmationChanged();
        }
    });
}

FolderViewModel::~FolderViewModel()
{
    m_watcher->stop();
    releaseBundleIcons();
}

/**
 * @brief Returns the folder shown by this view.
 * @return Absolute folder path.
 */
QString FolderViewModel::directoryPath() const
{
    return m_directoryPath;
}

/**
 * @brief Sets the folder shown by this view and loads its first snapshot.
 * @param path Folder to show.
 */
void FolderViewModel::setDirectoryPath(const QString &path)
{
    if (path.isEmpty()) {
        return;
    }
    const QString normalized = QDir::cleanPath(QDir(path).absolutePath());
    if (normalized == m_directoryPath) {
        return;
    }

    stopWatching();
    m_directoryPath = normalized;
    m_loaded = false;
    m_staleSinceWatchStopped = false;
    m_bundleIconGeneration += 1;
    releaseBundleIcons();
    m_bundleIconAttempted.clear();

    beginResetModel();
    m_snapshot.clear();
    endResetModel();
    emit directoryPathChanged();

    refresh();
    if (m_active) {
        startWatching();
    }
}

/**
 * @brief Returns the window title for the folder.
 * @return Last path component, or the full path for the root folder.
 */
QString FolderViewModel::title() const
{
    const QString name = QFileInfo(m_directoryPath).fileName();
    return name.isEmpty() ? QDir::toNativeSeparators(m_directoryPath) : name;
}

bool FolderViewModel::active() const
{
    return m_active;
}

/**
 * @brief Follows the hosting window's activity.
 *
 * An active view watches its folder. An inactive view releases the watch; it
 * reloads when it becomes active again so changes made meanwhile show up.
 *
 * @param active True when the hosting window is in the foreground.
 */
void FolderViewModel::setActive(bool active)
{
    if (active == m_active) {
        return;
    }
    m_active = active;
    emit activeChanged();

    if (!m_active) {
        stopWatching();
        return;
    }
    if (m_staleSinceWatchStopped) {
        refresh();
    }
    startWatching();
}

qreal FolderViewModel::viewWidth() const
{
    return m_viewWidth;
}

void FolderViewModel::setViewWidth(qreal width)
{
    if (qFuzzyCompare(width, m_viewWidth)) {
        return;
    }
    m_viewWidth = width;
    emit viewWidthChanged();
}

qreal FolderViewModel::cellWidth() const
{
    return m_settings.cellWidth;
}

qreal FolderViewModel::cellHeight() const
{
    return m_settings.cellHeight;
}

qreal FolderViewModel::spacing() const
{
    return m_settings.spacing;
}

qreal FolderViewModel::margin() const
{
    return m_settings.margin;
}

/**
 * @brief Returns the layout parameters the grid is drawn with.
 * @return Layout parameters including the last reported view width.
 */
GridLayoutParams FolderViewModel::layoutParams() const
{
    GridLayoutParams params;
    params.viewWidth = m_viewWidth;
    params.cellWidth = m_settings.cellWidth;
    params.cellHeight = m_settings.cellHeight;
    params.spacing = m_settings.spacing;
    params.margin = m_settings.margin;
    return params;
}

bool FolderViewModel::watching() const
{
    return m_watching;
}

bool FolderViewModel::awaitingConfirmation() const
{
    return m_orchestrator->state() == MoveOrchestrator::State::AwaitingConfirmation;
}

QString FolderViewModel::pendingConflictName() const
{
    return m_pendingConflictName;
}

FolderSnapshot FolderViewModel::snapshot() const
{
    return m_snapshot;
}

int FolderViewModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }

    return m_snapshot.size();
}

/**
 * @brief Returns data for a given model index and role.
 * @param index Model index to read.
 * @param role Data role identifier.
 * @return Role-specific data for the index.
 */
QVariant FolderViewModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_snapshot.size()) {
        return {};
    }

    const DirectoryEntry &entry = m_snapshot.at(index.row());

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return entry.name;
    case FilePathRole:
        return entry.path;
    case FileUrlRole:
        return QUrl::fromLocalFile(entry.path);
    case IsDirRole:
        return entry.isDir;
    case IsBundleRole:
        return entry.isBundle;
    case GlyphRole:
        return IconClassifier::glyphName(IconClassifier::classify(entry));
    case IconSourceRole:
        return iconSourceFor(entry);
    default:
        return {};
    }
}

QHash<int, QByteArray> FolderViewModel::roleNames() const
{
    return {
        {FileNameRole, "fileName"},
        {FilePathRole, "filePath"},
        {FileUrlRole, "fileUrl"},
        {IsDirRole, "isDir"},
        {IsBundleRole, "isBundle"},
        {GlyphRole, "glyph"},
        {IconSourceRole, "iconSource"},
    };
}

/**
 * @brief Reloads the folder, replacing the whole snapshot on success.
 *
 * On failure the previous snapshot stays displayed and one error is reported.
 */
void FolderViewModel::refresh()
{
    if (m_directoryPath.isEmpty()) {
        return;
    }

    FolderSnapshotLoader::LoadOptions options;
    options.bundleExtensions = m_settings.bundleExtensions;
    options.caseSensitivity = m_settings.caseSensitiveSort ? Qt::CaseSensitive : Qt::CaseInsensitive;

    FolderSnapshot next;
    OperationError error;
    if (!FolderSnapshotLoader::load(m_directoryPath, &next, &error, options)) {
        qWarning() << "Cannot list" << m_directoryPath << ":" << error.reason;
        reportError(error);
        return;
    }

    beginResetModel();
    m_snapshot = next;
    endResetModel();
    m_loaded = true;

    QSet<QString> present;
    present.reserve(m_snapshot.size());
    for (const DirectoryEntry &entry : m_snapshot) {
        present.insert(entry.path);
    }
    for (auto it = m_bundleIconAttempted.begin(); it != m_bundleIconAttempted.end();) {
        if (!present.contains(*it)) {
            if (m_bundleIconLoaded.remove(*it)) {
                BundleIconCache::instance().release(*it);
            }
            it = m_bundleIconAttempted.erase(it);
        } else {
            ++it;
        }
    }

    emit snapshotReplaced();
    requestBundleIcons();
}

/**
 * @brief Opens the entry at the given row.
 *
 * Files open with the desktop's default handler, bundles are launched, and
 * plain folders are announced through folderOpenRequested for a new window.
 *
 * @param row Row index to activate.
 */
void FolderViewModel::activate(int row)
{
    if (row < 0 || row >= m_snapshot.size()) {
        return;
    }

    const DirectoryEntry entry = m_snapshot.at(row);
    if (entry.isBundle) {
        QString error;
        if (!PlatformUtils::launchBundle(entry.path, &error)) {
            reportError(OperationError::open(entry.path, error));
        }
        return;
    }
    if (entry.isDir) {
        emit folderOpenRequested(entry.path);
        return;
    }

    QString error;
    if (!PlatformUtils::openWithDefaultHandler(entry.path, &error)) {
        reportError(OperationError::open(entry.path, error));
    }
}

/**
 * @brief Returns the folder row that would receive a drop at a point.
 * @param x Horizontal position in grid content coordinates.
 * @param y Vertical position in grid content coordinates.
 * @return Row of the folder under the point, or -1.
 */
int FolderViewModel::dropTargetRowAt(qreal x, qreal y) const
{
    return DropTargetResolver::resolveTargetRow(QPointF(x, y), m_snapshot, layoutParams());
}

/**
 * @brief Handles an item dropped on the grid.
 * @param sourceUrl Local file URL carried by the drag.
 * @param x Horizontal drop position in grid content coordinates.
 * @param y Vertical drop position in grid content coordinates.
 * @return True when the item was moved or a replace confirmation is pending.
 */
bool FolderViewModel::dropAt(const QUrl &sourceUrl, qreal x, qreal y)
{
    if (!sourceUrl.isLocalFile()) {
        qWarning() << "Ignoring drop of non-local item" << sourceUrl;
        return false;
    }
    return dropPath(sourceUrl.toLocalFile(), QPointF(x, y));
}

bool FolderViewModel::dropPath(const QString &sourcePath, const QPointF &location)
{
    if (m_directoryPath.isEmpty() || sourcePath.isEmpty()) {
        return false;
    }

    const int targetRow = DropTargetResolver::resolveTargetRow(location, m_snapshot, layoutParams());
    const QString targetDirectory = targetRow == FolderViewConstants::invalidRow
        ? m_directoryPath
        : m_snapshot.at(targetRow).path;

    const MoveOrchestrator::DropResult result = m_orchestrator->submitDrop(sourcePath, targetDirectory);
    return result == MoveOrchestrator::DropResult::Moved
        || result == MoveOrchestrator::DropResult::AwaitingConfirmation;
}

bool FolderViewModel::confirmReplace()
{
    return m_orchestrator->confirmReplace();
}

void FolderViewModel::cancelReplace()
{
    m_orchestrator->cancelReplace();
}

/**
 * @brief Retries watching after a watch setup failure.
 * @return True when the folder is watched afterwards.
 */
bool FolderViewModel::restartWatching()
{
    if (!m_active) {
        return false;
    }
    refresh();
    startWatching();
    return m_watching;
}

void FolderViewModel::startWatching()
{
    if (m_directoryPath.isEmpty()) {
        return;
    }

    QString error;
    if (!m_watcher->start(m_directoryPath, &error)) {
        qWarning() << "Cannot watch" << m_directoryPath << ":" << error;
        setWatching(false);
        emit watchFailed(OperationError::watchSetup(m_directoryPath, error).toVariantMap());
        return;
    }
    m_staleSinceWatchStopped = false;
    setWatching(true);
}

void FolderViewModel::stopWatching()
{
    if (m_watcher->isActive()) {
        m_watcher->stop();
    }
    if (m_loaded) {
        m_staleSinceWatchStopped = true;
    }
    setWatching(false);
}

void FolderViewModel::setWatching(bool watching)
{
    if (watching == m_watching) {
        return;
    }
    m_watching = watching;
    emit watchingChanged();
}

/**
 * @brief Surfaces a watch the system dropped and could not restore.
 * @param path Folder that is no longer watched.
 * @param reason Failure reason.
 */
void FolderViewModel::handleWatchLost(const QString &path, const QString &reason)
{
    qWarning() << "Lost watch on" << path << ":" << reason;
    if (m_loaded) {
        m_staleSinceWatchStopped = true;
    }
    setWatching(false);
    emit watchFailed(OperationError::watchSetup(path, reason).toVariantMap());
}

void FolderViewModel::reportError(const OperationError &error)
{
    emit errorOccurred(error.toVariantMap());
}

void FolderViewModel::handleReplaceConfirmationRequested(const QString &conflictName, const QString &destinationPath)
{
    Q_UNUSED(destinationPath);
    m_pendingConflictName = conflictName;
    emit awaitingConfirmationChanged();
    emit replaceConfirmationRequested(conflictName);
}

/**
 * @brief Starts one background icon load per bundle not tried yet.
 *
 * Results come back on the UI thread through QFutureWatcher; loads started for a
 * previous folder are discarded by the generation token.
 */
void FolderViewModel::requestBundleIcons()
{
    const int token = m_bundleIconGeneration;
    const int maximumSize = static_cast<int>(qMax(m_settings.cellWidth, m_settings.cellHeight));

    for (const DirectoryEntry &entry : m_snapshot) {
        if (!entry.isBundle || m_bundleIconAttempted.contains(entry.path)) {
            continue;
        }
        m_bundleIconAttempted.insert(entry.path);

        const QString bundlePath = entry.path;
        auto future = QtConcurrent::run([bundlePath, maximumSize]() {
            return BundleIcons::loadIcon(bundlePath, maximumSize);
        });

        auto *watcher = new QFutureWatcher<QImage>(this);
        connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, watcher, token, bundlePath]() {
            const QImage image = watcher->result();
            watcher->deleteLater();

            if (token != m_bundleIconGeneration) {
                return;
            }
            applyBundleIcon(bundlePath, image);
        });
        watcher->setFuture(future);
    }
}

void FolderViewModel::applyBundleIcon(const QString &bundlePath, const QImage &image)
{
    if (image.isNull()) {
        qDebug() << "No icon found in bundle" << bundlePath;
        return;
    }
    if (!m_bundleIconAttempted.contains(bundlePath) || m_bundleIconLoaded.contains(bundlePath)) {
        return;
    }

    BundleIconCache::instance().acquire(bundlePath, image);
    m_bundleIconLoaded.insert(bundlePath);

    for (int row = 0; row < m_snapshot.size(); ++row) {
        if (m_snapshot.at(row).path == bundlePath) {
            const QModelIndex changed = index(row, 0);
            emit dataChanged(changed, changed, {IconSourceRole});
            break;
        }
    }
}

void FolderViewModel::releaseBundleIcons()
{
    for (const QString &bundlePath : std::as_const(m_bundleIconLoaded)) {
        BundleIconCache::instance().release(bundlePath);
    }
    m_bundleIconLoaded.clear();
}

QString FolderViewModel::iconSourceFor(const DirectoryEntry &entry) const
{
    if (entry.isBundle && m_bundleIconLoaded.contains(entry.path)) {
        return BundleIcons::imageSource(entry.path);
    }
    return IconClassifier::imageSource(IconClassifier::classify(entry));
}
