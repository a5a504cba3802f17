#pragma once

#include <QAbstractListModel>
#include <QHash>
#include <QImage>
#include <QPointF>
#include <QSet>
#include <QUrl>
#include <QVariantMap>

#include <QtQml/qqml.h>

#include "AppSettings.h"
#include "DirectoryEntry.h"
#include "GridLayout.h"
#include "OperationError.h"

class DirectoryWatcher;
class MoveOrchestrator;

class FolderViewModel : public QAbstractListModel
{
    Q_OBJECT
    QML_ELEMENT

    Q_PROPERTY(QString directoryPath READ directoryPath WRITE setDirectoryPath NOTIFY directoryPathChanged)
    Q_PROPERTY(QString title READ title NOTIFY directoryPathChanged)
    Q_PROPERTY(bool active READ active WRITE setActive NOTIFY activeChanged)
    Q_PROPERTY(qreal viewWidth READ viewWidth WRITE setViewWidth NOTIFY viewWidthChanged)
    Q_PROPERTY(qreal cellWidth READ cellWidth CONSTANT)
    Q_PROPERTY(qreal cellHeight READ cellHeight CONSTANT)
    Q_PROPERTY(qreal spacing READ spacing CONSTANT)
    Q_PROPERTY(qreal margin READ margin CONSTANT)
    Q_PROPERTY(bool watching READ watching NOTIFY watchingChanged)
    Q_PROPERTY(bool awaitingConfirmation READ awaitingConfirmation NOTIFY awaitingConfirmationChanged)
    Q_PROPERTY(QString pendingConflictName READ pendingConflictName NOTIFY awaitingConfirmationChanged)

public:
    enum Role {
        FileNameRole = Qt::UserRole + 1,
        FilePathRole,
        FileUrlRole,
        IsDirRole,
        IsBundleRole,
        GlyphRole,
        IconSourceRole
    };
    Q_ENUM(Role)

    explicit FolderViewModel(QObject *parent = nullptr);
    FolderViewModel(const AppSettings &settings, QObject *parent = nullptr);
    ~FolderViewModel() override;

    QString directoryPath() const;
    void setDirectoryPath(const QString &path);
    QString title() const;

    bool active() const;
    void setActive(bool active);

    qreal viewWidth() const;
    void setViewWidth(qreal width);
    qreal cellWidth() const;
    qreal cellHeight() const;
    qreal spacing() const;
    qreal margin() const;
    GridLayoutParams layoutParams() const;

    bool watching() const;
    bool awaitingConfirmation() const;
    QString pendingConflictName() const;

    FolderSnapshot snapshot() const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE void refresh();
    Q_INVOKABLE void activate(int row);
    Q_INVOKABLE int dropTargetRowAt(qreal x, qreal y) const;
    Q_INVOKABLE bool dropAt(const QUrl &sourceUrl, qreal x, qreal y);
    Q_INVOKABLE bool confirmReplace();
    Q_INVOKABLE void cancelReplace();
    Q_INVOKABLE bool restartWatching();

    bool dropPath(const QString &sourcePath, const QPointF &location);

signals:
    void directoryPathChanged();
    void activeChanged();
    void viewWidthChanged();
    void watchingChanged();
    void awaitingConfirmationChanged();
    void snapshotReplaced();

    void folderOpenRequested(const QString &path);
    void replaceConfirmationRequested(const QString &conflictName);
    void errorOccurred(QVariantMap error);
    void watchFailed(QVariantMap error);

private:
    void startWatching();
    void stopWatching();
    void setWatching(bool watching);
    void reportError(const OperationError &error);
    void handleReplaceConfirmationRequested(const QString &conflictName, const QString &destinationPath);
    void handleWatchLost(const QString &path, const QString &reason);
    void releaseBundleIcons();
    void requestBundleIcons();
    void applyBundleIcon(const QString &bundlePath, const QImage &image);
    QString iconSourceFor(const DirectoryEntry &entry) const;

    AppSettings m_settings;
    QString m_directoryPath;
    bool m_active = false;
    bool m_watching = false;
    bool m_loaded = false;
    bool m_staleSinceWatchStopped = false;
    qreal m_viewWidth = -1.0;
    QString m_pendingConflictName;

    FolderSnapshot m_snapshot;
    QSet<QString> m_bundleIconAttempted;
    QSet<QString> m_bundleIconLoaded;
    int m_bundleIconGeneration = 0;

    DirectoryWatcher *m_watcher = nullptr;
    MoveOrchestrator *m_orchestrator = nullptr;
};
