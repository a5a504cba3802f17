#pragma once

#include <QFileSystemWatcher>
#include <QObject>
#include <QString>
#include <QTimer>

class DirectoryWatcher : public QObject
{
    Q_OBJECT

public:
    explicit DirectoryWatcher(QObject *parent = nullptr);
    ~DirectoryWatcher() override;

    bool start(const QString &path, QString *error = nullptr);
    void stop();

    bool isActive() const;
    QString path() const;

    int debounceInterval() const;
    void setDebounceInterval(int msec);

signals:
    void directoryChanged(const QString &path);
    void watchLost(const QString &path, const QString &reason);

private:
    void handleDirectoryChanged(const QString &path);
    void deliverChange();
    void rearmIfDropped();
    void releasePaths();

    QFileSystemWatcher m_watcher;
    QTimer m_debounceTimer;
    QString m_path;
    // Watched instead of m_path while the folder is missing.
    QString m_parentPath;
    bool m_active = false;
};
