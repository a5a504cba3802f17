#pragma once

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

class QQmlComponent;
class QQmlEngine;
class QQuickWindow;

class WindowManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int windowCount READ windowCount NOTIFY windowCountChanged)

public:
    explicit WindowManager(QQmlEngine *engine, const QUrl &windowUrl, QObject *parent = nullptr);

    int windowCount() const;

    Q_INVOKABLE bool openFolder(const QString &path);

signals:
    void windowCountChanged();

private:
    void releaseWindow(QQuickWindow *window);

    QQmlEngine *m_engine = nullptr;
    QQmlComponent *m_component = nullptr;
    QList<QPointer<QQuickWindow>> m_windows;
};
