#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

class QSettings;

struct AppSettings {
    QString startDirectory;
    qreal cellWidth = 100.0;
    qreal cellHeight = 100.0;
    qreal spacing = 20.0;
    qreal margin = 20.0;
    bool caseSensitiveSort = true;
    int watcherDebounceMs = 150;
    QStringList bundleExtensions;

    AppSettings();

    static AppSettings load();
    static AppSettings load(const QSettings &settings);
};
