#pragma once

#include <QMetaType>
#include <QString>
#include <QVariantMap>

struct OperationError {
    enum class Kind {
        Filesystem,
        Move,
        Replace,
        Open,
        WatchSetup
    };

    Kind kind = Kind::Filesystem;
    QString path;
    QString destination;
    QString reason;

    static OperationError filesystem(const QString &path, const QString &reason);
    static OperationError move(const QString &source, const QString &destination, const QString &reason);
    static OperationError replace(const QString &source, const QString &destination, const QString &reason);
    static OperationError open(const QString &path, const QString &reason);
    static OperationError watchSetup(const QString &path, const QString &reason);

    QString kindKey() const;
    QString title() const;
    QString message() const;
    QVariantMap toVariantMap() const;
};

Q_DECLARE_METATYPE(OperationError)
