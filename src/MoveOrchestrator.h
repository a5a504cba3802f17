#pragma once

#include <QObject>
#include <QString>

#include "OperationError.h"

struct PendingMove {
    QString sourcePath;
    QString destinationPath;

    bool isValid() const { return !sourcePath.isEmpty(); }
};

class MoveOrchestrator : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum class State {
        Idle,
        ResolvingDestination,
        AwaitingConfirmation,
        Moving,
        Replacing
    };
    Q_ENUM(State)

    enum class DropResult {
        Rejected,
        Cancelled,
        Moved,
        AwaitingConfirmation,
        Failed
    };
    Q_ENUM(DropResult)

    explicit MoveOrchestrator(QObject *parent = nullptr);

    State state() const;
    PendingMove pendingMove() const;

    DropResult submitDrop(const QString &sourcePath, const QString &targetDirectory);
    bool confirmReplace();
    void cancelReplace();

    static QString destinationFor(const QString &sourcePath, const QString &targetDirectory);

signals:
    void stateChanged();
    void replaceConfirmationRequested(const QString &conflictName, const QString &destinationPath);
    void contentsChanged();
    void operationFailed(const OperationError &error);

private:
    void setState(State state);
    void resetMoveState();
    DropResult performMove();
    bool performReplace();

    State m_state = State::Idle;
    PendingMove m_pending;
};
