#pragma once

#include <QString>
#include <QStringList>

#include "DirectoryEntry.h"

struct OperationError;

namespace FolderSnapshotLoader {

struct LoadOptions {
    QStringList bundleExtensions = {QStringLiteral("app"), QStringLiteral("appdir")};
    Qt::CaseSensitivity caseSensitivity = Qt::CaseSensitive;
};

bool isHiddenName(const QString &name);
void sortEntries(FolderSnapshot &entries, Qt::CaseSensitivity caseSensitivity = Qt::CaseSensitive);
bool load(const QString &path, FolderSnapshot *snapshot, OperationError *error, const LoadOptions &options = LoadOptions());

} // namespace FolderSnapshotLoader
