#pragma once

#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isSameOrInside(const QString &path, const QString &ancestor);
bool deletePermanently(const QString &path, QString *error);
bool openWithDefaultHandler(const QString &path, QString *error);
bool launchBundle(const QString &path, QString *error);

} // namespace PlatformUtils
