#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rwCore)
Q_DECLARE_LOGGING_CATEGORY(rwKb)
Q_DECLARE_LOGGING_CATEGORY(rwExplain)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
