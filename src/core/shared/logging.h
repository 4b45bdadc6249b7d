#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rcCore)
Q_DECLARE_LOGGING_CATEGORY(rcIndex)
Q_DECLARE_LOGGING_CATEGORY(rcRanking)
Q_DECLARE_LOGGING_CATEGORY(rcCorpus)
Q_DECLARE_LOGGING_CATEGORY(rcModels)
Q_DECLARE_LOGGING_CATEGORY(rcIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
