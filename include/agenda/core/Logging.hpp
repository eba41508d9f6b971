#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(AGENDA_TIMEZONE_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_RECURRENCE_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_CONFLICTS_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_AVAILABILITY_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_DATA_LOG)
