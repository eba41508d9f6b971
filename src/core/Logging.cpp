#include "agenda/core/Logging.hpp"

Q_LOGGING_CATEGORY(AGENDA_TIMEZONE_LOG, "agenda.timezone", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_RECURRENCE_LOG, "agenda.recurrence", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_CONFLICTS_LOG, "agenda.conflicts", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_AVAILABILITY_LOG, "agenda.availability", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_DATA_LOG, "agenda.data", QtInfoMsg)
