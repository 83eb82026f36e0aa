#include "coffeechat/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcSlots, "coffeechat.slots")
Q_LOGGING_CATEGORY(lcOrchestrator, "coffeechat.orchestrator")
Q_LOGGING_CATEGORY(lcCalendar, "coffeechat.calendar")
Q_LOGGING_CATEGORY(lcMail, "coffeechat.mail")
Q_LOGGING_CATEGORY(lcSettings, "coffeechat.settings")
