#pragma once

#include <QString>
#include <QUrl>
#include <functional>
#include <memory>

#include "coffeechat/data/AppSettings.hpp"

namespace coffeechat {
namespace data {
class SecretStore;
class SettingsStore;
}
namespace net {
class GoogleCalendarClient;
}
namespace mail {
class CurlSmtpClient;
}

namespace core {

class TaskOrchestrator;

class AppContext
{
public:
    using BrowserLauncher = std::function<void(const QUrl &)>;

    // An empty settingsPath selects the platform's native settings location.
    explicit AppContext(BrowserLauncher launcher, const QString &settingsPath = QString());
    ~AppContext();

    data::AppSettings &settings();
    data::SecretStore &secretStore();
    TaskOrchestrator &orchestrator();

    // Propagates edited calendar settings to the calendar client.
    void applyCalendarSettings();
    bool saveSettings();

private:
    void seedDraftFromTemplate();

    std::unique_ptr<data::SettingsStore> m_settingsStore;
    std::unique_ptr<data::SecretStore> m_secretStore;
    std::unique_ptr<net::GoogleCalendarClient> m_calendarClient;
    std::unique_ptr<mail::CurlSmtpClient> m_mailClient;
    std::unique_ptr<TaskOrchestrator> m_orchestrator;
    data::AppSettings m_settings;
};

} // namespace core
} // namespace coffeechat
