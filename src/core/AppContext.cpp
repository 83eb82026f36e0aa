#include "coffeechat/core/AppContext.hpp"

#include <QFileInfo>
#include <QtGlobal>

#include "coffeechat/core/Logging.hpp"
#include "coffeechat/core/TaskOrchestrator.hpp"
#include "coffeechat/data/InMemorySecretStore.hpp"
#include "coffeechat/data/SettingsStore.hpp"
#include "coffeechat/mail/CurlSmtpClient.hpp"
#include "coffeechat/mail/EmailTemplate.hpp"
#include "coffeechat/net/GoogleCalendarClient.hpp"

namespace coffeechat {
namespace core {

namespace {
constexpr auto SmtpPasswordEnv = "COFFEECHAT_SMTP_PASSWORD";
}

AppContext::AppContext(BrowserLauncher launcher, const QString &settingsPath)
    : m_settingsStore(settingsPath.isEmpty() ? std::make_unique<data::SettingsStore>()
                                             : std::make_unique<data::SettingsStore>(settingsPath))
    , m_secretStore(std::make_unique<data::InMemorySecretStore>())
{
    m_settings = m_settingsStore->load();
    seedDraftFromTemplate();

    m_calendarClient = std::make_unique<net::GoogleCalendarClient>(*m_secretStore, m_settings.calendar.clientSecretsPath,
                                                                   std::move(launcher));
    m_mailClient = std::make_unique<mail::CurlSmtpClient>(*m_secretStore);
    m_orchestrator = std::make_unique<TaskOrchestrator>(*m_calendarClient, *m_mailClient);

    if (qEnvironmentVariableIsSet(SmtpPasswordEnv)) {
        m_secretStore->set(m_settings.smtp.passwordHandle(), qEnvironmentVariable(SmtpPasswordEnv));
        qCInfo(lcSettings) << "SMTP password taken from" << SmtpPasswordEnv;
    }
    if (m_settings.calendarCredential) {
        m_orchestrator->restoreCredential(*m_settings.calendarCredential);
    }
}

AppContext::~AppContext() = default;

data::AppSettings &AppContext::settings()
{
    return m_settings;
}

data::SecretStore &AppContext::secretStore()
{
    return *m_secretStore;
}

TaskOrchestrator &AppContext::orchestrator()
{
    return *m_orchestrator;
}

void AppContext::applyCalendarSettings()
{
    m_calendarClient->setClientSecretsPath(m_settings.calendar.clientSecretsPath);
}

bool AppContext::saveSettings()
{
    m_settings.calendarCredential = m_orchestrator->credential();
    return m_settingsStore->save(m_settings);
}

void AppContext::seedDraftFromTemplate()
{
    if (!m_settings.subject.isEmpty() || !m_settings.body.isEmpty()) {
        return;
    }
    if (m_settings.templatePath.isEmpty() || !QFileInfo::exists(m_settings.templatePath)) {
        return;
    }
    auto loaded = mail::EmailTemplate::load(m_settings.templatePath);
    if (!loaded) {
        qCWarning(lcSettings) << "Failed to load template:" << loaded.error().message;
        return;
    }
    m_settings.subject = loaded.value().subjectTemplate();
    m_settings.body = loaded.value().bodyTemplate();
    qCInfo(lcSettings) << "Draft seeded from" << m_settings.templatePath;
}

} // namespace core
} // namespace coffeechat
