#include "coffeechat/data/SettingsStore.hpp"

#include <QSettings>
#include <QtGlobal>

#include "coffeechat/core/Logging.hpp"

namespace coffeechat {
namespace data {

namespace {
constexpr int MaxLookaheadDays = 60;

int boundedInt(const QSettings &settings, const QString &key, int fallback, int low, int high)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        return fallback;
    }
    if (value < low || value > high) {
        qCWarning(lcSettings) << "Clamping" << key << "value" << value << "to" << low << "-" << high;
    }
    return qBound(low, value, high);
}
} // namespace

SettingsStore::SettingsStore()
    : m_settings(std::make_unique<QSettings>())
{
}

SettingsStore::SettingsStore(const QString &iniPath)
    : m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

SettingsStore::~SettingsStore() = default;

QString SettingsStore::location() const
{
    return m_settings->fileName();
}

AppSettings SettingsStore::load() const
{
    const QSettings &settings = *m_settings;
    const AppSettings defaults;
    AppSettings result;

    result.senderName = settings.value(QStringLiteral("draft/senderName")).toString();
    result.subject = settings.value(QStringLiteral("draft/subject")).toString();
    result.body = settings.value(QStringLiteral("draft/body")).toString();
    result.templatePath = settings.value(QStringLiteral("draft/templatePath"), defaults.templatePath).toString();

    result.smtp.host = settings.value(QStringLiteral("smtp/host")).toString();
    result.smtp.port = static_cast<quint16>(boundedInt(settings, QStringLiteral("smtp/port"), defaults.smtp.port, 1, 65535));
    result.smtp.username = settings.value(QStringLiteral("smtp/username")).toString();
    result.smtp.fromAddress = settings.value(QStringLiteral("smtp/fromAddress")).toString().trimmed();
    if (!result.smtp.fromAddress.isEmpty() && !isValidEmailAddress(result.smtp.fromAddress)) {
        qCWarning(lcSettings) << "Ignoring malformed sender address in" << location();
        result.smtp.fromAddress.clear();
    }

    auto &calendar = result.calendar;
    calendar.bufferMinutes =
        boundedInt(settings, QStringLiteral("calendar/bufferMinutes"), defaults.calendar.bufferMinutes, 0, MaxBufferMinutes);
    calendar.dayStartHour =
        boundedInt(settings, QStringLiteral("calendar/dayStartHour"), defaults.calendar.dayStartHour, 0, 23);
    calendar.dayEndHour = boundedInt(settings, QStringLiteral("calendar/dayEndHour"), defaults.calendar.dayEndHour, 1, 24);
    if (calendar.dayEndHour <= calendar.dayStartHour) {
        qCWarning(lcSettings) << "Stored day window" << calendar.dayStartHour << "-" << calendar.dayEndHour
                              << "is empty, extending the end";
        calendar.dayEndHour = calendar.dayStartHour + 1;
    }
    calendar.minDurationMinutes = boundedInt(settings, QStringLiteral("calendar/minDurationMinutes"),
                                             defaults.calendar.minDurationMinutes, 0, MinutesPerDay);
    calendar.lookaheadDays = boundedInt(settings, QStringLiteral("calendar/lookaheadDays"),
                                        defaults.calendar.lookaheadDays, 1, MaxLookaheadDays);
    calendar.clientSecretsPath =
        settings.value(QStringLiteral("calendar/clientSecretsPath"), defaults.calendar.clientSecretsPath).toString();

    const CredentialHandle credential{ settings.value(QStringLiteral("calendar/credentialService")).toString(),
                                       settings.value(QStringLiteral("calendar/credentialAccount")).toString() };
    if (credential.isValid()) {
        result.calendarCredential = credential;
    }

    const int count = m_settings->beginReadArray(QStringLiteral("recipients"));
    for (int i = 0; i < count; ++i) {
        m_settings->setArrayIndex(i);
        Recipient recipient;
        recipient.name = m_settings->value(QStringLiteral("name")).toString();
        recipient.email = m_settings->value(QStringLiteral("email")).toString().trimmed();
        if (!isValidEmailAddress(recipient.email)) {
            if (!recipient.email.isEmpty()) {
                qCWarning(lcSettings) << "Dropping recipient" << i << "with a malformed address";
            }
            continue;
        }
        result.recipients.append(recipient);
    }
    m_settings->endArray();

    qCDebug(lcSettings) << "Loaded settings from" << location() << "with" << result.recipients.size() << "recipients";
    return result;
}

bool SettingsStore::save(const AppSettings &settings)
{
    QSettings &out = *m_settings;
    out.setValue(QStringLiteral("draft/senderName"), settings.senderName);
    out.setValue(QStringLiteral("draft/subject"), settings.subject);
    out.setValue(QStringLiteral("draft/body"), settings.body);
    out.setValue(QStringLiteral("draft/templatePath"), settings.templatePath);

    out.setValue(QStringLiteral("smtp/host"), settings.smtp.host);
    out.setValue(QStringLiteral("smtp/port"), settings.smtp.port);
    out.setValue(QStringLiteral("smtp/username"), settings.smtp.username);
    out.setValue(QStringLiteral("smtp/fromAddress"), settings.smtp.fromAddress);

    out.setValue(QStringLiteral("calendar/bufferMinutes"), settings.calendar.bufferMinutes);
    out.setValue(QStringLiteral("calendar/dayStartHour"), settings.calendar.dayStartHour);
    out.setValue(QStringLiteral("calendar/dayEndHour"), settings.calendar.dayEndHour);
    out.setValue(QStringLiteral("calendar/minDurationMinutes"), settings.calendar.minDurationMinutes);
    out.setValue(QStringLiteral("calendar/lookaheadDays"), settings.calendar.lookaheadDays);
    out.setValue(QStringLiteral("calendar/clientSecretsPath"), settings.calendar.clientSecretsPath);
    if (settings.calendarCredential) {
        out.setValue(QStringLiteral("calendar/credentialService"), settings.calendarCredential->serviceId);
        out.setValue(QStringLiteral("calendar/credentialAccount"), settings.calendarCredential->accountId);
    } else {
        out.remove(QStringLiteral("calendar/credentialService"));
        out.remove(QStringLiteral("calendar/credentialAccount"));
    }

    out.remove(QStringLiteral("recipients"));
    out.beginWriteArray(QStringLiteral("recipients"), settings.recipients.size());
    for (int i = 0; i < settings.recipients.size(); ++i) {
        out.setArrayIndex(i);
        out.setValue(QStringLiteral("name"), settings.recipients.at(i).name);
        out.setValue(QStringLiteral("email"), settings.recipients.at(i).email);
    }
    out.endArray();

    out.sync();
    if (out.status() != QSettings::NoError) {
        qCWarning(lcSettings) << "Failed to write settings to" << location();
        return false;
    }
    return true;
}

} // namespace data
} // namespace coffeechat
