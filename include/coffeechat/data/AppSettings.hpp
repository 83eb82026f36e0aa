#pragma once

#include <QDateTime>
#include <QString>
#include <QVector>
#include <optional>

#include "coffeechat/data/CredentialHandle.hpp"
#include "coffeechat/data/Interval.hpp"
#include "coffeechat/data/Recipient.hpp"

namespace coffeechat {
namespace data {

constexpr auto SmtpSecretService = "coffeechat.smtp";

struct SmtpSettings
{
    QString host;
    quint16 port = 587;
    QString username;
    QString fromAddress;

    CredentialHandle passwordHandle() const
    {
        return { QString::fromLatin1(SmtpSecretService), username };
    }
    bool isComplete() const
    {
        return !host.isEmpty() && !username.isEmpty() && isValidEmailAddress(fromAddress);
    }
};

struct CalendarSettings
{
    int bufferMinutes = 15;
    int dayStartHour = 9;
    int dayEndHour = 21;
    int minDurationMinutes = 30;
    int lookaheadDays = 14;
    QString clientSecretsPath = QStringLiteral("credentials.json");

    SlotQuery toQuery(const QDateTime &now) const;
};

struct AppSettings
{
    QString senderName;
    QString subject;
    QString body;
    QString templatePath = QStringLiteral("email_template.txt");
    QVector<Recipient> recipients;
    SmtpSettings smtp;
    CalendarSettings calendar;
    std::optional<CredentialHandle> calendarCredential;
};

} // namespace data
} // namespace coffeechat
