#pragma once

#include <QByteArray>
#include <QDateTime>

#include "coffeechat/mail/MailClient.hpp"

namespace coffeechat {
namespace data {
class SecretStore;
}

namespace mail {

// RFC 5322 message with a UTF-8 plain text body and CRLF line endings.
QByteArray buildMimeMessage(const QString &from, const QString &to, const QString &subject, const QString &body,
                            const QDateTime &date);

// RFC 2047 "B" encoding for header values that are not plain ASCII.
QByteArray encodeHeaderValue(const QString &value);

class CurlSmtpClient : public MailClient
{
public:
    explicit CurlSmtpClient(data::SecretStore &secrets, int timeoutSeconds = 60);
    ~CurlSmtpClient() override;

    core::Result<void> send(const data::SmtpSettings &smtp, const QString &from, const QString &to,
                            const QString &subject, const QString &body) override;

private:
    data::SecretStore &m_secrets;
    int m_timeoutSeconds = 60;
};

} // namespace mail
} // namespace coffeechat
