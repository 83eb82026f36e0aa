#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QUrl>
#include <functional>

#include "coffeechat/net/CalendarClient.hpp"

namespace coffeechat {
namespace data {
class SecretStore;
}

namespace net {

constexpr auto GoogleSecretService = "coffeechat.google";

struct ClientSecrets
{
    QString clientId;
    QString clientSecret;
    QUrl authUri;
    QUrl tokenUri;
};

struct TokenSet
{
    QString accessToken;
    QString refreshToken;
    QDateTime expiresAt;

    bool isExpired(const QDateTime &now) const;
};

// Accepts the credentials.json downloaded from the Google Cloud console ("installed" or "web").
core::Result<ClientSecrets> parseClientSecrets(const QByteArray &json);
core::Result<std::vector<data::Interval>> parseFreeBusyResponse(const QByteArray &json, const QString &calendarId);
QByteArray serializeTokens(const TokenSet &tokens);
std::optional<TokenSet> deserializeTokens(const QString &stored);

// Google Calendar access through the FreeBusy endpoint. Calls block on a local event
// loop and are meant for background threads. Tokens live in the SecretStore; the
// returned handle only names them.
class GoogleCalendarClient : public CalendarClient
{
public:
    using BrowserLauncher = std::function<void(const QUrl &)>;

    GoogleCalendarClient(data::SecretStore &secrets, QString clientSecretsPath, BrowserLauncher launcher);
    ~GoogleCalendarClient() override;

    core::Result<data::CredentialHandle> authorize() override;
    core::Result<std::vector<data::Interval>> listBusyEvents(const data::CredentialHandle &credential,
                                                             const data::Interval &range) override;

    void setClientSecretsPath(const QString &path);
    QString clientSecretsPath() const;

private:
    core::Result<ClientSecrets> readClientSecrets() const;
    core::Result<TokenSet> runBrowserFlow(const ClientSecrets &secrets);
    core::Result<TokenSet> refreshTokens(const ClientSecrets &secrets, const TokenSet &tokens);

    data::SecretStore &m_secrets;
    BrowserLauncher m_launcher;
    mutable QMutex m_pathMutex;
    QString m_clientSecretsPath;
};

} // namespace net
} // namespace coffeechat
