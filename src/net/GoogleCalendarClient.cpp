#include "coffeechat/net/GoogleCalendarClient.hpp"

#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QOAuth2AuthorizationCodeFlow>
#include <QOAuthHttpServerReplyHandler>
#include <QTimer>
#include <QUrlQuery>
#include <memory>

#include "coffeechat/core/Logging.hpp"
#include "coffeechat/data/SecretStore.hpp"

namespace coffeechat {
namespace net {

namespace {
constexpr auto CalendarScope = "https://www.googleapis.com/auth/calendar.readonly";
constexpr auto FreeBusyUrl = "https://www.googleapis.com/calendar/v3/freeBusy";
constexpr auto PrimaryCalendar = "primary";
constexpr int RequestTimeoutMs = 30 * 1000;
constexpr int AuthorizationTimeoutMs = 5 * 60 * 1000;

struct HttpResponse
{
    int status = 0;
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;
};

HttpResponse postBlocking(QNetworkAccessManager &manager, QNetworkRequest request, const QByteArray &payload)
{
    request.setTransferTimeout(RequestTimeoutMs);
    std::unique_ptr<QNetworkReply> reply(manager.post(request, payload));
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }
    HttpResponse response;
    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    response.error = reply->error();
    response.errorString = reply->errorString();
    return response;
}

core::Result<data::CredentialHandle> authorizeFailure(core::Error error)
{
    qCWarning(lcCalendar) << "Calendar authorization failed:" << error.message;
    return core::Result<data::CredentialHandle>::failure(std::move(error));
}

QString apiErrorMessage(const HttpResponse &response)
{
    const QJsonObject root = QJsonDocument::fromJson(response.body).object();
    const QJsonValue error = root.value(QStringLiteral("error"));
    if (error.isObject()) {
        return error.toObject().value(QStringLiteral("message")).toString(response.errorString);
    }
    if (error.isString()) {
        return root.value(QStringLiteral("error_description")).toString(error.toString());
    }
    return response.errorString;
}
} // namespace

bool TokenSet::isExpired(const QDateTime &now) const
{
    return accessToken.isEmpty() || !expiresAt.isValid() || expiresAt <= now.addSecs(60);
}

core::Result<ClientSecrets> parseClientSecrets(const QByteArray &json)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return core::Result<ClientSecrets>::failure(
            core::Error::invalidInput(QStringLiteral("Client secrets are not valid JSON: %1").arg(parseError.errorString())));
    }
    QJsonObject root = document.object();
    if (root.contains(QStringLiteral("installed"))) {
        root = root.value(QStringLiteral("installed")).toObject();
    } else if (root.contains(QStringLiteral("web"))) {
        root = root.value(QStringLiteral("web")).toObject();
    }

    ClientSecrets secrets;
    secrets.clientId = root.value(QStringLiteral("client_id")).toString();
    secrets.clientSecret = root.value(QStringLiteral("client_secret")).toString();
    secrets.authUri = QUrl(root.value(QStringLiteral("auth_uri")).toString(QStringLiteral("https://accounts.google.com/o/oauth2/auth")));
    secrets.tokenUri = QUrl(root.value(QStringLiteral("token_uri")).toString(QStringLiteral("https://oauth2.googleapis.com/token")));
    if (secrets.clientId.isEmpty() || secrets.clientSecret.isEmpty()) {
        return core::Result<ClientSecrets>::failure(
            core::Error::invalidInput(QStringLiteral("Client secrets lack client_id or client_secret")));
    }
    return core::Result<ClientSecrets>::success(std::move(secrets));
}

core::Result<std::vector<data::Interval>> parseFreeBusyResponse(const QByteArray &json, const QString &calendarId)
{
    using BusyResult = core::Result<std::vector<data::Interval>>;
    const QJsonDocument document = QJsonDocument::fromJson(json);
    if (!document.isObject()) {
        return BusyResult::failure(core::Error::network(QStringLiteral("FreeBusy response is not a JSON object")));
    }
    const QJsonObject calendar =
        document.object().value(QStringLiteral("calendars")).toObject().value(calendarId).toObject();
    const QJsonArray errors = calendar.value(QStringLiteral("errors")).toArray();
    if (!errors.isEmpty()) {
        const QString reason = errors.first().toObject().value(QStringLiteral("reason")).toString();
        return BusyResult::failure(
            core::Error::network(QStringLiteral("Calendar '%1' reported: %2").arg(calendarId, reason)));
    }

    std::vector<data::Interval> busy;
    for (const QJsonValue &value : calendar.value(QStringLiteral("busy")).toArray()) {
        const QJsonObject period = value.toObject();
        data::Interval interval{ QDateTime::fromString(period.value(QStringLiteral("start")).toString(), Qt::ISODate),
                                 QDateTime::fromString(period.value(QStringLiteral("end")).toString(), Qt::ISODate) };
        if (!interval.isValid()) {
            qCDebug(lcCalendar) << "Skipping busy period without usable bounds" << period;
            continue;
        }
        busy.push_back(interval);
    }
    return BusyResult::success(std::move(busy));
}

QByteArray serializeTokens(const TokenSet &tokens)
{
    QJsonObject object;
    object.insert(QStringLiteral("access_token"), tokens.accessToken);
    object.insert(QStringLiteral("refresh_token"), tokens.refreshToken);
    object.insert(QStringLiteral("expires_at"), tokens.expiresAt.toUTC().toString(Qt::ISODate));
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

std::optional<TokenSet> deserializeTokens(const QString &stored)
{
    const QJsonDocument document = QJsonDocument::fromJson(stored.toUtf8());
    if (!document.isObject()) {
        return std::nullopt;
    }
    const QJsonObject object = document.object();
    TokenSet tokens;
    tokens.accessToken = object.value(QStringLiteral("access_token")).toString();
    tokens.refreshToken = object.value(QStringLiteral("refresh_token")).toString();
    tokens.expiresAt = QDateTime::fromString(object.value(QStringLiteral("expires_at")).toString(), Qt::ISODate);
    if (tokens.accessToken.isEmpty() && tokens.refreshToken.isEmpty()) {
        return std::nullopt;
    }
    return tokens;
}

GoogleCalendarClient::GoogleCalendarClient(data::SecretStore &secrets, QString clientSecretsPath, BrowserLauncher launcher)
    : m_secrets(secrets)
    , m_launcher(std::move(launcher))
    , m_clientSecretsPath(std::move(clientSecretsPath))
{
}

GoogleCalendarClient::~GoogleCalendarClient() = default;

void GoogleCalendarClient::setClientSecretsPath(const QString &path)
{
    QMutexLocker locker(&m_pathMutex);
    m_clientSecretsPath = path;
}

QString GoogleCalendarClient::clientSecretsPath() const
{
    QMutexLocker locker(&m_pathMutex);
    return m_clientSecretsPath;
}

core::Result<ClientSecrets> GoogleCalendarClient::readClientSecrets() const
{
    const QString path = clientSecretsPath();
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return core::Result<ClientSecrets>::failure(core::Error::invalidInput(
            QStringLiteral("Cannot read client secrets '%1': %2").arg(path, file.errorString())));
    }
    return parseClientSecrets(file.readAll());
}

core::Result<data::CredentialHandle> GoogleCalendarClient::authorize()
{
    auto secrets = readClientSecrets();
    if (!secrets) {
        return authorizeFailure(secrets.error());
    }
    const data::CredentialHandle handle{ QString::fromLatin1(GoogleSecretService), secrets.value().clientId };

    if (const auto stored = m_secrets.get(handle)) {
        const auto cached = deserializeTokens(*stored);
        if (cached && !cached->refreshToken.isEmpty()) {
            auto refreshed = refreshTokens(secrets.value(), *cached);
            if (refreshed) {
                qCInfo(lcCalendar) << "Reused cached calendar authorization";
                return core::Result<data::CredentialHandle>::success(handle);
            }
            qCInfo(lcCalendar) << "Cached authorization rejected, starting browser consent:"
                               << refreshed.error().message;
        }
    }

    auto tokens = runBrowserFlow(secrets.value());
    if (!tokens) {
        return authorizeFailure(tokens.error());
    }
    m_secrets.set(handle, QString::fromUtf8(serializeTokens(tokens.value())));
    qCInfo(lcCalendar) << "Calendar authorization granted";
    return core::Result<data::CredentialHandle>::success(handle);
}

core::Result<TokenSet> GoogleCalendarClient::runBrowserFlow(const ClientSecrets &secrets)
{
    QNetworkAccessManager manager;
    QOAuth2AuthorizationCodeFlow flow(&manager);
    flow.setAuthorizationUrl(secrets.authUri);
    flow.setAccessTokenUrl(secrets.tokenUri);
    flow.setClientIdentifier(secrets.clientId);
    flow.setClientIdentifierSharedKey(secrets.clientSecret);
    flow.setScope(QString::fromLatin1(CalendarScope));
    flow.setModifyParametersFunction([](QAbstractOAuth::Stage stage, QVariantMap *parameters) {
        if (stage == QAbstractOAuth::Stage::RequestingAuthorization) {
            parameters->insert(QStringLiteral("access_type"), QStringLiteral("offline"));
            parameters->insert(QStringLiteral("prompt"), QStringLiteral("consent"));
        } else if (stage == QAbstractOAuth::Stage::RequestingAccessToken) {
            // The reply handler hands over the code still percent-encoded.
            const QByteArray code = parameters->value(QStringLiteral("code")).toByteArray();
            parameters->insert(QStringLiteral("code"), QUrl::fromPercentEncoding(code));
        }
    });

    auto *replyHandler = new QOAuthHttpServerReplyHandler(0, &flow);
    if (!replyHandler->isListening()) {
        return core::Result<TokenSet>::failure(
            core::Error::network(QStringLiteral("Cannot listen for the OAuth redirect on the loopback interface")));
    }
    flow.setReplyHandler(replyHandler);

    QEventLoop loop;
    bool granted = false;
    QString failure;
    QObject::connect(&flow, &QOAuth2AuthorizationCodeFlow::authorizeWithBrowser, &loop, [this](const QUrl &url) {
        qCInfo(lcCalendar) << "Opening consent page in the browser";
        if (m_launcher) {
            m_launcher(url);
        }
    });
    QObject::connect(&flow, &QAbstractOAuth::granted, &loop, [&]() {
        granted = true;
        loop.quit();
    });
    QObject::connect(&flow, &QAbstractOAuth2::error, &loop,
                     [&](const QString &error, const QString &description, const QUrl &) {
                         failure = description.isEmpty() ? error : QStringLiteral("%1: %2").arg(error, description);
                         loop.quit();
                     });
    QTimer::singleShot(AuthorizationTimeoutMs, &loop, [&]() {
        failure = QStringLiteral("Timed out waiting for browser consent");
        loop.quit();
    });

    flow.grant();
    loop.exec();

    if (!granted) {
        return core::Result<TokenSet>::failure(core::Error::network(
            QStringLiteral("Calendar connection failed: %1").arg(failure.isEmpty() ? QStringLiteral("not granted") : failure)));
    }
    TokenSet tokens;
    tokens.accessToken = flow.token();
    tokens.refreshToken = flow.refreshToken();
    tokens.expiresAt = flow.expirationAt().isValid() ? flow.expirationAt() : QDateTime::currentDateTimeUtc().addSecs(3600);
    return core::Result<TokenSet>::success(std::move(tokens));
}

core::Result<TokenSet> GoogleCalendarClient::refreshTokens(const ClientSecrets &secrets, const TokenSet &tokens)
{
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("client_id"), secrets.clientId);
    form.addQueryItem(QStringLiteral("client_secret"), secrets.clientSecret);
    form.addQueryItem(QStringLiteral("refresh_token"), tokens.refreshToken);
    form.addQueryItem(QStringLiteral("grant_type"), QStringLiteral("refresh_token"));

    QNetworkRequest request(secrets.tokenUri);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/x-www-form-urlencoded"));

    QNetworkAccessManager manager;
    const HttpResponse response = postBlocking(manager, request, form.toString(QUrl::FullyEncoded).toUtf8());
    if (response.error != QNetworkReply::NoError || response.status != 200) {
        return core::Result<TokenSet>::failure(
            core::Error::network(QStringLiteral("Token refresh failed: %1").arg(apiErrorMessage(response))));
    }

    const QJsonObject object = QJsonDocument::fromJson(response.body).object();
    TokenSet refreshed = tokens;
    refreshed.accessToken = object.value(QStringLiteral("access_token")).toString();
    refreshed.expiresAt = QDateTime::currentDateTimeUtc().addSecs(object.value(QStringLiteral("expires_in")).toInt(3600));
    if (object.contains(QStringLiteral("refresh_token"))) {
        refreshed.refreshToken = object.value(QStringLiteral("refresh_token")).toString();
    }
    if (refreshed.accessToken.isEmpty()) {
        return core::Result<TokenSet>::failure(core::Error::network(QStringLiteral("Token refresh returned no access token")));
    }
    m_secrets.set({ QString::fromLatin1(GoogleSecretService), secrets.clientId },
                  QString::fromUtf8(serializeTokens(refreshed)));
    return core::Result<TokenSet>::success(std::move(refreshed));
}

core::Result<std::vector<data::Interval>> GoogleCalendarClient::listBusyEvents(const data::CredentialHandle &credential,
                                                                               const data::Interval &range)
{
    using BusyResult = core::Result<std::vector<data::Interval>>;

    std::optional<TokenSet> tokens;
    if (const auto stored = m_secrets.get(credential)) {
        tokens = deserializeTokens(*stored);
    }
    if (!tokens) {
        return BusyResult::failure(
            core::Error::notConnected(QStringLiteral("No calendar authorization stored, connect the calendar again")));
    }

    std::optional<ClientSecrets> clientSecrets;
    auto ensureFreshTokens = [&]() -> std::optional<core::Error> {
        if (!clientSecrets) {
            auto read = readClientSecrets();
            if (!read) {
                return read.error();
            }
            clientSecrets = read.takeValue();
        }
        auto refreshed = refreshTokens(*clientSecrets, *tokens);
        if (!refreshed) {
            return refreshed.error();
        }
        tokens = refreshed.takeValue();
        return std::nullopt;
    };

    if (tokens->isExpired(QDateTime::currentDateTimeUtc()) && !tokens->refreshToken.isEmpty()) {
        if (auto error = ensureFreshTokens()) {
            return BusyResult::failure(*error);
        }
    }

    QJsonObject item;
    item.insert(QStringLiteral("id"), QString::fromLatin1(PrimaryCalendar));
    QJsonObject body;
    body.insert(QStringLiteral("timeMin"), range.start.toUTC().toString(Qt::ISODate));
    body.insert(QStringLiteral("timeMax"), range.end.toUTC().toString(Qt::ISODate));
    body.insert(QStringLiteral("timeZone"), QStringLiteral("UTC"));
    body.insert(QStringLiteral("items"), QJsonArray{ item });
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);

    QNetworkAccessManager manager;
    auto query = [&]() {
        QNetworkRequest request{ QUrl(QString::fromLatin1(FreeBusyUrl)) };
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
        request.setRawHeader("Authorization", "Bearer " + tokens->accessToken.toUtf8());
        return postBlocking(manager, request, payload);
    };

    qCInfo(lcCalendar) << "Querying FreeBusy between" << range.start << "and" << range.end;
    HttpResponse response = query();
    if (response.status == 401 && !tokens->refreshToken.isEmpty()) {
        qCInfo(lcCalendar) << "Access token rejected, refreshing once";
        if (auto error = ensureFreshTokens()) {
            return BusyResult::failure(*error);
        }
        response = query();
    }
    if (response.error != QNetworkReply::NoError || response.status != 200) {
        qCWarning(lcCalendar) << "FreeBusy query failed with HTTP" << response.status << response.errorString;
        return BusyResult::failure(
            core::Error::network(QStringLiteral("Slot fetching failed: %1").arg(apiErrorMessage(response))));
    }

    auto busy = parseFreeBusyResponse(response.body, QString::fromLatin1(PrimaryCalendar));
    if (busy) {
        qCInfo(lcCalendar) << "Found" << busy.value().size() << "busy periods";
    }
    return busy;
}

} // namespace net
} // namespace coffeechat
