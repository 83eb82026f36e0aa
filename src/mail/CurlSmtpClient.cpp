#include "coffeechat/mail/CurlSmtpClient.hpp"

#include <QLocale>
#include <QUuid>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "coffeechat/core/Logging.hpp"
#include "coffeechat/data/SecretStore.hpp"

namespace coffeechat {
namespace mail {

namespace {

struct CurlEasyDeleter
{
    void operator()(CURL *handle) const noexcept
    {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct CurlSlistDeleter
{
    void operator()(curl_slist *list) const noexcept
    {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;
using unique_curl_slist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

bool ensureCurlInitialized()
{
    static std::once_flag initOnce;
    static std::atomic<bool> initialized{ false };
    std::call_once(initOnce, []() {
        initialized.store(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK, std::memory_order_release);
    });
    return initialized.load(std::memory_order_acquire);
}

struct UploadSource
{
    const QByteArray &payload;
    std::size_t offset = 0;
};

std::size_t readFromPayload(char *buffer, std::size_t size, std::size_t nitems, void *userdata) noexcept
{
    auto *source = static_cast<UploadSource *>(userdata);
    if (!source || size == 0 || nitems == 0) {
        return 0;
    }
    const std::size_t remaining = static_cast<std::size_t>(source->payload.size()) - source->offset;
    const std::size_t take = std::min(remaining, size * nitems);
    if (take == 0) {
        return 0;
    }
    std::memcpy(buffer, source->payload.constData() + source->offset, take);
    source->offset += take;
    return take;
}

bool isAscii(const QString &value)
{
    for (const QChar ch : value) {
        if (ch.unicode() > 0x7e || (ch.unicode() < 0x20 && ch != QLatin1Char('\t'))) {
            return false;
        }
    }
    return true;
}

QByteArray messageIdFor(const QString &from)
{
    const int at = from.lastIndexOf(QLatin1Char('@'));
    const QString domain = at >= 0 ? from.mid(at + 1) : QStringLiteral("localhost");
    return "<" + QUuid::createUuid().toString(QUuid::WithoutBraces).toLatin1() + "@" + domain.toUtf8() + ">";
}

} // namespace

QByteArray encodeHeaderValue(const QString &value)
{
    if (isAscii(value)) {
        return value.toLatin1();
    }
    return "=?UTF-8?B?" + value.toUtf8().toBase64() + "?=";
}

QByteArray buildMimeMessage(const QString &from, const QString &to, const QString &subject, const QString &body,
                            const QDateTime &date)
{
    const QString dateText =
        QLocale::c().toString(date.toUTC(), QStringLiteral("ddd, dd MMM yyyy hh:mm:ss")) + QStringLiteral(" +0000");

    QString normalizedBody = body;
    normalizedBody.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    normalizedBody.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    normalizedBody.replace(QLatin1Char('\n'), QStringLiteral("\r\n"));

    QByteArray message;
    message += "Date: " + dateText.toLatin1() + "\r\n";
    message += "From: " + from.toUtf8() + "\r\n";
    message += "To: " + to.toUtf8() + "\r\n";
    message += "Subject: " + encodeHeaderValue(subject) + "\r\n";
    message += "Message-ID: " + messageIdFor(from) + "\r\n";
    message += "MIME-Version: 1.0\r\n";
    message += "Content-Type: text/plain; charset=UTF-8\r\n";
    message += "Content-Transfer-Encoding: 8bit\r\n";
    message += "\r\n";
    message += normalizedBody.toUtf8();
    if (!message.endsWith("\r\n")) {
        message += "\r\n";
    }
    return message;
}

CurlSmtpClient::CurlSmtpClient(data::SecretStore &secrets, int timeoutSeconds)
    : m_secrets(secrets)
    , m_timeoutSeconds(timeoutSeconds)
{
}

CurlSmtpClient::~CurlSmtpClient() = default;

core::Result<void> CurlSmtpClient::send(const data::SmtpSettings &smtp, const QString &from, const QString &to,
                                        const QString &subject, const QString &body)
{
    // Both addresses end up verbatim in header lines and in the MAIL FROM and RCPT TO commands.
    if (!data::isValidEmailAddress(from) || !data::isValidEmailAddress(to)) {
        qCWarning(lcMail) << "Refusing to send with a malformed address";
        return core::Result<void>::failure(core::Error::invalidInput(
            QStringLiteral("Invalid address (from '%1', to '%2')").arg(from.simplified(), to.simplified())));
    }
    if (!ensureCurlInitialized()) {
        return core::Result<void>::failure(core::Error::network(QStringLiteral("libcurl failed to initialize")));
    }
    unique_curl_easy curl{ curl_easy_init() };
    if (!curl) {
        return core::Result<void>::failure(core::Error::network(QStringLiteral("Failed to create SMTP transport")));
    }

    const bool implicitTls = smtp.port == 465;
    const std::string url = QStringLiteral("%1://%2:%3")
                                .arg(implicitTls ? QStringLiteral("smtps") : QStringLiteral("smtp"), smtp.host)
                                .arg(smtp.port)
                                .toStdString();
    const std::string username = smtp.username.toStdString();
    const std::string mailFrom = "<" + from.toStdString() + ">";
    const QByteArray payload = buildMimeMessage(from, to, subject, body, QDateTime::currentDateTimeUtc());
    UploadSource source{ payload };

    unique_curl_slist recipients{ curl_slist_append(nullptr, ("<" + to.toStdString() + ">").c_str()) };
    if (!recipients) {
        return core::Result<void>::failure(core::Error::network(QStringLiteral("Out of memory building recipients")));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readFromPayload);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &source);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(m_timeoutSeconds));

    char errorBuffer[CURL_ERROR_SIZE]{};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode code = CURLE_OK;
    {
        // The password lives only for the duration of this transfer.
        const auto password = m_secrets.get(smtp.passwordHandle());
        if (!password || password->isEmpty()) {
            return core::Result<void>::failure(core::Error::invalidInput(
                QStringLiteral("No SMTP password stored for %1").arg(smtp.username)));
        }
        std::string secret = password->toStdString();
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, secret.c_str());
        code = curl_easy_perform(curl.get());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, nullptr);
        std::fill(secret.begin(), secret.end(), '\0');
    }

    if (code != CURLE_OK) {
        long responseCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
        const QString detail = errorBuffer[0] != '\0' ? QString::fromUtf8(errorBuffer)
                                                      : QString::fromUtf8(curl_easy_strerror(code));
        qCWarning(lcMail) << "SMTP delivery to" << to << "via" << smtp.host << "failed, curl code"
                          << static_cast<int>(code) << "response" << responseCode << detail;
        return core::Result<void>::failure(
            core::Error::network(QStringLiteral("Failed to send email: %1 (SMTP %2)").arg(detail).arg(responseCode)));
    }

    qCInfo(lcMail) << "Email sent to" << to;
    return core::Result<void>::success();
}

} // namespace mail
} // namespace coffeechat
