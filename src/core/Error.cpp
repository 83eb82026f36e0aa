#include "coffeechat/core/Error.hpp"

#include <QStringList>

namespace coffeechat {
namespace core {

namespace {
Error make(ErrorCode code, QString message)
{
    Error error;
    error.code = code;
    error.message = std::move(message);
    return error;
}
} // namespace

Error Error::invalidInput(QString message)
{
    return make(ErrorCode::InvalidInput, std::move(message));
}

Error Error::notConnected(QString message)
{
    return make(ErrorCode::NotConnected, std::move(message));
}

Error Error::network(QString message)
{
    return make(ErrorCode::NetworkError, std::move(message));
}

Error Error::busy(QString message)
{
    return make(ErrorCode::Busy, std::move(message));
}

Error Error::partialSend(QVector<RecipientFailure> failures)
{
    QStringList names;
    names.reserve(failures.size());
    for (const auto &failure : failures) {
        names << QStringLiteral("%1 <%2>: %3").arg(failure.recipient.name, failure.recipient.email, failure.reason);
    }
    Error error = make(ErrorCode::PartialSendFailure,
                       QStringLiteral("Delivery failed for %1 recipient(s): %2")
                           .arg(failures.size())
                           .arg(names.join(QStringLiteral("; "))));
    error.failures = std::move(failures);
    return error;
}

QString Error::toString() const
{
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidInput:
        return QStringLiteral("InvalidInput");
    case ErrorCode::NotConnected:
        return QStringLiteral("NotConnected");
    case ErrorCode::NetworkError:
        return QStringLiteral("NetworkError");
    case ErrorCode::PartialSendFailure:
        return QStringLiteral("PartialSendFailure");
    case ErrorCode::Busy:
        return QStringLiteral("Busy");
    }
    return QStringLiteral("Unknown");
}

} // namespace core
} // namespace coffeechat
