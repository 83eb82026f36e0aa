#pragma once

#include <QString>
#include <QVector>

#include "coffeechat/data/Recipient.hpp"

namespace coffeechat {
namespace core {

enum class ErrorCode
{
    InvalidInput,
    NotConnected,
    NetworkError,
    PartialSendFailure,
    Busy,
};

struct RecipientFailure
{
    data::Recipient recipient;
    QString reason;
};

struct Error
{
    ErrorCode code = ErrorCode::InvalidInput;
    QString message;
    // Only populated for PartialSendFailure.
    QVector<RecipientFailure> failures;

    static Error invalidInput(QString message);
    static Error notConnected(QString message);
    static Error network(QString message);
    static Error busy(QString message);
    static Error partialSend(QVector<RecipientFailure> failures);

    QString toString() const;
};

QString errorCodeName(ErrorCode code);

} // namespace core
} // namespace coffeechat
