#pragma once

#include <QString>

#include "coffeechat/core/Result.hpp"
#include "coffeechat/data/AppSettings.hpp"

namespace coffeechat {
namespace mail {

// One delivery attempt per call. Blocking; only called from background tasks.
class MailClient
{
public:
    virtual ~MailClient() = default;

    virtual core::Result<void> send(const data::SmtpSettings &smtp, const QString &from, const QString &to,
                                    const QString &subject, const QString &body) = 0;
};

} // namespace mail
} // namespace coffeechat
