#pragma once

#include <QString>

namespace coffeechat {
namespace data {

// A bare "local@domain" address that is safe to place in a header line and an SMTP
// envelope command: exactly one '@', non-empty local and domain parts, and no
// whitespace, control characters, angle brackets or list separators.
bool isValidEmailAddress(const QString &address);

struct Recipient
{
    QString name;
    QString email;

    bool isValid() const { return !name.trimmed().isEmpty() && isValidEmailAddress(email); }
};

inline bool operator==(const Recipient &lhs, const Recipient &rhs)
{
    return lhs.name == rhs.name && lhs.email == rhs.email;
}

} // namespace data
} // namespace coffeechat
