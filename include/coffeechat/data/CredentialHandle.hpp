#pragma once

#include <QString>

namespace coffeechat {
namespace data {

// Opaque reference to a secret held by a SecretStore. Never carries the secret itself.
struct CredentialHandle
{
    QString serviceId;
    QString accountId;

    bool isValid() const { return !serviceId.isEmpty() && !accountId.isEmpty(); }
};

inline bool operator==(const CredentialHandle &lhs, const CredentialHandle &rhs)
{
    return lhs.serviceId == rhs.serviceId && lhs.accountId == rhs.accountId;
}

inline bool operator!=(const CredentialHandle &lhs, const CredentialHandle &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace coffeechat
