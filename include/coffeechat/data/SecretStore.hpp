#pragma once

#include <QString>
#include <optional>

#include "coffeechat/data/CredentialHandle.hpp"

namespace coffeechat {
namespace data {

class SecretStore
{
public:
    virtual ~SecretStore() = default;

    virtual std::optional<QString> get(const CredentialHandle &handle) const = 0;
    virtual void set(const CredentialHandle &handle, const QString &secret) = 0;
    virtual bool remove(const CredentialHandle &handle) = 0;
};

} // namespace data
} // namespace coffeechat
