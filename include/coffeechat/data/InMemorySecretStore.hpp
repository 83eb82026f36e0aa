#pragma once

#include <QHash>
#include <QMutex>

#include "coffeechat/data/SecretStore.hpp"

namespace coffeechat {
namespace data {

// Session-only store; safe to share between the UI thread and background tasks.
class InMemorySecretStore : public SecretStore
{
public:
    InMemorySecretStore();
    ~InMemorySecretStore() override;

    std::optional<QString> get(const CredentialHandle &handle) const override;
    void set(const CredentialHandle &handle, const QString &secret) override;
    bool remove(const CredentialHandle &handle) override;

private:
    static QString keyFor(const CredentialHandle &handle);

    mutable QMutex m_mutex;
    QHash<QString, QString> m_secrets;
};

} // namespace data
} // namespace coffeechat
