#include "coffeechat/data/InMemorySecretStore.hpp"

#include <QMutexLocker>

namespace coffeechat {
namespace data {

InMemorySecretStore::InMemorySecretStore() = default;
InMemorySecretStore::~InMemorySecretStore() = default;

std::optional<QString> InMemorySecretStore::get(const CredentialHandle &handle) const
{
    if (!handle.isValid()) {
        return std::nullopt;
    }
    QMutexLocker locker(&m_mutex);
    const auto it = m_secrets.constFind(keyFor(handle));
    if (it == m_secrets.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void InMemorySecretStore::set(const CredentialHandle &handle, const QString &secret)
{
    if (!handle.isValid()) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    m_secrets.insert(keyFor(handle), secret);
}

bool InMemorySecretStore::remove(const CredentialHandle &handle)
{
    QMutexLocker locker(&m_mutex);
    return m_secrets.remove(keyFor(handle)) > 0;
}

QString InMemorySecretStore::keyFor(const CredentialHandle &handle)
{
    return handle.serviceId + QLatin1Char('\n') + handle.accountId;
}

} // namespace data
} // namespace coffeechat
