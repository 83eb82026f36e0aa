#pragma once

#include <QString>
#include <memory>

#include "coffeechat/data/AppSettings.hpp"

class QSettings;

namespace coffeechat {
namespace data {

// Persists the AppSettings snapshot. Secrets are not part of AppSettings and are never written.
class SettingsStore
{
public:
    SettingsStore();
    explicit SettingsStore(const QString &iniPath);
    ~SettingsStore();

    AppSettings load() const;
    bool save(const AppSettings &settings);
    QString location() const;

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace data
} // namespace coffeechat
