#pragma once

#include <QDialog>

#include "coffeechat/data/AppSettings.hpp"

class QLineEdit;
class QListWidget;
class QSpinBox;
class QStackedWidget;

namespace coffeechat {
namespace data {
class SecretStore;
}

namespace ui {

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    SettingsDialog(data::SecretStore &secrets, QWidget *parent = nullptr);

    void setSettings(const data::AppSettings &settings);
    // Copies the edited fields into settings; draft and recipients are left alone.
    void applyTo(data::AppSettings &settings) const;

    // Writes a non-empty password field into the secret store under the SMTP username.
    void storePassword() const;

private:
    void setupUi();
    QWidget *createCalendarPage();
    QWidget *createSmtpPage();
    void keepHoursOrdered();

    data::SecretStore &m_secrets;
    QListWidget *m_categoryList = nullptr;
    QStackedWidget *m_pages = nullptr;

    QSpinBox *m_bufferSpin = nullptr;
    QSpinBox *m_startHourSpin = nullptr;
    QSpinBox *m_endHourSpin = nullptr;
    QSpinBox *m_minDurationSpin = nullptr;
    QSpinBox *m_lookaheadSpin = nullptr;
    QLineEdit *m_clientSecretsEdit = nullptr;

    QLineEdit *m_hostEdit = nullptr;
    QSpinBox *m_portSpin = nullptr;
    QLineEdit *m_usernameEdit = nullptr;
    QLineEdit *m_passwordEdit = nullptr;
    QLineEdit *m_fromEdit = nullptr;
    QLineEdit *m_senderNameEdit = nullptr;
    QLineEdit *m_templatePathEdit = nullptr;
};

} // namespace ui
} // namespace coffeechat
