#include "coffeechat/ui/dialogs/SettingsDialog.hpp"

#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>

#include "coffeechat/data/Interval.hpp"
#include "coffeechat/data/SecretStore.hpp"

namespace coffeechat {
namespace ui {

namespace {

QLabel *pageTitle(const QString &text, QWidget *parent)
{
    auto *title = new QLabel(text, parent);
    QFont titleFont = title->font();
    titleFont.setBold(true);
    title->setFont(titleFont);
    return title;
}

QSpinBox *boundedSpin(int min, int max, const QString &suffix, QWidget *parent)
{
    auto *spin = new QSpinBox(parent);
    spin->setRange(min, max);
    spin->setSuffix(suffix);
    return spin;
}

} // namespace

SettingsDialog::SettingsDialog(data::SecretStore &secrets, QWidget *parent)
    : QDialog(parent)
    , m_secrets(secrets)
{
    setWindowTitle(tr("Settings"));
    resize(640, 420);
    setupUi();
}

void SettingsDialog::setupUi()
{
    auto *outer = new QVBoxLayout(this);
    outer->setContentsMargins(16, 16, 16, 16);
    outer->setSpacing(12);

    auto *layout = new QHBoxLayout();
    layout->setSpacing(12);

    m_categoryList = new QListWidget(this);
    m_categoryList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_categoryList->setFixedWidth(160);
    m_categoryList->addItem(tr("Calendar"));
    m_categoryList->addItem(tr("Email"));

    m_pages = new QStackedWidget(this);
    m_pages->addWidget(createCalendarPage());
    m_pages->addWidget(createSmtpPage());

    layout->addWidget(m_categoryList);
    layout->addWidget(m_pages, 1);
    outer->addLayout(layout, 1);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    outer->addWidget(buttons);

    connect(m_categoryList, &QListWidget::currentRowChanged, m_pages, &QStackedWidget::setCurrentIndex);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    m_categoryList->setCurrentRow(0);
}

QWidget *SettingsDialog::createCalendarPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);
    layout->addWidget(pageTitle(tr("Availability"), page));

    auto *form = new QFormLayout();
    m_bufferSpin = boundedSpin(0, data::MaxBufferMinutes, tr(" min"), page);
    m_startHourSpin = boundedSpin(0, 23, tr(":00"), page);
    m_endHourSpin = boundedSpin(1, 24, tr(":00"), page);
    m_minDurationSpin = boundedSpin(0, 24 * 60, tr(" min"), page);
    m_lookaheadSpin = boundedSpin(1, 60, tr(" days"), page);

    auto *secretsRow = new QHBoxLayout();
    m_clientSecretsEdit = new QLineEdit(page);
    auto *browse = new QPushButton(tr("Browse..."), page);
    secretsRow->addWidget(m_clientSecretsEdit, 1);
    secretsRow->addWidget(browse);

    form->addRow(tr("Buffer around meetings"), m_bufferSpin);
    form->addRow(tr("Day starts at"), m_startHourSpin);
    form->addRow(tr("Day ends at"), m_endHourSpin);
    form->addRow(tr("Shortest slot"), m_minDurationSpin);
    form->addRow(tr("Look ahead"), m_lookaheadSpin);
    form->addRow(tr("OAuth client file"), secretsRow);
    layout->addLayout(form);

    auto *hint = new QLabel(tr("The client file is the JSON downloaded from the Google Cloud console."), page);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    layout->addStretch(1);

    connect(m_startHourSpin, qOverload<int>(&QSpinBox::valueChanged), this, &SettingsDialog::keepHoursOrdered);
    connect(m_endHourSpin, qOverload<int>(&QSpinBox::valueChanged), this, &SettingsDialog::keepHoursOrdered);
    connect(browse, &QPushButton::clicked, this, [this]() {
        const QString path = QFileDialog::getOpenFileName(this, tr("OAuth client file"), m_clientSecretsEdit->text(),
                                                          tr("JSON files (*.json)"));
        if (!path.isEmpty()) {
            m_clientSecretsEdit->setText(path);
        }
    });
    return page;
}

QWidget *SettingsDialog::createSmtpPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);
    layout->addWidget(pageTitle(tr("Outgoing mail"), page));

    auto *form = new QFormLayout();
    m_hostEdit = new QLineEdit(page);
    m_hostEdit->setPlaceholderText(QStringLiteral("smtp.example.com"));
    m_portSpin = boundedSpin(1, 65535, QString(), page);
    m_usernameEdit = new QLineEdit(page);
    m_passwordEdit = new QLineEdit(page);
    m_passwordEdit->setEchoMode(QLineEdit::Password);
    m_passwordEdit->setPlaceholderText(tr("unchanged"));
    m_fromEdit = new QLineEdit(page);
    m_fromEdit->setPlaceholderText(QStringLiteral("me@example.com"));
    m_senderNameEdit = new QLineEdit(page);
    m_templatePathEdit = new QLineEdit(page);

    form->addRow(tr("Server"), m_hostEdit);
    form->addRow(tr("Port"), m_portSpin);
    form->addRow(tr("Username"), m_usernameEdit);
    form->addRow(tr("Password"), m_passwordEdit);
    form->addRow(tr("From address"), m_fromEdit);
    form->addRow(tr("Your name"), m_senderNameEdit);
    form->addRow(tr("Template file"), m_templatePathEdit);
    layout->addLayout(form);

    auto *hint = new QLabel(tr("Port 465 uses implicit TLS, any other port upgrades with STARTTLS. "
                               "The password is kept for this session only."),
                            page);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    layout->addStretch(1);
    return page;
}

void SettingsDialog::keepHoursOrdered()
{
    if (m_endHourSpin->value() <= m_startHourSpin->value()) {
        QSignalBlocker blocker(m_endHourSpin);
        m_endHourSpin->setValue(qMin(24, m_startHourSpin->value() + 1));
    }
}

void SettingsDialog::setSettings(const data::AppSettings &settings)
{
    m_bufferSpin->setValue(settings.calendar.bufferMinutes);
    m_startHourSpin->setValue(settings.calendar.dayStartHour);
    m_endHourSpin->setValue(settings.calendar.dayEndHour);
    m_minDurationSpin->setValue(settings.calendar.minDurationMinutes);
    m_lookaheadSpin->setValue(settings.calendar.lookaheadDays);
    m_clientSecretsEdit->setText(settings.calendar.clientSecretsPath);

    m_hostEdit->setText(settings.smtp.host);
    m_portSpin->setValue(settings.smtp.port);
    m_usernameEdit->setText(settings.smtp.username);
    m_passwordEdit->clear();
    m_fromEdit->setText(settings.smtp.fromAddress);
    m_senderNameEdit->setText(settings.senderName);
    m_templatePathEdit->setText(settings.templatePath);
}

void SettingsDialog::applyTo(data::AppSettings &settings) const
{
    settings.calendar.bufferMinutes = m_bufferSpin->value();
    settings.calendar.dayStartHour = m_startHourSpin->value();
    settings.calendar.dayEndHour = m_endHourSpin->value();
    settings.calendar.minDurationMinutes = m_minDurationSpin->value();
    settings.calendar.lookaheadDays = m_lookaheadSpin->value();
    settings.calendar.clientSecretsPath = m_clientSecretsEdit->text().trimmed();

    settings.smtp.host = m_hostEdit->text().trimmed();
    settings.smtp.port = static_cast<quint16>(m_portSpin->value());
    settings.smtp.username = m_usernameEdit->text().trimmed();
    settings.smtp.fromAddress = m_fromEdit->text().trimmed();
    settings.senderName = m_senderNameEdit->text().trimmed();
    settings.templatePath = m_templatePathEdit->text().trimmed();
}

void SettingsDialog::storePassword() const
{
    const QString password = m_passwordEdit->text();
    const QString username = m_usernameEdit->text().trimmed();
    if (password.isEmpty() || username.isEmpty()) {
        return;
    }
    data::SmtpSettings smtp;
    smtp.username = username;
    m_secrets.set(smtp.passwordHandle(), password);
}

} // namespace ui
} // namespace coffeechat
