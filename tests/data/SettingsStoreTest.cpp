#include <QtTest/QtTest>

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>
#include <memory>

#include "coffeechat/data/SettingsStore.hpp"

using namespace coffeechat;

class SettingsStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void missingFileGivesDefaults();
    void roundTripsSettings();
    void clampsOutOfRangeValues();
    void repairsEmptyDayWindow();
    void dropsMalformedAddresses();
    void credentialHandleIsOptional();
    void passwordIsNeverWritten();
    void queryCoversLookahead();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_path;
};

void SettingsStoreTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_path = m_dir->filePath(QStringLiteral("settings.ini"));
}

void SettingsStoreTest::missingFileGivesDefaults()
{
    data::SettingsStore store(m_path);
    const auto settings = store.load();
    QCOMPARE(settings.calendar.bufferMinutes, 15);
    QCOMPARE(settings.calendar.dayStartHour, 9);
    QCOMPARE(settings.calendar.dayEndHour, 21);
    QCOMPARE(settings.calendar.minDurationMinutes, 30);
    QCOMPARE(settings.calendar.lookaheadDays, 14);
    QCOMPARE(settings.calendar.clientSecretsPath, QStringLiteral("credentials.json"));
    QCOMPARE(settings.smtp.port, quint16(587));
    QCOMPARE(settings.templatePath, QStringLiteral("email_template.txt"));
    QVERIFY(settings.recipients.isEmpty());
    QVERIFY(!settings.calendarCredential);
}

void SettingsStoreTest::roundTripsSettings()
{
    data::AppSettings settings;
    settings.senderName = QStringLiteral("Sam");
    settings.subject = QStringLiteral("Coffee?");
    settings.body = QStringLiteral("Hi {{ recipient_name }},\nline two");
    settings.recipients = { { QStringLiteral("Ann"), QStringLiteral("ann@example.com") },
                            { QStringLiteral("Bo"), QStringLiteral("bo@example.com") } };
    settings.smtp.host = QStringLiteral("smtp.example.com");
    settings.smtp.port = 465;
    settings.smtp.username = QStringLiteral("sam");
    settings.smtp.fromAddress = QStringLiteral("sam@example.com");
    settings.calendar.bufferMinutes = 5;
    settings.calendar.dayStartHour = 8;
    settings.calendar.dayEndHour = 18;
    settings.calendar.lookaheadDays = 7;
    settings.calendarCredential = data::CredentialHandle{ QStringLiteral("coffeechat.google"), QStringLiteral("client") };

    {
        data::SettingsStore store(m_path);
        QVERIFY(store.save(settings));
    }

    data::SettingsStore reopened(m_path);
    const auto loaded = reopened.load();
    QCOMPARE(loaded.senderName, settings.senderName);
    QCOMPARE(loaded.subject, settings.subject);
    QCOMPARE(loaded.body, settings.body);
    QCOMPARE(loaded.recipients, settings.recipients);
    QCOMPARE(loaded.smtp.host, settings.smtp.host);
    QCOMPARE(loaded.smtp.port, quint16(465));
    QCOMPARE(loaded.smtp.username, settings.smtp.username);
    QCOMPARE(loaded.smtp.fromAddress, settings.smtp.fromAddress);
    QCOMPARE(loaded.calendar.bufferMinutes, 5);
    QCOMPARE(loaded.calendar.dayStartHour, 8);
    QCOMPARE(loaded.calendar.dayEndHour, 18);
    QCOMPARE(loaded.calendar.lookaheadDays, 7);
    QVERIFY(loaded.calendarCredential);
    QCOMPARE(*loaded.calendarCredential, *settings.calendarCredential);
}

void SettingsStoreTest::clampsOutOfRangeValues()
{
    {
        QSettings raw(m_path, QSettings::IniFormat);
        raw.setValue(QStringLiteral("calendar/bufferMinutes"), 500);
        raw.setValue(QStringLiteral("calendar/lookaheadDays"), 0);
        raw.setValue(QStringLiteral("calendar/dayStartHour"), -3);
        raw.setValue(QStringLiteral("smtp/port"), 70000);
        raw.setValue(QStringLiteral("calendar/minDurationMinutes"), QStringLiteral("soon"));
    }

    data::SettingsStore store(m_path);
    const auto settings = store.load();
    QCOMPARE(settings.calendar.bufferMinutes, 120);
    QCOMPARE(settings.calendar.lookaheadDays, 1);
    QCOMPARE(settings.calendar.dayStartHour, 0);
    QCOMPARE(settings.smtp.port, quint16(65535));
    QCOMPARE(settings.calendar.minDurationMinutes, 30);
}

void SettingsStoreTest::repairsEmptyDayWindow()
{
    {
        QSettings raw(m_path, QSettings::IniFormat);
        raw.setValue(QStringLiteral("calendar/dayStartHour"), 14);
        raw.setValue(QStringLiteral("calendar/dayEndHour"), 10);
    }
    data::SettingsStore store(m_path);
    const auto settings = store.load();
    QCOMPARE(settings.calendar.dayStartHour, 14);
    QCOMPARE(settings.calendar.dayEndHour, 15);
}

void SettingsStoreTest::dropsMalformedAddresses()
{
    {
        QSettings raw(m_path, QSettings::IniFormat);
        raw.setValue(QStringLiteral("smtp/fromAddress"), QStringLiteral("sam@example.com\r\nBcc: all@example.net"));
        raw.beginWriteArray(QStringLiteral("recipients"));
        const QStringList emails{ QStringLiteral("ann@example.com\r\nBcc: someone@example.net"),
                                  QStringLiteral(" bo@example.com "), QStringLiteral("cy@@example.com"),
                                  QStringLiteral("<dee@example.com>") };
        for (int i = 0; i < emails.size(); ++i) {
            raw.setArrayIndex(i);
            raw.setValue(QStringLiteral("name"), QStringLiteral("Person %1").arg(i));
            raw.setValue(QStringLiteral("email"), emails.at(i));
        }
        raw.endArray();
    }

    data::SettingsStore store(m_path);
    const auto settings = store.load();
    QVERIFY(settings.smtp.fromAddress.isEmpty());
    QVERIFY(!settings.smtp.isComplete());
    QCOMPARE(settings.recipients.size(), 1);
    QCOMPARE(settings.recipients.front().email, QStringLiteral("bo@example.com"));
}

void SettingsStoreTest::credentialHandleIsOptional()
{
    data::SettingsStore store(m_path);
    data::AppSettings settings;
    settings.calendarCredential = data::CredentialHandle{ QStringLiteral("coffeechat.google"), QStringLiteral("c") };
    QVERIFY(store.save(settings));
    settings.calendarCredential.reset();
    QVERIFY(store.save(settings));
    QVERIFY(!store.load().calendarCredential);
}

void SettingsStoreTest::passwordIsNeverWritten()
{
    data::AppSettings settings;
    settings.smtp.username = QStringLiteral("sam");
    settings.smtp.host = QStringLiteral("smtp.example.com");
    data::SettingsStore store(m_path);
    QVERIFY(store.save(settings));

    QFile file(m_path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll().toLower();
    QVERIFY(!contents.contains("password"));
    QVERIFY(!contents.contains("secret="));
}

void SettingsStoreTest::queryCoversLookahead()
{
    data::CalendarSettings calendar;
    calendar.lookaheadDays = 3;
    calendar.dayStartHour = 8;
    calendar.dayEndHour = 24;
    const QDateTime now(QDate(2024, 3, 4), QTime(10, 30), Qt::UTC);

    const auto query = calendar.toQuery(now);
    QCOMPARE(query.queryRange.start, now);
    QCOMPARE(query.queryRange.end, now.addDays(3));
    QCOMPARE(query.dailyWindow.fromMinute, 8 * 60);
    QCOMPARE(query.dailyWindow.toMinute, data::MinutesPerDay);
    QCOMPARE(query.bufferMinutes, 15);
    QCOMPARE(query.minDurationMinutes, 30);
}

QTEST_GUILESS_MAIN(SettingsStoreTest)
#include "SettingsStoreTest.moc"
