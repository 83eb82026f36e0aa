#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "coffeechat/mail/EmailTemplate.hpp"

using namespace coffeechat;

namespace {

mail::TemplateVariables variables()
{
    mail::TemplateVariables vars;
    vars.recipientName = QStringLiteral("Ann");
    vars.senderName = QStringLiteral("Sam");
    vars.availabilities = QStringList{ QStringLiteral("Monday Mar 4: 10am-5pm"), QStringLiteral("Tuesday Mar 5: 9am-11am") };
    return vars;
}

} // namespace

class EmailTemplateTest : public QObject
{
    Q_OBJECT

private slots:
    void substitutesVariables();
    void rendersLoopOncePerAvailability();
    void loopOverEmptyListRendersNothing();
    void availabilitiesWithoutLoopAreJoinedByLines();
    void nestedLoopSeesOuterItem();
    void rejectsBrokenTemplates_data();
    void rejectsBrokenTemplates();
    void parsesTemplateFile();
    void rejectsFileWithoutHeader();
    void loadsTemplateFromDisk();
    void missingFileIsInvalidInput();
};

void EmailTemplateTest::substitutesVariables()
{
    auto parsed = mail::EmailTemplate::fromContent(QStringLiteral("Coffee with {{sender_name}}?"),
                                                   QStringLiteral("Hi {{ recipient_name }}, it's {{  sender_name }}."));
    QVERIFY(parsed);
    const auto message = parsed.value().render(variables());
    QCOMPARE(message.subject, QStringLiteral("Coffee with Sam?"));
    QCOMPARE(message.body, QStringLiteral("Hi Ann, it's Sam."));
}

void EmailTemplateTest::rendersLoopOncePerAvailability()
{
    auto parsed = mail::EmailTemplate::fromContent(
        QStringLiteral("Hello"), QStringLiteral("Free:\n{% for slot in availabilities %}* {{ slot }}\n{% endfor %}Bye"));
    QVERIFY(parsed);
    QCOMPARE(parsed.value().render(variables()).body,
             QStringLiteral("Free:\n* Monday Mar 4: 10am-5pm\n* Tuesday Mar 5: 9am-11am\nBye"));
}

void EmailTemplateTest::loopOverEmptyListRendersNothing()
{
    auto parsed = mail::EmailTemplate::fromContent(
        QStringLiteral("Hello"), QStringLiteral("[{% for slot in availabilities %}{{ slot }}{% endfor %}]"));
    QVERIFY(parsed);
    auto vars = variables();
    vars.availabilities.clear();
    QCOMPARE(parsed.value().render(vars).body, QStringLiteral("[]"));
}

void EmailTemplateTest::availabilitiesWithoutLoopAreJoinedByLines()
{
    auto parsed = mail::EmailTemplate::fromContent(QStringLiteral("Hello"), QStringLiteral("{{ availabilities }}"));
    QVERIFY(parsed);
    QCOMPARE(parsed.value().render(variables()).body,
             QStringLiteral("Monday Mar 4: 10am-5pm\nTuesday Mar 5: 9am-11am"));
}

void EmailTemplateTest::nestedLoopSeesOuterItem()
{
    auto parsed = mail::EmailTemplate::fromContent(
        QStringLiteral("x"),
        QStringLiteral("{% for a in availabilities %}{% for b in availabilities %}{{ a }}/{{ b }};{% endfor %}{% endfor %}"));
    QVERIFY(parsed);
    auto vars = variables();
    vars.availabilities = QStringList{ QStringLiteral("1"), QStringLiteral("2") };
    QCOMPARE(parsed.value().render(vars).body, QStringLiteral("1/1;1/2;2/1;2/2;"));
}

void EmailTemplateTest::rejectsBrokenTemplates_data()
{
    QTest::addColumn<QString>("body");
    QTest::addColumn<QString>("mentions");

    QTest::newRow("unknown variable") << QStringLiteral("Hi {{ name }}") << QStringLiteral("name");
    QTest::newRow("missing endfor") << QStringLiteral("{% for s in availabilities %}{{ s }}") << QStringLiteral("endfor");
    QTest::newRow("stray endfor") << QStringLiteral("text{% endfor %}") << QStringLiteral("endfor");
    QTest::newRow("loop over scalar") << QStringLiteral("{% for c in sender_name %}{% endfor %}") << QStringLiteral("sender_name");
    QTest::newRow("shadowing") << QStringLiteral("{% for sender_name in availabilities %}{% endfor %}")
                               << QStringLiteral("shadows");
    QTest::newRow("loop item out of scope") << QStringLiteral("{% for s in availabilities %}{% endfor %}{{ s }}")
                                            << QStringLiteral("'s'");
    QTest::newRow("unsupported statement") << QStringLiteral("{% if sender_name %}") << QStringLiteral("if");
}

void EmailTemplateTest::rejectsBrokenTemplates()
{
    QFETCH(QString, body);
    QFETCH(QString, mentions);

    const auto parsed = mail::EmailTemplate::fromContent(QStringLiteral("Subject"), body);
    QVERIFY(!parsed);
    QCOMPARE(parsed.error().code, core::ErrorCode::InvalidInput);
    QVERIFY2(parsed.error().message.contains(mentions), qPrintable(parsed.error().message));
}

void EmailTemplateTest::parsesTemplateFile()
{
    const auto parsed = mail::EmailTemplate::parseFile(
        QStringLiteral("Subject: Coffee with {{ sender_name }}?\r\n---\r\nHi {{ recipient_name }}\r\nSee you\r\n"));
    QVERIFY(parsed);
    QCOMPARE(parsed.value().subjectTemplate(), QStringLiteral("Coffee with {{ sender_name }}?"));
    QCOMPARE(parsed.value().bodyTemplate(), QStringLiteral("Hi {{ recipient_name }}\nSee you\n"));
    QCOMPARE(parsed.value().render(variables()).subject, QStringLiteral("Coffee with Sam?"));
}

void EmailTemplateTest::rejectsFileWithoutHeader()
{
    QVERIFY(!mail::EmailTemplate::parseFile(QStringLiteral("Hi there\n---\nbody")));
    QVERIFY(!mail::EmailTemplate::parseFile(QStringLiteral("Subject: Hi\nbody")));
    QVERIFY(!mail::EmailTemplate::parseFile(QString()));
}

void EmailTemplateTest::loadsTemplateFromDisk()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("email_template.txt"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QStringLiteral("Subject: Kaffee, {{ recipient_name }}?\n---\nGrüße, {{ sender_name }}").toUtf8());
    file.close();

    const auto loaded = mail::EmailTemplate::load(path);
    QVERIFY(loaded);
    const auto message = loaded.value().render(variables());
    QCOMPARE(message.subject, QStringLiteral("Kaffee, Ann?"));
    QCOMPARE(message.body, QStringLiteral("Grüße, Sam"));
}

void EmailTemplateTest::missingFileIsInvalidInput()
{
    const auto loaded = mail::EmailTemplate::load(QStringLiteral("/nonexistent/email_template.txt"));
    QVERIFY(!loaded);
    QCOMPARE(loaded.error().code, core::ErrorCode::InvalidInput);
}

QTEST_GUILESS_MAIN(EmailTemplateTest)
#include "EmailTemplateTest.moc"
