#include <QtTest/QtTest>

#include <QThreadPool>

#include "coffeechat/core/TaskOrchestrator.hpp"
#include "fakes/FakeCollaborators.hpp"

using namespace coffeechat;

namespace {

struct Harness
{
    fakes::FakeCalendarClient calendar;
    fakes::FakeMailClient mail;
    QThreadPool pool;
    core::TaskOrchestrator orchestrator{ calendar, mail, &pool };

    // A failed check must not leave a worker parked behind a closed gate.
    ~Harness()
    {
        calendar.gate.open();
        mail.gate.open();
    }
};

QDateTime utc(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 3, day), QTime(hour, minute), Qt::UTC);
}

data::SlotQuery dayQuery()
{
    data::SlotQuery query;
    query.queryRange = { utc(4, 0), utc(5, 0) };
    query.dailyWindow = data::DailyWindow::fromHours(9, 17);
    query.minDurationMinutes = 30;
    query.timeZone = QTimeZone::utc();
    return query;
}

core::SendRequest sendRequest(const QVector<data::Recipient> &recipients)
{
    core::SendRequest request;
    request.smtp.host = QStringLiteral("smtp.example.com");
    request.smtp.username = QStringLiteral("me");
    request.smtp.fromAddress = QStringLiteral("me@example.com");
    request.senderName = QStringLiteral("Sam");
    request.subjectTemplate = QStringLiteral("Coffee with {{ sender_name }}?");
    request.bodyTemplate = QStringLiteral("Hi {{ recipient_name }},\n{% for slot in availabilities %}- {{ slot }}\n{% endfor %}");
    request.availabilities = QStringList{ QStringLiteral("Monday Mar 4: 10am–5pm") };
    request.recipients = recipients;
    return request;
}

bool finish(core::TaskOrchestrator &orchestrator)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < 5000) {
        if (core::isTerminal(orchestrator.poll())) {
            return true;
        }
        QTest::qWait(5);
    }
    return false;
}

bool connectCalendar(Harness &h)
{
    if (!h.orchestrator.startConnect() || !finish(h.orchestrator)) {
        return false;
    }
    return h.orchestrator.acknowledge() && h.orchestrator.isConnected();
}

} // namespace

class TaskOrchestratorTest : public QObject
{
    Q_OBJECT

private slots:
    void startsIdle();
    void connectStoresCredential();
    void secondConnectIsRejectedWithoutAcknowledge();
    void failedConnectDropsCredential();
    void startFetchRejectedWhileInFlight_data();
    void startFetchRejectedWhileInFlight();
    void fetchWithoutCredentialIsNotConnected();
    void fetchWithInvalidQueryIsRejected();
    void fetchComputesFreeSlots();
    void failedFetchClearsFreeSlots();
    void connectClearsFreeSlots();
    void sendReportsExactlyTheFailingRecipient();
    void sendRendersTemplatePerRecipient();
    void sendPublishesProgressPerRecipient();
    void sendRejectsIncompleteRequests();
    void invalidRecipientFailsWithoutDelivery();
    void headerInjectionAddressNeverReachesMailClient();
    void acknowledgeOnlyResetsTerminalStates();
    void pollDoesNotBlockWhileInFlight();
};

void TaskOrchestratorTest::startsIdle()
{
    Harness h;
    QVERIFY(core::isIdle(h.orchestrator.state()));
    QVERIFY(core::isIdle(h.orchestrator.poll()));
    QVERIFY(!h.orchestrator.isConnected());
}

void TaskOrchestratorTest::connectStoresCredential()
{
    Harness h;
    QVERIFY(h.orchestrator.startConnect());
    QVERIFY(std::holds_alternative<core::state::Connecting>(h.orchestrator.state()));
    QVERIFY(finish(h.orchestrator));

    const auto *succeeded = std::get_if<core::state::Succeeded>(&h.orchestrator.state());
    QVERIFY(succeeded);
    QCOMPARE(succeeded->operation, core::Operation::Connect);
    QVERIFY(h.orchestrator.isConnected());
    QCOMPARE(h.orchestrator.credential()->serviceId, QStringLiteral("coffeechat.google"));
}

void TaskOrchestratorTest::secondConnectIsRejectedWithoutAcknowledge()
{
    Harness h;
    h.calendar.gate.close();
    QVERIFY(h.orchestrator.startConnect());

    const auto second = h.orchestrator.startConnect();
    QVERIFY(!second);
    QCOMPARE(second.rejection()->code, core::ErrorCode::Busy);
    QVERIFY(std::holds_alternative<core::state::Connecting>(h.orchestrator.state()));

    h.calendar.gate.open();
    QVERIFY(finish(h.orchestrator));
    QVERIFY(!h.orchestrator.startConnect());

    QVERIFY(h.orchestrator.acknowledge());
    QVERIFY(h.orchestrator.startConnect());
    QVERIFY(finish(h.orchestrator));
    QCOMPARE(h.calendar.authorizeCalls.load(), 2);
}

void TaskOrchestratorTest::failedConnectDropsCredential()
{
    Harness h;
    QVERIFY(h.orchestrator.restoreCredential({ QStringLiteral("coffeechat.google"), QStringLiteral("old") }));
    h.calendar.failAuthorize = true;

    QVERIFY(h.orchestrator.startConnect());
    QVERIFY(finish(h.orchestrator));
    const auto *failed = std::get_if<core::state::Failed>(&h.orchestrator.state());
    QVERIFY(failed);
    QCOMPARE(failed->operation, core::Operation::Connect);
    QCOMPARE(failed->error.code, core::ErrorCode::NetworkError);
    QVERIFY(!h.orchestrator.isConnected());
}

void TaskOrchestratorTest::startFetchRejectedWhileInFlight_data()
{
    QTest::addColumn<int>("operation");
    QTest::newRow("connecting") << static_cast<int>(core::Operation::Connect);
    QTest::newRow("fetching") << static_cast<int>(core::Operation::Fetch);
    QTest::newRow("sending") << static_cast<int>(core::Operation::Send);
}

void TaskOrchestratorTest::startFetchRejectedWhileInFlight()
{
    QFETCH(int, operation);

    Harness h;
    QVERIFY(connectCalendar(h));
    h.calendar.gate.close();
    h.mail.gate.close();

    switch (static_cast<core::Operation>(operation)) {
    case core::Operation::Connect:
        QVERIFY(h.orchestrator.startConnect());
        break;
    case core::Operation::Fetch:
        QVERIFY(h.orchestrator.startFetch(dayQuery()));
        break;
    case core::Operation::Send:
        QVERIFY(h.orchestrator.startSend(sendRequest({ { QStringLiteral("Ann"), QStringLiteral("ann@example.com") } })));
        break;
    }

    const QString before = core::describe(h.orchestrator.state());
    const auto rejected = h.orchestrator.startFetch(dayQuery());
    QVERIFY(!rejected);
    QCOMPARE(rejected.rejection()->code, core::ErrorCode::Busy);
    QCOMPARE(core::describe(h.orchestrator.state()), before);
    QCOMPARE(core::describe(h.orchestrator.poll()), before);

    QVERIFY(!h.orchestrator.startSend(sendRequest({ { QStringLiteral("Bo"), QStringLiteral("bo@example.com") } })));
    QCOMPARE(core::describe(h.orchestrator.state()), before);

    h.calendar.gate.open();
    h.mail.gate.open();
    QVERIFY(finish(h.orchestrator));
}

void TaskOrchestratorTest::fetchWithoutCredentialIsNotConnected()
{
    Harness h;
    const auto rejected = h.orchestrator.startFetch(dayQuery());
    QVERIFY(!rejected);
    QCOMPARE(rejected.rejection()->code, core::ErrorCode::NotConnected);
    QVERIFY(core::isIdle(h.orchestrator.state()));
    QCOMPARE(h.calendar.listCalls.load(), 0);
}

void TaskOrchestratorTest::fetchWithInvalidQueryIsRejected()
{
    Harness h;
    QVERIFY(connectCalendar(h));
    auto query = dayQuery();
    query.dailyWindow = data::DailyWindow::fromHours(9, 9);

    const auto rejected = h.orchestrator.startFetch(query);
    QVERIFY(!rejected);
    QCOMPARE(rejected.rejection()->code, core::ErrorCode::InvalidInput);
    QVERIFY(core::isIdle(h.orchestrator.state()));
}

void TaskOrchestratorTest::fetchComputesFreeSlots()
{
    Harness h;
    QVERIFY(connectCalendar(h));
    h.calendar.busy = { { utc(4, 9), utc(4, 10) } };

    QVERIFY(h.orchestrator.startFetch(dayQuery()));
    QVERIFY(std::holds_alternative<core::state::Fetching>(h.orchestrator.state()));
    QVERIFY(finish(h.orchestrator));
    QVERIFY(std::holds_alternative<core::state::Succeeded>(h.orchestrator.state()));

    const std::vector<data::Interval> expected{ { utc(4, 10), utc(4, 17) } };
    QCOMPARE(h.orchestrator.freeSlots(), expected);
}

void TaskOrchestratorTest::failedFetchClearsFreeSlots()
{
    Harness h;
    QVERIFY(connectCalendar(h));
    QVERIFY(h.orchestrator.startFetch(dayQuery()));
    QVERIFY(finish(h.orchestrator));
    QVERIFY(!h.orchestrator.freeSlots().empty());
    QVERIFY(h.orchestrator.acknowledge());

    h.calendar.failList = true;
    QVERIFY(h.orchestrator.startFetch(dayQuery()));
    QVERIFY(finish(h.orchestrator));
    const auto *failed = std::get_if<core::state::Failed>(&h.orchestrator.state());
    QVERIFY(failed);
    QCOMPARE(failed->operation, core::Operation::Fetch);
    QVERIFY(h.orchestrator.freeSlots().empty());
    QVERIFY(h.orchestrator.isConnected());
}

void TaskOrchestratorTest::connectClearsFreeSlots()
{
    Harness h;
    QVERIFY(connectCalendar(h));
    QVERIFY(h.orchestrator.startFetch(dayQuery()));
    QVERIFY(finish(h.orchestrator));
    QVERIFY(h.orchestrator.acknowledge());
    QVERIFY(!h.orchestrator.freeSlots().empty());

    QVERIFY(h.orchestrator.startConnect());
    QVERIFY(h.orchestrator.freeSlots().empty());
    QVERIFY(finish(h.orchestrator));
}

void TaskOrchestratorTest::sendReportsExactlyTheFailingRecipient()
{
    Harness h;
    const QVector<data::Recipient> recipients{
        { QStringLiteral("Ann"), QStringLiteral("ann@example.com") },
        { QStringLiteral("Bo"), QStringLiteral("bo@example.com") },
        { QStringLiteral("Cy"), QStringLiteral("cy@example.com") },
    };
    h.mail.failingAddresses.insert(QStringLiteral("bo@example.com"));

    QVERIFY(h.orchestrator.startSend(sendRequest(recipients)));
    QVERIFY(std::holds_alternative<core::state::Sending>(h.orchestrator.state()));
    QVERIFY(finish(h.orchestrator));

    const auto *failed = std::get_if<core::state::Failed>(&h.orchestrator.state());
    QVERIFY(failed);
    QCOMPARE(failed->operation, core::Operation::Send);
    QCOMPARE(failed->error.code, core::ErrorCode::PartialSendFailure);
    QCOMPARE(failed->error.failures.size(), 1);
    QCOMPARE(failed->error.failures.front().recipient, recipients.at(1));
    QVERIFY(failed->error.message.contains(QStringLiteral("bo@example.com")));
    QVERIFY(!failed->error.message.contains(QStringLiteral("ann@example.com")));

    const auto &report = h.orchestrator.lastDeliveryReport();
    QCOMPARE(report.size(), 3);
    QVERIFY(report.at(0).delivered);
    QVERIFY(!report.at(1).delivered);
    QVERIFY(report.at(1).reason.contains(QStringLiteral("550")));
    QVERIFY(report.at(2).delivered);

    // No retry of the failed recipient.
    QCOMPARE(h.mail.sentTo(), QStringList({ QStringLiteral("ann@example.com"), QStringLiteral("bo@example.com"),
                                            QStringLiteral("cy@example.com") }));
}

void TaskOrchestratorTest::sendRendersTemplatePerRecipient()
{
    Harness h;
    QVERIFY(h.orchestrator.startSend(sendRequest({
        { QStringLiteral("Ann"), QStringLiteral("ann@example.com") },
        { QStringLiteral("Bo"), QStringLiteral("bo@example.com") },
    })));
    QVERIFY(finish(h.orchestrator));
    QVERIFY(std::holds_alternative<core::state::Succeeded>(h.orchestrator.state()));

    QCOMPARE(h.mail.subjects(), QStringList({ QStringLiteral("Coffee with Sam?"), QStringLiteral("Coffee with Sam?") }));
    const QStringList bodies = h.mail.bodies();
    QCOMPARE(bodies.size(), 2);
    QCOMPARE(bodies.at(0), QStringLiteral("Hi Ann,\n- Monday Mar 4: 10am–5pm\n"));
    QVERIFY(bodies.at(1).startsWith(QStringLiteral("Hi Bo,")));
}

void TaskOrchestratorTest::sendPublishesProgressPerRecipient()
{
    Harness h;
    h.mail.failingAddresses.insert(QStringLiteral("bo@example.com"));
    h.mail.gate.close();
    QVERIFY(h.orchestrator.startSend(sendRequest({
        { QStringLiteral("Ann"), QStringLiteral("ann@example.com") },
        { QStringLiteral("Bo"), QStringLiteral("bo@example.com") },
        { QStringLiteral("Cy"), QStringLiteral("cy@example.com") },
    })));
    QVERIFY(h.orchestrator.deliveryProgress().isEmpty());

    h.mail.gate.step(1);
    QElapsedTimer timer;
    timer.start();
    while (h.orchestrator.deliveryProgress().isEmpty() && timer.elapsed() < 5000) {
        h.orchestrator.poll();
        QTest::qWait(5);
    }
    QCOMPARE(h.orchestrator.deliveryProgress().size(), 1);
    QVERIFY(h.orchestrator.deliveryProgress().front().delivered);
    QCOMPARE(h.orchestrator.deliveryProgress().front().recipient.name, QStringLiteral("Ann"));
    QVERIFY(std::holds_alternative<core::state::Sending>(h.orchestrator.state()));
    QVERIFY(h.orchestrator.lastDeliveryReport().isEmpty());

    h.mail.gate.open();
    QVERIFY(finish(h.orchestrator));
    const auto &progress = h.orchestrator.deliveryProgress();
    const auto &report = h.orchestrator.lastDeliveryReport();
    QCOMPARE(progress.size(), 3);
    for (int i = 0; i < report.size(); ++i) {
        QCOMPARE(progress.at(i).recipient, report.at(i).recipient);
        QCOMPARE(progress.at(i).delivered, report.at(i).delivered);
    }
    QVERIFY(!progress.at(1).delivered);

    // A new send starts from an empty list.
    QVERIFY(h.orchestrator.acknowledge());
    h.mail.gate.close();
    QVERIFY(h.orchestrator.startSend(sendRequest({ { QStringLiteral("Ann"), QStringLiteral("ann@example.com") } })));
    QVERIFY(h.orchestrator.deliveryProgress().isEmpty());
    h.mail.gate.open();
    QVERIFY(finish(h.orchestrator));
    QCOMPARE(h.orchestrator.deliveryProgress().size(), 1);
}

void TaskOrchestratorTest::sendRejectsIncompleteRequests()
{
    Harness h;
    const QVector<data::Recipient> one{ { QStringLiteral("Ann"), QStringLiteral("ann@example.com") } };

    auto noRecipients = h.orchestrator.startSend(sendRequest({}));
    QVERIFY(!noRecipients);
    QCOMPARE(noRecipients.rejection()->code, core::ErrorCode::InvalidInput);

    auto request = sendRequest(one);
    request.smtp.host.clear();
    QVERIFY(!h.orchestrator.startSend(request));

    request = sendRequest(one);
    request.bodyTemplate = QStringLiteral("{{ favourite_colour }}");
    const auto badTemplate = h.orchestrator.startSend(request);
    QVERIFY(!badTemplate);
    QVERIFY(badTemplate.rejection()->message.contains(QStringLiteral("favourite_colour")));

    QVERIFY(core::isIdle(h.orchestrator.state()));
    QVERIFY(h.mail.sentTo().isEmpty());
}

void TaskOrchestratorTest::invalidRecipientFailsWithoutDelivery()
{
    Harness h;
    QVERIFY(h.orchestrator.startSend(sendRequest({
        { QStringLiteral("Ann"), QStringLiteral("ann.example.com") },
        { QStringLiteral("Bo"), QStringLiteral("bo@example.com") },
    })));
    QVERIFY(finish(h.orchestrator));

    const auto *failed = std::get_if<core::state::Failed>(&h.orchestrator.state());
    QVERIFY(failed);
    QCOMPARE(failed->error.failures.size(), 1);
    QCOMPARE(failed->error.failures.front().recipient.email, QStringLiteral("ann.example.com"));
    QCOMPARE(h.mail.sentTo(), QStringList{ QStringLiteral("bo@example.com") });
}

void TaskOrchestratorTest::headerInjectionAddressNeverReachesMailClient()
{
    Harness h;
    const QString injected = QStringLiteral("ann@example.com\r\nBcc: someone@example.net");
    QVERIFY(h.orchestrator.startSend(sendRequest({
        { QStringLiteral("Ann"), injected },
        { QStringLiteral("Bo"), QStringLiteral("bo@example.com") },
    })));
    QVERIFY(finish(h.orchestrator));

    const auto *failed = std::get_if<core::state::Failed>(&h.orchestrator.state());
    QVERIFY(failed);
    QCOMPARE(failed->error.code, core::ErrorCode::PartialSendFailure);
    QCOMPARE(failed->error.failures.size(), 1);
    QCOMPARE(failed->error.failures.front().recipient.email, injected);
    QCOMPARE(h.mail.sentTo(), QStringList{ QStringLiteral("bo@example.com") });
    QVERIFY(!h.orchestrator.lastDeliveryReport().at(0).delivered);
    QVERIFY(h.orchestrator.acknowledge());

    auto request = sendRequest({ { QStringLiteral("Bo"), QStringLiteral("bo@example.com") } });
    request.smtp.fromAddress = QStringLiteral("me@example.com\r\nBcc: someone@example.net");
    const auto rejected = h.orchestrator.startSend(request);
    QVERIFY(!rejected);
    QCOMPARE(rejected.rejection()->code, core::ErrorCode::InvalidInput);
    QCOMPARE(h.mail.sentTo().size(), 1);
}

void TaskOrchestratorTest::acknowledgeOnlyResetsTerminalStates()
{
    Harness h;
    QVERIFY(!h.orchestrator.acknowledge());

    h.calendar.gate.close();
    QVERIFY(h.orchestrator.startConnect());
    QVERIFY(!h.orchestrator.acknowledge());
    QVERIFY(std::holds_alternative<core::state::Connecting>(h.orchestrator.state()));

    h.calendar.gate.open();
    QVERIFY(finish(h.orchestrator));
    QVERIFY(h.orchestrator.acknowledge());
    QVERIFY(core::isIdle(h.orchestrator.state()));
    QVERIFY(h.orchestrator.isConnected());
}

void TaskOrchestratorTest::pollDoesNotBlockWhileInFlight()
{
    Harness h;
    h.calendar.gate.close();
    QVERIFY(h.orchestrator.startConnect());

    QElapsedTimer timer;
    timer.start();
    for (int i = 0; i < 100; ++i) {
        QVERIFY(std::holds_alternative<core::state::Connecting>(h.orchestrator.poll()));
    }
    QVERIFY(timer.elapsed() < 1000);
    QVERIFY(!h.orchestrator.restoreCredential({ QStringLiteral("s"), QStringLiteral("a") }));

    h.calendar.gate.open();
    QVERIFY(finish(h.orchestrator));
}

QTEST_GUILESS_MAIN(TaskOrchestratorTest)
#include "TaskOrchestratorTest.moc"
