#include "coffeechat/core/TaskOrchestrator.hpp"

#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

#include "coffeechat/core/Logging.hpp"
#include "coffeechat/core/SlotFinder.hpp"
#include "coffeechat/mail/EmailTemplate.hpp"
#include "coffeechat/mail/MailClient.hpp"
#include "coffeechat/net/CalendarClient.hpp"

namespace coffeechat {
namespace core {

StartResult StartResult::accepted()
{
    return StartResult();
}

StartResult StartResult::rejected(Error error)
{
    StartResult result;
    result.m_rejection = std::move(error);
    return result;
}

TaskOrchestrator::TaskOrchestrator(net::CalendarClient &calendar, mail::MailClient &mail, QThreadPool *pool)
    : m_calendar(calendar)
    , m_mail(mail)
    , m_pool(pool ? pool : QThreadPool::globalInstance())
    , m_channel(std::make_shared<CompletionChannel<Completion>>())
    , m_progress(std::make_shared<CompletionChannel<DeliveryOutcome>>())
{
}

TaskOrchestrator::~TaskOrchestrator()
{
    // Operations cannot be cancelled; the task still references the collaborators.
    m_inFlight.waitForFinished();
}

StartResult TaskOrchestrator::startConnect()
{
    if (auto rejection = rejectIfBusy(Operation::Connect); !rejection) {
        return rejection;
    }

    m_freeSlots.clear();
    m_state = state::Connecting{};
    qCInfo(lcOrchestrator) << "Starting calendar authorization";

    net::CalendarClient *calendar = &m_calendar;
    dispatch([calendar]() {
        Completion completion;
        completion.replacesCredential = true;
        auto result = calendar->authorize();
        if (result) {
            completion.credential = result.value();
            completion.terminal = state::Succeeded{ Operation::Connect };
        } else {
            completion.terminal = state::Failed{ Operation::Connect, result.error() };
        }
        return completion;
    });
    return StartResult::accepted();
}

StartResult TaskOrchestrator::startFetch(const data::SlotQuery &query)
{
    if (auto rejection = rejectIfBusy(Operation::Fetch); !rejection) {
        return rejection;
    }
    if (!m_credential || !m_credential->isValid()) {
        qCWarning(lcOrchestrator) << "Refusing fetch without a calendar connection";
        return StartResult::rejected(Error::notConnected(QStringLiteral("Calendar is not connected")));
    }
    if (auto error = validateQuery(query)) {
        qCWarning(lcOrchestrator) << "Refusing fetch:" << error->message;
        return StartResult::rejected(*error);
    }

    m_state = state::Fetching{};
    qCInfo(lcOrchestrator) << "Fetching busy periods for" << query.queryRange.toString();

    net::CalendarClient *calendar = &m_calendar;
    const data::CredentialHandle credential = *m_credential;
    dispatch([calendar, credential, query]() {
        Completion completion;
        auto busy = calendar->listBusyEvents(credential, query.queryRange);
        if (!busy) {
            completion.freeSlots = std::vector<data::Interval>();
            completion.terminal = state::Failed{ Operation::Fetch, busy.error() };
            return completion;
        }
        auto slots = computeFreeSlots(busy.value(), query);
        if (!slots) {
            completion.freeSlots = std::vector<data::Interval>();
            completion.terminal = state::Failed{ Operation::Fetch, slots.error() };
            return completion;
        }
        completion.freeSlots = slots.takeValue();
        completion.terminal = state::Succeeded{ Operation::Fetch };
        return completion;
    });
    return StartResult::accepted();
}

StartResult TaskOrchestrator::startSend(const SendRequest &request)
{
    if (auto rejection = rejectIfBusy(Operation::Send); !rejection) {
        return rejection;
    }
    if (request.recipients.isEmpty()) {
        return StartResult::rejected(Error::invalidInput(QStringLiteral("No recipients added")));
    }
    if (!request.smtp.isComplete()) {
        return StartResult::rejected(
            Error::invalidInput(QStringLiteral("Missing SMTP settings (host, username, from address)")));
    }
    auto parsed = mail::EmailTemplate::fromContent(request.subjectTemplate, request.bodyTemplate);
    if (!parsed) {
        qCWarning(lcOrchestrator) << "Refusing send:" << parsed.error().message;
        return StartResult::rejected(parsed.error());
    }

    m_state = state::Sending{};
    m_deliveryProgress.clear();
    qCInfo(lcOrchestrator) << "Sending invitations to" << request.recipients.size() << "recipients";

    mail::MailClient *mailClient = &m_mail;
    auto progress = m_progress;
    const mail::EmailTemplate emailTemplate = parsed.takeValue();
    dispatch([mailClient, progress, emailTemplate, request]() {
        QVector<DeliveryOutcome> outcomes;
        QVector<RecipientFailure> failures;
        outcomes.reserve(request.recipients.size());

        for (const auto &recipient : request.recipients) {
            DeliveryOutcome outcome;
            outcome.recipient = recipient;
            if (!recipient.isValid()) {
                outcome.reason = QStringLiteral("Invalid email address '%1'").arg(recipient.email);
            } else {
                const auto message =
                    emailTemplate.render({ recipient.name, request.senderName, request.availabilities });
                auto sent = mailClient->send(request.smtp, request.smtp.fromAddress, recipient.email, message.subject,
                                             message.body);
                outcome.delivered = sent.isOk();
                if (!sent) {
                    outcome.reason = sent.error().message;
                }
            }
            if (outcome.delivered) {
                qCInfo(lcOrchestrator) << "Invitation delivered to" << recipient.email;
            } else {
                qCWarning(lcOrchestrator) << "Invitation to" << recipient.email << "failed:" << outcome.reason;
                failures.append(RecipientFailure{ recipient, outcome.reason });
            }
            progress->send(outcome);
            outcomes.append(outcome);
        }

        Completion completion;
        completion.deliveries = outcomes;
        if (failures.isEmpty()) {
            completion.terminal = state::Succeeded{ Operation::Send };
        } else {
            completion.terminal = state::Failed{ Operation::Send, Error::partialSend(failures) };
        }
        return completion;
    });
    return StartResult::accepted();
}

OperationState TaskOrchestrator::poll()
{
    if (isInFlight(m_state)) {
        // Progress is drained after the completion is taken so a terminal state never
        // shows up with outcomes still queued behind it.
        auto completion = m_channel->tryReceive();
        while (auto outcome = m_progress->tryReceive()) {
            m_deliveryProgress.append(std::move(*outcome));
        }
        if (completion) {
            apply(std::move(*completion));
        }
    }
    return m_state;
}

bool TaskOrchestrator::acknowledge()
{
    if (!isTerminal(m_state)) {
        return false;
    }
    m_state = state::Idle{};
    return true;
}

bool TaskOrchestrator::restoreCredential(const data::CredentialHandle &handle)
{
    if (!isIdle(m_state) || !handle.isValid()) {
        return false;
    }
    m_credential = handle;
    return true;
}

StartResult TaskOrchestrator::rejectIfBusy(Operation operation) const
{
    if (isIdle(m_state)) {
        return StartResult::accepted();
    }
    qCWarning(lcOrchestrator) << "Rejected" << operationName(operation) << "while" << describe(m_state);
    return StartResult::rejected(Error::busy(
        QStringLiteral("Cannot %1 while the state is %2").arg(operationName(operation), describe(m_state))));
}

void TaskOrchestrator::dispatch(std::function<Completion()> task)
{
    auto channel = m_channel;
    m_inFlight = QtConcurrent::run(m_pool, [channel, task = std::move(task)]() {
        channel->send(task());
    });
}

void TaskOrchestrator::apply(Completion completion)
{
    if (completion.replacesCredential) {
        m_credential = std::move(completion.credential);
    }
    if (completion.freeSlots) {
        m_freeSlots = std::move(*completion.freeSlots);
    }
    if (completion.deliveries) {
        m_deliveryReport = std::move(*completion.deliveries);
    }
    m_state = std::move(completion.terminal);
    qCInfo(lcOrchestrator) << "Operation finished:" << describe(m_state);
}

} // namespace core
} // namespace coffeechat
