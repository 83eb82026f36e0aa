#pragma once

#include <QFuture>
#include <QStringList>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "coffeechat/core/CompletionChannel.hpp"
#include "coffeechat/core/Error.hpp"
#include "coffeechat/core/OperationState.hpp"
#include "coffeechat/data/AppSettings.hpp"
#include "coffeechat/data/CredentialHandle.hpp"
#include "coffeechat/data/Interval.hpp"
#include "coffeechat/data/Recipient.hpp"

class QThreadPool;

namespace coffeechat {
namespace net {
class CalendarClient;
}
namespace mail {
class MailClient;
}

namespace core {

class StartResult
{
public:
    static StartResult accepted();
    static StartResult rejected(Error error);

    bool isStarted() const { return !m_rejection.has_value(); }
    explicit operator bool() const { return isStarted(); }
    const std::optional<Error> &rejection() const { return m_rejection; }

private:
    std::optional<Error> m_rejection;
};

struct DeliveryOutcome
{
    data::Recipient recipient;
    bool delivered = false;
    QString reason;
};

struct SendRequest
{
    data::SmtpSettings smtp;
    QString senderName;
    QString subjectTemplate;
    QString bodyTemplate;
    QStringList availabilities;
    QVector<data::Recipient> recipients;
};

// Runs at most one of connect, fetch and send at a time on a background pool.
//
// Everything observable (state, free slots, credential, delivery report) is written on
// the owner thread only: background tasks post one Completion on a channel and poll()
// applies it in a single step. A start call made while anything but Idle is current is
// refused without side effects; terminal states must be acknowledged before the next start.
class TaskOrchestrator
{
public:
    TaskOrchestrator(net::CalendarClient &calendar, mail::MailClient &mail, QThreadPool *pool = nullptr);
    ~TaskOrchestrator();

    TaskOrchestrator(const TaskOrchestrator &) = delete;
    TaskOrchestrator &operator=(const TaskOrchestrator &) = delete;

    StartResult startConnect();
    StartResult startFetch(const data::SlotQuery &query);
    StartResult startSend(const SendRequest &request);

    // Never blocks. Applies at most one pending completion and collects per-recipient
    // outcomes posted by a send in flight.
    OperationState poll();
    // Resets a terminal state to Idle. Returns false (and does nothing) otherwise.
    bool acknowledge();

    const OperationState &state() const { return m_state; }
    const std::vector<data::Interval> &freeSlots() const { return m_freeSlots; }
    const std::optional<data::CredentialHandle> &credential() const { return m_credential; }
    const QVector<DeliveryOutcome> &lastDeliveryReport() const { return m_deliveryReport; }
    // Outcomes of the current (or most recent) send in recipient order, as seen by poll().
    const QVector<DeliveryOutcome> &deliveryProgress() const { return m_deliveryProgress; }
    bool isConnected() const { return m_credential.has_value(); }

    // Reinstates a handle persisted by an earlier session. Only allowed while idle.
    bool restoreCredential(const data::CredentialHandle &handle);

private:
    struct Completion
    {
        OperationState terminal;
        bool replacesCredential = false;
        std::optional<data::CredentialHandle> credential;
        std::optional<std::vector<data::Interval>> freeSlots;
        std::optional<QVector<DeliveryOutcome>> deliveries;
    };

    StartResult rejectIfBusy(Operation operation) const;
    void dispatch(std::function<Completion()> task);
    void apply(Completion completion);

    net::CalendarClient &m_calendar;
    mail::MailClient &m_mail;
    QThreadPool *m_pool = nullptr;
    std::shared_ptr<CompletionChannel<Completion>> m_channel;
    std::shared_ptr<CompletionChannel<DeliveryOutcome>> m_progress;
    QFuture<void> m_inFlight;

    OperationState m_state = state::Idle{};
    std::vector<data::Interval> m_freeSlots;
    std::optional<data::CredentialHandle> m_credential;
    QVector<DeliveryOutcome> m_deliveryReport;
    QVector<DeliveryOutcome> m_deliveryProgress;
};

} // namespace core
} // namespace coffeechat
