#include "coffeechat/ui/viewmodels/OperationViewModel.hpp"

namespace coffeechat {
namespace ui {

namespace {

bool sameState(const core::OperationState &lhs, const core::OperationState &rhs)
{
    if (lhs.index() != rhs.index()) {
        return false;
    }
    // Terminal states of different operations share an index.
    return core::describe(lhs) == core::describe(rhs);
}

} // namespace

OperationViewModel::OperationViewModel(core::TaskOrchestrator &orchestrator, QObject *parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
    , m_lastSeen(orchestrator.state())
{
    m_timer.setInterval(DefaultPollIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &OperationViewModel::tick);
    m_timer.start();
}

const core::OperationState &OperationViewModel::state() const
{
    return m_lastSeen;
}

void OperationViewModel::setPollInterval(int milliseconds)
{
    m_timer.setInterval(qMax(1, milliseconds));
}

void OperationViewModel::tick()
{
    if (!core::isInFlight(m_orchestrator.state())) {
        return;
    }
    const core::OperationState state = m_orchestrator.poll();
    publishProgress();
    publish(state);
}

void OperationViewModel::acknowledge()
{
    if (m_orchestrator.acknowledge()) {
        publish(m_orchestrator.state());
    }
}

void OperationViewModel::notifyStarted()
{
    m_reportedProgress = m_orchestrator.deliveryProgress().size();
    publish(m_orchestrator.state());
}

void OperationViewModel::publishProgress()
{
    const auto &progress = m_orchestrator.deliveryProgress();
    if (progress.size() < m_reportedProgress) {
        m_reportedProgress = 0;
    }
    while (m_reportedProgress < progress.size()) {
        // Copied: a connected slot may start another operation, which clears the list.
        const core::DeliveryOutcome outcome = progress.at(m_reportedProgress++);
        emit deliveryProgressed(outcome);
    }
}

void OperationViewModel::publish(const core::OperationState &state)
{
    if (sameState(state, m_lastSeen)) {
        return;
    }
    // Slots may acknowledge from inside terminalReached, which republishes.
    const core::OperationState current = state;
    m_lastSeen = current;
    emit stateChanged(current);
    if (core::isTerminal(current)) {
        emit terminalReached(current);
    }
}

} // namespace ui
} // namespace coffeechat
