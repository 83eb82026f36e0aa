#pragma once

#include <QMetaType>
#include <QObject>
#include <QTimer>

#include "coffeechat/core/OperationState.hpp"
#include "coffeechat/core/TaskOrchestrator.hpp"

namespace coffeechat {
namespace ui {

// Drives TaskOrchestrator::poll() from the event loop and republishes state changes as signals.
class OperationViewModel : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPollIntervalMs = 100;

    explicit OperationViewModel(core::TaskOrchestrator &orchestrator, QObject *parent = nullptr);

    const core::OperationState &state() const;
    void setPollInterval(int milliseconds);

public slots:
    void tick();
    void acknowledge();
    // Call after a start* method so the view reflects the new in-flight state immediately.
    void notifyStarted();

signals:
    void stateChanged(const coffeechat::core::OperationState &state);
    void terminalReached(const coffeechat::core::OperationState &state);
    // One emission per recipient while a send is running, always before terminalReached.
    void deliveryProgressed(const coffeechat::core::DeliveryOutcome &outcome);

private:
    void publish(const core::OperationState &state);
    void publishProgress();

    core::TaskOrchestrator &m_orchestrator;
    QTimer m_timer;
    core::OperationState m_lastSeen;
    int m_reportedProgress = 0;
};

} // namespace ui
} // namespace coffeechat

Q_DECLARE_METATYPE(coffeechat::core::OperationState)
