#pragma once

#include <QString>

#include "coffeechat/core/OperationState.hpp"

namespace coffeechat {
namespace ui {

struct ControlInputs
{
    bool calendarConnected = false;
    bool hasRecipients = false;
};

struct ControlStates
{
    bool connectEnabled = false;
    bool fetchEnabled = false;
    bool sendEnabled = false;
    bool settingsEditable = false;
    bool busyIndicatorVisible = false;
    QString statusText;
};

// Enabled/disabled projection of the orchestrator state; holds no state of its own.
ControlStates projectControls(const core::OperationState &state, const ControlInputs &inputs);

} // namespace ui
} // namespace coffeechat
