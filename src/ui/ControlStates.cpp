#include "coffeechat/ui/ControlStates.hpp"

#include <QCoreApplication>

namespace coffeechat {
namespace ui {

namespace {
QString tr(const char *text)
{
    return QCoreApplication::translate("ControlStates", text);
}

QString statusFor(const core::OperationState &state, const ControlInputs &inputs)
{
    if (std::holds_alternative<core::state::Connecting>(state)) {
        return tr("Connecting to Google Calendar... check your browser.");
    }
    if (std::holds_alternative<core::state::Fetching>(state)) {
        return tr("Fetching available slots...");
    }
    if (std::holds_alternative<core::state::Sending>(state)) {
        return tr("Sending invitations...");
    }
    if (const auto *failed = std::get_if<core::state::Failed>(&state)) {
        return failed->error.message;
    }
    if (const auto *succeeded = std::get_if<core::state::Succeeded>(&state)) {
        switch (succeeded->operation) {
        case core::Operation::Connect:
            return tr("Successfully connected to Google Calendar.");
        case core::Operation::Fetch:
            return tr("Available slots updated.");
        case core::Operation::Send:
            return tr("All invitations sent.");
        }
    }
    return inputs.calendarConnected ? tr("Calendar: Connected") : tr("Calendar: Not Connected");
}
} // namespace

ControlStates projectControls(const core::OperationState &state, const ControlInputs &inputs)
{
    ControlStates controls;
    const bool idle = core::isIdle(state);
    controls.connectEnabled = idle;
    controls.fetchEnabled = idle && inputs.calendarConnected;
    controls.sendEnabled = idle && inputs.hasRecipients;
    controls.settingsEditable = idle;
    controls.busyIndicatorVisible = core::isInFlight(state);
    controls.statusText = statusFor(state, inputs);
    return controls;
}

} // namespace ui
} // namespace coffeechat
