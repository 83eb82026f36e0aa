#pragma once

#include <QString>
#include <variant>

#include "coffeechat/core/Error.hpp"

namespace coffeechat {
namespace core {

enum class Operation
{
    Connect,
    Fetch,
    Send,
};

namespace state {
struct Idle
{
};
struct Connecting
{
};
struct Fetching
{
};
struct Sending
{
};
struct Succeeded
{
    Operation operation = Operation::Connect;
};
struct Failed
{
    Operation operation = Operation::Connect;
    Error error;
};
} // namespace state

using OperationState =
    std::variant<state::Idle, state::Connecting, state::Fetching, state::Sending, state::Succeeded, state::Failed>;

inline bool isIdle(const OperationState &s)
{
    return std::holds_alternative<state::Idle>(s);
}

inline bool isTerminal(const OperationState &s)
{
    return std::holds_alternative<state::Succeeded>(s) || std::holds_alternative<state::Failed>(s);
}

inline bool isInFlight(const OperationState &s)
{
    return !isIdle(s) && !isTerminal(s);
}

QString operationName(Operation operation);
QString describe(const OperationState &s);

} // namespace core
} // namespace coffeechat
