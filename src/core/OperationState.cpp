#include "coffeechat/core/OperationState.hpp"

namespace coffeechat {
namespace core {

QString operationName(Operation operation)
{
    switch (operation) {
    case Operation::Connect:
        return QStringLiteral("connect");
    case Operation::Fetch:
        return QStringLiteral("fetch");
    case Operation::Send:
        return QStringLiteral("send");
    }
    return QStringLiteral("unknown");
}

QString describe(const OperationState &s)
{
    struct Visitor
    {
        QString operator()(const state::Idle &) const { return QStringLiteral("Idle"); }
        QString operator()(const state::Connecting &) const { return QStringLiteral("Connecting"); }
        QString operator()(const state::Fetching &) const { return QStringLiteral("Fetching"); }
        QString operator()(const state::Sending &) const { return QStringLiteral("Sending"); }
        QString operator()(const state::Succeeded &v) const
        {
            return QStringLiteral("Succeeded(%1)").arg(operationName(v.operation));
        }
        QString operator()(const state::Failed &v) const
        {
            return QStringLiteral("Failed(%1, %2)").arg(operationName(v.operation), v.error.toString());
        }
    };
    return std::visit(Visitor{}, s);
}

} // namespace core
} // namespace coffeechat
