#include "coffeechat/data/Recipient.hpp"

namespace coffeechat {
namespace data {

bool isValidEmailAddress(const QString &address)
{
    const int at = address.indexOf(QLatin1Char('@'));
    if (at <= 0 || at == address.size() - 1 || address.indexOf(QLatin1Char('@'), at + 1) != -1) {
        return false;
    }
    for (const QChar ch : address) {
        if (ch.isSpace() || ch.category() == QChar::Other_Control) {
            return false;
        }
        switch (ch.unicode()) {
        case '<':
        case '>':
        case ',':
        case ';':
        case '"':
            return false;
        default:
            break;
        }
    }
    return true;
}

} // namespace data
} // namespace coffeechat
