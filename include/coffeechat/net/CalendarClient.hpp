#pragma once

#include <vector>

#include "coffeechat/core/Result.hpp"
#include "coffeechat/data/CredentialHandle.hpp"
#include "coffeechat/data/Interval.hpp"

namespace coffeechat {
namespace net {

// Blocking calendar access. Only called from background tasks.
class CalendarClient
{
public:
    virtual ~CalendarClient() = default;

    virtual core::Result<data::CredentialHandle> authorize() = 0;
    virtual core::Result<std::vector<data::Interval>> listBusyEvents(const data::CredentialHandle &credential,
                                                                     const data::Interval &range) = 0;
};

} // namespace net
} // namespace coffeechat
