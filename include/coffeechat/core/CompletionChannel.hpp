#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <deque>
#include <optional>

namespace coffeechat {
namespace core {

// Hands completion messages from background tasks to the polling thread.
template <typename T>
class CompletionChannel
{
public:
    void send(T message)
    {
        QMutexLocker locker(&m_mutex);
        m_queue.push_back(std::move(message));
    }

    std::optional<T> tryReceive()
    {
        QMutexLocker locker(&m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T message = std::move(m_queue.front());
        m_queue.pop_front();
        return message;
    }

    bool isEmpty() const
    {
        QMutexLocker locker(&m_mutex);
        return m_queue.empty();
    }

private:
    mutable QMutex m_mutex;
    std::deque<T> m_queue;
};

} // namespace core
} // namespace coffeechat
