#ifndef STEALTHPOOL_BASICS_CHANNEL_H_INCLUDED
#define STEALTHPOOL_BASICS_CHANNEL_H_INCLUDED

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace stealthpool {

/** Unbounded multi-producer queue drained by a single consumer. */
template <class T>
class Channel
{
public:
    Channel() = default;
    Channel(Channel const&) = delete;
    Channel&
    operator=(Channel const&) = delete;

    void
    send(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(value));
        }
        cond_.notify_one();
    }

    /** Block until a value is available. */
    T
    receive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty(); });
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

private:
    std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
};

}  // namespace stealthpool

#endif
