#include <acpbridge/logging.hpp>
#include <acpbridge/timer.hpp>

namespace acpbridge
{

Timer::Timer() = default;

Timer::~Timer()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        deadline_.reset();
        callback_ = nullptr;
    }
    cv_.notify_all();

    if (worker_.joinable())
        worker_.join();
}

void Timer::arm(std::chrono::milliseconds delay, Callback callback)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return;
        deadline_ = std::chrono::steady_clock::now() + delay;
        callback_ = std::move(callback);
        ++generation_;
        if (!worker_.joinable())
            worker_ = std::thread(&Timer::run, this);
    }
    cv_.notify_all();
}

bool Timer::cancel()
{
    bool was_pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_pending = deadline_.has_value();
        deadline_.reset();
        callback_ = nullptr;
        ++generation_;
    }
    cv_.notify_all();
    return was_pending;
}

bool Timer::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

void Timer::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        if (!deadline_)
        {
            cv_.wait(lock, [this] { return stopping_ || deadline_.has_value(); });
            continue;
        }

        uint64_t armed = generation_;
        auto deadline = *deadline_;
        // Wakes early on re-arm or cancel; the generation tells them apart from expiry
        if (cv_.wait_until(lock, deadline, [this, armed] { return stopping_ || generation_ != armed; }))
            continue;

        Callback callback = std::move(callback_);
        callback_ = nullptr;
        deadline_.reset();

        lock.unlock();
        if (callback)
        {
            try
            {
                callback();
            }
            catch (const std::exception& e)
            {
                log::get()->error("Timer callback threw: {}", e.what());
            }
        }
        lock.lock();
    }
}

} // namespace acpbridge
