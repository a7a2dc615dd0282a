#include "executor.hpp"

#include <acpbridge/logging.hpp>

namespace acpbridge
{
namespace internal
{

SerialExecutor::SerialExecutor() : worker_(&SerialExecutor::run, this) {}

SerialExecutor::~SerialExecutor()
{
    shutdown();
}

bool SerialExecutor::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable() && !on_worker_thread())
        worker_.join();
}

bool SerialExecutor::on_worker_thread() const
{
    return worker_.get_id() == std::this_thread::get_id();
}

void SerialExecutor::run()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty())
                return; // stopping and drained
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            log::get()->error("Background task failed: {}", e.what());
        }
    }
}

} // namespace internal
} // namespace acpbridge
