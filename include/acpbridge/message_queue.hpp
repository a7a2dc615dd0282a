#ifndef ACPBRIDGE_MESSAGE_QUEUE_HPP
#define ACPBRIDGE_MESSAGE_QUEUE_HPP

#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace acpbridge
{

/**
 * FIFO single-flight work queue.
 *
 * Items are processed strictly in arrival order, one at a time, on the
 * queue's drain thread. A failing item rejects only its own future; the
 * queue moves on to the next one.
 *
 * Example:
 * @code
 * MessageQueue<std::shared_ptr<MessageContext>> queue(
 *     [&](std::shared_ptr<MessageContext>& ctx, long id) { processor.process(*ctx, id); });
 * auto done = queue.enqueue(ctx);
 * done.get(); // rethrows the processing error, if any
 * @endcode
 */
template <typename Context>
class MessageQueue
{
  public:
    using ProcessFn = std::function<void(Context&, long request_id)>;

    explicit MessageQueue(ProcessFn process)
        : process_(std::move(process)), worker_(&MessageQueue::drain, this)
    {
    }

    // Processes whatever is still queued, then stops
    ~MessageQueue()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
    }

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    // Completes when the item has been processed; carries its exception if it failed
    std::future<void> enqueue(Context context)
    {
        Item item{0, std::move(context), std::promise<void>()};
        std::future<void> done = item.promise.get_future();

        long request_id;
        size_t length;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                throw SessionStateError("Message queue is shutting down");
            request_id = ++sequence_;
            item.request_id = request_id;
            pending_.push_back(std::move(item));
            length = pending_.size();
        }
        cv_.notify_one();

        if (length > 1)
            log::get()->info("Message enqueued requestId={} queueLength={}", request_id, length);
        return done;
    }

    // Items waiting, not counting the one being processed
    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    bool is_processing() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return processing_;
    }

  private:
    struct Item
    {
        long request_id;
        Context context;
        std::promise<void> promise;
    };

    void drain()
    {
        for (;;)
        {
            std::optional<Item> item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                processing_ = false;
                cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (pending_.empty())
                    return;
                item.emplace(std::move(pending_.front()));
                pending_.pop_front();
                processing_ = true;
            }

            try
            {
                process_(item->context, item->request_id);
                item->promise.set_value();
            }
            catch (const std::exception& e)
            {
                log::get()->warn("Message processing failed requestId={} error={}", item->request_id,
                                 e.what());
                item->promise.set_exception(std::current_exception());
            }
            catch (...)
            {
                log::get()->warn("Message processing failed requestId={} error=unknown",
                                 item->request_id);
                item->promise.set_exception(std::make_exception_ptr(
                    ItemProcessingError("Message processing failed", item->request_id)));
            }
        }
    }

    ProcessFn process_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> pending_;
    long sequence_ = 0;
    bool processing_ = false;
    bool stopping_ = false;

    std::thread worker_; // last: starts once everything above exists
};

} // namespace acpbridge

#endif // ACPBRIDGE_MESSAGE_QUEUE_HPP
