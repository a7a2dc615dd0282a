#ifndef ACPBRIDGE_CONTEXT_QUEUE_HPP
#define ACPBRIDGE_CONTEXT_QUEUE_HPP

#include <acpbridge/types.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace acpbridge
{

struct ContextQueueEntry
{
    std::string id;
    std::string timestamp;            // ISO-8601 UTC
    std::string source = "async_job";
    std::string content;
};

void to_json(json& j, const ContextQueueEntry& entry);
void from_json(const json& j, ContextQueueEntry& entry);

// Entry stamped with the current UTC time
ContextQueueEntry make_context_entry(std::string id, std::string content);

/**
 * Durable holding area for background-task results that could not be
 * injected into a live session.
 *
 * Entries live in <home>/context-queue.json and are drained into the next
 * prompt after a restart. Failures are logged, never thrown.
 */
class ContextQueue
{
  public:
    explicit ContextQueue(std::string home_dir);

    std::string path() const;

    void append(const ContextQueueEntry& entry);

    // Returns the stored entries and empties the file
    std::vector<ContextQueueEntry> load_and_clear();

  private:
    std::string home_dir_;
    std::mutex mutex_;
};

/**
 * "" for no entries, otherwise
 * "Pending context from recent background jobs:\n" followed by the entries
 * separated by blank lines.
 */
std::string format_for_prompt(const std::vector<ContextQueueEntry>& entries);

} // namespace acpbridge

#endif // ACPBRIDGE_CONTEXT_QUEUE_HPP
