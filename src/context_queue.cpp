#include <acpbridge/context_queue.hpp>
#include <acpbridge/logging.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace acpbridge
{

namespace
{
constexpr const char* CONTEXT_QUEUE_FILE = "context-queue.json";

std::string iso_timestamp_utc()
{
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << ms.count() << 'Z';
    return ss.str();
}

json read_queue_file(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file)
        throw std::runtime_error("Failed to open context queue file: " + filename);

    json queue;
    file >> queue;
    if (!queue.is_array())
        throw std::runtime_error("Context queue file is not a JSON array: " + filename);
    return queue;
}

void write_queue_file(const std::string& filename, const json& queue)
{
    std::ofstream file(filename);
    if (!file)
        throw std::runtime_error("Failed to open context queue file: " + filename);
    file << std::setw(2) << queue << std::endl;
}
} // namespace

void to_json(json& j, const ContextQueueEntry& entry)
{
    j = json{{"id", entry.id},
             {"timestamp", entry.timestamp},
             {"source", entry.source},
             {"content", entry.content}};
}

void from_json(const json& j, ContextQueueEntry& entry)
{
    entry.id = j.value("id", "");
    entry.timestamp = j.value("timestamp", "");
    entry.source = j.value("source", "async_job");
    entry.content = j.value("content", "");
}

ContextQueueEntry make_context_entry(std::string id, std::string content)
{
    ContextQueueEntry entry;
    entry.id = std::move(id);
    entry.timestamp = iso_timestamp_utc();
    entry.content = std::move(content);
    return entry;
}

ContextQueue::ContextQueue(std::string home_dir) : home_dir_(std::move(home_dir)) {}

std::string ContextQueue::path() const
{
    return (fs::path(home_dir_) / CONTEXT_QUEUE_FILE).string();
}

void ContextQueue::append(const ContextQueueEntry& entry)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string filename = path();
    try
    {
        json queue = json::array();
        if (fs::exists(filename))
        {
            try
            {
                queue = read_queue_file(filename);
            }
            catch (const std::exception& e)
            {
                log::get()->warn("Discarding unreadable context queue {}: {}", filename, e.what());
                queue = json::array();
            }
        }

        queue.push_back(entry);
        fs::create_directories(home_dir_);
        write_queue_file(filename, queue);
        log::get()->info("Added to context queue entryId={} queueLength={}", entry.id,
                         queue.size());
    }
    catch (const std::exception& e)
    {
        log::get()->error("Failed to append to context queue error={}", e.what());
    }
}

std::vector<ContextQueueEntry> ContextQueue::load_and_clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string filename = path();
    if (!fs::exists(filename))
        return {};

    try
    {
        auto entries = read_queue_file(filename).get<std::vector<ContextQueueEntry>>();
        write_queue_file(filename, json::array());
        log::get()->info("Loaded context queue count={}", entries.size());
        return entries;
    }
    catch (const std::exception& e)
    {
        log::get()->error("Failed to load context queue error={}", e.what());
        return {};
    }
}

std::string format_for_prompt(const std::vector<ContextQueueEntry>& entries)
{
    if (entries.empty())
        return "";

    std::string formatted;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0)
            formatted += "\n\n";
        const auto& entry = entries[i];
        if (entry.source == "async_job")
            formatted += "[Background Job " + entry.id + "] " + entry.content;
        else
            formatted += entry.content;
    }
    return "Pending context from recent background jobs:\n" + formatted;
}

} // namespace acpbridge
