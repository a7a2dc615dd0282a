#include <acpbridge/acpbridge.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

// Terminal front end: every stdin line is one chat message.
//
//   /abort            cancel the running prompt
//   /context <text>   hand background-task output to the session
//   /state            show the runtime state
//   /quit             exit
//
// Configured through the usual environment variables (CLI_AGENT, ...).

namespace
{
std::mutex g_output_mutex;

class StdioContext : public acpbridge::MessageContext
{
  public:
    explicit StdioContext(std::string text) : text_(std::move(text)) {}

    std::string text() const override
    {
        return text_;
    }

    std::string chat_id() const override
    {
        return "stdin";
    }

    std::function<void()> start_typing() override
    {
        print("(thinking...)");
        return [] {};
    }

    void send_text(const std::string& text) override
    {
        print("[agent] " + text);
    }

  private:
    static void print(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::cout << line << "\n" << std::flush;
    }

    std::string text_;
};
} // namespace

int main()
{
    acpbridge::log::configure_from_environment();
    std::cout << "acpbridge version: " << acpbridge::version_string() << "\n";

    acpbridge::BridgeConfig config;
    try
    {
        config = acpbridge::load_config_from_environment();
    }
    catch (const acpbridge::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<acpbridge::CliAgent> agent =
        acpbridge::create_cli_agent(config.agent_type, config.agent);
    auto validation = agent->validate();
    if (!validation.valid)
    {
        std::cerr << "Error: " << validation.error << "\n";
        return 1;
    }

    acpbridge::ContextQueue pending_context(config.home_dir);

    acpbridge::RuntimeHooks hooks;
    hooks.ensure_memory_file = [&config]
    { std::filesystem::create_directories(config.home_dir); };
    hooks.build_prompt_with_memory = [&pending_context](const std::string& text, bool fresh_session)
    {
        // Only a fresh session has not seen queued background results yet
        if (!fresh_session)
            return text;
        std::string pending = acpbridge::format_for_prompt(pending_context.load_and_clear());
        return pending.empty() ? text : pending + "\n\n" + text;
    };

    acpbridge::AcpRuntime runtime(agent, config.runtime, hooks);
    runtime.schedule_prewarm("startup");

    acpbridge::MessageProcessor processor(runtime, config.processor, config.runtime.debug_stream);

    acpbridge::MessageQueue<std::shared_ptr<StdioContext>> queue(
        [&processor](std::shared_ptr<StdioContext>& context, long request_id)
        {
            try
            {
                processor.process(*context, request_id);
            }
            catch (const std::exception& e)
            {
                context->send_text(acpbridge::format_failure_message(e));
                throw;
            }
        });

    std::cout << agent->display_name() << " ready. Type a message, or /quit.\n";

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        if (line == "/quit")
            break;

        if (line == "/abort")
        {
            runtime.request_manual_abort();
            runtime.cancel_active_prompt();
            continue;
        }

        if (line == "/state")
        {
            auto state = runtime.runtime_state();
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "state=" << acpbridge::to_string(state.state)
                      << " session_ready=" << state.session_ready
                      << " process_running=" << state.process_running
                      << " queued=" << queue.size() << "\n";
            continue;
        }

        if (line.rfind("/context ", 0) == 0)
        {
            std::string text = line.substr(9);
            if (!runtime.append_context(text))
                pending_context.append(acpbridge::make_context_entry(
                    "manual-" + std::to_string(std::hash<std::string>{}(text) % 100000), text));
            continue;
        }

        queue.enqueue(std::make_shared<StdioContext>(line));
    }

    runtime.shutdown("stdin closed");
    return 0;
}
