#include <acpbridge/protocol/acp.hpp>

namespace acpbridge
{
namespace protocol
{

namespace
{
std::string string_field(const json& j, const char* key)
{
    if (j.is_object() && j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return {};
}

json cancelled_outcome()
{
    return json{{"outcome", {{"outcome", "cancelled"}}}};
}
} // namespace

SessionNotification parse_session_notification(const json& params)
{
    SessionNotification notification;
    notification.session_id = string_field(params, "sessionId");

    const json update = params.is_object() ? params.value("update", json::object()) : json::object();
    std::string kind = string_field(update, "sessionUpdate");
    const json content = update.is_object() ? update.value("content", json()) : json();
    bool is_text = string_field(content, "type") == "text";

    if (kind == "agent_message_chunk" && is_text)
        notification.update = MessageChunk{string_field(content, "text")};
    else if (kind == "agent_thought_chunk")
        notification.update = ThoughtChunk{string_field(content, "text")};
    else
        notification.update = OtherUpdate{kind, update};

    return notification;
}

std::vector<PermissionOption> parse_permission_options(const json& params)
{
    std::vector<PermissionOption> options;
    if (!params.is_object() || !params.contains("options") || !params["options"].is_array())
        return options;

    for (const auto& option : params["options"])
    {
        PermissionOption parsed;
        parsed.option_id = string_field(option, "optionId");
        parsed.kind = string_field(option, "kind");
        parsed.name = string_field(option, "name");
        if (!parsed.option_id.empty())
            options.push_back(std::move(parsed));
    }
    return options;
}

json build_permission_response(const std::vector<PermissionOption>& options,
                               const std::string& strategy)
{
    if (strategy == "cancelled" || options.empty())
        return cancelled_outcome();

    const PermissionOption* selected = &options.front();
    for (const auto& option : options)
    {
        if (option.kind == strategy)
        {
            selected = &option;
            break;
        }
    }

    return json{{"outcome", {{"outcome", "selected"}, {"optionId", selected->option_id}}}};
}

json build_text_prompt(const std::string& text)
{
    return json::array({json{{"type", "text"}, {"text", text}}});
}

json no_op_file_operation(const json&)
{
    return json::object();
}

} // namespace protocol
} // namespace acpbridge
