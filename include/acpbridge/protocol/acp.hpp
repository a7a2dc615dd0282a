#ifndef ACPBRIDGE_PROTOCOL_ACP_HPP
#define ACPBRIDGE_PROTOCOL_ACP_HPP

#include <acpbridge/types.hpp>
#include <string>
#include <variant>
#include <vector>

namespace acpbridge
{
namespace protocol
{

// Agent-side methods
constexpr const char* METHOD_INITIALIZE = "initialize";
constexpr const char* METHOD_SESSION_NEW = "session/new";
constexpr const char* METHOD_SESSION_PROMPT = "session/prompt";
constexpr const char* METHOD_SESSION_CANCEL = "session/cancel";

// Client-side methods (agent -> us)
constexpr const char* METHOD_SESSION_UPDATE = "session/update";
constexpr const char* METHOD_REQUEST_PERMISSION = "session/request_permission";
constexpr const char* METHOD_READ_TEXT_FILE = "fs/read_text_file";
constexpr const char* METHOD_WRITE_TEXT_FILE = "fs/write_text_file";

constexpr const char* STOP_REASON_CANCELLED = "cancelled";

// ============================================================================
// session/update
// ============================================================================

/// agent_message_chunk with text content - user-visible output
struct MessageChunk
{
    std::string text;
};

/// agent_thought_chunk - reasoning, never forwarded
struct ThoughtChunk
{
    std::string text;
};

/// Any other update kind (tool calls, plans, non-text content, ...)
struct OtherUpdate
{
    std::string kind;
    json raw;
};

using SessionUpdate = std::variant<MessageChunk, ThoughtChunk, OtherUpdate>;

struct SessionNotification
{
    std::string session_id;
    SessionUpdate update;
};

// Parse session/update params. Missing fields degrade to OtherUpdate.
SessionNotification parse_session_notification(const json& params);

// ============================================================================
// session/request_permission
// ============================================================================

struct PermissionOption
{
    std::string option_id;
    std::string kind; // allow_once, allow_always, reject_once, reject_always
    std::string name;
};

std::vector<PermissionOption> parse_permission_options(const json& params);

/**
 * Answer a permission request according to a strategy.
 *
 * "cancelled" always yields {outcome: {outcome: "cancelled"}}. Any other
 * strategy selects the first option whose kind equals it, falling back to the
 * first option; with no options the request is cancelled.
 */
json build_permission_response(const std::vector<PermissionOption>& options,
                               const std::string& strategy);

// [{type: "text", text}]
json build_text_prompt(const std::string& text);

// fs/read_text_file and fs/write_text_file are acknowledged without touching disk
json no_op_file_operation(const json& params);

} // namespace protocol
} // namespace acpbridge

#endif // ACPBRIDGE_PROTOCOL_ACP_HPP
