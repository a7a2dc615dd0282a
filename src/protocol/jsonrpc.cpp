#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <acpbridge/protocol/jsonrpc.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <vector>

namespace acpbridge
{
namespace protocol
{

namespace
{
// "Internal error: <details>" - keep whatever the agent put in data
std::string describe_error(const json& error)
{
    std::string message = error.value("message", "Unknown error");
    if (error.contains("data") && !error["data"].is_null())
    {
        const auto& data = error["data"];
        if (data.is_string())
            message += ": " + data.get<std::string>();
        else if (data.is_object() && data.contains("details") && data["details"].is_string())
            message += ": " + data["details"].get<std::string>();
        else
            message += ": " + data.dump();
    }
    return message;
}
} // namespace

MessageKind classify_message(const json& message)
{
    if (!message.is_object())
        return MessageKind::Invalid;

    bool has_id = message.contains("id") && !message["id"].is_null();
    if (message.contains("method") && message["method"].is_string())
        return has_id ? MessageKind::Request : MessageKind::Notification;
    if (has_id && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;
    return MessageKind::Invalid;
}

JsonRpcPeer::JsonRpcPeer() = default;

JsonRpcPeer::~JsonRpcPeer()
{
    fail_all_pending("JSON-RPC peer shutting down");
}

long JsonRpcPeer::register_request(ResponseCallback callback)
{
    long id = next_id_++;
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.emplace(id, std::move(callback));
    return id;
}

std::optional<JsonRpcPeer::ResponseCallback> JsonRpcPeer::take_pending(long id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
        return std::nullopt;
    auto callback = std::move(it->second);
    pending_.erase(it);
    return callback;
}

std::string JsonRpcPeer::build_request_message(long id, const std::string& method,
                                               const json& params) const
{
    json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return msg.dump() + "\n";
}

std::string JsonRpcPeer::build_notification(const std::string& method, const json& params)
{
    json msg = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    return msg.dump() + "\n";
}

std::string JsonRpcPeer::build_result_response(const json& id, const json& result)
{
    json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    return msg.dump() + "\n";
}

std::string JsonRpcPeer::build_error_response(const json& id, int code, const std::string& message)
{
    json msg = {
        {"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
    return msg.dump() + "\n";
}

void JsonRpcPeer::send_request_async(const WriteFunc& write_func, const std::string& method,
                                     const json& params, ResponseCallback callback)
{
    // Register pending request BEFORE sending
    long id = register_request(std::move(callback));
    try
    {
        write_func(build_request_message(id, method, params));
    }
    catch (const std::exception&)
    {
        take_pending(id);
        throw;
    }
}

json JsonRpcPeer::send_request(const WriteFunc& write_func, const std::string& method,
                               const json& params, int timeout_ms)
{
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();

    long id = next_id_++;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace(id,
                         [promise](const json& result, std::exception_ptr error)
                         {
                             if (error)
                                 promise->set_exception(error);
                             else
                                 promise->set_value(result);
                         });
    }

    try
    {
        write_func(build_request_message(id, method, params));
    }
    catch (const std::exception&)
    {
        take_pending(id);
        throw;
    }

    if (timeout_ms > 0)
    {
        auto status = future.wait_for(std::chrono::milliseconds(timeout_ms));
        if (status == std::future_status::timeout)
        {
            // A response racing the timeout still owns the callback; only throw if we removed it
            if (take_pending(id))
                throw BridgeError("Request timed out after " + std::to_string(timeout_ms) +
                                  "ms: " + method);
        }
    }

    return future.get();
}

void JsonRpcPeer::send_notification(const WriteFunc& write_func, const std::string& method,
                                    const json& params)
{
    write_func(build_notification(method, params));
}

void JsonRpcPeer::handle_response(const json& message)
{
    const auto& id_json = message.at("id");
    if (!id_json.is_number_integer())
    {
        log::get()->warn("Ignoring JSON-RPC response with unexpected id: {}", id_json.dump());
        return;
    }

    auto callback = take_pending(id_json.get<long>());
    if (!callback)
    {
        log::get()->debug("Ignoring JSON-RPC response for unknown id {}", id_json.dump());
        return;
    }

    if (message.contains("error") && !message["error"].is_null())
    {
        const auto& error = message["error"];
        int code = error.is_object() ? error.value("code", INTERNAL_ERROR) : INTERNAL_ERROR;
        std::string text = error.is_object() ? describe_error(error) : error.dump();
        (*callback)(json(), std::make_exception_ptr(RpcError(text, code)));
        return;
    }

    (*callback)(message.value("result", json()), nullptr);
}

void JsonRpcPeer::fail_all_pending(const std::string& reason)
{
    std::map<long, ResponseCallback> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }

    for (auto& [id, callback] : pending)
    {
        try
        {
            callback(json(), std::make_exception_ptr(ConnectionClosedError(reason)));
        }
        catch (const std::exception& e)
        {
            log::get()->warn("Pending request {} callback threw: {}", id, e.what());
        }
    }
}

size_t JsonRpcPeer::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace protocol
} // namespace acpbridge
