#ifndef ACPBRIDGE_PROTOCOL_JSONRPC_HPP
#define ACPBRIDGE_PROTOCOL_JSONRPC_HPP

#include <acpbridge/types.hpp>
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace acpbridge
{
namespace protocol
{

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

enum class MessageKind
{
    Request,      // method + id
    Notification, // method, no id
    Response,     // result or error + id
    Invalid
};

MessageKind classify_message(const json& message);

// JSON-RPC peer - correlates outgoing requests with their responses.
// Framing is the caller's business: every build_* result ends with '\n'.
class JsonRpcPeer
{
  public:
    using WriteFunc = std::function<void(const std::string&)>;
    // Exactly one of result / error is meaningful
    using ResponseCallback = std::function<void(const json& result, std::exception_ptr error)>;

    JsonRpcPeer();
    ~JsonRpcPeer();

    JsonRpcPeer(const JsonRpcPeer&) = delete;
    JsonRpcPeer& operator=(const JsonRpcPeer&) = delete;

    // Send a request and block for the response.
    // Throws RpcError on an error response, BridgeError on timeout (timeout_ms <= 0 waits forever).
    json send_request(const WriteFunc& write_func, const std::string& method, const json& params,
                      int timeout_ms = 60000);

    // Send a request; callback runs on the thread that delivers the response
    void send_request_async(const WriteFunc& write_func, const std::string& method,
                            const json& params, ResponseCallback callback);

    void send_notification(const WriteFunc& write_func, const std::string& method,
                           const json& params);

    // Handle an incoming response message
    void handle_response(const json& message);

    // Reject every pending request with ConnectionClosedError(reason)
    void fail_all_pending(const std::string& reason);

    size_t pending_count() const;

    // Message builders
    std::string build_request_message(long id, const std::string& method, const json& params) const;
    static std::string build_notification(const std::string& method, const json& params);
    static std::string build_result_response(const json& id, const json& result);
    static std::string build_error_response(const json& id, int code, const std::string& message);

  private:
    long register_request(ResponseCallback callback);
    std::optional<ResponseCallback> take_pending(long id);

    std::atomic<long> next_id_{0};
    std::map<long, ResponseCallback> pending_;
    mutable std::mutex mutex_;
};

} // namespace protocol
} // namespace acpbridge

#endif // ACPBRIDGE_PROTOCOL_JSONRPC_HPP
