#ifndef PROVMARK_CLIENT_HPP
#define PROVMARK_CLIENT_HPP

#include "net_common.hpp"
#include "protocol.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ProvMark {
namespace net {

/**
 * @brief WebSocket client for a ProvenanceServer.
 *
 * Requests are matched to responses by request id, so several may be in
 * flight at once.
 */
class ProvenanceClient {
public:
    ProvenanceClient();
    ~ProvenanceClient();

    ProvenanceClient(const ProvenanceClient&) = delete;
    ProvenanceClient& operator=(const ProvenanceClient&) = delete;

    /**
     * @brief Starts connecting to a ws:// URI on a background thread.
     * @throws ProvMark::RuntimeError if the URI is invalid.
     */
    void connect(const std::string& uri);

    /**
     * @brief Blocks until the connection is open, has failed, or the timeout expires.
     * @return true if the connection is open.
     */
    bool wait_until_ready(std::chrono::milliseconds timeout);

    void disconnect();
    bool is_connected() const;

    /**
     * @brief Sends a request and returns a future for its response.
     *        The future holds a RuntimeError if the connection drops first.
     * @throws ProvMark::LogicError if not connected.
     */
    std::future<Response> async_request(Message::OpCode op_code, const nlohmann::json& body);

    /**
     * @brief Synchronous request. On timeout the request is forgotten and a
     *        late response for it is dropped.
     * @throws ProvMark::RuntimeError on timeout or disconnect.
     */
    Response request(Message::OpCode op_code, const nlohmann::json& body,
                     std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);

    SubmitResult submit(const ProvenanceRecord& record);
    std::optional<ProvenanceRecord> get_record(const std::string& id);
    LookupResult lookup(const LookupRequest& lookup_request);
    Response delete_record(const DeleteRequest& delete_request);

    // Requests sent and still waiting for a response.
    size_t pending_count() const;

private:
    enum class State { IDLE, CONNECTING, OPEN, CLOSED };

    std::future<Response> send_request(Message::OpCode op_code, const nlohmann::json& body, uint32_t& request_id);

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsClientMessagePtr msg);
    void run_client();
    void fail_pending(const std::string& reason);
    void set_state(State state);

    WsClient client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    State state_ = State::IDLE;

    mutable std::mutex pending_requests_mutex_;
    std::map<uint32_t, std::promise<Response>> pending_requests_;
    std::atomic<uint32_t> next_request_id_{0};
};

} // namespace net
} // namespace ProvMark

#endif // PROVMARK_CLIENT_HPP
