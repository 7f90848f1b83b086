#ifndef PROVMARK_SERVER_HPP
#define PROVMARK_SERVER_HPP

#include "net_common.hpp"
#include "protocol.hpp"
#include "service.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace ProvMark {
namespace net {

/**
 * @brief WebSocket front end for a ProvenanceService.
 *
 * Every binary frame is a Request; every Request gets exactly one Response
 * carrying the same request id. Handlers run on the server's I/O thread.
 */
class ProvenanceServer {
public:
    using RequestHandler = std::function<Response(const Request&)>;

    explicit ProvenanceServer(ProvenanceService& service);
    ~ProvenanceServer();

    ProvenanceServer(const ProvenanceServer&) = delete;
    ProvenanceServer& operator=(const ProvenanceServer&) = delete;

    /**
     * @brief Binds the port and starts serving on a background thread.
     * @throws ProvMark::RuntimeError if the port cannot be bound.
     */
    void run(uint16_t port);

    /**
     * @brief Stops accepting, closes open connections and joins the I/O thread.
     */
    void stop();

    /**
     * @brief Registers (or replaces) the handler for an operation code.
     */
    void register_request_handler(Message::OpCode op_code, RequestHandler handler);

    /**
     * @brief Decodes one request frame, dispatches it and encodes the response.
     *        Handler exceptions become error responses.
     * @throws ProvMark::RuntimeError if the frame has no readable request id.
     */
    byte_vector handle_frame(const byte_vector& frame);

private:
    void register_service_handlers();
    Response dispatch(Message::OpCode op_code, uint32_t request_id, const std::string& body_text);

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsMessagePtr msg);

    WsServer server_;
    ProvenanceService& service_;

    std::mutex handlers_mutex_;
    std::map<Message::OpCode, RequestHandler> handlers_;

    std::mutex connections_mutex_;
    std::set<WsConnectionHdl, std::owner_less<WsConnectionHdl>> connections_;

    std::unique_ptr<std::thread> server_thread_;
};

} // namespace net
} // namespace ProvMark

#endif // PROVMARK_SERVER_HPP
