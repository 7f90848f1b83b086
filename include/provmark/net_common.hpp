#ifndef PROVMARK_NET_COMMON_HPP
#define PROVMARK_NET_COMMON_HPP

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/client.hpp>

#include <chrono>

namespace ProvMark {
namespace net {

    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using WsClient = websocketpp::client<websocketpp::config::asio>;
    using WsConnectionHdl = websocketpp::connection_hdl;
    using WsMessagePtr = WsServer::message_ptr;
    using WsClientMessagePtr = WsClient::message_ptr;

    // All frames are binary; text frames are ignored.
    const websocketpp::frame::opcode::value BINDATA_OPCODE = websocketpp::frame::opcode::binary;

    constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{10000};

} // namespace net
} // namespace ProvMark

#endif // PROVMARK_NET_COMMON_HPP
