#include "provmark/server.hpp"

#include <iostream>

#include "provmark/errors.hpp"

namespace ProvMark {
    namespace net {

        namespace {

            ErrorCode lookup_error_code(MatchStatus status) {
                switch (status) {
                    case MatchStatus::HASH_MISMATCH:
                        return ErrorCode::HASH_MISMATCH;
                    case MatchStatus::NOT_FOUND:
                        return ErrorCode::NOT_FOUND;
                    default:
                        return ErrorCode::OK;
                }
            }

            Response ok(const Request& request, nlohmann::json body) {
                Response response;
                response.request_id = request.request_id;
                response.body = std::move(body);
                return response;
            }

        }  // namespace

        ProvenanceServer::ProvenanceServer(ProvenanceService& service) : service_(service) {
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_open_handler(std::bind(&ProvenanceServer::on_open, this, std::placeholders::_1));
            server_.set_close_handler(std::bind(&ProvenanceServer::on_close, this, std::placeholders::_1));
            server_.set_message_handler(
                std::bind(&ProvenanceServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
            server_.clear_access_channels(websocketpp::log::alevel::all);

            register_service_handlers();
        }

        ProvenanceServer::~ProvenanceServer() {
            stop();
        }

        void ProvenanceServer::run(uint16_t port) {
            if (server_thread_) {
                throw LogicError("Server is already running.");
            }

            websocketpp::lib::error_code ec;
            server_.listen(port, ec);
            if (ec) {
                throw RuntimeError("Could not listen on port " + std::to_string(port) + ": " + ec.message());
            }
            server_.start_accept(ec);
            if (ec) {
                throw RuntimeError("Could not accept connections: " + ec.message());
            }

            server_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    server_.run();
                } catch (const std::exception& e) {
                    std::cerr << "Server thread exception: " << e.what() << std::endl;
                }
            });
            std::cerr << "[SERVER] Listening on port " << port << std::endl;
        }

        void ProvenanceServer::stop() {
            if (!server_thread_) {
                return;
            }

            // Connection state belongs to the I/O thread; shut down from there.
            server_.get_io_service().post([this]() {
                websocketpp::lib::error_code ec;
                if (server_.is_listening()) {
                    server_.stop_listening(ec);
                }
                std::lock_guard<std::mutex> lock(connections_mutex_);
                for (const auto& hdl : connections_) {
                    server_.close(hdl, websocketpp::close::status::going_away, "Server shutdown", ec);
                    if (ec) {
                        std::cerr << "[SERVER] Close failed: " << ec.message() << std::endl;
                    }
                }
            });

            if (server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();
        }

        void ProvenanceServer::register_request_handler(Message::OpCode op_code, RequestHandler handler) {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_[op_code] = std::move(handler);
        }

        void ProvenanceServer::register_service_handlers() {
            register_request_handler(Ops::SUBMIT_RECORD, [this](const Request& request) {
                SubmitResult result = service_.submit(request.body.get<ProvenanceRecord>());
                if (result.code != ErrorCode::OK) {
                    std::cerr << "[SERVER] Submit rejected (" << to_string(result.code) << "): " << result.message
                              << std::endl;
                }
                Response response = ok(request, result);
                response.code = result.code;
                return response;
            });

            register_request_handler(Ops::GET_RECORD, [this](const Request& request) {
                std::string id = request.body.at("id").get<std::string>();
                std::optional<ProvenanceRecord> record = service_.get(id);
                if (!record) {
                    return Response::failure(request.request_id, ErrorCode::NOT_FOUND, "Record not found");
                }
                return ok(request, *record);
            });

            register_request_handler(Ops::LIST_RECORDS, [this](const Request& request) {
                return ok(request, {{"records", service_.list_recent()}});
            });

            register_request_handler(Ops::FIND_BY_HASH, [this](const Request& request) {
                std::string hash = request.body.at("contentHash").get<std::string>();
                return ok(request, {{"records", service_.find_by_hash(hash)}});
            });

            register_request_handler(Ops::LOOKUP, [this](const Request& request) {
                LookupResult result = service_.lookup(request.body.get<LookupRequest>());
                Response response = ok(request, result);
                response.code = lookup_error_code(result.match.status);
                return response;
            });

            register_request_handler(Ops::DELETE_RECORD, [this](const Request& request) {
                DeleteRequest delete_request = request.body.get<DeleteRequest>();
                DeleteOutcome outcome = service_.delete_record(delete_request);
                std::cerr << "[SERVER] Delete " << delete_request.id << (delete_request.verify_only ? " (verify only)" : "")
                          << ": " << to_string(outcome) << std::endl;

                Response response = ok(request, {{"id", delete_request.id}, {"outcome", to_string(outcome)}});
                response.code = to_error_code(outcome);
                return response;
            });
        }

        byte_vector ProvenanceServer::handle_frame(const byte_vector& frame) {
            Message message = Message::deserialize(frame);
            if (message.op_code == Ops::RESPONSE) {
                throw RuntimeError("Clients may not send response frames.");
            }
            MessageReader reader(message);
            uint32_t request_id = reader.read_param<uint32_t>();

            std::string body_text;
            try {
                body_text = reader.read_param<std::string>();
            } catch (const RuntimeError& e) {
                return Response::failure(request_id, ErrorCode::MALFORMED_INPUT, e.what()).encode();
            }
            return dispatch(message.op_code, request_id, body_text).encode();
        }

        Response ProvenanceServer::dispatch(Message::OpCode op_code, uint32_t request_id, const std::string& body_text) {
            RequestHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlers_mutex_);
                auto it = handlers_.find(op_code);
                if (it != handlers_.end()) {
                    handler = it->second;
                }
            }
            if (!handler) {
                return Response::failure(request_id, ErrorCode::MALFORMED_INPUT,
                                         "Unknown operation code: " + std::to_string(op_code));
            }

            try {
                Request request;
                request.op_code = op_code;
                request.request_id = request_id;
                request.body = nlohmann::json::parse(body_text);
                return handler(request);
            } catch (const MalformedInput& e) {
                std::cerr << "[SERVER] Request " << request_id << " (op " << op_code << ") rejected: " << e.what()
                          << std::endl;
                return Response::failure(request_id, ErrorCode::MALFORMED_INPUT, e.what());
            } catch (const nlohmann::json::exception& e) {
                return Response::failure(request_id, ErrorCode::MALFORMED_INPUT, e.what());
            } catch (const std::exception& e) {
                std::cerr << "[SERVER] Request " << request_id << " (op " << op_code << ") failed: " << e.what()
                          << std::endl;
                return Response::failure(request_id, ErrorCode::INTERNAL, "Internal server error");
            }
        }

        void ProvenanceServer::on_open(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.insert(hdl);
        }

        void ProvenanceServer::on_close(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.erase(hdl);
        }

        void ProvenanceServer::on_message(WsConnectionHdl hdl, WsMessagePtr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            try {
                byte_vector frame(msg->get_payload().begin(), msg->get_payload().end());
                byte_vector response = handle_frame(frame);
                server_.send(hdl, response.data(), response.size(), BINDATA_OPCODE);
            } catch (const std::exception& e) {
                std::cerr << "[SERVER] Dropping undecodable frame: " << e.what() << std::endl;
                websocketpp::lib::error_code ec;
                server_.close(hdl, websocketpp::close::status::protocol_error, "Malformed frame", ec);
            }
        }

    }  // namespace net
}  // namespace ProvMark
