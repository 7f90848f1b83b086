#include "provmark/client.hpp"

#include <iostream>

#include "provmark/errors.hpp"

namespace ProvMark {
    namespace net {

        ProvenanceClient::ProvenanceClient() {
            client_.init_asio();
            client_.set_open_handler(std::bind(&ProvenanceClient::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&ProvenanceClient::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&ProvenanceClient::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&ProvenanceClient::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
            client_.clear_error_channels(websocketpp::log::elevel::all);
        }

        ProvenanceClient::~ProvenanceClient() {
            disconnect();
        }

        void ProvenanceClient::connect(const std::string& uri) {
            if (client_thread_) {
                throw LogicError("Client is already connected or connecting.");
            }

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(uri, ec);
            if (ec) {
                throw RuntimeError("Could not create connection: " + ec.message());
            }

            set_state(State::CONNECTING);
            client_.connect(con);
            client_thread_ = std::make_unique<std::thread>(&ProvenanceClient::run_client, this);
        }

        bool ProvenanceClient::wait_until_ready(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait_for(lock, timeout, [this]() { return state_ != State::CONNECTING; });
            return state_ == State::OPEN;
        }

        void ProvenanceClient::disconnect() {
            if (!client_thread_) {
                return;
            }

            if (is_connected()) {
                websocketpp::lib::error_code ec;
                client_.close(connection_hdl_, websocketpp::close::status::going_away, "", ec);
                if (ec) {
                    // Already closing; stop the loop outright.
                    client_.stop();
                }
            } else {
                client_.stop();
            }

            if (client_thread_->joinable()) {
                client_thread_->join();
            }
            client_thread_.reset();

            fail_pending("Client disconnected");
            set_state(State::CLOSED);
        }

        bool ProvenanceClient::is_connected() const {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_ == State::OPEN;
        }

        std::future<Response> ProvenanceClient::async_request(Message::OpCode op_code, const nlohmann::json& body) {
            uint32_t request_id = 0;
            return send_request(op_code, body, request_id);
        }

        std::future<Response> ProvenanceClient::send_request(Message::OpCode op_code, const nlohmann::json& body,
                                                             uint32_t& request_id) {
            if (!is_connected()) {
                throw LogicError("Client not connected.");
            }

            Request request;
            request.op_code = op_code;
            request.request_id = next_request_id_++;
            request.body = body;
            request_id = request.request_id;

            auto promise = std::promise<Response>();
            auto future = promise.get_future();
            {
                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                pending_requests_[request.request_id] = std::move(promise);
            }

            byte_vector frame = request.encode();
            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, frame.data(), frame.size(), BINDATA_OPCODE, ec);
            if (ec) {
                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                pending_requests_.erase(request.request_id);
                throw RuntimeError("Error sending request: " + ec.message());
            }
            return future;
        }

        Response ProvenanceClient::request(Message::OpCode op_code, const nlohmann::json& body,
                                           std::chrono::milliseconds timeout) {
            uint32_t request_id = 0;
            std::future<Response> future = send_request(op_code, body, request_id);
            if (future.wait_for(timeout) != std::future_status::ready) {
                {
                    std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                    pending_requests_.erase(request_id);
                }
                throw RuntimeError("Request timed out after " + std::to_string(timeout.count()) + " ms.");
            }
            return future.get();
        }

        SubmitResult ProvenanceClient::submit(const ProvenanceRecord& record) {
            Response response = request(Ops::SUBMIT_RECORD, record);
            if (response.code != ErrorCode::OK && response.code != ErrorCode::SIGNATURE_INVALID) {
                throw RuntimeError(std::string("Submit failed (") + to_string(response.code) +
                                   "): " + response.body.value("error", std::string()));
            }
            SubmitResult result = response.body.get<SubmitResult>();
            result.code = response.code;
            return result;
        }

        std::optional<ProvenanceRecord> ProvenanceClient::get_record(const std::string& id) {
            Response response = request(Ops::GET_RECORD, {{"id", id}});
            if (response.code == ErrorCode::NOT_FOUND) {
                return std::nullopt;
            }
            if (response.code != ErrorCode::OK) {
                throw RuntimeError(std::string("Get failed (") + to_string(response.code) +
                                   "): " + response.body.value("error", std::string()));
            }
            return response.body.get<ProvenanceRecord>();
        }

        LookupResult ProvenanceClient::lookup(const LookupRequest& lookup_request) {
            Response response = request(Ops::LOOKUP, lookup_request);
            if (!response.body.contains("status")) {
                throw RuntimeError(std::string("Lookup failed (") + to_string(response.code) +
                                   "): " + response.body.value("error", std::string()));
            }
            return response.body.get<LookupResult>();
        }

        Response ProvenanceClient::delete_record(const DeleteRequest& delete_request) {
            return request(Ops::DELETE_RECORD, delete_request);
        }

        size_t ProvenanceClient::pending_count() const {
            std::lock_guard<std::mutex> lock(pending_requests_mutex_);
            return pending_requests_.size();
        }

        void ProvenanceClient::fail_pending(const std::string& reason) {
            std::lock_guard<std::mutex> lock(pending_requests_mutex_);
            for (auto& pair : pending_requests_) {
                pair.second.set_exception(std::make_exception_ptr(RuntimeError(reason)));
            }
            pending_requests_.clear();
        }

        void ProvenanceClient::set_state(State state) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = state;
            }
            state_cv_.notify_all();
        }

        void ProvenanceClient::on_open(WsConnectionHdl hdl) {
            connection_hdl_ = hdl;
            set_state(State::OPEN);
        }

        void ProvenanceClient::on_close(WsConnectionHdl hdl) {
            set_state(State::CLOSED);
            fail_pending("Connection closed");
        }

        void ProvenanceClient::on_fail(WsConnectionHdl hdl) {
            WsClient::connection_ptr con = client_.get_con_from_hdl(hdl);
            std::cerr << "Connection failed: " << con->get_ec().message() << std::endl;
            set_state(State::CLOSED);
            fail_pending("Connection failed");
        }

        void ProvenanceClient::on_message(WsConnectionHdl hdl, WsClientMessagePtr msg) {
            if (msg->get_opcode() != BINDATA_OPCODE) {
                return;  // Ignore non-binary messages
            }

            try {
                byte_vector frame(msg->get_payload().begin(), msg->get_payload().end());
                Response response = Response::decode(frame);

                std::lock_guard<std::mutex> lock(pending_requests_mutex_);
                auto it = pending_requests_.find(response.request_id);
                if (it != pending_requests_.end()) {
                    it->second.set_value(std::move(response));
                    pending_requests_.erase(it);
                } else {
                    std::cerr << "Received response for unknown or already handled request ID: "
                              << response.request_id << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Message processing failed: " << e.what() << std::endl;
            }
        }

        void ProvenanceClient::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "Client thread exception: " << e.what() << std::endl;
            }
        }

    }  // namespace net
}  // namespace ProvMark
