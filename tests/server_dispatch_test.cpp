#include <gtest/gtest.h>
#include "provmark/authorization.hpp"
#include "provmark/crypto.hpp"
#include "provmark/errors.hpp"
#include "provmark/record_store.hpp"
#include "provmark/server.hpp"
#include "provmark/service.hpp"
#include "test_records.hpp"
#include <string>

namespace {

constexpr int64_t NOW = 1704067200000;

}  // namespace

// Frames go straight through handle_frame; no socket is opened.
class ServerDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ProvMark::Crypto::init(), 0);
        keys_ = ProvMark::IdentityKeyManager::generate_keypair();
    }

    ProvMark::Response call(ProvMark::Message::OpCode op, uint32_t id, const nlohmann::json& body) {
        ProvMark::Request request;
        request.op_code = op;
        request.request_id = id;
        request.body = body;
        return ProvMark::Response::decode(server_.handle_frame(request.encode()));
    }

    std::string submit(const std::string& content) {
        nlohmann::json record = ProvMark::test::signed_record(keys_, content, "2024-01-01T00:00:00.000Z");
        ProvMark::Response response = call(ProvMark::Ops::SUBMIT_RECORD, 1, record);
        EXPECT_EQ(response.code, ProvMark::ErrorCode::OK);
        return response.body.value("id", "");
    }

    ProvMark::KeyPairHex keys_;
    ProvMark::InMemoryRecordStore store_;
    ProvMark::ProvenanceService service_{store_, ProvMark::ServiceOptions(), [] { return NOW; }};
    ProvMark::net::ProvenanceServer server_{service_};
};

TEST_F(ServerDispatchTest, SubmitThenGet) {
    // 1. Submit a signed record
    std::string id = submit("hello");
    ASSERT_FALSE(id.empty());

    // 2. Fetch it back; the request id is echoed
    ProvMark::Response response = call(ProvMark::Ops::GET_RECORD, 77, {{"id", id}});
    ASSERT_EQ(response.request_id, 77u);
    ASSERT_EQ(response.code, ProvMark::ErrorCode::OK);
    ProvMark::ProvenanceRecord record = response.body.get<ProvMark::ProvenanceRecord>();
    ASSERT_EQ(record.id, id);
    ASSERT_EQ(record.title, "Record hello");

    // 3. Unknown id
    ProvMark::Response missing = call(ProvMark::Ops::GET_RECORD, 78, {{"id", "nope"}});
    ASSERT_EQ(missing.code, ProvMark::ErrorCode::NOT_FOUND);
    ASSERT_TRUE(missing.body.contains("error"));
}

TEST_F(ServerDispatchTest, SubmitWithForeignSignatureIsRefused) {
    ProvMark::ProvenanceRecord record = ProvMark::test::signed_record(keys_, "a", "2024-01-01T00:00:00.000Z");
    record.signature = ProvMark::test::signed_record(keys_, "b", "2024-01-01T00:00:00.000Z").signature;

    ::testing::internal::CaptureStderr();
    ProvMark::Response response = call(ProvMark::Ops::SUBMIT_RECORD, 2, record);
    std::string log = ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(response.code, ProvMark::ErrorCode::SIGNATURE_INVALID);
    ASSERT_EQ(store_.count(), 0u);
    ASSERT_NE(log.find("[SERVER] Submit rejected (SIGNATURE_INVALID)"), std::string::npos);
}

TEST_F(ServerDispatchTest, MalformedSubmitIsLogged) {
    ::testing::internal::CaptureStderr();
    ProvMark::Response response = call(ProvMark::Ops::SUBMIT_RECORD, 3, {{"title", "only"}});
    std::string log = ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(response.code, ProvMark::ErrorCode::MALFORMED_INPUT);
    ASSERT_NE(log.find("rejected"), std::string::npos);
}

TEST_F(ServerDispatchTest, ListAndFindByHash) {
    std::string id = submit("listed");
    ProvMark::ProvenanceRecord stored = *service_.get(id);

    ProvMark::Response list = call(ProvMark::Ops::LIST_RECORDS, 3, nlohmann::json::object());
    ASSERT_EQ(list.code, ProvMark::ErrorCode::OK);
    ASSERT_EQ(list.body["records"].size(), 1u);

    ProvMark::Response found = call(ProvMark::Ops::FIND_BY_HASH, 4, {{"contentHash", stored.content_hash}});
    ASSERT_EQ(found.code, ProvMark::ErrorCode::OK);
    ASSERT_EQ(found.body["records"].size(), 1u);
    ASSERT_EQ(found.body["records"][0]["id"], id);
}

TEST_F(ServerDispatchTest, LookupCodes) {
    std::string id = submit("original");
    ProvMark::ProvenanceRecord stored = *service_.get(id);

    ProvMark::Response match = call(ProvMark::Ops::LOOKUP, 5, {{"contentHash", stored.content_hash}});
    ASSERT_EQ(match.code, ProvMark::ErrorCode::OK);
    ASSERT_EQ(match.body["status"], "FOUND");

    std::string other_hash(64, 'f');
    ProvMark::Response mismatch =
        call(ProvMark::Ops::LOOKUP, 6, {{"contentHash", other_hash}, {"recordId", id}});
    ASSERT_EQ(mismatch.code, ProvMark::ErrorCode::HASH_MISMATCH);
    ASSERT_EQ(mismatch.body["status"], "HASH_MISMATCH");

    ProvMark::Response none = call(ProvMark::Ops::LOOKUP, 7, {{"contentHash", other_hash}});
    ASSERT_EQ(none.code, ProvMark::ErrorCode::NOT_FOUND);
    ASSERT_EQ(none.body["status"], "NOT_FOUND");
}

TEST_F(ServerDispatchTest, DeleteFlow) {
    std::string id = submit("doomed");

    // 1. Stale timestamp
    int64_t stale = NOW - ProvMark::ACTION_WINDOW_MILLIS - 1;
    nlohmann::json expired = {{"id", id},
                              {"timestamp", stale},
                              {"signature", ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, id, stale,
                                                                                    keys_.private_key)}};
    ProvMark::Response expired_response = call(ProvMark::Ops::DELETE_RECORD, 8, expired);
    ASSERT_EQ(expired_response.code, ProvMark::ErrorCode::ACTION_EXPIRED);
    ASSERT_EQ(expired_response.body["outcome"], "EXPIRED");

    // 2. Signed by someone else
    ProvMark::KeyPairHex stranger = ProvMark::IdentityKeyManager::generate_keypair();
    nlohmann::json forged = {{"id", id},
                             {"timestamp", NOW},
                             {"signature", ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, id, NOW,
                                                                                   stranger.private_key)}};
    ASSERT_EQ(call(ProvMark::Ops::DELETE_RECORD, 9, forged).code, ProvMark::ErrorCode::SIGNATURE_INVALID);

    // 3. Valid: verify-only leaves the record, then a real delete removes it
    std::string signature = ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, id, NOW, keys_.private_key);
    nlohmann::json valid = {{"id", id}, {"timestamp", NOW}, {"signature", signature}, {"verify_only", true}};
    ProvMark::Response verified = call(ProvMark::Ops::DELETE_RECORD, 10, valid);
    ASSERT_EQ(verified.code, ProvMark::ErrorCode::OK);
    ASSERT_EQ(verified.body["outcome"], "VERIFIED");
    ASSERT_EQ(store_.count(), 1u);

    valid["verify_only"] = false;
    ProvMark::Response deleted = call(ProvMark::Ops::DELETE_RECORD, 11, valid);
    ASSERT_EQ(deleted.code, ProvMark::ErrorCode::OK);
    ASSERT_EQ(deleted.body["outcome"], "DELETED");
    ASSERT_EQ(store_.count(), 0u);

    // 4. Gone now
    ASSERT_EQ(call(ProvMark::Ops::DELETE_RECORD, 12, valid).code, ProvMark::ErrorCode::NOT_FOUND);
}

TEST_F(ServerDispatchTest, MalformedRequests) {
    // Unknown operation
    ProvMark::Response unknown = call(0x0999, 13, nlohmann::json::object());
    ASSERT_EQ(unknown.code, ProvMark::ErrorCode::MALFORMED_INPUT);
    ASSERT_EQ(unknown.request_id, 13u);

    // Missing required field
    ASSERT_EQ(call(ProvMark::Ops::GET_RECORD, 14, nlohmann::json::object()).code,
              ProvMark::ErrorCode::MALFORMED_INPUT);
    ASSERT_EQ(call(ProvMark::Ops::SUBMIT_RECORD, 15, {{"title", "only"}}).code,
              ProvMark::ErrorCode::MALFORMED_INPUT);
    ASSERT_EQ(call(ProvMark::Ops::LOOKUP, 16, {{"contentHash", "xyz"}}).code, ProvMark::ErrorCode::MALFORMED_INPUT);

    // Body that is not JSON
    ProvMark::byte_vector not_json = ProvMark::MessageBuilder(ProvMark::Ops::GET_RECORD)
                                         .add_param(static_cast<uint32_t>(17))
                                         .add_param("{not json")
                                         .build()
                                         .serialize();
    ProvMark::Response bad_body = ProvMark::Response::decode(server_.handle_frame(not_json));
    ASSERT_EQ(bad_body.request_id, 17u);
    ASSERT_EQ(bad_body.code, ProvMark::ErrorCode::MALFORMED_INPUT);

    // No request id at all
    ProvMark::byte_vector no_id = ProvMark::MessageBuilder(ProvMark::Ops::GET_RECORD).build().serialize();
    ASSERT_THROW(server_.handle_frame(no_id), ProvMark::RuntimeError);
}
