#include <iostream>
#include <string>

#include "provmark/authorization.hpp"
#include "provmark/crypto.hpp"
#include "provmark/identity.hpp"
#include "provmark/record_store.hpp"
#include "provmark/registrar.hpp"
#include "provmark/service.hpp"
#include "provmark/timestamp.hpp"
#include "provmark/verifier.hpp"

int main() {
    // 1. Initialize the crypto library
    if (ProvMark::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // 2. Creator identity
    ProvMark::KeyPairHex keys = ProvMark::IdentityKeyManager::generate_keypair();
    std::cout << "Creator: " << ProvMark::IdentityKeyManager::derive_did(keys.public_key) << std::endl;

    // 3. Register a document
    std::string text = "Field notes, 14 March. Weather clear, wind from the north-west.";
    ProvMark::byte_vector content(text.begin(), text.end());

    ProvMark::RegistrationRequest request;
    request.title = "Field notes";
    request.file_name = "notes.txt";
    request.content_type = "text/plain";
    request.display_name = "Example Author";
    request.usage_policy.license = "CC-BY-4.0";
    request.usage_policy.ai_training = ProvMark::Permission::DENIED;
    request.usage_policy.commercial_use = ProvMark::Permission::ALLOWED;

    ProvMark::Registrar registrar;
    ProvMark::ProvenanceRecord record = registrar.register_content(content, request, keys);
    std::cout << "Signed payload hash: " << record.signed_payload_hash << std::endl;

    // 4. Submit to a registry
    ProvMark::InMemoryRecordStore store;
    ProvMark::ProvenanceService service(store);
    ProvMark::SubmitResult submitted = service.submit(record);
    std::cout << "Submit: " << ProvMark::to_string(submitted.code) << " id=" << submitted.id << std::endl;

    // 5. Verify the original and a tampered copy
    ProvMark::Verifier verifier(service.resolver());
    ProvMark::VerificationReport report = verifier.verify_content(content, request.content_type);
    std::cout << "Original: " << ProvMark::to_string(report.status) << " - " << report.message << std::endl;

    ProvMark::byte_vector tampered = content;
    tampered.back() = '!';
    report = verifier.verify_content(tampered, request.content_type);
    std::cout << "Tampered: " << ProvMark::to_string(report.status) << " - " << report.message << std::endl;

    // 6. Delete, authorised by the creator's key
    ProvMark::DeleteRequest del;
    del.id = submitted.id;
    del.timestamp_millis = ProvMark::Timestamp::now_unix_millis();
    del.signature = ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, del.id, del.timestamp_millis,
                                                            keys.private_key);
    std::cout << "Delete: " << ProvMark::to_string(service.delete_record(del)) << std::endl;
    std::cout << "Records left: " << store.count() << std::endl;

    return 0;
}
