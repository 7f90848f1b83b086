#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "provmark/authorization.hpp"
#include "provmark/client.hpp"
#include "provmark/crypto.hpp"
#include "provmark/fingerprint.hpp"
#include "provmark/identity.hpp"
#include "provmark/perceptual.hpp"
#include "provmark/registrar.hpp"
#include "provmark/timestamp.hpp"
#include "provmark/verifier.hpp"

namespace {

using ProvMark::byte_vector;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [args]\n"
              << "\n"
              << "Offline:\n"
              << "  keygen\n"
              << "  did <public-key-hex>\n"
              << "  hash <file>\n"
              << "  phash <image>\n"
              << "  distance <phash-a> <phash-b>\n"
              << "  register <file> --title <t> --display-name <n> --key <private-key-hex>\n"
              << "           [--description <d>] [--content-type <mime>] [--license <l>]\n"
              << "           [--ai-training allowed|denied] [--ai-derivatives allowed|denied]\n"
              << "           [--commercial allowed|denied] [--no-attribution] [--policy-note <n>]\n"
              << "           [--signed-at <iso8601>]\n"
              << "  check <file> <record.json>\n"
              << "  sign-delete <record-id> <private-key-hex>\n"
              << "\n"
              << "Online (uri like ws://localhost:9010):\n"
              << "  submit <uri> <record.json>\n"
              << "  lookup <uri> <file> [--record-id <id>] [--content-type <mime>]\n"
              << "  verify <uri> <file> [--content-type <mime>]\n"
              << "  delete <uri> <record-id> <private-key-hex> [--verify-only]\n";
}

class UsageError : public ProvMark::InvalidArgument {
public:
    using ProvMark::InvalidArgument::InvalidArgument;
};

// Positional arguments plus --name value / --flag options.
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& name) const { return options.count(name) != 0; }

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }

    std::string require(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end() || it->second.empty()) {
            throw UsageError("Missing required option --" + name);
        }
        return it->second;
    }

    const std::string& at(size_t index, const char* what) const {
        if (index >= positional.size()) {
            throw UsageError(std::string("Missing argument: ") + what);
        }
        return positional[index];
    }
};

const std::vector<std::string> FLAG_OPTIONS = {"no-attribution", "verify-only"};

Arguments parse_arguments(int argc, char** argv, int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            args.positional.push_back(token);
            continue;
        }
        std::string name = token.substr(2);
        if (std::find(FLAG_OPTIONS.begin(), FLAG_OPTIONS.end(), name) != FLAG_OPTIONS.end()) {
            args.options[name] = "true";
            continue;
        }
        if (i + 1 >= argc) {
            throw UsageError("Option " + token + " expects a value");
        }
        args.options[name] = argv[++i];
    }
    return args;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
    return text;
}

std::string guess_content_type(const std::string& path) {
    static const std::map<std::string, std::string> types = {
        {"png", "image/png"},   {"jpg", "image/jpeg"},  {"jpeg", "image/jpeg"}, {"gif", "image/gif"},
        {"webp", "image/webp"}, {"bmp", "image/bmp"},   {"tif", "image/tiff"},  {"tiff", "image/tiff"},
        {"txt", "text/plain"},  {"pdf", "application/pdf"}, {"json", "application/json"},
    };
    auto dot = path.find_last_of('.');
    if (dot != std::string::npos) {
        auto it = types.find(lower(path.substr(dot + 1)));
        if (it != types.end()) {
            return it->second;
        }
    }
    return "application/octet-stream";
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ProvMark::RuntimeError("Cannot open " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProvMark::MalformedInput(path + " is not valid JSON: " + e.what());
    }
}

std::optional<std::string> perceptual_hash_for(const byte_vector& content, const std::string& content_type) {
    if (!ProvMark::PerceptualFingerprint::is_image_type(content_type)) {
        return std::nullopt;
    }
    ProvMark::OpenCvImageDecoder decoder;
    return ProvMark::PerceptualFingerprint::compute(content, decoder);
}

void connect_or_throw(ProvMark::net::ProvenanceClient& client, const std::string& uri) {
    client.connect(uri);
    if (!client.wait_until_ready(std::chrono::seconds(5))) {
        throw ProvMark::RuntimeError("Could not connect to " + uri);
    }
}

// --- Commands ---

int cmd_keygen(const Arguments&) {
    ProvMark::KeyPairHex keys = ProvMark::IdentityKeyManager::generate_keypair();
    nlohmann::json out = {{"privateKey", keys.private_key},
                          {"publicKey", keys.public_key},
                          {"did", ProvMark::IdentityKeyManager::derive_did(keys.public_key)}};
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int cmd_did(const Arguments& args) {
    std::cout << ProvMark::IdentityKeyManager::derive_did(args.at(0, "public key")) << std::endl;
    return 0;
}

int cmd_hash(const Arguments& args) {
    std::cout << ProvMark::ContentFingerprint::hash_file(args.at(0, "file")) << std::endl;
    return 0;
}

int cmd_phash(const Arguments& args) {
    byte_vector content = ProvMark::ContentFingerprint::read_file(args.at(0, "image"));
    ProvMark::OpenCvImageDecoder decoder;
    std::cout << ProvMark::PerceptualFingerprint::compute(content, decoder) << std::endl;
    return 0;
}

int cmd_distance(const Arguments& args) {
    auto distance = ProvMark::PerceptualFingerprint::hamming_distance(args.at(0, "first hash"), args.at(1, "second hash"));
    if (!distance) {
        std::cout << "incomparable" << std::endl;
        return 1;
    }
    std::cout << *distance << std::endl;
    return 0;
}

int cmd_register(const Arguments& args) {
    const std::string& path = args.at(0, "file");
    byte_vector content = ProvMark::ContentFingerprint::read_file(path);

    std::string private_key = args.require("key");
    ProvMark::KeyPairHex keys;
    keys.private_key = private_key;
    keys.public_key = ProvMark::IdentityKeyManager::public_key_from_private(private_key);

    ProvMark::RegistrationRequest request;
    request.title = args.require("title");
    if (args.has("description")) {
        request.description = args.get("description");
    }
    request.file_name = base_name(path);
    request.content_type = args.get("content-type", guess_content_type(path));
    request.display_name = args.require("display-name");
    request.usage_policy.license = args.get("license", "All rights reserved");
    request.usage_policy.ai_training = ProvMark::parse_permission(upper(args.get("ai-training", "denied")));
    request.usage_policy.ai_derivative_generation = ProvMark::parse_permission(upper(args.get("ai-derivatives", "denied")));
    request.usage_policy.commercial_use = ProvMark::parse_permission(upper(args.get("commercial", "denied")));
    request.usage_policy.attribution_required = !args.has("no-attribution");
    request.usage_policy.policy_note = args.get("policy-note");
    request.include_perceptual_hash = ProvMark::PerceptualFingerprint::is_image_type(request.content_type);

    ProvMark::OpenCvImageDecoder decoder;
    ProvMark::Registrar registrar(&decoder);
    ProvMark::ProvenanceRecord record = registrar.register_content(content, request, keys, args.get("signed-at"));

    nlohmann::json out = record;
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int cmd_check(const Arguments& args) {
    byte_vector content = ProvMark::ContentFingerprint::read_file(args.at(0, "file"));
    ProvMark::ProvenanceRecord record = read_json_file(args.at(1, "record.json")).get<ProvMark::ProvenanceRecord>();

    ProvMark::VerificationReport report = ProvMark::Verifier::verify_against_record(content, record);
    std::cout << ProvMark::to_string(report.status) << ": " << report.message << std::endl;
    return report.status == ProvMark::VerificationStatus::VERIFIED ? 0 : 1;
}

int cmd_sign_delete(const Arguments& args) {
    const std::string& id = args.at(0, "record id");
    int64_t timestamp = ProvMark::Timestamp::now_unix_millis();
    std::string signature =
        ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, id, timestamp, args.at(1, "private key"));

    nlohmann::json out = {{"id", id}, {"timestamp", timestamp}, {"signature", signature}};
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int cmd_submit(const Arguments& args) {
    ProvMark::ProvenanceRecord record = read_json_file(args.at(1, "record.json")).get<ProvMark::ProvenanceRecord>();

    ProvMark::net::ProvenanceClient client;
    connect_or_throw(client, args.at(0, "uri"));
    ProvMark::SubmitResult result = client.submit(record);
    client.disconnect();

    std::cout << ProvMark::to_string(result.code) << ": " << result.message;
    if (!result.id.empty()) {
        std::cout << " (id " << result.id << ")";
    }
    std::cout << std::endl;
    return result.code == ProvMark::ErrorCode::OK ? 0 : 1;
}

int cmd_lookup(const Arguments& args) {
    const std::string& path = args.at(1, "file");
    byte_vector content = ProvMark::ContentFingerprint::read_file(path);
    std::string content_type = args.get("content-type", guess_content_type(path));

    ProvMark::LookupRequest request;
    request.content_hash = ProvMark::ContentFingerprint::hash(content);
    if (args.has("record-id")) {
        request.record_id = args.get("record-id");
    } else {
        request.perceptual_hash = perceptual_hash_for(content, content_type);
    }

    ProvMark::net::ProvenanceClient client;
    connect_or_throw(client, args.at(0, "uri"));
    ProvMark::LookupResult result = client.lookup(request);
    client.disconnect();

    nlohmann::json out = result;
    std::cout << out.dump(2) << std::endl;
    return result.match.status == ProvMark::MatchStatus::NOT_FOUND ||
                   result.match.status == ProvMark::MatchStatus::HASH_MISMATCH
               ? 1
               : 0;
}

int cmd_verify(const Arguments& args) {
    const std::string& path = args.at(1, "file");
    byte_vector content = ProvMark::ContentFingerprint::read_file(path);
    std::string content_type = args.get("content-type", guess_content_type(path));

    ProvMark::net::ProvenanceClient client;
    connect_or_throw(client, args.at(0, "uri"));

    ProvMark::OpenCvImageDecoder decoder;
    ProvMark::Verifier verifier(
        [&client](const std::string& content_hash, const std::optional<std::string>& perceptual_hash) {
            ProvMark::LookupRequest request;
            request.content_hash = content_hash;
            request.perceptual_hash = perceptual_hash;
            return client.lookup(request).match;
        },
        &decoder);
    ProvMark::VerificationReport report = verifier.verify_content(content, content_type);
    client.disconnect();

    std::cout << ProvMark::to_string(report.status) << ": " << report.message << std::endl;
    if (report.record) {
        std::cout << "  record:  " << report.record->id << " \"" << report.record->title << "\"" << std::endl;
        std::cout << "  creator: " << report.record->creator_id << std::endl;
    }
    if (report.distance) {
        std::cout << "  hamming distance: " << *report.distance << std::endl;
    }
    return report.status == ProvMark::VerificationStatus::VERIFIED ||
                   report.status == ProvMark::VerificationStatus::PERCEPTUAL_MATCH
               ? 0
               : 1;
}

int cmd_delete(const Arguments& args) {
    ProvMark::DeleteRequest request;
    request.id = args.at(1, "record id");
    request.timestamp_millis = ProvMark::Timestamp::now_unix_millis();
    request.signature = ProvMark::ActionAuthorizer::sign_action(ProvMark::DELETE_ACTION, request.id,
                                                                request.timestamp_millis, args.at(2, "private key"));
    request.verify_only = args.has("verify-only");

    ProvMark::net::ProvenanceClient client;
    connect_or_throw(client, args.at(0, "uri"));
    ProvMark::Response response = client.delete_record(request);
    client.disconnect();

    std::cout << ProvMark::to_string(response.code) << ": "
              << response.body.value("outcome", response.body.value("error", std::string())) << std::endl;
    return response.code == ProvMark::ErrorCode::OK ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    if (ProvMark::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    using Command = int (*)(const Arguments&);
    static const std::map<std::string, Command> commands = {
        {"keygen", cmd_keygen},   {"did", cmd_did},           {"hash", cmd_hash},
        {"phash", cmd_phash},     {"distance", cmd_distance}, {"register", cmd_register},
        {"check", cmd_check},     {"sign-delete", cmd_sign_delete},
        {"submit", cmd_submit},   {"lookup", cmd_lookup},     {"verify", cmd_verify},
        {"delete", cmd_delete},
    };

    auto it = commands.find(argv[1]);
    if (it == commands.end()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        return it->second(parse_arguments(argc, argv, 2));
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    } catch (const ProvMark::Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
