#include <csignal>
#include <iostream>
#include <memory>

#include <pthread.h>

#include "provmark/config.hpp"
#include "provmark/crypto.hpp"
#include "provmark/record_store.hpp"
#include "provmark/server.hpp"
#include "provmark/service.hpp"

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    if (ProvMark::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // Block the shutdown signals before any thread starts so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        ProvMark::ServerConfig config = argc == 2 ? ProvMark::ServerConfig::load(argv[1]) : ProvMark::ServerConfig();

        std::unique_ptr<ProvMark::RecordStore> store;
        if (config.store_path.empty()) {
            store = std::make_unique<ProvMark::InMemoryRecordStore>();
            std::cerr << "[SERVER] No store_path configured, records are kept in memory." << std::endl;
        } else {
            auto file_store = std::make_unique<ProvMark::JsonFileRecordStore>(config.store_path);
            std::cerr << "[SERVER] Loaded " << file_store->count() << " record(s) from " << file_store->path()
                      << std::endl;
            store = std::move(file_store);
        }

        ProvMark::ProvenanceService service(*store, config.service_options());
        ProvMark::net::ProvenanceServer server(service);
        server.run(config.port);

        int received = 0;
        sigwait(&signals, &received);
        std::cerr << "[SERVER] Received signal " << received << ", shutting down." << std::endl;
        server.stop();
    } catch (const ProvMark::Exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
