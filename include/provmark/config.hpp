#ifndef PROVMARK_CONFIG_HPP
#define PROVMARK_CONFIG_HPP

#include "service.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ProvMark {

    /**
     * @brief Settings for the registry server.
     *
     * Example file:
     * @code
     * {
     *   "port": 9010,
     *   "store_path": "provmark_records.json",
     *   "similarity_threshold": 10,
     *   "action_window_ms": 300000,
     *   "list_limit": 50
     * }
     * @endcode
     * Every key is optional. An empty store_path keeps records in memory only.
     */
    struct ServerConfig {
        uint16_t port = 9010;
        std::string store_path = "provmark_records.json";
        int similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD;
        int64_t action_window_ms = ACTION_WINDOW_MILLIS;
        size_t list_limit = 50;

        /**
         * @throws ProvMark::MalformedInput for wrongly typed or out-of-range values.
         */
        static ServerConfig from_json(const nlohmann::json& j);

        /**
         * @throws ProvMark::RuntimeError if the file cannot be read,
         *         ProvMark::MalformedInput if it is not a valid config.
         */
        static ServerConfig load(const std::string& path);

        ServiceOptions service_options() const;
    };

} // namespace ProvMark

#endif // PROVMARK_CONFIG_HPP
