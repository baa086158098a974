// Server settings from the command line and PJ_DIR_* environment variables.

#ifndef PJDIR_CONFIG_H
#define PJDIR_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "logging.h"
#include "ohttp.h"
#include "relay.h"

namespace pjdir {

    enum class ConfigErrorCode {
        SUCCESS = 0,
        HELP_REQUESTED,
        ERR_BAD_OPTION,
        ERR_BAD_VALUE
    };
    inline std::string ConfigErrorCodeToString(ConfigErrorCode code) {
        switch (code) {
            case ConfigErrorCode::SUCCESS: return "SUCCESS";
            case ConfigErrorCode::HELP_REQUESTED: return "HELP_REQUESTED";
            case ConfigErrorCode::ERR_BAD_OPTION: return "ERR_BAD_OPTION";
            case ConfigErrorCode::ERR_BAD_VALUE: return "ERR_BAD_VALUE";
            default: return "Unknown error code";
        }
    }

    enum class BackendKind {
        kRedis,
        kMemory
    };

    struct ServerConfig {
        std::string listen_address = "0.0.0.0";
        uint16_t port = 8080;
        BackendKind backend = BackendKind::kRedis;
        std::string db_host = "localhost:6379";
        std::chrono::seconds long_poll_timeout{30};
        std::chrono::seconds mailbox_ttl{86400};
        size_t max_payload_size = 65536;
        size_t max_session_id_length = 64;
        uint16_t aead_id = ohttp::kAeadChaCha20Poly1305;
        std::chrono::seconds key_rotation_interval{0};  // 0 disables rotation
        std::chrono::seconds key_overlap{600};
        bool advertise_previous_keys = false;
        unsigned threads = 1;
        LogLevel log_level = LogLevel::INFO;

        RelayOptions relay_options() const;
    };

    // Maps an environment variable to the option it sets, or "" when it
    // sets none. PJ_DIR_MAX_PAYLOAD_SIZE sets max-payload-size; the older
    // PJ_DIR_TIMEOUT_SECS and PJ_DB_HOST names are accepted as well.
    std::string environment_option_name(const std::string& variable);

    // Command line values win over the environment. On anything but SUCCESS,
    // message holds the text to print: the usage for HELP_REQUESTED, the
    // problem followed by the usage otherwise.
    ConfigErrorCode parse_config(int argc, const char* const argv[], ServerConfig* out, std::string* message);

}  // namespace pjdir

#endif  // PJDIR_CONFIG_H
