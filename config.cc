#include "config.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

#include <boost/program_options.hpp>

#include "redis_mailbox.h"

namespace po = boost::program_options;

namespace pjdir {

    namespace {

        constexpr char kEnvironmentPrefix[] = "PJ_DIR_";

        // Every option but help may come from the environment.
        const char* const kOptionNames[] = {
            "listen-address", "port", "backend", "db-host", "timeout", "mailbox-ttl", "max-payload-size",
            "max-session-id-length", "aead", "key-rotation-interval", "key-overlap", "advertise-previous-keys",
            "threads", "log-level",
        };

        // Raw values as parsed, range-checked afterwards.
        struct RawOptions {
            std::string listen_address;
            long port;
            std::string backend;
            std::string db_host;
            long timeout;
            long mailbox_ttl;
            long long max_payload_size;
            long max_session_id_length;
            std::string aead;
            long key_rotation_interval;
            long key_overlap;
            bool advertise_previous_keys;
            long threads;
            std::string log_level;
        };

        po::options_description make_options(RawOptions* raw) {
            po::options_description desc("Allowed options");
            // clang-format off
            desc.add_options()
                ("help", "produce help message")
                ("listen-address", po::value<std::string>(&raw->listen_address)->default_value("0.0.0.0"),
                 "address to accept connections on")
                ("port", po::value<long>(&raw->port)->default_value(8080), "TCP port")
                ("backend", po::value<std::string>(&raw->backend)->default_value("redis"),
                 "mailbox backend: redis or memory")
                ("db-host", po::value<std::string>(&raw->db_host)->default_value("localhost:6379"),
                 "Redis server, host[:port]")
                ("timeout", po::value<long>(&raw->timeout)->default_value(30), "long-poll timeout in seconds")
                ("mailbox-ttl", po::value<long>(&raw->mailbox_ttl)->default_value(86400),
                 "seconds a mailbox slot is kept")
                ("max-payload-size", po::value<long long>(&raw->max_payload_size)->default_value(65536),
                 "largest relayed payload in bytes")
                ("max-session-id-length", po::value<long>(&raw->max_session_id_length)->default_value(64),
                 "longest accepted session id")
                ("aead", po::value<std::string>(&raw->aead)->default_value("chacha20-poly1305"),
                 "AEAD of generated keys: chacha20-poly1305 or aes-128-gcm")
                ("key-rotation-interval", po::value<long>(&raw->key_rotation_interval)->default_value(0),
                 "seconds between key rotations, 0 to keep one key")
                ("key-overlap", po::value<long>(&raw->key_overlap)->default_value(600),
                 "seconds a replaced key is still accepted")
                ("advertise-previous-keys",
                 po::value<bool>(&raw->advertise_previous_keys)->default_value(false)->implicit_value(true),
                 "list replaced keys in /ohttp-keys as well")
                ("threads", po::value<long>(&raw->threads)->default_value(0),
                 "I/O threads, 0 for one per core")
                ("log-level", po::value<std::string>(&raw->log_level)->default_value("info"),
                 "trace, debug, info, warn, error, critical or off")
                ;
            // clang-format on
            return desc;
        }

        std::string usage(const po::options_description& desc) {
            std::ostringstream out;
            out << "Usage: pjdir-server [options]\n" << desc;
            return out.str();
        }

        ConfigErrorCode bad_value(const std::string& problem, const po::options_description& desc,
                                  std::string* message) {
            *message = problem + "\n" + usage(desc);
            return ConfigErrorCode::ERR_BAD_VALUE;
        }

    }  // namespace

    RelayOptions ServerConfig::relay_options() const {
        RelayOptions options;
        options.max_payload_size = max_payload_size;
        options.max_session_id_length = max_session_id_length;
        options.long_poll_timeout = long_poll_timeout;
        return options;
    }

    std::string environment_option_name(const std::string& variable) {
        if (variable == "PJ_DB_HOST") {
            return "db-host";
        }
        if (variable == "PJ_DIR_TIMEOUT_SECS") {
            return "timeout";
        }
        const std::string prefix = kEnvironmentPrefix;
        if (variable.compare(0, prefix.size(), prefix) != 0) {
            return "";
        }
        std::string name = variable.substr(prefix.size());
        for (char& c : name) {
            c = c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        for (const char* option : kOptionNames) {
            if (name == option) {
                return name;
            }
        }
        return "";
    }

    ConfigErrorCode parse_config(int argc, const char* const argv[], ServerConfig* out, std::string* message) {
        RawOptions raw;
        po::options_description desc = make_options(&raw);

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);
            po::store(po::parse_environment(desc, environment_option_name), vm);
            po::notify(vm);
        } catch (po::error& e) {
            *message = std::string(e.what()) + "\n" + usage(desc);
            return ConfigErrorCode::ERR_BAD_OPTION;
        }

        if (vm.count("help")) {
            *message = usage(desc);
            return ConfigErrorCode::HELP_REQUESTED;
        }

        ServerConfig config;
        config.listen_address = raw.listen_address;

        if (raw.port < 1 || raw.port > 65535) {
            return bad_value("port must be between 1 and 65535", desc, message);
        }
        config.port = static_cast<uint16_t>(raw.port);

        if (raw.backend == "redis") {
            config.backend = BackendKind::kRedis;
            std::string host;
            std::string port;
            if (!RedisMailboxBackend::parse_address(raw.db_host, &host, &port)) {
                return bad_value("db-host is not a valid address: " + raw.db_host, desc, message);
            }
        } else if (raw.backend == "memory") {
            config.backend = BackendKind::kMemory;
        } else {
            return bad_value("backend must be redis or memory", desc, message);
        }
        config.db_host = raw.db_host;

        if (raw.timeout < 1) {
            return bad_value("timeout must be at least one second", desc, message);
        }
        config.long_poll_timeout = std::chrono::seconds(raw.timeout);

        if (raw.mailbox_ttl < 1) {
            return bad_value("mailbox-ttl must be at least one second", desc, message);
        }
        config.mailbox_ttl = std::chrono::seconds(raw.mailbox_ttl);

        if (raw.max_payload_size < 1) {
            return bad_value("max-payload-size must be positive", desc, message);
        }
        config.max_payload_size = static_cast<size_t>(raw.max_payload_size);

        if (raw.max_session_id_length < 1) {
            return bad_value("max-session-id-length must be positive", desc, message);
        }
        config.max_session_id_length = static_cast<size_t>(raw.max_session_id_length);

        if (raw.aead == "chacha20-poly1305") {
            config.aead_id = ohttp::kAeadChaCha20Poly1305;
        } else if (raw.aead == "aes-128-gcm") {
            config.aead_id = ohttp::kAeadAes128Gcm;
        } else {
            return bad_value("aead must be chacha20-poly1305 or aes-128-gcm", desc, message);
        }

        if (raw.key_rotation_interval < 0) {
            return bad_value("key-rotation-interval must not be negative", desc, message);
        }
        config.key_rotation_interval = std::chrono::seconds(raw.key_rotation_interval);

        if (raw.key_overlap < 0) {
            return bad_value("key-overlap must not be negative", desc, message);
        }
        config.key_overlap = std::chrono::seconds(raw.key_overlap);
        config.advertise_previous_keys = raw.advertise_previous_keys;

        if (raw.threads < 0) {
            return bad_value("threads must not be negative", desc, message);
        }
        config.threads = raw.threads == 0 ? std::max(1u, std::thread::hardware_concurrency())
                                          : static_cast<unsigned>(raw.threads);

        if (!parse_log_level(raw.log_level, &config.log_level)) {
            return bad_value("unknown log-level: " + raw.log_level, desc, message);
        }

        *out = config;
        return ConfigErrorCode::SUCCESS;
    }

}  // namespace pjdir
