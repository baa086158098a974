#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "config.h"
#include "http_server.h"
#include "key_epochs.h"
#include "logging.h"
#include "mailbox.h"
#include "memory_mailbox.h"
#include "redis_mailbox.h"
#include "relay.h"

namespace net = boost::asio;

namespace {

    constexpr uint8_t kFirstKeyId = 1;
    constexpr auto kRedisIoTimeout = std::chrono::seconds(5);

    // Generates a fresh key every interval and makes it current.
    class KeyRotator {
      public:
        KeyRotator(net::io_context& ioc, pjdir::KeyEpochManager& keys, uint16_t aead_id,
                   std::chrono::seconds interval)
            : timer_(ioc), keys_(keys), aead_id_(aead_id), interval_(interval) {}

        void start() {
            timer_.expires_after(interval_);
            timer_.async_wait([this](boost::system::error_code ec) {
                if (ec) {
                    return;
                }
                rotate();
                start();
            });
        }

        void cancel() { timer_.cancel(); }

      private:
        void rotate() {
            uint8_t key_id = keys_.next_key_id();
            std::shared_ptr<const pjdir::ohttp::KeyPair> key = pjdir::ohttp::KeyPair::generate(key_id, aead_id_);
            if (!key) {
                PJDIR_LOG_ERROR("Key generation failed, keeping the current key");
                return;
            }
            pjdir::KeyErrorCode code = keys_.rotate(key);
            if (code != pjdir::KeyErrorCode::SUCCESS) {
                PJDIR_LOG_ERROR("Key rotation failed: " << pjdir::KeyErrorCodeToString(code));
                return;
            }
            PJDIR_LOG_INFO("Rotated OHTTP key, current key id " << static_cast<int>(key_id));
        }

        net::steady_timer timer_;
        pjdir::KeyEpochManager& keys_;
        uint16_t aead_id_;
        std::chrono::seconds interval_;
    };

}  // namespace

int main(int argc, char* argv[]) {
    pjdir::ServerConfig config;
    std::string message;
    pjdir::ConfigErrorCode parsed = pjdir::parse_config(argc, argv, &config, &message);
    if (parsed == pjdir::ConfigErrorCode::HELP_REQUESTED) {
        std::cout << message;
        return 0;
    }
    if (parsed != pjdir::ConfigErrorCode::SUCCESS) {
        std::cerr << message;
        return 2;
    }
    pjdir::set_log_level(config.log_level);

    boost::system::error_code ec;
    net::ip::address address = net::ip::make_address(config.listen_address, ec);
    if (ec) {
        std::cerr << "Invalid listen-address " << config.listen_address << ": " << ec.message() << "\n";
        return 2;
    }

    try {
        net::io_context ioc{static_cast<int>(config.threads)};

        pjdir::KeyEpochManager keys(config.key_overlap, config.advertise_previous_keys);
        std::shared_ptr<const pjdir::ohttp::KeyPair> first = pjdir::ohttp::KeyPair::generate(kFirstKeyId, config.aead_id);
        if (!first) {
            PJDIR_LOG_CRITICAL("Unable to generate the OHTTP key");
            return 1;
        }
        pjdir::KeyErrorCode installed = keys.rotate(first);
        if (installed != pjdir::KeyErrorCode::SUCCESS) {
            PJDIR_LOG_CRITICAL("Unable to install the OHTTP key: " << pjdir::KeyErrorCodeToString(installed));
            return 1;
        }

        std::unique_ptr<pjdir::MailboxBackend> backend;
        if (config.backend == pjdir::BackendKind::kMemory) {
            PJDIR_LOG_WARN("Using the in-memory mailbox; sessions are not shared with other instances");
            backend.reset(new pjdir::MemoryMailboxBackend(ioc));
        } else {
            std::string host;
            std::string port;
            if (!pjdir::RedisMailboxBackend::parse_address(config.db_host, &host, &port)) {
                PJDIR_LOG_CRITICAL("Invalid db-host " << config.db_host);
                return 2;
            }
            PJDIR_LOG_INFO("Using Redis at " << host << ":" << port);
            backend.reset(new pjdir::RedisMailboxBackend(ioc, host, port, kRedisIoTimeout));
        }

        pjdir::MailboxStore mailbox(ioc, *backend, config.mailbox_ttl);
        pjdir::Relay relay(keys, mailbox, config.relay_options());

        auto listener = std::make_shared<pjdir::HttpListener>(ioc, relay);
        net::ip::tcp::endpoint endpoint(address, config.port);
        if (!listener->listen(endpoint)) {
            PJDIR_LOG_CRITICAL("Unable to listen on " << endpoint);
            return 1;
        }
        listener->run();
        PJDIR_LOG_INFO("Payjoin directory listening on " << endpoint << " with " << config.threads
                                                         << " threads");

        KeyRotator rotator(ioc, keys, config.aead_id, config.key_rotation_interval);
        if (config.key_rotation_interval.count() > 0) {
            rotator.start();
        }

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code const&, int signal) {
            PJDIR_LOG_INFO("Received signal " << signal << ", shutting down");
            listener->stop();
            rotator.cancel();
            ioc.stop();
        });

        std::vector<std::thread> threads;
        threads.reserve(config.threads - 1);
        for (unsigned i = 1; i < config.threads; i++) {
            threads.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (std::thread& thread : threads) {
            thread.join();
        }
    } catch (const std::exception& e) {
        PJDIR_LOG_CRITICAL("Directory failed: " << e.what());
        return 1;
    }

    return 0;
}
