// Mailbox backend on a Redis server, shared by every directory process that
// points at it.

#ifndef PJDIR_REDIS_MAILBOX_H
#define PJDIR_REDIS_MAILBOX_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "mailbox.h"

namespace pjdir {

    class RedisConnection;

    // Slots are plain string keys written with SET ... PX and announced with
    // PUBLISH on a channel of the same name. Commands go to whichever pooled
    // connection has the fewest outstanding; each subscription gets a
    // connection of its own, closed when the subscription is released.
    //
    // Every command is bounded by io_timeout. A command that runs out of time
    // fails alone with ERR_BACKEND_UNAVAILABLE; the others on its connection
    // keep waiting for their own replies. A lost connection is reopened on
    // the next command.
    class RedisMailboxBackend : public MailboxBackend {
      public:
        static constexpr size_t kDefaultConnections = 4;

        RedisMailboxBackend(boost::asio::io_context& ioc, std::string host, std::string port,
                            std::chrono::milliseconds io_timeout, size_t connections = kDefaultConnections);
        ~RedisMailboxBackend() override;

        // Accepts "host", "host:port", "[v6addr]:port", optionally prefixed
        // with "redis://". The port defaults to 6379.
        static bool parse_address(const std::string& address, std::string* host, std::string* port);

        void async_store(const std::string& key, std::vector<uint8_t> payload, std::chrono::milliseconds ttl,
                         StoreHandler handler) override;
        void async_fetch(const std::string& key, FetchHandler handler) override;
        std::unique_ptr<Subscription> subscribe(const std::string& channel,
                                                std::function<void(MailboxErrorCode)> on_status,
                                                std::function<void()> on_notify) override;

      private:
        std::shared_ptr<RedisConnection> least_loaded() const;

        boost::asio::io_context& ioc_;
        std::string host_;
        std::string port_;
        std::chrono::milliseconds io_timeout_;
        std::vector<std::shared_ptr<RedisConnection>> commands_;
    };

}  // namespace pjdir

#endif  // PJDIR_REDIS_MAILBOX_H
