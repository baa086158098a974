// Single-process mailbox backend.

#ifndef PJDIR_MEMORY_MAILBOX_H
#define PJDIR_MEMORY_MAILBOX_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "mailbox.h"

namespace pjdir {

    // Keeps slots in a map with per-slot expiry and delivers notifications
    // through the io_context. Only one server process can use it.
    class MemoryMailboxBackend : public MailboxBackend {
      public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit MemoryMailboxBackend(boost::asio::io_context& ioc, NowFn now = [] { return Clock::now(); });

        void async_store(const std::string& key, std::vector<uint8_t> payload, std::chrono::milliseconds ttl,
                         StoreHandler handler) override;
        void async_fetch(const std::string& key, FetchHandler handler) override;
        std::unique_ptr<Subscription> subscribe(const std::string& channel,
                                                std::function<void(MailboxErrorCode)> on_status,
                                                std::function<void()> on_notify) override;

        // Live slots, expired ones excluded.
        size_t size() const;
        // Slots still held, including expired ones not yet swept.
        size_t retained() const;
        size_t subscriber_count() const;

      private:
        class MemorySubscription;

        struct Slot {
            std::vector<uint8_t> payload;
            Clock::time_point expires_at;
        };

        void unsubscribe(const std::string& channel, uint64_t id);
        // Drops expired slots unless a sweep ran less than a second ago.
        void purge_expired_locked(Clock::time_point now);

        boost::asio::io_context& ioc_;
        NowFn now_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Slot> slots_;
        std::unordered_map<std::string, std::map<uint64_t, std::function<void()>>> subscribers_;
        uint64_t next_subscriber_id_ = 0;
        Clock::time_point next_purge_{};
        // Subscriptions can outlive the backend when waits are still queued on
        // the io_context at shutdown; they unsubscribe only while it lives.
        std::shared_ptr<MemoryMailboxBackend*> lifetime_;
    };

}  // namespace pjdir

#endif  // PJDIR_MEMORY_MAILBOX_H
