// Session mailboxes: one slot per (session, direction) held by a shared
// key-value store with publish/subscribe.

#ifndef PJDIR_MAILBOX_H
#define PJDIR_MAILBOX_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

namespace pjdir {

    enum class Direction {
        kRequest,   // sender to receiver
        kResponse   // receiver to sender
    };

    // "req" or "res"
    std::string DirectionSuffix(Direction direction);

    // Store key and notification channel, "<session_id>:<req|res>".
    std::string slot_key(const std::string& session_id, Direction direction);

    // Body published on a slot's channel after each write.
    constexpr char kUpdatedMessage[] = "updated";

    enum class MailboxErrorCode {
        SUCCESS = 0,
        ERR_EMPTY,
        ERR_TIMED_OUT,
        ERR_CANCELLED,
        ERR_BACKEND_UNAVAILABLE
    };
    inline std::string MailboxErrorCodeToString(MailboxErrorCode code) {
        switch (code) {
            case MailboxErrorCode::SUCCESS: return "SUCCESS";
            case MailboxErrorCode::ERR_EMPTY: return "ERR_EMPTY";
            case MailboxErrorCode::ERR_TIMED_OUT: return "ERR_TIMED_OUT";
            case MailboxErrorCode::ERR_CANCELLED: return "ERR_CANCELLED";
            case MailboxErrorCode::ERR_BACKEND_UNAVAILABLE: return "ERR_BACKEND_UNAVAILABLE";
            default: return "Unknown error code";
        }
    }

    using StoreHandler = std::function<void(MailboxErrorCode)>;
    using FetchHandler = std::function<void(MailboxErrorCode, std::vector<uint8_t>)>;

    // The shared store. Handlers are never invoked from inside the call that
    // registered them.
    class MailboxBackend {
      public:
        // Holds one channel registration; destroying it releases the
        // registration.
        class Subscription {
          public:
            virtual ~Subscription() = default;
        };

        virtual ~MailboxBackend() = default;

        // Sets key to payload with the given expiry, then publishes
        // kUpdatedMessage on the channel named key once the set has been
        // acknowledged.
        virtual void async_store(const std::string& key, std::vector<uint8_t> payload,
                                 std::chrono::milliseconds ttl, StoreHandler handler) = 0;

        // SUCCESS with the payload, or ERR_EMPTY.
        virtual void async_fetch(const std::string& key, FetchHandler handler) = 0;

        // on_status receives SUCCESS once the registration is active, and
        // ERR_BACKEND_UNAVAILABLE if it cannot be made or is lost later.
        // on_notify runs for every message published on channel.
        virtual std::unique_ptr<Subscription> subscribe(const std::string& channel,
                                                        std::function<void(MailboxErrorCode)> on_status,
                                                        std::function<void()> on_notify) = 0;
    };

    // Cancels a long-poll. A handle may be created, and even cancelled,
    // before the wait it controls has started. Copies share state.
    class WaitHandle {
      public:
        WaitHandle();

        void cancel();
        bool cancelled() const;

      private:
        friend class MailboxStore;

        struct State {
            std::mutex mutex;
            bool cancelled = false;
            std::function<void()> cancel_wait;
        };

        void attach(std::function<void()> cancel_wait);

        std::shared_ptr<State> state_;
    };

    class MailboxStore {
      public:
        // The backend must outlive the store and every wait it starts.
        MailboxStore(boost::asio::io_context& ioc, MailboxBackend& backend, std::chrono::milliseconds ttl);

        // Replaces the slot and resets its expiry.
        void async_put(const std::string& session_id, Direction direction, std::vector<uint8_t> payload,
                       StoreHandler handler);

        // Non-blocking read; ERR_EMPTY when there is no slot. Reading does not
        // remove the slot.
        void async_get(const std::string& session_id, Direction direction, FetchHandler handler);

        // Completes with the slot's payload as soon as there is one, with
        // ERR_TIMED_OUT at deadline, or with ERR_CANCELLED once handle is
        // cancelled. The channel registration is released before handler runs.
        WaitHandle async_wait_for(const std::string& session_id, Direction direction,
                                  std::chrono::steady_clock::time_point deadline, FetchHandler handler,
                                  WaitHandle handle = WaitHandle());

        std::chrono::milliseconds ttl() const { return ttl_; }

      private:
        boost::asio::io_context& ioc_;
        MailboxBackend& backend_;
        std::chrono::milliseconds ttl_;
    };

}  // namespace pjdir

#endif  // PJDIR_MAILBOX_H
