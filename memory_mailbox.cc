#include "memory_mailbox.h"

#include <utility>

#include <boost/asio/post.hpp>

namespace net = boost::asio;

namespace pjdir {

    namespace {
        // Expired slots are swept at most this often, by whichever store or
        // fetch comes first after the interval.
        constexpr auto kPurgeInterval = std::chrono::seconds(1);
    }

    class MemoryMailboxBackend::MemorySubscription : public MailboxBackend::Subscription {
      public:
        MemorySubscription(std::weak_ptr<MemoryMailboxBackend*> backend, std::string channel, uint64_t id)
            : backend_(std::move(backend)), channel_(std::move(channel)), id_(id) {}

        ~MemorySubscription() override {
            if (std::shared_ptr<MemoryMailboxBackend*> backend = backend_.lock()) {
                (*backend)->unsubscribe(channel_, id_);
            }
        }

      private:
        std::weak_ptr<MemoryMailboxBackend*> backend_;
        std::string channel_;
        uint64_t id_;
    };

    MemoryMailboxBackend::MemoryMailboxBackend(net::io_context& ioc, NowFn now)
        : ioc_(ioc), now_(std::move(now)), lifetime_(std::make_shared<MemoryMailboxBackend*>(this)) {}

    void MemoryMailboxBackend::async_store(const std::string& key, std::vector<uint8_t> payload,
                                           std::chrono::milliseconds ttl, StoreHandler handler) {
        std::vector<std::function<void()>> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Clock::time_point now = now_();
            purge_expired_locked(now);
            slots_[key] = Slot{std::move(payload), now + ttl};
            auto it = subscribers_.find(key);
            if (it != subscribers_.end()) {
                for (const auto& subscriber : it->second) {
                    listeners.push_back(subscriber.second);
                }
            }
        }
        // The slot is readable before any listener hears about it.
        for (std::function<void()>& listener : listeners) {
            net::post(ioc_, std::move(listener));
        }
        net::post(ioc_, [handler = std::move(handler)] { handler(MailboxErrorCode::SUCCESS); });
    }

    void MemoryMailboxBackend::async_fetch(const std::string& key, FetchHandler handler) {
        MailboxErrorCode code = MailboxErrorCode::ERR_EMPTY;
        std::vector<uint8_t> payload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Clock::time_point now = now_();
            purge_expired_locked(now);
            auto it = slots_.find(key);
            if (it != slots_.end() && it->second.expires_at > now) {
                code = MailboxErrorCode::SUCCESS;
                payload = it->second.payload;
            }
        }
        net::post(ioc_, [handler = std::move(handler), code, payload = std::move(payload)]() mutable {
            handler(code, std::move(payload));
        });
    }

    std::unique_ptr<MailboxBackend::Subscription> MemoryMailboxBackend::subscribe(
            const std::string& channel, std::function<void(MailboxErrorCode)> on_status,
            std::function<void()> on_notify) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_subscriber_id_++;
            subscribers_[channel][id] = std::move(on_notify);
        }
        net::post(ioc_, [on_status = std::move(on_status)] { on_status(MailboxErrorCode::SUCCESS); });
        return std::unique_ptr<Subscription>(new MemorySubscription(lifetime_, channel, id));
    }

    size_t MemoryMailboxBackend::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Clock::time_point now = now_();
        size_t live = 0;
        for (const auto& slot : slots_) {
            if (slot.second.expires_at > now) {
                live++;
            }
        }
        return live;
    }

    size_t MemoryMailboxBackend::retained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    size_t MemoryMailboxBackend::subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& channel : subscribers_) {
            count += channel.second.size();
        }
        return count;
    }

    void MemoryMailboxBackend::unsubscribe(const std::string& channel, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(channel);
        if (it == subscribers_.end()) {
            return;
        }
        it->second.erase(id);
        if (it->second.empty()) {
            subscribers_.erase(it);
        }
    }

    void MemoryMailboxBackend::purge_expired_locked(Clock::time_point now) {
        if (now < next_purge_) {
            return;
        }
        for (auto it = slots_.begin(); it != slots_.end();) {
            if (it->second.expires_at <= now) {
                it = slots_.erase(it);
            } else {
                ++it;
            }
        }
        next_purge_ = now + kPurgeInterval;
    }

}  // namespace pjdir
