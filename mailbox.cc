#include "mailbox.h"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "logging.h"

namespace net = boost::asio;

namespace pjdir {

    std::string DirectionSuffix(Direction direction) {
        switch (direction) {
            case Direction::kRequest: return "req";
            case Direction::kResponse: return "res";
            default: return "unknown";
        }
    }

    std::string slot_key(const std::string& session_id, Direction direction) {
        return session_id + ":" + DirectionSuffix(direction);
    }

    WaitHandle::WaitHandle() : state_(std::make_shared<State>()) {}

    void WaitHandle::cancel() {
        std::function<void()> cancel_wait;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled) {
                return;
            }
            state_->cancelled = true;
            cancel_wait = std::move(state_->cancel_wait);
        }
        if (cancel_wait) {
            cancel_wait();
        }
    }

    bool WaitHandle::cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    void WaitHandle::attach(std::function<void()> cancel_wait) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled) {
                state_->cancel_wait = std::move(cancel_wait);
                return;
            }
        }
        cancel_wait();
    }

    namespace {

        // One long-poll. Every step runs on the waiter's strand:
        //
        //   subscribe -> (active) -> fetch -> payload? done : wait
        //   notify    -> fetch (or mark a refetch while one is in flight)
        //   deadline  -> ERR_TIMED_OUT
        //
        // Fetching only after the subscription is active closes the window
        // where a put lands between the read and the registration.
        class Waiter : public std::enable_shared_from_this<Waiter> {
          public:
            Waiter(net::io_context& ioc, MailboxBackend& backend, std::string key,
                   std::chrono::steady_clock::time_point deadline, FetchHandler handler)
                : strand_(net::make_strand(ioc)),
                  timer_(strand_),
                  backend_(backend),
                  key_(std::move(key)),
                  deadline_(deadline),
                  handler_(std::move(handler)) {}

            void start() {
                net::post(strand_, [self = shared_from_this()] { self->do_start(); });
            }

            void cancel() {
                net::post(strand_, [self = shared_from_this()] {
                    self->finish(MailboxErrorCode::ERR_CANCELLED, {});
                });
            }

          private:
            void do_start() {
                if (done_) {
                    return;
                }
                timer_.expires_at(deadline_);
                timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                    if (!ec) {
                        self->finish(MailboxErrorCode::ERR_TIMED_OUT, {});
                    }
                });

                // The backend keeps these callbacks for as long as the
                // subscription lives; they must not keep the waiter alive.
                std::weak_ptr<Waiter> weak = shared_from_this();
                subscription_ = backend_.subscribe(
                    key_,
                    [weak](MailboxErrorCode code) {
                        if (std::shared_ptr<Waiter> self = weak.lock()) {
                            net::post(self->strand_, [self, code] { self->on_status(code); });
                        }
                    },
                    [weak] {
                        if (std::shared_ptr<Waiter> self = weak.lock()) {
                            net::post(self->strand_, [self] { self->on_notify(); });
                        }
                    });
            }

            void on_status(MailboxErrorCode code) {
                if (done_) {
                    return;
                }
                if (code != MailboxErrorCode::SUCCESS) {
                    PJDIR_LOG_WARN("Mailbox subscription failed: " << MailboxErrorCodeToString(code));
                    finish(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, {});
                    return;
                }
                if (!active_) {
                    active_ = true;
                    fetch();
                }
            }

            void on_notify() {
                if (done_ || !active_) {
                    return;
                }
                if (fetching_) {
                    refetch_ = true;
                    return;
                }
                fetch();
            }

            void fetch() {
                fetching_ = true;
                backend_.async_fetch(key_, [self = shared_from_this()](MailboxErrorCode code,
                                                                       std::vector<uint8_t> payload) {
                    net::post(self->strand_, [self, code, payload = std::move(payload)]() mutable {
                        self->on_fetch(code, std::move(payload));
                    });
                });
            }

            void on_fetch(MailboxErrorCode code, std::vector<uint8_t> payload) {
                fetching_ = false;
                if (done_) {
                    return;
                }
                if (code == MailboxErrorCode::SUCCESS) {
                    finish(code, std::move(payload));
                } else if (code == MailboxErrorCode::ERR_EMPTY) {
                    if (refetch_) {
                        refetch_ = false;
                        fetch();
                    }
                } else {
                    PJDIR_LOG_WARN("Mailbox fetch failed: " << MailboxErrorCodeToString(code));
                    finish(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, {});
                }
            }

            void finish(MailboxErrorCode code, std::vector<uint8_t> payload) {
                if (done_) {
                    return;
                }
                done_ = true;
                timer_.cancel();
                subscription_.reset();
                FetchHandler handler = std::move(handler_);
                handler(code, std::move(payload));
            }

            net::strand<net::io_context::executor_type> strand_;
            net::steady_timer timer_;
            MailboxBackend& backend_;
            std::string key_;
            std::chrono::steady_clock::time_point deadline_;
            FetchHandler handler_;
            std::unique_ptr<MailboxBackend::Subscription> subscription_;
            bool done_ = false;
            bool active_ = false;
            bool fetching_ = false;
            bool refetch_ = false;
        };

    }  // namespace

    MailboxStore::MailboxStore(net::io_context& ioc, MailboxBackend& backend, std::chrono::milliseconds ttl)
        : ioc_(ioc), backend_(backend), ttl_(ttl) {}

    void MailboxStore::async_put(const std::string& session_id, Direction direction, std::vector<uint8_t> payload,
                                 StoreHandler handler) {
        PJDIR_LOG_DEBUG("Storing " << payload.size() << " bytes in " << slot_key(session_id, direction));
        backend_.async_store(slot_key(session_id, direction), std::move(payload), ttl_,
                             [handler = std::move(handler)](MailboxErrorCode code) {
                                 if (code != MailboxErrorCode::SUCCESS) {
                                     PJDIR_LOG_WARN("Mailbox store failed: " << MailboxErrorCodeToString(code));
                                 }
                                 handler(code);
                             });
    }

    void MailboxStore::async_get(const std::string& session_id, Direction direction, FetchHandler handler) {
        backend_.async_fetch(slot_key(session_id, direction), std::move(handler));
    }

    WaitHandle MailboxStore::async_wait_for(const std::string& session_id, Direction direction,
                                            std::chrono::steady_clock::time_point deadline, FetchHandler handler,
                                            WaitHandle handle) {
        auto waiter = std::make_shared<Waiter>(ioc_, backend_, slot_key(session_id, direction), deadline,
                                               std::move(handler));
        waiter->start();
        std::weak_ptr<Waiter> weak = waiter;
        handle.attach([weak] {
            if (std::shared_ptr<Waiter> waiter = weak.lock()) {
                waiter->cancel();
            }
        });
        return handle;
    }

}  // namespace pjdir
