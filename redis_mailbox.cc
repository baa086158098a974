#include "redis_mailbox.h"

#include <algorithm>
#include <atomic>
#include <deque>
#include <unordered_set>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <hiredis/async.h>
#include <hiredis/hiredis.h>

#include "logging.h"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace pjdir {

    namespace {

        constexpr char kDefaultPort[] = "6379";

        bool is_error(const redisReply* reply) {
            return reply != nullptr && reply->type == REDIS_REPLY_ERROR;
        }

        std::string reply_text(const redisReply* reply) {
            if (reply == nullptr || reply->str == nullptr) {
                return "";
            }
            return std::string(reply->str, reply->len);
        }

    }  // namespace

    // One hiredis async context driven by the io_context: hiredis asks for
    // read and write readiness through its event hooks and the socket is
    // watched with a stream_descriptor. Everything touching the context runs
    // on the connection's strand.
    class RedisConnection : public std::enable_shared_from_this<RedisConnection> {
      public:
        // Runs on the strand with the server's reply (possibly an error
        // reply), or with ERR_BACKEND_UNAVAILABLE and no reply.
        using ReplyHandler = std::function<void(MailboxErrorCode, const redisReply*)>;

        RedisConnection(net::io_context& ioc, std::string host, std::string port, std::chrono::milliseconds timeout)
            : strand_(net::make_strand(ioc)),
              resolver_(strand_),
              descriptor_(strand_),
              host_(std::move(host)),
              port_(std::move(port)),
              timeout_(timeout) {}

        ~RedisConnection() {
            if (context_ != nullptr) {
                detached_ = true;
                redisAsyncFree(context_);
            }
        }

        // handler runs once. The command is sent on a pipelined connection
        // and bounded by the timeout on its own.
        void async_command(std::vector<std::string> args, ReplyHandler handler) {
            start(std::move(args), std::move(handler), false);
        }

        // SUBSCRIBE: handler runs for the confirmation and every message after
        // it, until the connection is lost. Only the confirmation is bounded
        // by the timeout.
        void async_subscribe(const std::string& channel, ReplyHandler handler) {
            start({"SUBSCRIBE", channel}, std::move(handler), true);
        }

        // Drops every pending handler and closes the connection.
        void close() {
            net::post(strand_, [self = shared_from_this()] {
                self->detached_ = true;
                self->resolver_.cancel();
                for (const std::shared_ptr<Command>& command : self->active_) {
                    command->timer.cancel();
                }
                self->active_.clear();
                self->waiting_.clear();
                if (self->context_ != nullptr) {
                    redisAsyncFree(self->context_);
                }
            });
        }

        size_t load() const { return load_.load(std::memory_order_relaxed); }

      private:
        struct Command {
            explicit Command(const net::strand<net::io_context::executor_type>& strand) : timer(strand) {}

            std::vector<std::string> args;
            ReplyHandler handler;
            net::steady_timer timer;
            bool persistent = false;
            bool sent = false;  // handed to hiredis, which owes it a callback
            bool finished = false;
        };

        void start(std::vector<std::string> args, ReplyHandler handler, bool persistent) {
            auto command = std::make_shared<Command>(strand_);
            command->args = std::move(args);
            command->handler = std::move(handler);
            command->persistent = persistent;
            load_.fetch_add(1, std::memory_order_relaxed);

            net::post(strand_, [self = shared_from_this(), command] {
                if (self->detached_) {
                    self->load_.fetch_sub(1, std::memory_order_relaxed);
                    return;
                }
                self->active_.insert(command);
                command->timer.expires_after(self->timeout_);
                command->timer.async_wait([self, command](boost::system::error_code ec) {
                    if (ec || command->finished) {
                        return;
                    }
                    PJDIR_LOG_WARN("Redis " << command->args[0] << " timed out after " << self->timeout_.count()
                                            << " ms");
                    self->complete(command, MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, nullptr);
                });

                if (self->context_ != nullptr) {
                    self->send(command);
                    return;
                }
                self->waiting_.push_back(command);
                self->open();
            });
        }

        void open() {
            if (resolving_) {
                return;
            }
            resolving_ = true;
            resolver_.async_resolve(host_, port_,
                                    [self = shared_from_this()](boost::system::error_code ec,
                                                                tcp::resolver::results_type results) {
                                        self->on_resolve(ec, results);
                                    });
        }

        void on_resolve(boost::system::error_code ec, const tcp::resolver::results_type& results) {
            resolving_ = false;
            if (detached_) {
                return;
            }
            if (ec || results.empty()) {
                PJDIR_LOG_WARN("Redis resolve " << host_ << ": " << ec.message());
                return fail_waiting();
            }
            if (context_ == nullptr && !connect(results.begin()->endpoint())) {
                return fail_waiting();
            }
            std::deque<std::shared_ptr<Command>> waiting;
            waiting.swap(waiting_);
            for (const std::shared_ptr<Command>& command : waiting) {
                send(command);
            }
        }

        bool connect(const tcp::endpoint& endpoint) {
            std::string address = endpoint.address().to_string();
            redisAsyncContext* context = redisAsyncConnect(address.c_str(), endpoint.port());
            if (context == nullptr) {
                PJDIR_LOG_WARN("Redis connect: out of memory");
                return false;
            }
            if (context->err) {
                PJDIR_LOG_WARN("Redis connect " << endpoint << ": " << context->errstr);
                redisAsyncFree(context);
                return false;
            }

            boost::system::error_code ec;
            descriptor_.assign(context->c.fd, ec);
            if (ec) {
                PJDIR_LOG_WARN("Redis socket: " << ec.message());
                redisAsyncFree(context);
                return false;
            }
            context->data = this;
            context->ev.data = this;
            context->ev.addRead = &RedisConnection::add_read;
            context->ev.delRead = &RedisConnection::del_read;
            context->ev.addWrite = &RedisConnection::add_write;
            context->ev.delWrite = &RedisConnection::del_write;
            context->ev.cleanup = &RedisConnection::cleanup;
            redisAsyncSetConnectCallback(context, &RedisConnection::on_connect);
            redisAsyncSetDisconnectCallback(context, &RedisConnection::on_disconnect);
            context_ = context;
            return true;
        }

        void send(const std::shared_ptr<Command>& command) {
            if (command->finished) {
                return;
            }
            std::vector<const char*> argv;
            std::vector<size_t> lengths;
            for (const std::string& arg : command->args) {
                argv.push_back(arg.data());
                lengths.push_back(arg.size());
            }
            auto* holder = new std::shared_ptr<Command>(command);
            int status = redisAsyncCommandArgv(context_, &RedisConnection::on_reply, holder,
                                               static_cast<int>(argv.size()), argv.data(), lengths.data());
            if (status != REDIS_OK) {
                delete holder;
                PJDIR_LOG_WARN("Redis " << command->args[0] << " not sent");
                complete(command, MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, nullptr);
                return;
            }
            command->sent = true;
            if (command->persistent) {
                subscribed_ = true;
            } else {
                awaiting_replies_++;
            }
            arm_read();
        }

        void handle_reply(std::shared_ptr<Command>* holder, const redisReply* reply) {
            std::shared_ptr<Command> command = *holder;
            if (!command->persistent || reply == nullptr) {
                if (!command->persistent && awaiting_replies_ > 0) {
                    awaiting_replies_--;
                }
                // A command that timed out still occupies its connection
                // until this point.
                load_.fetch_sub(1, std::memory_order_relaxed);
                delete holder;
            }
            if (detached_) {
                return;
            }
            if (reply == nullptr) {
                complete(command, MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, nullptr);
                return;
            }
            complete(command, MailboxErrorCode::SUCCESS, reply);
        }

        void complete(const std::shared_ptr<Command>& command, MailboxErrorCode code, const redisReply* reply) {
            if (command->finished) {
                return;
            }
            command->timer.cancel();
            if (!command->persistent || code != MailboxErrorCode::SUCCESS) {
                command->finished = true;
                active_.erase(command);
                if (!command->sent) {
                    load_.fetch_sub(1, std::memory_order_relaxed);
                }
            }
            command->handler(code, reply);
        }

        void fail_waiting() {
            std::deque<std::shared_ptr<Command>> waiting;
            waiting.swap(waiting_);
            for (const std::shared_ptr<Command>& command : waiting) {
                complete(command, MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, nullptr);
            }
        }

        // An idle command connection is not watched, so it does not keep the
        // io_context busy. A server-side close is noticed by the next command.
        void arm_read() {
            if (context_ == nullptr || !reading_ || read_armed_ || (awaiting_replies_ == 0 && !subscribed_)) {
                return;
            }
            read_armed_ = true;
            descriptor_.async_wait(net::posix::descriptor_base::wait_read,
                                   [self = shared_from_this()](boost::system::error_code ec) {
                                       self->read_armed_ = false;
                                       if (!ec && self->context_ != nullptr && self->reading_) {
                                           redisAsyncHandleRead(self->context_);
                                       }
                                       // Aborted when the context was replaced; watch the new socket.
                                       if (!ec || ec == net::error::operation_aborted) {
                                           self->arm_read();
                                       }
                                   });
        }

        void arm_write() {
            if (context_ == nullptr || !writing_ || write_armed_) {
                return;
            }
            write_armed_ = true;
            descriptor_.async_wait(net::posix::descriptor_base::wait_write,
                                   [self = shared_from_this()](boost::system::error_code ec) {
                                       self->write_armed_ = false;
                                       if (!ec && self->context_ != nullptr && self->writing_) {
                                           redisAsyncHandleWrite(self->context_);
                                       }
                                       // Aborted when the context was replaced; watch the new socket.
                                       if (!ec || ec == net::error::operation_aborted) {
                                           self->arm_write();
                                       }
                                   });
        }

        // hiredis event hooks
        static void add_read(void* data) {
            auto* self = static_cast<RedisConnection*>(data);
            self->reading_ = true;
            self->arm_read();
        }

        static void del_read(void* data) { static_cast<RedisConnection*>(data)->reading_ = false; }

        static void add_write(void* data) {
            auto* self = static_cast<RedisConnection*>(data);
            self->writing_ = true;
            self->arm_write();
        }

        static void del_write(void* data) { static_cast<RedisConnection*>(data)->writing_ = false; }

        // The context is being freed; hiredis closes the socket itself.
        static void cleanup(void* data) {
            auto* self = static_cast<RedisConnection*>(data);
            self->context_ = nullptr;
            self->reading_ = false;
            self->writing_ = false;
            self->subscribed_ = false;
            self->awaiting_replies_ = 0;
            self->descriptor_.release();
        }

        static void on_reply(redisAsyncContext* context, void* reply, void* privdata) {
            static_cast<RedisConnection*>(context->data)
                ->handle_reply(static_cast<std::shared_ptr<Command>*>(privdata), static_cast<redisReply*>(reply));
        }

        static void on_connect(const redisAsyncContext* context, int status) {
            if (status != REDIS_OK) {
                PJDIR_LOG_WARN("Redis connect: " << context->errstr);
            }
        }

        static void on_disconnect(const redisAsyncContext* context, int status) {
            if (status != REDIS_OK) {
                PJDIR_LOG_WARN("Redis connection lost: " << context->errstr);
            }
        }

        net::strand<net::io_context::executor_type> strand_;
        tcp::resolver resolver_;
        net::posix::stream_descriptor descriptor_;
        std::string host_;
        std::string port_;
        std::chrono::milliseconds timeout_;
        redisAsyncContext* context_ = nullptr;
        std::unordered_set<std::shared_ptr<Command>> active_;
        std::deque<std::shared_ptr<Command>> waiting_;  // for the connection to open
        std::atomic<size_t> load_{0};
        size_t awaiting_replies_ = 0;
        bool subscribed_ = false;
        bool resolving_ = false;
        bool reading_ = false;
        bool writing_ = false;
        bool read_armed_ = false;
        bool write_armed_ = false;
        bool detached_ = false;
    };

    namespace {

        class RedisSubscription : public MailboxBackend::Subscription {
          public:
            explicit RedisSubscription(std::shared_ptr<RedisConnection> connection)
                : connection_(std::move(connection)) {}

            // Closing the connection is what ends the subscription on the
            // server.
            ~RedisSubscription() override { connection_->close(); }

          private:
            std::shared_ptr<RedisConnection> connection_;
        };

    }  // namespace

    RedisMailboxBackend::RedisMailboxBackend(net::io_context& ioc, std::string host, std::string port,
                                             std::chrono::milliseconds io_timeout, size_t connections)
        : ioc_(ioc), host_(std::move(host)), port_(std::move(port)), io_timeout_(io_timeout) {
        for (size_t i = 0; i < std::max<size_t>(connections, 1); i++) {
            commands_.push_back(std::make_shared<RedisConnection>(ioc, host_, port_, io_timeout));
        }
    }

    RedisMailboxBackend::~RedisMailboxBackend() {
        for (const std::shared_ptr<RedisConnection>& connection : commands_) {
            connection->close();
        }
    }

    bool RedisMailboxBackend::parse_address(const std::string& address, std::string* host, std::string* port) {
        std::string rest = address;
        const std::string scheme = "redis://";
        if (rest.compare(0, scheme.size(), scheme) == 0) {
            rest = rest.substr(scheme.size());
        }
        if (!rest.empty() && rest.back() == '/') {
            rest.pop_back();
        }
        if (rest.empty()) {
            return false;
        }

        std::string parsed_host;
        std::string parsed_port = kDefaultPort;
        if (rest[0] == '[') {
            size_t close = rest.find(']');
            if (close == std::string::npos) {
                return false;
            }
            parsed_host = rest.substr(1, close - 1);
            if (close + 1 < rest.size()) {
                if (rest[close + 1] != ':') {
                    return false;
                }
                parsed_port = rest.substr(close + 2);
            }
        } else {
            size_t colon = rest.rfind(':');
            if (colon == std::string::npos) {
                parsed_host = rest;
            } else {
                parsed_host = rest.substr(0, colon);
                parsed_port = rest.substr(colon + 1);
            }
        }
        if (parsed_host.empty() || parsed_port.empty() || parsed_port.size() > 5 ||
            parsed_port.find_first_not_of("0123456789") != std::string::npos ||
            std::stoul(parsed_port) == 0 || std::stoul(parsed_port) > 65535) {
            return false;
        }
        *host = parsed_host;
        *port = parsed_port;
        return true;
    }

    std::shared_ptr<RedisConnection> RedisMailboxBackend::least_loaded() const {
        std::shared_ptr<RedisConnection> best = commands_.front();
        for (const std::shared_ptr<RedisConnection>& connection : commands_) {
            if (connection->load() < best->load()) {
                best = connection;
            }
        }
        return best;
    }

    void RedisMailboxBackend::async_store(const std::string& key, std::vector<uint8_t> payload,
                                          std::chrono::milliseconds ttl, StoreHandler handler) {
        std::string value(payload.begin(), payload.end());
        std::shared_ptr<RedisConnection> connection = least_loaded();
        connection->async_command(
            {"SET", key, value, "PX", std::to_string(ttl.count())},
            [connection, key, handler](MailboxErrorCode code, const redisReply* reply) {
                if (code != MailboxErrorCode::SUCCESS || is_error(reply)) {
                    if (is_error(reply)) {
                        PJDIR_LOG_WARN("Redis SET failed: " << reply_text(reply));
                    }
                    return handler(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE);
                }
                // Announce only after the value is readable.
                connection->async_command({"PUBLISH", key, kUpdatedMessage},
                                          [handler](MailboxErrorCode code, const redisReply* reply) {
                                              if (code != MailboxErrorCode::SUCCESS || is_error(reply)) {
                                                  if (is_error(reply)) {
                                                      PJDIR_LOG_WARN("Redis PUBLISH failed: " << reply_text(reply));
                                                  }
                                                  return handler(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE);
                                              }
                                              handler(MailboxErrorCode::SUCCESS);
                                          });
            });
    }

    void RedisMailboxBackend::async_fetch(const std::string& key, FetchHandler handler) {
        least_loaded()->async_command({"GET", key}, [handler](MailboxErrorCode code, const redisReply* reply) {
            if (code != MailboxErrorCode::SUCCESS) {
                return handler(code, {});
            }
            switch (reply->type) {
                case REDIS_REPLY_STRING:
                    return handler(MailboxErrorCode::SUCCESS,
                                   std::vector<uint8_t>(reply->str, reply->str + reply->len));
                case REDIS_REPLY_NIL:
                    return handler(MailboxErrorCode::ERR_EMPTY, {});
                default:
                    PJDIR_LOG_WARN("Unexpected Redis GET reply: " << reply_text(reply));
                    return handler(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, {});
            }
        });
    }

    std::unique_ptr<MailboxBackend::Subscription> RedisMailboxBackend::subscribe(
            const std::string& channel, std::function<void(MailboxErrorCode)> on_status,
            std::function<void()> on_notify) {
        auto connection = std::make_shared<RedisConnection>(ioc_, host_, port_, io_timeout_);
        auto subscribed = std::make_shared<bool>(false);
        connection->async_subscribe(channel, [on_status, on_notify, subscribed](MailboxErrorCode code,
                                                                                const redisReply* reply) {
            if (code != MailboxErrorCode::SUCCESS || is_error(reply)) {
                if (is_error(reply)) {
                    PJDIR_LOG_WARN("Redis SUBSCRIBE rejected: " << reply_text(reply));
                }
                return on_status(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE);
            }
            if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 3) {
                return;
            }
            std::string kind = reply_text(reply->element[0]);
            if (kind == "subscribe" && !*subscribed) {
                *subscribed = true;
                on_status(MailboxErrorCode::SUCCESS);
            } else if (kind == "message") {
                on_notify();
            }
        });
        return std::unique_ptr<Subscription>(new RedisSubscription(connection));
    }

}  // namespace pjdir
