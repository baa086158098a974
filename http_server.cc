#include "http_server.h"

#include <chrono>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "logging.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace pjdir {

    namespace {

        constexpr auto kIoTimeout = std::chrono::seconds(30);
        constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);
        constexpr std::size_t kWatchChunk = 4096;
        constexpr std::size_t kPipelineSlack = 8192;
        constexpr char kServerName[] = "pjdir";

        using body_type = http::vector_body<uint8_t>;

        void fail(beast::error_code ec, const char* what) {
            PJDIR_LOG_DEBUG(what << ": " << ec.message());
        }

        bool is_resource_exhaustion(const beast::error_code& ec) {
            return ec == net::error::no_descriptors ||
                   ec == boost::system::errc::too_many_files_open_in_system ||
                   ec == net::error::no_buffer_space || ec == net::error::no_memory;
        }

        std::string as_string(beast::string_view s) {
            return std::string(s.data(), s.size());
        }

        // One connection. Requests are served one at a time; while the relay
        // holds a long-poll the socket is watched so a client that goes away
        // releases its wait.
        class HttpSession : public std::enable_shared_from_this<HttpSession> {
          public:
            HttpSession(tcp::socket&& socket, Relay& relay) : stream_(std::move(socket)), relay_(relay) {}

            void run() {
                // We need to be executing within a strand to perform async operations
                // on the I/O objects in this session.
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
            }

          private:
            void do_read() {
                // Construct a new parser for each message
                parser_.emplace();
                parser_->body_limit(relay_.max_body_size());
                stream_.expires_after(kIoTimeout);
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t) {
                // This means they closed the connection
                if (ec == http::error::end_of_stream) {
                    return do_eof();
                }
                if (ec == http::error::body_limit) {
                    PJDIR_LOG_INFO("Refused request body above " << relay_.max_body_size() << " bytes");
                    version_ = parser_->get().version();
                    keep_alive_ = false;
                    HttpResponse refused;
                    refused.status = 413;
                    return write(std::move(refused));
                }
                if (ec) {
                    return fail(ec, "read");
                }

                http::request<body_type> request = parser_->release();
                version_ = request.version();
                keep_alive_ = request.keep_alive();

                HttpRequest outer;
                outer.method = as_string(request.method_string());
                outer.target = as_string(request.target());
                outer.content_type = as_string(request[http::field::content_type]);
                outer.body = std::move(request.body());

                stream_.expires_never();
                waiting_ = true;
                auto self = shared_from_this();
                wait_ = relay_.handle(outer, [self](HttpResponse response) {
                    net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
                        self->on_response(std::move(response));
                    });
                });
                watch_disconnect();
            }

            // Reads whatever arrives while the relay holds the request. Bytes
            // of a pipelined request stay in buffer_ for the next parser; end
            // of stream or a reset means the client left.
            void watch_disconnect() {
                if (buffer_.size() >= relay_.max_body_size() + kPipelineSlack) {
                    // Enough unanswered input; stop reading until the response is out.
                    return;
                }
                stream_.async_read_some(buffer_.prepare(kWatchChunk),
                                        beast::bind_front_handler(&HttpSession::on_watch_read, shared_from_this()));
            }

            void on_watch_read(beast::error_code ec, std::size_t bytes_read) {
                buffer_.commit(bytes_read);
                if (ec == net::error::operation_aborted || !waiting_) {
                    return;
                }
                if (ec) {
                    PJDIR_LOG_DEBUG("Client disconnected during long-poll: " << ec.message());
                    waiting_ = false;
                    wait_.cancel();
                    stream_.close();
                    return;
                }
                watch_disconnect();
            }

            void on_response(HttpResponse response) {
                if (!waiting_) {
                    return;
                }
                waiting_ = false;
                beast::error_code ec;
                stream_.socket().cancel(ec);
                write(std::move(response));
            }

            void write(HttpResponse response) {
                response_.emplace(static_cast<http::status>(response.status), version_);
                response_->set(http::field::server, kServerName);
                if (!response.content_type.empty()) {
                    response_->set(http::field::content_type, response.content_type);
                }
                response_->body() = std::move(response.body);
                response_->keep_alive(keep_alive_);
                response_->prepare_payload();

                stream_.expires_after(kIoTimeout);
                http::async_write(stream_, *response_,
                                  beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                            response_->keep_alive()));
            }

            void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
                if (ec) {
                    return fail(ec, "write");
                }
                if (!keep_alive) {
                    // This means we should close the connection, usually because
                    // the response indicated the "Connection: close" semantic.
                    return do_eof();
                }
                response_.reset();
                do_read();
            }

            void do_eof() {
                // Send a TCP shutdown
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            Relay& relay_;
            boost::optional<http::request_parser<body_type>> parser_;
            boost::optional<http::response<body_type>> response_;
            WaitHandle wait_;
            unsigned version_ = 11;
            bool keep_alive_ = true;
            bool waiting_ = false;
        };

    }  // namespace

    HttpListener::HttpListener(net::io_context& ioc, Relay& relay)
        : ioc_(ioc), relay_(relay), acceptor_(net::make_strand(ioc)), backoff_(acceptor_.get_executor()) {}

    bool HttpListener::listen(const tcp::endpoint& endpoint) {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            PJDIR_LOG_ERROR("open: " << ec.message());
            return false;
        }
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            PJDIR_LOG_ERROR("set_option: " << ec.message());
            return false;
        }
        acceptor_.bind(endpoint, ec);
        if (ec) {
            PJDIR_LOG_ERROR("bind " << endpoint << ": " << ec.message());
            return false;
        }
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            PJDIR_LOG_ERROR("listen: " << ec.message());
            return false;
        }
        return true;
    }

    void HttpListener::run() {
        do_accept();
    }

    void HttpListener::stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            self->running_ = false;
            self->backoff_.cancel();
            beast::error_code ec;
            self->acceptor_.cancel(ec);
            self->acceptor_.close(ec);
        });
    }

    tcp::endpoint HttpListener::local_endpoint() const {
        beast::error_code ec;
        return acceptor_.local_endpoint(ec);
    }

    void HttpListener::do_accept() {
        if (!running_) {
            return;
        }
        // The new connection gets its own strand
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&HttpListener::on_accept, shared_from_this()));
    }

    void HttpListener::on_accept(beast::error_code ec, tcp::socket socket) {
        if (!running_ || ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            PJDIR_LOG_WARN("accept: " << ec.message());
            if (is_resource_exhaustion(ec)) {
                // Out of descriptors or memory; the pending connection stays
                // in the backlog until some are released.
                backoff_.expires_after(kAcceptBackoff);
                backoff_.async_wait([self = shared_from_this()](beast::error_code wait_ec) {
                    if (!wait_ec) {
                        self->do_accept();
                    }
                });
                return;
            }
            return do_accept();
        }
        std::make_shared<HttpSession>(std::move(socket), relay_)->run();

        // Accept another connection
        do_accept();
    }

}  // namespace pjdir
