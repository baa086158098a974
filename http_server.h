// Plain HTTP/1.1 front end for the relay.

#ifndef PJDIR_HTTP_SERVER_H
#define PJDIR_HTTP_SERVER_H

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "relay.h"

namespace pjdir {

    // Accepts connections and gives each its own strand. Transport security
    // is left to a terminating proxy in front of the directory.
    class HttpListener : public std::enable_shared_from_this<HttpListener> {
      public:
        HttpListener(boost::asio::io_context& ioc, Relay& relay);

        // Opens, binds and listens. Logs and returns false on failure.
        bool listen(const boost::asio::ip::tcp::endpoint& endpoint);

        // Start accepting incoming connections
        void run();
        void stop();

        boost::asio::ip::tcp::endpoint local_endpoint() const;

      private:
        void do_accept();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

        boost::asio::io_context& ioc_;
        Relay& relay_;
        boost::asio::ip::tcp::acceptor acceptor_;
        // Delays the next accept after the process runs out of descriptors.
        boost::asio::steady_timer backoff_;
        bool running_ = true;
    };

}  // namespace pjdir

#endif  // PJDIR_HTTP_SERVER_H
