#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "gtest/gtest.h"

#include "http_server.h"
#include "key_epochs.h"
#include "mailbox.h"
#include "memory_mailbox.h"
#include "relay.h"

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using pjdir::KeyErrorCode;
using pjdir::ohttp::KeyPair;

class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(keys_.rotate(KeyPair::generate(1, pjdir::ohttp::kAeadChaCha20Poly1305)), KeyErrorCode::SUCCESS);
    options_.max_payload_size = 512;
    options_.long_poll_timeout = std::chrono::seconds(30);
    relay_.reset(new pjdir::Relay(keys_, mailbox_, options_));
    listener_ = std::make_shared<pjdir::HttpListener>(ioc_, *relay_);
    ASSERT_TRUE(listener_->listen(tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)));
    listener_->run();
    thread_ = std::thread([this] { ioc_.run(); });
  }

  void TearDown() override {
    if (listener_) {
      listener_->stop();
    }
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  http::response<http::string_body> roundTrip(http::request<http::string_body> request) {
    net::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect(listener_->local_endpoint());
    request.prepare_payload();
    http::write(socket, request);
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    return response;
  }

  net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> work_ = net::make_work_guard(ioc_);
  pjdir::KeyEpochManager keys_{std::chrono::minutes(10)};
  pjdir::MemoryMailboxBackend backend_{ioc_};
  pjdir::MailboxStore mailbox_{ioc_, backend_, std::chrono::hours(1)};
  pjdir::RelayOptions options_;
  std::unique_ptr<pjdir::Relay> relay_;
  std::shared_ptr<pjdir::HttpListener> listener_;
  std::thread thread_;
};

TEST_F(HttpServerTest, ServesHealthOverKeepAlive) {
  net::io_context client_ioc;
  tcp::socket socket(client_ioc);
  socket.connect(listener_->local_endpoint());
  beast::flat_buffer buffer;

  for (int i = 0; i < 2; i++) {
    http::request<http::string_body> request{http::verb::get, "/health", 11};
    request.set(http::field::host, "localhost");
    http::write(socket, request);
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_TRUE(response.body().empty());
  }
}

TEST_F(HttpServerTest, ServesKeyAdvertisement) {
  http::request<http::string_body> request{http::verb::get, "/ohttp-keys", 11};
  http::response<http::string_body> response = roundTrip(request);
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response[http::field::content_type], "application/ohttp-keys");
  EXPECT_EQ(response.body().size(), size_t(2 + 1 + 2 + 32 + 2 + 4));
}

TEST_F(HttpServerTest, RefusesBodyAboveLimit) {
  // The declared length alone is enough; no body is sent.
  net::io_context client_ioc;
  tcp::socket socket(client_ioc);
  socket.connect(listener_->local_endpoint());
  std::string header = "POST / HTTP/1.1\r\nHost: localhost\r\nContent-Type: message/ohttp-req\r\n"
                       "Content-Length: " + std::to_string(relay_->max_body_size() + 1) + "\r\n\r\n";
  net::write(socket, net::buffer(header));

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(socket, buffer, response);
  EXPECT_EQ(response.result(), http::status::payload_too_large);
  EXPECT_FALSE(response.keep_alive());
}

TEST_F(HttpServerTest, DisconnectReleasesLongPoll) {
  {
    net::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect(listener_->local_endpoint());
    http::request<http::string_body> request{http::verb::post, "/abc123?v=1", 11};
    request.body() = "original";
    request.prepare_payload();
    http::write(socket, request);

    // Give the server time to start waiting, then hang up.
    for (int i = 0; i < 100 && backend_.subscriber_count() == 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(backend_.subscriber_count(), size_t(1));
  }

  for (int i = 0; i < 100 && backend_.subscriber_count() != 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(backend_.subscriber_count(), size_t(0));
}

TEST_F(HttpServerTest, PipelinedBytesDoNotHideDisconnect) {
  {
    net::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect(listener_->local_endpoint());
    std::string pipelined = "POST /abc123?v=1 HTTP/1.1\r\nHost: localhost\r\nContent-Length: 8\r\n\r\noriginal"
                            "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";
    net::write(socket, net::buffer(pipelined));

    for (int i = 0; i < 100 && backend_.subscriber_count() == 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(backend_.subscriber_count(), size_t(1));
    // Let the server see the second request before hanging up.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  for (int i = 0; i < 100 && backend_.subscriber_count() != 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(backend_.subscriber_count(), size_t(0));
}

TEST_F(HttpServerTest, PipelinedRequestServedAfterLongPoll) {
  net::io_context client_ioc;
  tcp::socket socket(client_ioc);
  socket.connect(listener_->local_endpoint());
  std::string pipelined = "POST /abc123?v=1 HTTP/1.1\r\nHost: localhost\r\nContent-Length: 8\r\n\r\noriginal"
                          "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";
  net::write(socket, net::buffer(pipelined));

  for (int i = 0; i < 100 && backend_.subscriber_count() == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ASSERT_EQ(backend_.subscriber_count(), size_t(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  std::string proposal = "proposal";
  mailbox_.async_put("abc123", pjdir::Direction::kResponse, std::vector<uint8_t>(proposal.begin(), proposal.end()),
                     [](pjdir::MailboxErrorCode code) { EXPECT_EQ(code, pjdir::MailboxErrorCode::SUCCESS); });

  beast::flat_buffer buffer;
  http::response<http::string_body> first;
  http::read(socket, buffer, first);
  EXPECT_EQ(first.result(), http::status::ok);
  EXPECT_EQ(first.body(), "proposal");

  http::response<http::string_body> second;
  http::read(socket, buffer, second);
  EXPECT_EQ(second.result(), http::status::ok);
  EXPECT_TRUE(second.body().empty());
}

// Fills the descriptor table so the listener's accept fails with EMFILE,
// then frees it and expects the queued connection to be served.
TEST_F(HttpServerTest, KeepsAcceptingAfterDescriptorExhaustion) {
  struct rlimit saved;
  ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &saved), 0);
  struct rlimit lowered = saved;
  lowered.rlim_cur = std::min<rlim_t>(saved.rlim_cur, 256);
  ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &lowered), 0);

  std::vector<int> filler;
  while (true) {
    int fd = open("/dev/null", O_RDONLY);
    if (fd < 0) {
      ASSERT_EQ(errno, EMFILE);
      break;
    }
    filler.push_back(fd);
  }
  ASSERT_FALSE(filler.empty());
  // One descriptor for the client side; the server side has none left.
  close(filler.back());
  filler.pop_back();

  net::io_context client_ioc;
  tcp::socket socket(client_ioc);
  socket.connect(listener_->local_endpoint());
  std::this_thread::sleep_for(std::chrono::milliseconds(250));

  for (int fd : filler) {
    close(fd);
  }
  ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &saved), 0);

  // A listener that gave up would leave this read hanging.
  struct timeval receive_timeout = {5, 0};
  ASSERT_EQ(setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &receive_timeout, sizeof(receive_timeout)), 0);

  http::request<http::string_body> request{http::verb::get, "/health", 11};
  request.set(http::field::host, "localhost");
  http::write(socket, request);
  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(socket, buffer, response);
  EXPECT_EQ(response.result(), http::status::ok);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
