#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "gtest/gtest.h"

#include "bhttp.h"
#include "key_epochs.h"
#include "memory_mailbox.h"
#include "ohttp.h"
#include "relay.h"

namespace {

using pjdir::Direction;
using pjdir::HttpRequest;
using pjdir::HttpResponse;
using pjdir::KeyEpochManager;
using pjdir::KeyErrorCode;
using pjdir::MailboxErrorCode;
using pjdir::MailboxStore;
using pjdir::MemoryMailboxBackend;
using pjdir::Relay;
using pjdir::RelayOptions;
using pjdir::WaitHandle;
using pjdir::ohttp::ClientContext;
using pjdir::ohttp::KeyPair;
using pjdir::ohttp::OhttpErrorCode;

constexpr size_t kMaxPayload = 1024;

std::vector<uint8_t> bytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

RelayOptions makeOptions(std::chrono::milliseconds long_poll_timeout) {
  RelayOptions options;
  options.max_payload_size = kMaxPayload;
  options.max_session_id_length = 64;
  options.long_poll_timeout = long_poll_timeout;
  return options;
}

struct Exchange {
  bool done = false;
  HttpResponse outer;
  ClientContext client;
  WaitHandle wait;
};

// Every store, fetch and subscription fails as if the database were down.
class UnreachableBackend : public pjdir::MailboxBackend {
 public:
  explicit UnreachableBackend(boost::asio::io_context& ioc) : ioc_(ioc) {}

  void async_store(const std::string&, std::vector<uint8_t>, std::chrono::milliseconds,
                   pjdir::StoreHandler handler) override {
    boost::asio::post(ioc_, [handler] { handler(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE); });
  }
  void async_fetch(const std::string&, pjdir::FetchHandler handler) override {
    boost::asio::post(ioc_, [handler] { handler(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE, {}); });
  }
  std::unique_ptr<Subscription> subscribe(const std::string&, std::function<void(MailboxErrorCode)> on_status,
                                          std::function<void()>) override {
    boost::asio::post(ioc_, [on_status] { on_status(MailboxErrorCode::ERR_BACKEND_UNAVAILABLE); });
    return std::unique_ptr<Subscription>(new Subscription());
  }

 private:
  boost::asio::io_context& ioc_;
};

class RelayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    key_ = KeyPair::generate(1, pjdir::ohttp::kAeadChaCha20Poly1305);
    ASSERT_NE(key_, nullptr);
    ASSERT_EQ(keys_.rotate(key_), KeyErrorCode::SUCCESS);
  }

  void run() {
    ioc_.restart();
    ioc_.run();
  }

  std::shared_ptr<Exchange> send(Relay& relay, const HttpRequest& request) {
    auto exchange = std::make_shared<Exchange>();
    exchange->wait = relay.handle(request, [exchange](HttpResponse response) {
      EXPECT_FALSE(exchange->done);
      exchange->done = true;
      exchange->outer = std::move(response);
    });
    return exchange;
  }

  HttpRequest outerRequest(const std::string& method, const std::string& target, std::vector<uint8_t> body = {}) {
    HttpRequest request;
    request.method = method;
    request.target = target;
    request.body = std::move(body);
    return request;
  }

  std::vector<uint8_t> innerBytes(const std::string& method, const std::string& path, const std::string& body) {
    pjdir::bhttp::Request inner;
    inner.method = method;
    inner.scheme = "https";
    inner.authority = "directory.example";
    inner.path = path;
    inner.content = bytes(body);
    std::vector<uint8_t> encoded;
    EXPECT_EQ(pjdir::bhttp::encode_request(inner, &encoded), pjdir::bhttp::BhttpErrorCode::SUCCESS);
    return encoded;
  }

  // Encapsulates an inner request to the current key and hands it to relay.
  std::shared_ptr<Exchange> sendInner(Relay& relay, const std::string& method, const std::string& path,
                                      const std::string& body = "") {
    ClientContext client;
    std::vector<uint8_t> enc_request;
    EXPECT_EQ(pjdir::ohttp::encapsulate_request(key_->config(), innerBytes(method, path, body), &enc_request,
                                                &client),
              OhttpErrorCode::SUCCESS);
    HttpRequest request = outerRequest("POST", "/", std::move(enc_request));
    request.content_type = pjdir::kOhttpRequestContentType;
    std::shared_ptr<Exchange> exchange = send(relay, request);
    exchange->client = std::move(client);
    return exchange;
  }

  std::shared_ptr<Exchange> sendInner(const std::string& method, const std::string& path,
                                      const std::string& body = "") {
    return sendInner(relay_, method, path, body);
  }

  // The decrypted inner response of a completed exchange.
  pjdir::bhttp::Response open(const Exchange& exchange) {
    pjdir::bhttp::Response inner;
    EXPECT_TRUE(exchange.done);
    EXPECT_EQ(exchange.outer.status, 200u);
    EXPECT_EQ(exchange.outer.content_type, pjdir::kOhttpResponseContentType);
    std::vector<uint8_t> plaintext;
    EXPECT_EQ(pjdir::ohttp::decapsulate_response(exchange.client, exchange.outer.body, &plaintext),
              OhttpErrorCode::SUCCESS);
    EXPECT_EQ(pjdir::bhttp::decode_response(plaintext, 1 << 20, &inner), pjdir::bhttp::BhttpErrorCode::SUCCESS);
    return inner;
  }

  std::vector<uint8_t> slot(const std::string& session_id, Direction direction) {
    std::vector<uint8_t> payload;
    mailbox_.async_get(session_id, direction, [&payload](MailboxErrorCode, std::vector<uint8_t> data) {
      payload = std::move(data);
    });
    run();
    return payload;
  }

  boost::asio::io_context ioc_;
  KeyEpochManager keys_{std::chrono::minutes(10)};
  std::shared_ptr<const KeyPair> key_;
  MemoryMailboxBackend backend_{ioc_};
  MailboxStore mailbox_{ioc_, backend_, std::chrono::hours(24)};
  Relay relay_{keys_, mailbox_, makeOptions(std::chrono::seconds(5))};
};

TEST_F(RelayTest, ServesHealthAndKeys) {
  std::shared_ptr<Exchange> health = send(relay_, outerRequest("GET", "/health"));
  ASSERT_TRUE(health->done);
  EXPECT_EQ(health->outer.status, 200u);
  EXPECT_TRUE(health->outer.body.empty());

  std::shared_ptr<Exchange> keys = send(relay_, outerRequest("GET", "/ohttp-keys"));
  ASSERT_TRUE(keys->done);
  EXPECT_EQ(keys->outer.status, 200u);
  EXPECT_EQ(keys->outer.content_type, pjdir::kOhttpKeysContentType);
  std::vector<pjdir::ohttp::KeyConfig> configs;
  ASSERT_EQ(pjdir::ohttp::decode_key_config_list(keys->outer.body, &configs),
            pjdir::ohttp::OhttpParseErrorCode::SUCCESS);
  ASSERT_EQ(configs.size(), size_t(1));
  EXPECT_EQ(configs[0], key_->config());

  std::shared_ptr<Exchange> missing = send(relay_, outerRequest("GET", "/abc123"));
  EXPECT_EQ(missing->outer.status, 404u);
  missing = send(relay_, outerRequest("DELETE", "/"));
  EXPECT_EQ(missing->outer.status, 404u);
}

TEST_F(RelayTest, KeysUnavailableWithoutCurrentKey) {
  KeyEpochManager empty(std::chrono::minutes(10));
  Relay relay(empty, mailbox_, makeOptions(std::chrono::seconds(1)));
  std::shared_ptr<Exchange> keys = send(relay, outerRequest("GET", "/ohttp-keys"));
  ASSERT_TRUE(keys->done);
  EXPECT_EQ(keys->outer.status, 500u);
}

TEST_F(RelayTest, InnerKeyFetch) {
  std::shared_ptr<Exchange> exchange = sendInner("GET", "/ohttp-keys");
  pjdir::bhttp::Response inner = open(*exchange);
  EXPECT_EQ(inner.status, 200u);
  EXPECT_EQ(inner.content, pjdir::ohttp::encode_key_config_list({key_->config()}));
}

TEST_F(RelayTest, SenderAndReceiverExchangeThroughMailbox) {
  // Receiver polls first, then the sender posts and waits for the answer.
  std::shared_ptr<Exchange> receiver_poll = sendInner("GET", "/abc123");
  std::shared_ptr<Exchange> sender_post;
  std::shared_ptr<Exchange> receiver_put;

  boost::asio::steady_timer sender_timer(ioc_);
  sender_timer.expires_after(std::chrono::milliseconds(50));
  sender_timer.async_wait([&](const boost::system::error_code&) {
    sender_post = sendInner("POST", "/abc123?v=2", "req-bytes");
  });

  boost::asio::steady_timer receiver_timer(ioc_);
  receiver_timer.expires_after(std::chrono::milliseconds(150));
  receiver_timer.async_wait([&](const boost::system::error_code&) {
    receiver_put = sendInner("PUT", "/abc123", "res-bytes");
  });
  run();

  pjdir::bhttp::Response polled = open(*receiver_poll);
  EXPECT_EQ(polled.status, 200u);
  EXPECT_EQ(polled.content, bytes("req-bytes"));

  ASSERT_NE(receiver_put, nullptr);
  pjdir::bhttp::Response put = open(*receiver_put);
  EXPECT_EQ(put.status, 200u);
  EXPECT_TRUE(put.content.empty());

  ASSERT_NE(sender_post, nullptr);
  pjdir::bhttp::Response answered = open(*sender_post);
  EXPECT_EQ(answered.status, 200u);
  EXPECT_EQ(answered.content, bytes("res-bytes"));
}

TEST_F(RelayTest, LongPollTimeoutIsAcceptedNotError) {
  Relay relay(keys_, mailbox_, makeOptions(std::chrono::milliseconds(200)));
  auto started = std::chrono::steady_clock::now();
  std::shared_ptr<Exchange> poll = sendInner(relay, "GET", "/nope");
  std::shared_ptr<Exchange> post = sendInner(relay, "POST", "/lonely", "req-bytes");
  run();
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(open(*poll).status, 202u);
  pjdir::bhttp::Response posted = open(*post);
  EXPECT_EQ(posted.status, 202u);
  EXPECT_TRUE(posted.content.empty());
  EXPECT_GE(elapsed, std::chrono::milliseconds(200));
  EXPECT_EQ(slot("lonely", Direction::kRequest), bytes("req-bytes"));
}

TEST_F(RelayTest, InnerClientErrorsAreSealed) {
  std::shared_ptr<Exchange> bad_id = sendInner("PUT", "/not.a.valid.id", "x");
  std::shared_ptr<Exchange> long_id = sendInner("PUT", "/" + std::string(65, 'a'), "x");
  std::shared_ptr<Exchange> oversize = sendInner("PUT", "/abc123", std::string(kMaxPayload + 1, 'x'));
  std::shared_ptr<Exchange> unknown = sendInner("DELETE", "/abc123");
  std::shared_ptr<Exchange> nested = sendInner("GET", "/abc123/extra");
  run();

  EXPECT_EQ(open(*bad_id).status, 400u);
  EXPECT_EQ(open(*long_id).status, 400u);
  EXPECT_EQ(open(*oversize).status, 413u);
  EXPECT_EQ(open(*unknown).status, 404u);
  EXPECT_EQ(open(*nested).status, 404u);
  EXPECT_EQ(backend_.size(), size_t(0));
}

TEST_F(RelayTest, MalformedInnerMessageIsSealed) {
  ClientContext client;
  std::vector<uint8_t> enc_request;
  std::vector<uint8_t> garbage = {0x07, 0x01, 0x02};
  ASSERT_EQ(pjdir::ohttp::encapsulate_request(key_->config(), garbage, &enc_request, &client),
            OhttpErrorCode::SUCCESS);
  std::shared_ptr<Exchange> exchange = send(relay_, outerRequest("POST", "/", enc_request));
  exchange->client = std::move(client);

  EXPECT_EQ(open(*exchange).status, 400u);
}

TEST_F(RelayTest, CryptoRejectionsLookIdentical) {
  ClientContext client;
  std::vector<uint8_t> valid;
  ASSERT_EQ(pjdir::ohttp::encapsulate_request(key_->config(), innerBytes("GET", "/ohttp-keys", ""), &valid, &client),
            OhttpErrorCode::SUCCESS);

  // Encapsulated to a key that has since been retired and expired.
  KeyEpochManager::Clock::time_point now = KeyEpochManager::Clock::now();
  KeyEpochManager rotating(std::chrono::minutes(10), false, [&now] { return now; });
  ASSERT_EQ(rotating.rotate(key_), KeyErrorCode::SUCCESS);
  ASSERT_EQ(rotating.rotate(KeyPair::generate(2, pjdir::ohttp::kAeadChaCha20Poly1305)), KeyErrorCode::SUCCESS);
  now += std::chrono::minutes(11);
  Relay relay(rotating, mailbox_, makeOptions(std::chrono::seconds(1)));

  std::vector<uint8_t> tampered = valid;
  tampered.back() ^= 0x80;
  std::vector<uint8_t> truncated(valid.begin(), valid.begin() + 5);

  std::shared_ptr<Exchange> retired = send(relay, outerRequest("POST", "/", valid));
  std::shared_ptr<Exchange> bad_tag = send(relay, outerRequest("POST", "/", tampered));
  std::shared_ptr<Exchange> malformed = send(relay, outerRequest("POST", "/", truncated));
  std::shared_ptr<Exchange> empty = send(relay, outerRequest("POST", "/"));

  for (const auto& exchange : {retired, bad_tag, malformed, empty}) {
    ASSERT_TRUE(exchange->done);
    EXPECT_EQ(exchange->outer.status, 400u);
    EXPECT_EQ(exchange->outer.content_type, "application/problem+json");
    EXPECT_EQ(exchange->outer.body, retired->outer.body);
  }
  EXPECT_EQ(std::string(retired->outer.body.begin(), retired->outer.body.end()),
            "{\"type\":\"https://iana.org/assignments/http-problem-types#ohttp-key\", "
            "\"title\": \"key identifier unknown\"}");
}

TEST_F(RelayTest, OversizeEnvelopeRefusedBeforeDecapsulation) {
  std::vector<uint8_t> body(relay_.max_body_size() + 1, 0);
  std::shared_ptr<Exchange> exchange = send(relay_, outerRequest("POST", "/", body));
  ASSERT_TRUE(exchange->done);
  EXPECT_EQ(exchange->outer.status, 413u);
}

TEST_F(RelayTest, CancelledPollNeverAnswers) {
  std::shared_ptr<Exchange> poll = sendInner("GET", "/abc123");
  boost::asio::steady_timer disconnect(ioc_);
  disconnect.expires_after(std::chrono::milliseconds(20));
  disconnect.async_wait([&](const boost::system::error_code&) { poll->wait.cancel(); });
  auto started = std::chrono::steady_clock::now();
  run();

  EXPECT_FALSE(poll->done);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
  EXPECT_EQ(backend_.subscriber_count(), size_t(0));
}

TEST_F(RelayTest, UnreachableBackendIsSealedServiceUnavailable) {
  UnreachableBackend unreachable(ioc_);
  MailboxStore mailbox(ioc_, unreachable, std::chrono::hours(24));
  Relay relay(keys_, mailbox, makeOptions(std::chrono::seconds(5)));

  auto started = std::chrono::steady_clock::now();
  std::shared_ptr<Exchange> post = sendInner(relay, "POST", "/abc123", "req-bytes");
  std::shared_ptr<Exchange> put = sendInner(relay, "PUT", "/abc123", "res-bytes");
  std::shared_ptr<Exchange> poll = sendInner(relay, "GET", "/abc123");
  std::shared_ptr<Exchange> v1 = send(relay, outerRequest("POST", "/abc123?v=1", bytes("original")));
  run();

  // The outer layer still succeeds; only the sealed inner response says 503.
  EXPECT_EQ(open(*post).status, 503u);
  EXPECT_EQ(open(*put).status, 503u);
  EXPECT_EQ(open(*poll).status, 503u);
  ASSERT_TRUE(v1->done);
  EXPECT_EQ(v1->outer.status, 503u);

  // None of them sat out the long-poll timeout.
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}

TEST_F(RelayTest, V1SenderWithOfflineReceiver) {
  Relay relay(keys_, mailbox_, makeOptions(std::chrono::milliseconds(100)));
  std::shared_ptr<Exchange> exchange = send(relay, outerRequest("POST", "/abc123?v=1&maxadditionalfeecontribution=182",
                                                                bytes("cHNidP8BAHECAAAAAQ==")));
  run();

  ASSERT_TRUE(exchange->done);
  EXPECT_EQ(exchange->outer.status, 503u);
  EXPECT_EQ(std::string(exchange->outer.body.begin(), exchange->outer.body.end()),
            "{\"errorCode\": \"unavailable\", "
            "\"message\": \"V2 receiver offline. V1 sends require synchronous communications.\"}");
  EXPECT_EQ(slot("abc123", Direction::kRequest),
            bytes("cHNidP8BAHECAAAAAQ==\nv=1&maxadditionalfeecontribution=182"));
}

TEST_F(RelayTest, V1SenderGetsReceiverAnswer) {
  std::shared_ptr<Exchange> sender = send(relay_, outerRequest("POST", "/abc123?v=1", bytes("original")));
  std::shared_ptr<Exchange> receiver_put;
  boost::asio::steady_timer receiver_timer(ioc_);
  receiver_timer.expires_after(std::chrono::milliseconds(50));
  receiver_timer.async_wait([&](const boost::system::error_code&) {
    receiver_put = sendInner("PUT", "/abc123", "proposal");
  });
  run();

  ASSERT_TRUE(sender->done);
  EXPECT_EQ(sender->outer.status, 200u);
  EXPECT_EQ(sender->outer.body, bytes("proposal"));
  ASSERT_NE(receiver_put, nullptr);
  EXPECT_EQ(open(*receiver_put).status, 200u);
}

TEST_F(RelayTest, V1RejectsNonUtf8Body) {
  std::shared_ptr<Exchange> exchange = send(relay_, outerRequest("POST", "/abc123", {0xC3, 0x28}));
  ASSERT_TRUE(exchange->done);
  EXPECT_EQ(exchange->outer.status, 400u);
  EXPECT_EQ(std::string(exchange->outer.body.begin(), exchange->outer.body.end()),
            "{\"errorCode\": \"original-psbt-rejected \", \"message\": \"Body is not a string\"}");
  EXPECT_EQ(backend_.size(), size_t(0));
}

TEST(SessionIdTest, AcceptsUrlSafeIdentifiers) {
  EXPECT_TRUE(pjdir::is_valid_session_id("abc123", 64));
  EXPECT_TRUE(pjdir::is_valid_session_id("A-b_9", 64));
  EXPECT_FALSE(pjdir::is_valid_session_id("", 64));
  EXPECT_FALSE(pjdir::is_valid_session_id("abc 123", 64));
  EXPECT_FALSE(pjdir::is_valid_session_id("abc%2F", 64));
  EXPECT_FALSE(pjdir::is_valid_session_id("abcdef", 5));
}

TEST(Utf8Test, RejectsInvalidSequences) {
  EXPECT_TRUE(pjdir::is_valid_utf8(bytes("plain ascii")));
  EXPECT_TRUE(pjdir::is_valid_utf8({0xE2, 0x82, 0xBF}));               // U+20BF
  EXPECT_FALSE(pjdir::is_valid_utf8({0xC0, 0xAF}));                    // overlong '/'
  EXPECT_FALSE(pjdir::is_valid_utf8({0xED, 0xA0, 0x80}));              // surrogate
  EXPECT_FALSE(pjdir::is_valid_utf8({0xF4, 0x90, 0x80, 0x80}));        // past U+10FFFF
  EXPECT_FALSE(pjdir::is_valid_utf8({0xE2, 0x82}));                    // truncated
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
