#include <vector>

#include "gtest/gtest.h"

#include "gateway.h"

namespace {

using pjdir::DecapsulationFailure;
using pjdir::KeyEpochManager;
using pjdir::KeyErrorCode;
using pjdir::OhttpGateway;
using pjdir::ohttp::ClientContext;
using pjdir::ohttp::KeyPair;
using pjdir::ohttp::OhttpErrorCode;
using pjdir::ohttp::ResponseContext;

constexpr size_t kMaxMessageSize = 1024;

std::vector<uint8_t> bytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

class GatewayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    first_ = KeyPair::generate(1, pjdir::ohttp::kAeadChaCha20Poly1305);
    ASSERT_NE(first_, nullptr);
    ASSERT_EQ(keys_.rotate(first_), KeyErrorCode::SUCCESS);
  }

  std::vector<uint8_t> encapsulate(const std::shared_ptr<const KeyPair>& key, const std::vector<uint8_t>& plain,
                                   ClientContext* client) {
    std::vector<uint8_t> enc_request;
    EXPECT_EQ(pjdir::ohttp::encapsulate_request(key->config(), plain, &enc_request, client),
              OhttpErrorCode::SUCCESS);
    return enc_request;
  }

  KeyEpochManager::Clock::time_point now_ = KeyEpochManager::Clock::time_point() + std::chrono::hours(1);
  KeyEpochManager keys_{std::chrono::minutes(10), false, [this] { return now_; }};
  OhttpGateway gateway_{keys_, kMaxMessageSize};
  std::shared_ptr<const KeyPair> first_;
};

TEST_F(GatewayTest, RoundTripThroughCurrentKey) {
  ClientContext client;
  std::vector<uint8_t> enc_request = encapsulate(first_, bytes("inner request"), &client);

  std::vector<uint8_t> request;
  ResponseContext context;
  ASSERT_EQ(gateway_.decapsulate(enc_request, &request, &context), OhttpErrorCode::SUCCESS);
  EXPECT_EQ(request, bytes("inner request"));

  std::vector<uint8_t> enc_response;
  ASSERT_EQ(gateway_.encapsulate(context, bytes("inner response"), &enc_response), OhttpErrorCode::SUCCESS);
  std::vector<uint8_t> response;
  ASSERT_EQ(pjdir::ohttp::decapsulate_response(client, enc_response, &response), OhttpErrorCode::SUCCESS);
  EXPECT_EQ(response, bytes("inner response"));

  EXPECT_THROW(gateway_.encapsulate(context, bytes("again"), &enc_response), pjdir::ohttp::ContextReuseError);
}

TEST_F(GatewayTest, PreviousKeyAcceptedUntilOverlapEnds) {
  ClientContext early_client;
  std::vector<uint8_t> early = encapsulate(first_, bytes("early"), &early_client);
  ClientContext late_client;
  std::vector<uint8_t> late = encapsulate(first_, bytes("late"), &late_client);

  std::shared_ptr<const KeyPair> second = KeyPair::generate(2, pjdir::ohttp::kAeadChaCha20Poly1305);
  ASSERT_EQ(keys_.rotate(second), KeyErrorCode::SUCCESS);

  now_ += std::chrono::minutes(9);
  std::vector<uint8_t> request;
  ResponseContext context;
  ASSERT_EQ(gateway_.decapsulate(early, &request, &context), OhttpErrorCode::SUCCESS);
  EXPECT_EQ(request, bytes("early"));

  now_ += std::chrono::minutes(1);
  ResponseContext late_context;
  EXPECT_EQ(gateway_.decapsulate(late, &request, &late_context), OhttpErrorCode::ERR_UNKNOWN_KEY);
  EXPECT_TRUE(late_context.used());

  // A context opened before the key expired still seals its response.
  std::vector<uint8_t> enc_response;
  ASSERT_EQ(gateway_.encapsulate(context, bytes("reply"), &enc_response), OhttpErrorCode::SUCCESS);
  std::vector<uint8_t> response;
  ASSERT_EQ(pjdir::ohttp::decapsulate_response(early_client, enc_response, &response), OhttpErrorCode::SUCCESS);
  EXPECT_EQ(response, bytes("reply"));
}

TEST_F(GatewayTest, ClassifiesFailures) {
  std::vector<uint8_t> request;
  ResponseContext context;

  std::vector<uint8_t> oversize(kMaxMessageSize + 1, 0);
  OhttpErrorCode code = gateway_.decapsulate(oversize, &request, &context);
  EXPECT_EQ(pjdir::classify_decapsulation_error(code), DecapsulationFailure::OVERSIZE);

  std::vector<uint8_t> short_header = {1, 0x00, 0x20};
  code = gateway_.decapsulate(short_header, &request, &context);
  EXPECT_EQ(pjdir::classify_decapsulation_error(code), DecapsulationFailure::MALFORMED);

  ClientContext client;
  std::vector<uint8_t> enc_request = encapsulate(first_, bytes("payload"), &client);
  std::vector<uint8_t> foreign = enc_request;
  foreign[0] = 42;
  code = gateway_.decapsulate(foreign, &request, &context);
  EXPECT_EQ(pjdir::classify_decapsulation_error(code), DecapsulationFailure::UNKNOWN_KEY);

  std::vector<uint8_t> tampered = enc_request;
  tampered.back() ^= 0x01;
  code = gateway_.decapsulate(tampered, &request, &context);
  EXPECT_EQ(pjdir::classify_decapsulation_error(code), DecapsulationFailure::AUTHENTICATION);

  // Same key_id, different suite.
  std::vector<uint8_t> wrong_suite = enc_request;
  wrong_suite[6] = 0x01;
  code = gateway_.decapsulate(wrong_suite, &request, &context);
  EXPECT_EQ(pjdir::classify_decapsulation_error(code), DecapsulationFailure::MALFORMED);

  EXPECT_TRUE(context.used());
}

TEST_F(GatewayTest, RejectsOversizeResponseBeforeSealing) {
  ClientContext client;
  std::vector<uint8_t> enc_request = encapsulate(first_, bytes("x"), &client);
  std::vector<uint8_t> request;
  ResponseContext context;
  ASSERT_EQ(gateway_.decapsulate(enc_request, &request, &context), OhttpErrorCode::SUCCESS);

  std::vector<uint8_t> enc_response;
  EXPECT_EQ(gateway_.encapsulate(context, std::vector<uint8_t>(kMaxMessageSize + 1, 'a'), &enc_response),
            OhttpErrorCode::ERR_OVERSIZE);
  EXPECT_FALSE(context.used());
  EXPECT_EQ(gateway_.encapsulate(context, bytes("small"), &enc_response), OhttpErrorCode::SUCCESS);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
