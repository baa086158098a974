// Oblivious HTTP message encapsulation per https://www.rfc-editor.org/rfc/rfc9458

#ifndef PJDIR_OHTTP_H
#define PJDIR_OHTTP_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "openssl/hpke.h"

namespace pjdir {
namespace ohttp {

    // IANA HPKE identifiers, see https://www.iana.org/assignments/hpke/hpke.xhtml
    constexpr uint16_t kKemX25519HkdfSha256 = 0x0020;
    constexpr uint16_t kKdfHkdfSha256 = 0x0001;
    constexpr uint16_t kAeadAes128Gcm = 0x0001;
    constexpr uint16_t kAeadChaCha20Poly1305 = 0x0003;

    constexpr size_t kX25519PublicKeyLength = 32;
    constexpr size_t kX25519EncLength = 32;
    // key_id (8) + kem_id (16) + kdf_id (16) + aead_id (16)
    constexpr size_t kRequestHeaderLength = 7;

    enum class OhttpErrorCode {
        SUCCESS = 0,
        ERR_OVERSIZE,
        ERR_NO_ENCAPSULATED_HEADER,
        ERR_UNSUPPORTED_SUITE,
        ERR_UNKNOWN_KEY,
        ERR_NO_PUBLIC_KEY,
        ERR_NO_CIPHER_TEXT,
        ERR_NO_CONTEXT_CREATED,
        ERR_UNABLE_TO_OPEN,
        ERR_UNABLE_TO_SEAL,
        ERR_NO_SECRET,
        ERR_NO_PRK,
        ERR_NO_AEAD_KEY,
        ERR_NO_AEAD_NONCE,
        ERR_UNABLE_TO_OPEN_RESPONSE
    };
    inline std::string OhttpErrorCodeToString(OhttpErrorCode code) {
        switch (code) {
            case OhttpErrorCode::SUCCESS: return "SUCCESS";
            case OhttpErrorCode::ERR_OVERSIZE: return "ERR_OVERSIZE";
            case OhttpErrorCode::ERR_NO_ENCAPSULATED_HEADER: return "ERR_NO_ENCAPSULATED_HEADER";
            case OhttpErrorCode::ERR_UNSUPPORTED_SUITE: return "ERR_UNSUPPORTED_SUITE";
            case OhttpErrorCode::ERR_UNKNOWN_KEY: return "ERR_UNKNOWN_KEY";
            case OhttpErrorCode::ERR_NO_PUBLIC_KEY: return "ERR_NO_PUBLIC_KEY";
            case OhttpErrorCode::ERR_NO_CIPHER_TEXT: return "ERR_NO_CIPHER_TEXT";
            case OhttpErrorCode::ERR_NO_CONTEXT_CREATED: return "ERR_NO_CONTEXT_CREATED";
            case OhttpErrorCode::ERR_UNABLE_TO_OPEN: return "ERR_UNABLE_TO_OPEN";
            case OhttpErrorCode::ERR_UNABLE_TO_SEAL: return "ERR_UNABLE_TO_SEAL";
            case OhttpErrorCode::ERR_NO_SECRET: return "ERR_NO_SECRET";
            case OhttpErrorCode::ERR_NO_PRK: return "ERR_NO_PRK";
            case OhttpErrorCode::ERR_NO_AEAD_KEY: return "ERR_NO_AEAD_KEY";
            case OhttpErrorCode::ERR_NO_AEAD_NONCE: return "ERR_NO_AEAD_NONCE";
            case OhttpErrorCode::ERR_UNABLE_TO_OPEN_RESPONSE: return "ERR_UNABLE_TO_OPEN_RESPONSE";
            default: return "Unknown error code";
        }
    }
    enum class OhttpParseErrorCode {
        SUCCESS = 0,
        ERR_BAD_OFFSET,
        ERR_BAD_LENGTH,
        ERR_UNSUPPORTED_KEM,
    };
    inline std::string OhttpParseErrorCodeToString(OhttpParseErrorCode code) {
        switch (code) {
            case OhttpParseErrorCode::SUCCESS: return "SUCCESS";
            case OhttpParseErrorCode::ERR_BAD_OFFSET: return "ERR_BAD_OFFSET";
            case OhttpParseErrorCode::ERR_BAD_LENGTH: return "ERR_BAD_LENGTH";
            case OhttpParseErrorCode::ERR_UNSUPPORTED_KEM: return "ERR_UNSUPPORTED_KEM";
            default: return "Unknown error code";
        }
    }

    // Thrown when a response context is used for a second response.
    class ContextReuseError : public std::logic_error {
      public:
        ContextReuseError() : std::logic_error("OHTTP response context already used") {}
    };

    struct SymmetricAlgorithm {
        uint16_t kdf_id;
        uint16_t aead_id;
    };

    inline bool operator==(const SymmetricAlgorithm& a, const SymmetricAlgorithm& b) {
        return a.kdf_id == b.kdf_id && a.aead_id == b.aead_id;
    }

    // Key Config {
    //   Key Identifier (8),
    //   HPKE KEM ID (16),
    //   HPKE Public Key (Npk * 8),
    //   HPKE Symmetric Algorithms Length (16) = 4..65532,
    //   HPKE Symmetric Algorithms (32) ...,
    // }
    struct KeyConfig {
        uint8_t key_id = 0;
        uint16_t kem_id = kKemX25519HkdfSha256;
        std::vector<uint8_t> public_key;
        std::vector<SymmetricAlgorithm> symmetric;
    };

    inline bool operator==(const KeyConfig& a, const KeyConfig& b) {
        return a.key_id == b.key_id && a.kem_id == b.kem_id &&
               a.public_key == b.public_key && a.symmetric == b.symmetric;
    }

    bool is_supported_aead(uint16_t aead_id);

    std::vector<uint8_t> encode_key_config(const KeyConfig& config);

    // application/ohttp-keys: each configuration prefixed with its 16-bit length.
    std::vector<uint8_t> encode_key_config_list(const std::vector<KeyConfig>& configs);

    // Configurations for an unsupported KEM are skipped; any framing error
    // discards the whole list.
    OhttpParseErrorCode decode_key_config_list(const std::vector<uint8_t>& input, std::vector<KeyConfig>* out);

    // An HPKE key pair published under one key identifier with one symmetric
    // suite. Immutable once created.
    class KeyPair {
      public:
        // Returns nullptr if aead_id is unsupported or key generation fails.
        static std::shared_ptr<const KeyPair> generate(uint8_t key_id, uint16_t aead_id);

        // Builds a key pair from a raw X25519 private key.
        static std::shared_ptr<const KeyPair> from_private_key(uint8_t key_id, uint16_t aead_id,
                                                               const std::vector<uint8_t>& private_key);

        uint8_t key_id() const { return key_id_; }
        uint16_t kem_id() const { return kKemX25519HkdfSha256; }
        uint16_t kdf_id() const { return kKdfHkdfSha256; }
        uint16_t aead_id() const { return aead_id_; }
        const EVP_HPKE_KEY* hpke_key() const { return key_.get(); }

        std::vector<uint8_t> public_key() const;
        KeyConfig config() const;

      private:
        KeyPair(uint8_t key_id, uint16_t aead_id, bssl::UniquePtr<EVP_HPKE_KEY> key);

        uint8_t key_id_;
        uint16_t aead_id_;
        bssl::UniquePtr<EVP_HPKE_KEY> key_;
    };

    // Per-request state saved by decapsulate_request and needed to encapsulate
    // exactly one response. Move-only; holds the exported response secret
    // rather than the HPKE context.
    class ResponseContext {
      public:
        ResponseContext() = default;
        ~ResponseContext();
        ResponseContext(ResponseContext&& other) noexcept;
        ResponseContext& operator=(ResponseContext&& other) noexcept;
        ResponseContext(const ResponseContext&) = delete;
        ResponseContext& operator=(const ResponseContext&) = delete;

        // True once a response has been sealed, or for a context that never
        // came out of a successful decapsulation.
        bool used() const { return used_; }

      private:
        friend OhttpErrorCode decapsulate_request(const KeyPair&, const std::vector<uint8_t>&,
                                                  std::vector<uint8_t>*, ResponseContext*);
        friend OhttpErrorCode encapsulate_response(ResponseContext&, const std::vector<uint8_t>&,
                                                   std::vector<uint8_t>*);

        void wipe();

        std::vector<uint8_t> enc_;
        std::vector<uint8_t> secret_;
        uint16_t aead_id_ = 0;
        bool used_ = true;
    };

    // Client half of one request/response exchange.
    class ClientContext {
      public:
        ClientContext() = default;
        ClientContext(ClientContext&&) = default;
        ClientContext& operator=(ClientContext&&) = default;

      private:
        friend OhttpErrorCode encapsulate_request(const KeyConfig&, const std::vector<uint8_t>&,
                                                  std::vector<uint8_t>*, ClientContext*);
        friend OhttpErrorCode decapsulate_response(const ClientContext&, const std::vector<uint8_t>&,
                                                   std::vector<uint8_t>*);

        bssl::UniquePtr<EVP_HPKE_CTX> hpke_ctx_;
        std::vector<uint8_t> enc_;
        uint16_t aead_id_ = 0;
    };

    // Gateway side. The caller has already matched the header's key_id to
    // key; a suite mismatch fails with ERR_UNSUPPORTED_SUITE.
    OhttpErrorCode decapsulate_request(const KeyPair& key, const std::vector<uint8_t>& enc_request,
                                       std::vector<uint8_t>* request, ResponseContext* context);

    // Throws ContextReuseError if context was already used.
    OhttpErrorCode encapsulate_response(ResponseContext& context, const std::vector<uint8_t>& response,
                                        std::vector<uint8_t>* enc_response);

    // Client side. Uses the first symmetric suite of config this library supports.
    OhttpErrorCode encapsulate_request(const KeyConfig& config, const std::vector<uint8_t>& request,
                                       std::vector<uint8_t>* enc_request, ClientContext* context);

    OhttpErrorCode decapsulate_response(const ClientContext& context, const std::vector<uint8_t>& enc_response,
                                        std::vector<uint8_t>* response);

}  // namespace ohttp
}  // namespace pjdir

#endif  // PJDIR_OHTTP_H
