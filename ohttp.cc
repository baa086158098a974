#include <algorithm>
#include <vector>

#include "ohttp.h"
#include "ohttp_internal.h"
#include "openssl/aead.h"
#include "openssl/digest.h"
#include "openssl/hkdf.h"
#include "openssl/hpke.h"
#include "openssl/mem.h"
#include "openssl/rand.h"

namespace pjdir {
namespace ohttp {

    namespace {

        const char kRequestInfoLabel[] = "message/bhttp request";
        const char kResponseExportLabel[] = "message/bhttp response";

        void append_u16(std::vector<uint8_t>& out, uint16_t value) {
            out.push_back((value >> 8) & 0xFF);
            out.push_back(value & 0xFF);
        }

        uint16_t read_u16(const std::vector<uint8_t>& in, size_t offset) {
            return static_cast<uint16_t>((in[offset] << 8) | in[offset + 1]);
        }

        const EVP_HPKE_AEAD* hpke_aead(uint16_t aead_id) {
            switch (aead_id) {
                case kAeadAes128Gcm: return EVP_hpke_aes_128_gcm();
                case kAeadChaCha20Poly1305: return EVP_hpke_chacha20_poly1305();
                default: return nullptr;
            }
        }

        const EVP_AEAD* response_aead(uint16_t aead_id) {
            switch (aead_id) {
                case kAeadAes128Gcm: return EVP_aead_aes_128_gcm();
                case kAeadChaCha20Poly1305: return EVP_aead_chacha20_poly1305();
                default: return nullptr;
            }
        }

        // max(Nn, Nk)
        size_t response_secret_length(const EVP_AEAD* aead) {
            return std::max(EVP_AEAD_key_length(aead), EVP_AEAD_nonce_length(aead));
        }

        // prk = Extract(concat(enc, response_nonce), secret)
        // aead_key = Expand(prk, "key", Nk)
        // aead_nonce = Expand(prk, "nonce", Nn)
        OhttpErrorCode derive_response_keys(const EVP_AEAD* aead,
                                            const std::vector<uint8_t>& secret,
                                            const std::vector<uint8_t>& enc,
                                            const uint8_t* response_nonce,
                                            size_t response_nonce_len,
                                            std::vector<uint8_t>* aead_key,
                                            std::vector<uint8_t>* aead_nonce) {
            std::vector<uint8_t> salt(enc);
            salt.insert(salt.end(), response_nonce, response_nonce + response_nonce_len);

            uint8_t prk[EVP_MAX_MD_SIZE];
            size_t prk_len;
            int rv = HKDF_extract(
                /* *out_key */ prk,
                /* *out_len */ &prk_len,
                /* *digest */ EVP_sha256(),
                /* *secret */ secret.data(),
                /*  secret_len */ secret.size(),
                /* *salt */ salt.data(),
                /*  salt_len */ salt.size());
            if (rv != 1) {
                return OhttpErrorCode::ERR_NO_PRK;
            }

            static const uint8_t kKeyLabel[] = {'k', 'e', 'y'};
            aead_key->resize(EVP_AEAD_key_length(aead));
            rv = HKDF_expand(
                /* *out */ aead_key->data(),
                /*  out_len */ aead_key->size(),
                /* *digest */ EVP_sha256(),
                /* *prk */ prk,
                /*  prk_len */ prk_len,
                /* *info */ kKeyLabel,
                /*  info_len */ sizeof(kKeyLabel));
            if (rv != 1) {
                OPENSSL_cleanse(prk, sizeof(prk));
                return OhttpErrorCode::ERR_NO_AEAD_KEY;
            }

            static const uint8_t kNonceLabel[] = {'n', 'o', 'n', 'c', 'e'};
            aead_nonce->resize(EVP_AEAD_nonce_length(aead));
            rv = HKDF_expand(
                /* *out */ aead_nonce->data(),
                /*  out_len */ aead_nonce->size(),
                /* *digest */ EVP_sha256(),
                /* *prk */ prk,
                /*  prk_len */ prk_len,
                /* *info */ kNonceLabel,
                /*  info_len */ sizeof(kNonceLabel));
            OPENSSL_cleanse(prk, sizeof(prk));
            if (rv != 1) {
                return OhttpErrorCode::ERR_NO_AEAD_NONCE;
            }
            return OhttpErrorCode::SUCCESS;
        }

        OhttpErrorCode export_response_secret(const EVP_HPKE_CTX* hpke_ctx, const EVP_AEAD* aead,
                                              std::vector<uint8_t>* secret) {
            secret->resize(response_secret_length(aead));
            int rv = EVP_HPKE_CTX_export(
                /* *ctx */ hpke_ctx,
                /* *out */ secret->data(),
                /*  secret_len */ secret->size(),
                /* *context */ reinterpret_cast<const uint8_t*>(kResponseExportLabel),
                /*  context_len */ sizeof(kResponseExportLabel) - 1);
            if (rv != 1) {
                secret->clear();
                return OhttpErrorCode::ERR_NO_SECRET;
            }
            return OhttpErrorCode::SUCCESS;
        }

    }  // namespace

    bool is_supported_aead(uint16_t aead_id) {
        return hpke_aead(aead_id) != nullptr;
    }

    std::vector<uint8_t> encode_key_config(const KeyConfig& config) {
        std::vector<uint8_t> out;
        out.push_back(config.key_id);
        append_u16(out, config.kem_id);
        out.insert(out.end(), config.public_key.begin(), config.public_key.end());

        // HPKE Symmetric Algorithms {
        //   HPKE KDF ID (16),
        //   HPKE AEAD ID (16),
        // }
        append_u16(out, static_cast<uint16_t>(config.symmetric.size() * 4));
        for (const SymmetricAlgorithm& alg : config.symmetric) {
            append_u16(out, alg.kdf_id);
            append_u16(out, alg.aead_id);
        }
        return out;
    }

    std::vector<uint8_t> encode_key_config_list(const std::vector<KeyConfig>& configs) {
        // Each encoded configuration is prefixed with a 2-byte integer in
        // network byte order that indicates the length of the key configuration
        // in bytes. The length-prefixed encodings are concatenated to form a
        // list.
        std::vector<uint8_t> out;
        for (const KeyConfig& config : configs) {
            std::vector<uint8_t> encoded = encode_key_config(config);
            append_u16(out, static_cast<uint16_t>(encoded.size()));
            out.insert(out.end(), encoded.begin(), encoded.end());
        }
        return out;
    }

    OhttpParseErrorCode decode_key_config_list(const std::vector<uint8_t>& input, std::vector<KeyConfig>* out) {
        std::vector<KeyConfig> configs;
        size_t offset = 0;
        while (offset < input.size()) {
            if (input.size() - offset < 2) {
                return OhttpParseErrorCode::ERR_BAD_OFFSET;
            }
            size_t len = read_u16(input, offset);
            offset += 2;
            if (input.size() - offset < len) {
                return OhttpParseErrorCode::ERR_BAD_OFFSET;
            }
            size_t end = offset + len;
            if (len < 3 + 2) {
                return OhttpParseErrorCode::ERR_BAD_LENGTH;
            }
            KeyConfig config;
            config.key_id = input[offset];
            config.kem_id = read_u16(input, offset + 1);
            if (config.kem_id != kKemX25519HkdfSha256) {
                // Unknown KEMs have unknown key lengths; skip the whole entry.
                offset = end;
                continue;
            }
            size_t pos = offset + 3;
            if (end - pos < kX25519PublicKeyLength + 2) {
                return OhttpParseErrorCode::ERR_BAD_LENGTH;
            }
            config.public_key.assign(input.begin() + pos, input.begin() + pos + kX25519PublicKeyLength);
            pos += kX25519PublicKeyLength;
            size_t symmetric_len = read_u16(input, pos);
            pos += 2;
            if (symmetric_len != end - pos || symmetric_len % 4 != 0 || symmetric_len == 0) {
                return OhttpParseErrorCode::ERR_BAD_LENGTH;
            }
            for (; pos < end; pos += 4) {
                config.symmetric.push_back({read_u16(input, pos), read_u16(input, pos + 2)});
            }
            configs.push_back(std::move(config));
            offset = end;
        }
        *out = std::move(configs);
        return OhttpParseErrorCode::SUCCESS;
    }

    std::vector<uint8_t> encode_request_header(const RequestHeader& header) {
        std::vector<uint8_t> hdr;
        hdr.push_back(header.key_id);
        append_u16(hdr, header.kem_id);
        append_u16(hdr, header.kdf_id);
        append_u16(hdr, header.aead_id);
        return hdr;
    }

    OhttpParseErrorCode parse_request_header(const std::vector<uint8_t>& enc_request, RequestHeader* out) {
        if (enc_request.size() < kRequestHeaderLength) {
            return OhttpParseErrorCode::ERR_BAD_OFFSET;
        }
        out->key_id = enc_request[0];
        out->kem_id = read_u16(enc_request, 1);
        out->kdf_id = read_u16(enc_request, 3);
        out->aead_id = read_u16(enc_request, 5);
        return OhttpParseErrorCode::SUCCESS;
    }

    std::vector<uint8_t> build_request_info(const RequestHeader& header) {
        // Build a sequence of bytes (info) by concatenating the ASCII-encoded
        // string "message/bhttp request", a zero byte, and the header.
        std::vector<uint8_t> info(kRequestInfoLabel, kRequestInfoLabel + sizeof(kRequestInfoLabel) - 1);
        info.push_back(0);
        std::vector<uint8_t> hdr = encode_request_header(header);
        info.insert(info.end(), hdr.begin(), hdr.end());
        return info;
    }

    KeyPair::KeyPair(uint8_t key_id, uint16_t aead_id, bssl::UniquePtr<EVP_HPKE_KEY> key)
        : key_id_(key_id), aead_id_(aead_id), key_(std::move(key)) {}

    std::shared_ptr<const KeyPair> KeyPair::generate(uint8_t key_id, uint16_t aead_id) {
        if (!is_supported_aead(aead_id)) {
            return nullptr;
        }
        bssl::UniquePtr<EVP_HPKE_KEY> key(EVP_HPKE_KEY_new());
        if (!key || EVP_HPKE_KEY_generate(key.get(), EVP_hpke_x25519_hkdf_sha256()) != 1) {
            return nullptr;
        }
        return std::shared_ptr<const KeyPair>(new KeyPair(key_id, aead_id, std::move(key)));
    }

    std::shared_ptr<const KeyPair> KeyPair::from_private_key(uint8_t key_id, uint16_t aead_id,
                                                             const std::vector<uint8_t>& private_key) {
        if (!is_supported_aead(aead_id)) {
            return nullptr;
        }
        bssl::UniquePtr<EVP_HPKE_KEY> key(EVP_HPKE_KEY_new());
        if (!key || EVP_HPKE_KEY_init(key.get(), EVP_hpke_x25519_hkdf_sha256(),
                                      private_key.data(), private_key.size()) != 1) {
            return nullptr;
        }
        return std::shared_ptr<const KeyPair>(new KeyPair(key_id, aead_id, std::move(key)));
    }

    std::vector<uint8_t> KeyPair::public_key() const {
        uint8_t public_key[EVP_HPKE_MAX_PUBLIC_KEY_LENGTH];
        size_t public_key_len;
        if (!EVP_HPKE_KEY_public_key(key_.get(), public_key, &public_key_len, sizeof(public_key))) {
            return {};
        }
        return std::vector<uint8_t>(public_key, public_key + public_key_len);
    }

    KeyConfig KeyPair::config() const {
        KeyConfig config;
        config.key_id = key_id_;
        config.kem_id = kem_id();
        config.public_key = public_key();
        config.symmetric.push_back({kdf_id(), aead_id_});
        return config;
    }

    ResponseContext::~ResponseContext() {
        wipe();
    }

    ResponseContext::ResponseContext(ResponseContext&& other) noexcept
        : enc_(std::move(other.enc_)),
          secret_(std::move(other.secret_)),
          aead_id_(other.aead_id_),
          used_(other.used_) {
        other.used_ = true;
    }

    ResponseContext& ResponseContext::operator=(ResponseContext&& other) noexcept {
        if (this != &other) {
            wipe();
            enc_ = std::move(other.enc_);
            secret_ = std::move(other.secret_);
            aead_id_ = other.aead_id_;
            used_ = other.used_;
            other.used_ = true;
        }
        return *this;
    }

    void ResponseContext::wipe() {
        if (!secret_.empty()) {
            OPENSSL_cleanse(secret_.data(), secret_.size());
        }
        secret_.clear();
        enc_.clear();
    }

    OhttpErrorCode decapsulate_request(const KeyPair& key, const std::vector<uint8_t>& enc_request,
                                       std::vector<uint8_t>* request, ResponseContext* context) {
        // Break the request into 3 parts: header (the AAD), the encapsulated
        // ephemeral key, and the ciphertext.
        RequestHeader header;
        if (parse_request_header(enc_request, &header) != OhttpParseErrorCode::SUCCESS) {
            return OhttpErrorCode::ERR_NO_ENCAPSULATED_HEADER;
        }
        if (header.key_id != key.key_id() || header.kem_id != key.kem_id() ||
            header.kdf_id != key.kdf_id() || header.aead_id != key.aead_id()) {
            return OhttpErrorCode::ERR_UNSUPPORTED_SUITE;
        }
        if (enc_request.size() < kRequestHeaderLength + kX25519EncLength) {
            return OhttpErrorCode::ERR_NO_PUBLIC_KEY;
        }
        std::vector<uint8_t> ad(enc_request.begin(), enc_request.begin() + kRequestHeaderLength);
        std::vector<uint8_t> enc(enc_request.begin() + kRequestHeaderLength,
                                 enc_request.begin() + kRequestHeaderLength + kX25519EncLength);
        std::vector<uint8_t> ct(enc_request.begin() + kRequestHeaderLength + kX25519EncLength, enc_request.end());
        if (ct.empty()) {
            return OhttpErrorCode::ERR_NO_CIPHER_TEXT;
        }

        std::vector<uint8_t> info = build_request_info(header);
        bssl::ScopedEVP_HPKE_CTX hpke_ctx;
        int rv = EVP_HPKE_CTX_setup_recipient(
            /* *ctx */ hpke_ctx.get(),
            /* *key */ key.hpke_key(),
            /* *kdf */ EVP_hpke_hkdf_sha256(),
            /* *aead */ hpke_aead(key.aead_id()),
            /* *enc */ enc.data(),
            /*  enc_len */ enc.size(),
            /* *info */ info.data(),
            /*  info_len */ info.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_NO_CONTEXT_CREATED;
        }

        std::vector<uint8_t> plaintext(ct.size());
        size_t plaintext_len;
        rv = EVP_HPKE_CTX_open(
            /* *ctx */ hpke_ctx.get(),
            /* *out */ plaintext.data(),
            /* *out_len */ &plaintext_len,
            /*  max_out_len */ plaintext.size(),
            /* *ct */ ct.data(),
            /*  ct_len */ ct.size(),
            /* *ad */ ad.data(),
            /*  ad_len */ ad.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_UNABLE_TO_OPEN;
        }
        plaintext.resize(plaintext_len);

        ResponseContext saved;
        OhttpErrorCode exported = export_response_secret(hpke_ctx.get(), response_aead(key.aead_id()), &saved.secret_);
        if (exported != OhttpErrorCode::SUCCESS) {
            return exported;
        }
        saved.enc_ = std::move(enc);
        saved.aead_id_ = key.aead_id();
        saved.used_ = false;

        *request = std::move(plaintext);
        *context = std::move(saved);
        return OhttpErrorCode::SUCCESS;
    }

    OhttpErrorCode encapsulate_response(ResponseContext& context, const std::vector<uint8_t>& response,
                                        std::vector<uint8_t>* enc_response) {
        if (context.used_) {
            throw ContextReuseError();
        }
        context.used_ = true;

        const EVP_AEAD* aead = response_aead(context.aead_id_);
        size_t nonce_len = response_secret_length(aead);

        // response_nonce = random(max(Nn, Nk))
        std::vector<uint8_t> response_nonce(nonce_len);
        if (RAND_bytes(response_nonce.data(), response_nonce.size()) != 1) {
            context.wipe();
            return OhttpErrorCode::ERR_NO_AEAD_NONCE;
        }

        std::vector<uint8_t> aead_key;
        std::vector<uint8_t> aead_nonce;
        OhttpErrorCode derived = derive_response_keys(aead, context.secret_, context.enc_,
                                                      response_nonce.data(), response_nonce.size(),
                                                      &aead_key, &aead_nonce);
        context.wipe();
        if (derived != OhttpErrorCode::SUCCESS) {
            return derived;
        }

        // ct = Seal(aead_key, aead_nonce, "", response)
        bssl::ScopedEVP_AEAD_CTX aead_ctx;
        int rv = EVP_AEAD_CTX_init(aead_ctx.get(), aead, aead_key.data(), aead_key.size(),
                                   EVP_AEAD_DEFAULT_TAG_LENGTH, nullptr);
        OPENSSL_cleanse(aead_key.data(), aead_key.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_NO_AEAD_KEY;
        }
        std::vector<uint8_t> ct(response.size() + EVP_AEAD_max_overhead(aead));
        size_t ct_len;
        rv = EVP_AEAD_CTX_seal(
            /* *ctx */ aead_ctx.get(),
            /* *out */ ct.data(),
            /* *out_len */ &ct_len,
            /*  max_out_len */ ct.size(),
            /* *nonce */ aead_nonce.data(),
            /*  nonce_len */ aead_nonce.size(),
            /* *in */ response.data(),
            /*  in_len */ response.size(),
            /* *ad */ nullptr,
            /*  ad_len */ 0);
        if (rv != 1) {
            return OhttpErrorCode::ERR_UNABLE_TO_SEAL;
        }

        // enc_response = concat(response_nonce, ct)
        std::vector<uint8_t> out(response_nonce);
        out.insert(out.end(), ct.begin(), ct.begin() + ct_len);
        *enc_response = std::move(out);
        return OhttpErrorCode::SUCCESS;
    }

    OhttpErrorCode encapsulate_request(const KeyConfig& config, const std::vector<uint8_t>& request,
                                       std::vector<uint8_t>* enc_request, ClientContext* context) {
        if (config.kem_id != kKemX25519HkdfSha256 || config.public_key.size() != kX25519PublicKeyLength) {
            return OhttpErrorCode::ERR_UNSUPPORTED_SUITE;
        }
        auto suite = std::find_if(config.symmetric.begin(), config.symmetric.end(),
                                  [](const SymmetricAlgorithm& alg) {
                                      return alg.kdf_id == kKdfHkdfSha256 && is_supported_aead(alg.aead_id);
                                  });
        if (suite == config.symmetric.end()) {
            return OhttpErrorCode::ERR_UNSUPPORTED_SUITE;
        }

        // hdr = concat(encode(1, key_id),
        //              encode(2, kem_id),
        //              encode(2, kdf_id),
        //              encode(2, aead_id))
        // info = concat(encode_str("message/bhttp request"),
        //               encode(1, 0),
        //               hdr)
        // enc, sctxt = SetupBaseS(pkR, info)
        // ct = sctxt.Seal("", request)
        // enc_request = concat(hdr, enc, ct)
        RequestHeader header{config.key_id, config.kem_id, suite->kdf_id, suite->aead_id};
        std::vector<uint8_t> hdr = encode_request_header(header);
        std::vector<uint8_t> info = build_request_info(header);

        bssl::UniquePtr<EVP_HPKE_CTX> hpke_ctx(EVP_HPKE_CTX_new());
        if (!hpke_ctx) {
            return OhttpErrorCode::ERR_NO_CONTEXT_CREATED;
        }
        uint8_t enc[EVP_HPKE_MAX_ENC_LENGTH];
        size_t enc_len;
        int rv = EVP_HPKE_CTX_setup_sender(
            /* *ctx */ hpke_ctx.get(),
            /* *out_enc */ enc,
            /* *out_enc_len */ &enc_len,
            /*  max_enc */ sizeof(enc),
            /* *kem */ EVP_hpke_x25519_hkdf_sha256(),
            /* *kdf */ EVP_hpke_hkdf_sha256(),
            /* *aead */ hpke_aead(suite->aead_id),
            /* *peer_public_key */ config.public_key.data(),
            /*  peer_public_key_len */ config.public_key.size(),
            /* *info */ info.data(),
            /*  info_len */ info.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_NO_CONTEXT_CREATED;
        }

        std::vector<uint8_t> ct(request.size() + EVP_HPKE_CTX_max_overhead(hpke_ctx.get()));
        size_t ct_len;
        rv = EVP_HPKE_CTX_seal(
            /* *ctx */ hpke_ctx.get(),
            /* *out */ ct.data(),
            /* *out_len */ &ct_len,
            /*  max_out_len */ ct.size(),
            /* *in */ request.data(),
            /*  in_len */ request.size(),
            /* *ad */ hdr.data(),
            /*  ad_len */ hdr.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_UNABLE_TO_SEAL;
        }

        std::vector<uint8_t> out(hdr);
        out.insert(out.end(), enc, enc + enc_len);
        out.insert(out.end(), ct.begin(), ct.begin() + ct_len);

        context->hpke_ctx_ = std::move(hpke_ctx);
        context->enc_.assign(enc, enc + enc_len);
        context->aead_id_ = suite->aead_id;
        *enc_request = std::move(out);
        return OhttpErrorCode::SUCCESS;
    }

    OhttpErrorCode decapsulate_response(const ClientContext& context, const std::vector<uint8_t>& enc_response,
                                        std::vector<uint8_t>* response) {
        if (!context.hpke_ctx_) {
            return OhttpErrorCode::ERR_NO_CONTEXT_CREATED;
        }
        const EVP_AEAD* aead = response_aead(context.aead_id_);
        size_t nonce_len = response_secret_length(aead);

        // Separate into nonce and ciphertext
        if (enc_response.size() < nonce_len + EVP_AEAD_max_overhead(aead)) {
            return OhttpErrorCode::ERR_NO_AEAD_NONCE;
        }
        std::vector<uint8_t> secret;
        OhttpErrorCode code = export_response_secret(context.hpke_ctx_.get(), aead, &secret);
        if (code != OhttpErrorCode::SUCCESS) {
            return code;
        }
        std::vector<uint8_t> aead_key;
        std::vector<uint8_t> aead_nonce;
        code = derive_response_keys(aead, secret, context.enc_, enc_response.data(), nonce_len,
                                    &aead_key, &aead_nonce);
        OPENSSL_cleanse(secret.data(), secret.size());
        if (code != OhttpErrorCode::SUCCESS) {
            return code;
        }

        bssl::ScopedEVP_AEAD_CTX aead_ctx;
        int rv = EVP_AEAD_CTX_init(aead_ctx.get(), aead, aead_key.data(), aead_key.size(),
                                   EVP_AEAD_DEFAULT_TAG_LENGTH, nullptr);
        OPENSSL_cleanse(aead_key.data(), aead_key.size());
        if (rv != 1) {
            return OhttpErrorCode::ERR_NO_AEAD_KEY;
        }
        std::vector<uint8_t> pt(enc_response.size() - nonce_len);
        size_t pt_len;
        rv = EVP_AEAD_CTX_open(
            /* *ctx */ aead_ctx.get(),
            /* *out */ pt.data(),
            /* *out_len */ &pt_len,
            /*  max_out_len */ pt.size(),
            /* *nonce */ aead_nonce.data(),
            /*  nonce_len */ aead_nonce.size(),
            /* *in */ enc_response.data() + nonce_len,
            /*  in_len */ enc_response.size() - nonce_len,
            /* *ad */ nullptr,
            /*  ad_len */ 0);
        if (rv != 1) {
            return OhttpErrorCode::ERR_UNABLE_TO_OPEN_RESPONSE;
        }
        pt.resize(pt_len);
        *response = std::move(pt);
        return OhttpErrorCode::SUCCESS;
    }

}  // namespace ohttp
}  // namespace pjdir
