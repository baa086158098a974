// Decapsulates inbound OHTTP requests against the key epochs and seals the
// matching responses.

#ifndef PJDIR_GATEWAY_H
#define PJDIR_GATEWAY_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "key_epochs.h"
#include "ohttp.h"

namespace pjdir {

    // Why a request was rejected. Only ever logged; every kind produces the
    // same response on the wire.
    enum class DecapsulationFailure {
        NONE = 0,
        MALFORMED,
        UNKNOWN_KEY,
        AUTHENTICATION,
        OVERSIZE
    };
    inline std::string DecapsulationFailureToString(DecapsulationFailure failure) {
        switch (failure) {
            case DecapsulationFailure::NONE: return "NONE";
            case DecapsulationFailure::MALFORMED: return "MALFORMED";
            case DecapsulationFailure::UNKNOWN_KEY: return "UNKNOWN_KEY";
            case DecapsulationFailure::AUTHENTICATION: return "AUTHENTICATION";
            case DecapsulationFailure::OVERSIZE: return "OVERSIZE";
            default: return "Unknown failure";
        }
    }

    DecapsulationFailure classify_decapsulation_error(ohttp::OhttpErrorCode code);

    class OhttpGateway {
      public:
        // max_message_size bounds the encapsulated request and the plaintext
        // response alike.
        OhttpGateway(const KeyEpochManager& keys, size_t max_message_size);

        // Parses the header, resolves its key_id and opens the request. On
        // success context holds the state for exactly one response.
        ohttp::OhttpErrorCode decapsulate(const std::vector<uint8_t>& enc_request, std::vector<uint8_t>* request,
                                          ohttp::ResponseContext* context) const;

        // Throws ohttp::ContextReuseError if context was already used.
        ohttp::OhttpErrorCode encapsulate(ohttp::ResponseContext& context, const std::vector<uint8_t>& response,
                                          std::vector<uint8_t>* enc_response) const;

        size_t max_message_size() const { return max_message_size_; }

      private:
        const KeyEpochManager& keys_;
        size_t max_message_size_;
    };

}  // namespace pjdir

#endif  // PJDIR_GATEWAY_H
