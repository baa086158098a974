#include "gateway.h"

#include "logging.h"
#include "ohttp_internal.h"

namespace pjdir {

    DecapsulationFailure classify_decapsulation_error(ohttp::OhttpErrorCode code) {
        switch (code) {
            case ohttp::OhttpErrorCode::SUCCESS:
                return DecapsulationFailure::NONE;
            case ohttp::OhttpErrorCode::ERR_OVERSIZE:
                return DecapsulationFailure::OVERSIZE;
            case ohttp::OhttpErrorCode::ERR_UNKNOWN_KEY:
                return DecapsulationFailure::UNKNOWN_KEY;
            case ohttp::OhttpErrorCode::ERR_NO_ENCAPSULATED_HEADER:
            case ohttp::OhttpErrorCode::ERR_UNSUPPORTED_SUITE:
            case ohttp::OhttpErrorCode::ERR_NO_PUBLIC_KEY:
            case ohttp::OhttpErrorCode::ERR_NO_CIPHER_TEXT:
                return DecapsulationFailure::MALFORMED;
            default:
                return DecapsulationFailure::AUTHENTICATION;
        }
    }

    OhttpGateway::OhttpGateway(const KeyEpochManager& keys, size_t max_message_size)
        : keys_(keys), max_message_size_(max_message_size) {}

    ohttp::OhttpErrorCode OhttpGateway::decapsulate(const std::vector<uint8_t>& enc_request,
                                                    std::vector<uint8_t>* request,
                                                    ohttp::ResponseContext* context) const {
        ohttp::OhttpErrorCode code = ohttp::OhttpErrorCode::SUCCESS;
        ohttp::RequestHeader header;
        std::shared_ptr<const ohttp::KeyPair> key;

        // Size, then header, then key lookup: nothing cryptographic happens
        // until all three pass.
        if (enc_request.size() > max_message_size_) {
            code = ohttp::OhttpErrorCode::ERR_OVERSIZE;
        } else if (ohttp::parse_request_header(enc_request, &header) != ohttp::OhttpParseErrorCode::SUCCESS) {
            code = ohttp::OhttpErrorCode::ERR_NO_ENCAPSULATED_HEADER;
        } else if (keys_.resolve_for_decapsulation(header.key_id, &key) != KeyErrorCode::SUCCESS) {
            code = ohttp::OhttpErrorCode::ERR_UNKNOWN_KEY;
        } else {
            code = ohttp::decapsulate_request(*key, enc_request, request, context);
        }

        if (code != ohttp::OhttpErrorCode::SUCCESS) {
            PJDIR_LOG_INFO("Rejected OHTTP request: " << DecapsulationFailureToString(classify_decapsulation_error(code))
                           << " (" << ohttp::OhttpErrorCodeToString(code) << ")");
        }
        return code;
    }

    ohttp::OhttpErrorCode OhttpGateway::encapsulate(ohttp::ResponseContext& context,
                                                    const std::vector<uint8_t>& response,
                                                    std::vector<uint8_t>* enc_response) const {
        if (context.used()) {
            throw ohttp::ContextReuseError();
        }
        if (response.size() > max_message_size_) {
            PJDIR_LOG_ERROR("Inner response of " << response.size() << " bytes exceeds " << max_message_size_);
            return ohttp::OhttpErrorCode::ERR_OVERSIZE;
        }
        ohttp::OhttpErrorCode code = ohttp::encapsulate_response(context, response, enc_response);
        if (code != ohttp::OhttpErrorCode::SUCCESS) {
            PJDIR_LOG_ERROR("Unable to encapsulate response: " << ohttp::OhttpErrorCodeToString(code));
        }
        return code;
    }

}  // namespace pjdir
