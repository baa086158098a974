// Binary HTTP messages per https://www.rfc-editor.org/rfc/rfc9292

#ifndef PJDIR_BHTTP_H
#define PJDIR_BHTTP_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pjdir {
namespace bhttp {

    struct Field {
        std::string name;
        std::string value;
    };

    inline bool operator==(const Field& a, const Field& b) {
        return a.name == b.name && a.value == b.value;
    }

    // Order-preserving; duplicate names are allowed.
    using Fields = std::vector<Field>;

    struct Request {
        std::string method;
        std::string scheme;
        std::string authority;
        std::string path;
        Fields headers;
        std::vector<uint8_t> content;
        Fields trailers;
    };

    struct InformationalResponse {
        uint64_t status = 100;
        Fields headers;
    };

    struct Response {
        std::vector<InformationalResponse> informational;
        uint64_t status = 200;
        Fields headers;
        std::vector<uint8_t> content;
        Fields trailers;
    };

    bool operator==(const Request& a, const Request& b);
    bool operator==(const InformationalResponse& a, const InformationalResponse& b);
    bool operator==(const Response& a, const Response& b);

    enum class BhttpErrorCode {
        SUCCESS = 0,
        ERR_TRUNCATED,
        ERR_BAD_FRAMING,
        ERR_BAD_FIELD_SECTION,
        ERR_BAD_STATUS,
        ERR_NONZERO_PADDING,
        ERR_OVERSIZE
    };
    inline std::string BhttpErrorCodeToString(BhttpErrorCode code) {
        switch (code) {
            case BhttpErrorCode::SUCCESS: return "SUCCESS";
            case BhttpErrorCode::ERR_TRUNCATED: return "ERR_TRUNCATED";
            case BhttpErrorCode::ERR_BAD_FRAMING: return "ERR_BAD_FRAMING";
            case BhttpErrorCode::ERR_BAD_FIELD_SECTION: return "ERR_BAD_FIELD_SECTION";
            case BhttpErrorCode::ERR_BAD_STATUS: return "ERR_BAD_STATUS";
            case BhttpErrorCode::ERR_NONZERO_PADDING: return "ERR_NONZERO_PADDING";
            case BhttpErrorCode::ERR_OVERSIZE: return "ERR_OVERSIZE";
            default: return "Unknown error code";
        }
    }

    // Every code except SUCCESS and ERR_OVERSIZE means the input is malformed.
    inline bool is_malformed(BhttpErrorCode code) {
        return code != BhttpErrorCode::SUCCESS && code != BhttpErrorCode::ERR_OVERSIZE;
    }

    // Known-length encodings. Deterministic: equal messages encode to equal bytes.
    // Messages the decoder would refuse are refused here too: an empty method
    // (ERR_BAD_FRAMING), an empty field name (ERR_BAD_FIELD_SECTION), a final
    // status outside 200..599 or an informational one outside 100..199
    // (ERR_BAD_STATUS). *encoded is untouched on failure.
    BhttpErrorCode encode_request(const Request& request, std::vector<uint8_t>* encoded);
    BhttpErrorCode encode_response(const Response& response, std::vector<uint8_t>* encoded);

    // Accept known-length and indeterminate-length framing. Inputs, and any
    // length claimed inside them, larger than max_message_size fail with
    // ERR_OVERSIZE before anything is allocated for them.
    BhttpErrorCode decode_request(const std::vector<uint8_t>& input, size_t max_message_size, Request* out);
    BhttpErrorCode decode_response(const std::vector<uint8_t>& input, size_t max_message_size, Response* out);

    // Convenience accessors.
    std::string find_header(const Fields& fields, const std::string& name);
    Response make_response(uint64_t status, std::vector<uint8_t> content = {});

}  // namespace bhttp
}  // namespace pjdir

#endif  // PJDIR_BHTTP_H
