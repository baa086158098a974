#ifndef PJDIR_OHTTP_INTERNAL_H
#define PJDIR_OHTTP_INTERNAL_H

#include <vector>
#include <cstdint>

#include "ohttp.h"

namespace pjdir {
namespace ohttp {
    // Internal functions exposed for testing or internal use

    struct RequestHeader {
        uint8_t key_id;
        uint16_t kem_id;
        uint16_t kdf_id;
        uint16_t aead_id;
    };

    std::vector<uint8_t> encode_request_header(const RequestHeader& header);

    OhttpParseErrorCode parse_request_header(const std::vector<uint8_t>& enc_request, RequestHeader* out);

    // concat("message/bhttp request", 0x00, hdr)
    std::vector<uint8_t> build_request_info(const RequestHeader& header);
}  // namespace ohttp
}  // namespace pjdir

#endif  // PJDIR_OHTTP_INTERNAL_H
