#ifndef PJDIR_BHTTP_INTERNAL_H
#define PJDIR_BHTTP_INTERNAL_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pjdir {
namespace bhttp {
    // Internal functions exposed for testing or internal use

    // QUIC variable-length integers, see https://www.rfc-editor.org/rfc/rfc9000#section-16
    constexpr uint64_t kMaxVarint = (uint64_t(1) << 62) - 1;

    void append_varint(std::vector<uint8_t>& out, uint64_t value);

    // Returns the number of bytes consumed, or 0 if input[offset..] holds no
    // complete varint.
    size_t read_varint(const std::vector<uint8_t>& input, size_t offset, uint64_t* value);
}  // namespace bhttp
}  // namespace pjdir

#endif  // PJDIR_BHTTP_INTERNAL_H
