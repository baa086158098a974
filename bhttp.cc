#include "bhttp.h"
#include "bhttp_internal.h"

#include <algorithm>
#include <cctype>

namespace pjdir {
namespace bhttp {

    namespace {

        constexpr uint64_t kKnownLengthRequest = 0;
        constexpr uint64_t kKnownLengthResponse = 1;
        constexpr uint64_t kIndeterminateLengthRequest = 2;
        constexpr uint64_t kIndeterminateLengthResponse = 3;

        void append_bytes(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
            append_varint(out, len);
            out.insert(out.end(), data, data + len);
        }

        void append_string(std::vector<uint8_t>& out, const std::string& str) {
            append_bytes(out, reinterpret_cast<const uint8_t*>(str.data()), str.size());
        }

        // Known-Length Field Section {
        //   Length (i),
        //   Field Line (..) ...,
        // }
        void append_field_section(std::vector<uint8_t>& out, const Fields& fields) {
            std::vector<uint8_t> lines;
            for (const Field& field : fields) {
                append_string(lines, field.name);
                append_string(lines, field.value);
            }
            append_bytes(out, lines.data(), lines.size());
        }

        // A zero-length name ends an indeterminate-length section, so no
        // field may have one.
        bool valid_fields(const Fields& fields) {
            return std::none_of(fields.begin(), fields.end(), [](const Field& f) { return f.name.empty(); });
        }

        bool is_informational(uint64_t status) { return status >= 100 && status < 200; }
        bool is_final(uint64_t status) { return status >= 200 && status <= 599; }

        // Cursor over one encoded message. Every length read from the wire is
        // checked against the configured maximum before it is used.
        class Reader {
          public:
            Reader(const std::vector<uint8_t>& input, size_t max_size)
                : input_(input), max_size_(max_size) {}

            bool at_end() const { return offset_ >= input_.size(); }
            size_t remaining() const { return input_.size() - offset_; }

            BhttpErrorCode varint(uint64_t* value) {
                size_t used = read_varint(input_, offset_, value);
                if (used == 0) {
                    return BhttpErrorCode::ERR_TRUNCATED;
                }
                offset_ += used;
                return BhttpErrorCode::SUCCESS;
            }

            BhttpErrorCode length(uint64_t* len) {
                BhttpErrorCode rv = varint(len);
                if (rv != BhttpErrorCode::SUCCESS) {
                    return rv;
                }
                if (*len > max_size_) {
                    return BhttpErrorCode::ERR_OVERSIZE;
                }
                if (*len > remaining()) {
                    return BhttpErrorCode::ERR_TRUNCATED;
                }
                return BhttpErrorCode::SUCCESS;
            }

            BhttpErrorCode bytes(std::vector<uint8_t>* out) {
                uint64_t len;
                BhttpErrorCode rv = length(&len);
                if (rv != BhttpErrorCode::SUCCESS) {
                    return rv;
                }
                out->insert(out->end(), input_.begin() + offset_, input_.begin() + offset_ + len);
                offset_ += len;
                return BhttpErrorCode::SUCCESS;
            }

            BhttpErrorCode string(std::string* out) {
                uint64_t len;
                BhttpErrorCode rv = length(&len);
                if (rv != BhttpErrorCode::SUCCESS) {
                    return rv;
                }
                out->assign(input_.begin() + offset_, input_.begin() + offset_ + len);
                offset_ += len;
                return BhttpErrorCode::SUCCESS;
            }

            // Known-length field section; field lines may not cross its end.
            BhttpErrorCode known_length_fields(Fields* out) {
                uint64_t len;
                BhttpErrorCode rv = length(&len);
                if (rv != BhttpErrorCode::SUCCESS) {
                    return rv;
                }
                std::vector<uint8_t> section(input_.begin() + offset_, input_.begin() + offset_ + len);
                offset_ += len;
                Reader lines(section, max_size_);
                while (!lines.at_end()) {
                    Field field;
                    if (lines.string(&field.name) != BhttpErrorCode::SUCCESS ||
                        lines.string(&field.value) != BhttpErrorCode::SUCCESS ||
                        field.name.empty()) {
                        return BhttpErrorCode::ERR_BAD_FIELD_SECTION;
                    }
                    out->push_back(std::move(field));
                }
                return BhttpErrorCode::SUCCESS;
            }

            // Indeterminate-length field section: lines up to a zero-length name.
            BhttpErrorCode indeterminate_length_fields(Fields* out) {
                while (true) {
                    Field field;
                    BhttpErrorCode rv = string(&field.name);
                    if (rv != BhttpErrorCode::SUCCESS) {
                        return rv;
                    }
                    if (field.name.empty()) {
                        return BhttpErrorCode::SUCCESS;
                    }
                    rv = string(&field.value);
                    if (rv != BhttpErrorCode::SUCCESS) {
                        return rv;
                    }
                    out->push_back(std::move(field));
                }
            }

            BhttpErrorCode fields(bool known_length, Fields* out) {
                return known_length ? known_length_fields(out) : indeterminate_length_fields(out);
            }

            // Indeterminate-length content: chunks up to a zero-length chunk.
            BhttpErrorCode content(bool known_length, std::vector<uint8_t>* out) {
                if (known_length) {
                    return bytes(out);
                }
                while (true) {
                    size_t before = out->size();
                    BhttpErrorCode rv = bytes(out);
                    if (rv != BhttpErrorCode::SUCCESS) {
                        return rv;
                    }
                    if (out->size() == before) {
                        return BhttpErrorCode::SUCCESS;
                    }
                    if (out->size() > max_size_) {
                        return BhttpErrorCode::ERR_OVERSIZE;
                    }
                }
            }

            // Padding (..): whatever follows the last section must be zeros.
            BhttpErrorCode padding() {
                bool all_zero = std::all_of(input_.begin() + offset_, input_.end(),
                                            [](uint8_t b) { return b == 0; });
                offset_ = input_.size();
                return all_zero ? BhttpErrorCode::SUCCESS : BhttpErrorCode::ERR_NONZERO_PADDING;
            }

          private:
            const std::vector<uint8_t>& input_;
            size_t max_size_;
            size_t offset_ = 0;
        };

        // The sections after the control data. A message may end early at any
        // section boundary; the missing sections are empty.
        BhttpErrorCode read_sections(Reader& reader, bool known_length, Fields* headers,
                                     std::vector<uint8_t>* content, Fields* trailers) {
            if (reader.at_end()) {
                return BhttpErrorCode::SUCCESS;
            }
            BhttpErrorCode rv = reader.fields(known_length, headers);
            if (rv != BhttpErrorCode::SUCCESS || reader.at_end()) {
                return rv;
            }
            rv = reader.content(known_length, content);
            if (rv != BhttpErrorCode::SUCCESS || reader.at_end()) {
                return rv;
            }
            rv = reader.fields(known_length, trailers);
            if (rv != BhttpErrorCode::SUCCESS) {
                return rv;
            }
            return reader.padding();
        }

    }  // namespace

    void append_varint(std::vector<uint8_t>& out, uint64_t value) {
        // The two most significant bits of the first byte carry log2 of the
        // encoded length.
        if (value < 0x40) {
            out.push_back(static_cast<uint8_t>(value));
        } else if (value < 0x4000) {
            out.push_back(static_cast<uint8_t>(0x40 | (value >> 8)));
            out.push_back(static_cast<uint8_t>(value & 0xFF));
        } else if (value < 0x40000000) {
            out.push_back(static_cast<uint8_t>(0x80 | (value >> 24)));
            for (int shift = 16; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        } else {
            value &= kMaxVarint;
            out.push_back(static_cast<uint8_t>(0xC0 | (value >> 56)));
            for (int shift = 48; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    size_t read_varint(const std::vector<uint8_t>& input, size_t offset, uint64_t* value) {
        if (offset >= input.size()) {
            return 0;
        }
        size_t len = size_t(1) << (input[offset] >> 6);
        if (input.size() - offset < len) {
            return 0;
        }
        uint64_t v = input[offset] & 0x3F;
        for (size_t i = 1; i < len; i++) {
            v = (v << 8) | input[offset + i];
        }
        *value = v;
        return len;
    }

    bool operator==(const Request& a, const Request& b) {
        return a.method == b.method && a.scheme == b.scheme && a.authority == b.authority &&
               a.path == b.path && a.headers == b.headers && a.content == b.content &&
               a.trailers == b.trailers;
    }

    bool operator==(const InformationalResponse& a, const InformationalResponse& b) {
        return a.status == b.status && a.headers == b.headers;
    }

    bool operator==(const Response& a, const Response& b) {
        return a.informational == b.informational && a.status == b.status &&
               a.headers == b.headers && a.content == b.content && a.trailers == b.trailers;
    }

    BhttpErrorCode encode_request(const Request& request, std::vector<uint8_t>* encoded) {
        if (request.method.empty()) {
            return BhttpErrorCode::ERR_BAD_FRAMING;
        }
        if (!valid_fields(request.headers) || !valid_fields(request.trailers)) {
            return BhttpErrorCode::ERR_BAD_FIELD_SECTION;
        }

        // Known-Length Request {
        //   Framing Indicator (i) = 0,
        //   Request Control Data (..),
        //   Known-Length Field Section (..),
        //   Known-Length Content (..),
        //   Known-Length Field Section (..),
        //   Padding (..),
        // }
        std::vector<uint8_t> out;
        append_varint(out, kKnownLengthRequest);

        // Request Control Data {
        //   Method Length (i), Method (..),
        //   Scheme Length (i), Scheme (..),
        //   Authority Length (i), Authority (..),
        //   Path Length (i), Path (..),
        // }
        append_string(out, request.method);
        append_string(out, request.scheme);
        append_string(out, request.authority);
        append_string(out, request.path);

        append_field_section(out, request.headers);
        append_bytes(out, request.content.data(), request.content.size());
        append_field_section(out, request.trailers);

        // No padding.
        *encoded = std::move(out);
        return BhttpErrorCode::SUCCESS;
    }

    BhttpErrorCode encode_response(const Response& response, std::vector<uint8_t>* encoded) {
        if (!is_final(response.status)) {
            return BhttpErrorCode::ERR_BAD_STATUS;
        }
        for (const InformationalResponse& info : response.informational) {
            if (!is_informational(info.status)) {
                return BhttpErrorCode::ERR_BAD_STATUS;
            }
            if (!valid_fields(info.headers)) {
                return BhttpErrorCode::ERR_BAD_FIELD_SECTION;
            }
        }
        if (!valid_fields(response.headers) || !valid_fields(response.trailers)) {
            return BhttpErrorCode::ERR_BAD_FIELD_SECTION;
        }

        // Known-Length Response {
        //   Framing Indicator (i) = 1,
        //   Known-Length Informational Response (..) ...,
        //   Final Response Control Data (..),
        //   Known-Length Field Section (..),
        //   Known-Length Content (..),
        //   Known-Length Field Section (..),
        //   Padding (..),
        // }
        std::vector<uint8_t> out;
        append_varint(out, kKnownLengthResponse);
        for (const InformationalResponse& info : response.informational) {
            append_varint(out, info.status);
            append_field_section(out, info.headers);
        }
        append_varint(out, response.status);
        append_field_section(out, response.headers);
        append_bytes(out, response.content.data(), response.content.size());
        append_field_section(out, response.trailers);
        *encoded = std::move(out);
        return BhttpErrorCode::SUCCESS;
    }

    BhttpErrorCode decode_request(const std::vector<uint8_t>& input, size_t max_message_size, Request* out) {
        if (input.size() > max_message_size) {
            return BhttpErrorCode::ERR_OVERSIZE;
        }
        Reader reader(input, max_message_size);
        uint64_t framing;
        BhttpErrorCode rv = reader.varint(&framing);
        if (rv != BhttpErrorCode::SUCCESS) {
            return rv;
        }
        if (framing != kKnownLengthRequest && framing != kIndeterminateLengthRequest) {
            return BhttpErrorCode::ERR_BAD_FRAMING;
        }
        Request request;
        if ((rv = reader.string(&request.method)) != BhttpErrorCode::SUCCESS ||
            (rv = reader.string(&request.scheme)) != BhttpErrorCode::SUCCESS ||
            (rv = reader.string(&request.authority)) != BhttpErrorCode::SUCCESS ||
            (rv = reader.string(&request.path)) != BhttpErrorCode::SUCCESS) {
            return rv;
        }
        if (request.method.empty()) {
            return BhttpErrorCode::ERR_BAD_FRAMING;
        }
        rv = read_sections(reader, framing == kKnownLengthRequest, &request.headers,
                           &request.content, &request.trailers);
        if (rv != BhttpErrorCode::SUCCESS) {
            return rv;
        }
        *out = std::move(request);
        return BhttpErrorCode::SUCCESS;
    }

    BhttpErrorCode decode_response(const std::vector<uint8_t>& input, size_t max_message_size, Response* out) {
        if (input.size() > max_message_size) {
            return BhttpErrorCode::ERR_OVERSIZE;
        }
        Reader reader(input, max_message_size);
        uint64_t framing;
        BhttpErrorCode rv = reader.varint(&framing);
        if (rv != BhttpErrorCode::SUCCESS) {
            return rv;
        }
        if (framing != kKnownLengthResponse && framing != kIndeterminateLengthResponse) {
            return BhttpErrorCode::ERR_BAD_FRAMING;
        }
        bool known_length = framing == kKnownLengthResponse;
        Response response;
        while (true) {
            uint64_t status;
            if ((rv = reader.varint(&status)) != BhttpErrorCode::SUCCESS) {
                return rv;
            }
            if (is_informational(status)) {
                InformationalResponse info;
                info.status = status;
                if ((rv = reader.fields(known_length, &info.headers)) != BhttpErrorCode::SUCCESS) {
                    return rv;
                }
                response.informational.push_back(std::move(info));
                continue;
            }
            if (!is_final(status)) {
                return BhttpErrorCode::ERR_BAD_STATUS;
            }
            response.status = status;
            break;
        }
        rv = read_sections(reader, known_length, &response.headers, &response.content, &response.trailers);
        if (rv != BhttpErrorCode::SUCCESS) {
            return rv;
        }
        *out = std::move(response);
        return BhttpErrorCode::SUCCESS;
    }

    std::string find_header(const Fields& fields, const std::string& name) {
        for (const Field& field : fields) {
            if (field.name.size() == name.size() &&
                std::equal(field.name.begin(), field.name.end(), name.begin(),
                           [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) ==
                                                       std::tolower(static_cast<unsigned char>(b)); })) {
                return field.value;
            }
        }
        return "";
    }

    Response make_response(uint64_t status, std::vector<uint8_t> content) {
        Response response;
        response.status = status;
        response.content = std::move(content);
        return response;
    }

}  // namespace bhttp
}  // namespace pjdir
