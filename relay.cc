#include "relay.h"

#include <memory>
#include <utility>

#include "logging.h"

namespace pjdir {

    namespace {

        // Sent for every decapsulation failure, whatever the cause, see
        // https://www.rfc-editor.org/rfc/rfc9458#section-5.3
        constexpr char kKeyRejectionBody[] =
            "{\"type\":\"https://iana.org/assignments/http-problem-types#ohttp-key\", "
            "\"title\": \"key identifier unknown\"}";

        constexpr char kV1UnavailableBody[] =
            "{\"errorCode\": \"unavailable\", "
            "\"message\": \"V2 receiver offline. V1 sends require synchronous communications.\"}";

        constexpr char kV1NotUtf8Body[] =
            "{\"errorCode\": \"original-psbt-rejected \", \"message\": \"Body is not a string\"}";

        std::vector<uint8_t> bytes(const std::string& s) {
            return std::vector<uint8_t>(s.begin(), s.end());
        }

        HttpResponse make_http_response(unsigned status, std::string content_type = "",
                                        std::vector<uint8_t> body = {}) {
            HttpResponse response;
            response.status = status;
            response.content_type = std::move(content_type);
            response.body = std::move(body);
            return response;
        }

        void split_target(const std::string& target, std::string* path, std::string* query) {
            size_t mark = target.find('?');
            if (mark == std::string::npos) {
                *path = target;
                query->clear();
            } else {
                *path = target.substr(0, mark);
                *query = target.substr(mark + 1);
            }
        }

        // "/<segment>" with no further slashes; empty otherwise.
        std::string single_segment(const std::string& path) {
            if (path.size() < 2 || path[0] != '/' || path.find('/', 1) != std::string::npos) {
                return "";
            }
            return path.substr(1);
        }

    }  // namespace

    bool is_valid_session_id(const std::string& id, size_t max_length) {
        if (id.empty() || id.size() > max_length) {
            return false;
        }
        for (char c : id) {
            bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                      c == '_';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
        size_t i = 0;
        while (i < bytes.size()) {
            uint8_t lead = bytes[i];
            size_t length;
            uint32_t min;
            uint32_t code_point;
            if (lead < 0x80) {
                i++;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                length = 2;
                min = 0x80;
                code_point = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                min = 0x800;
                code_point = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                min = 0x10000;
                code_point = lead & 0x07;
            } else {
                return false;
            }
            if (bytes.size() - i < length) {
                return false;
            }
            for (size_t j = 1; j < length; j++) {
                if ((bytes[i + j] & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (bytes[i + j] & 0x3F);
            }
            // Overlong forms, surrogates and values past U+10FFFF.
            if (code_point < min || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            i += length;
        }
        return true;
    }

    Relay::Relay(const KeyEpochManager& keys, MailboxStore& mailbox, RelayOptions options)
        : keys_(keys), mailbox_(mailbox), options_(options), gateway_(keys, options.max_message_size()) {}

    std::chrono::steady_clock::time_point Relay::deadline() const {
        return std::chrono::steady_clock::now() + options_.long_poll_timeout;
    }

    WaitHandle Relay::handle(const HttpRequest& request, ResponseHandler handler) {
        WaitHandle wait;
        std::string path;
        std::string query;
        split_target(request.target, &path, &query);
        PJDIR_LOG_DEBUG(request.method << " " << path << " (" << request.body.size() << " bytes)");

        if (request.method == "GET" && path == "/health") {
            handler(make_http_response(200));
        } else if (request.method == "GET" && path == "/ohttp-keys") {
            serve_keys(handler);
        } else if (request.method == "POST" && path == "/") {
            serve_gateway(request, std::move(handler), wait);
        } else if (request.method == "POST" && !single_segment(path).empty()) {
            serve_v1(single_segment(path), query, request, std::move(handler), wait);
        } else {
            handler(make_http_response(404));
        }
        return wait;
    }

    void Relay::serve_keys(const ResponseHandler& handler) const {
        std::vector<uint8_t> advertised;
        KeyErrorCode code = keys_.advertise_bytes(&advertised);
        if (code != KeyErrorCode::SUCCESS) {
            PJDIR_LOG_ERROR("Unable to advertise OHTTP keys: " << KeyErrorCodeToString(code));
            handler(make_http_response(500));
            return;
        }
        handler(make_http_response(200, kOhttpKeysContentType, std::move(advertised)));
    }

    void Relay::serve_gateway(const HttpRequest& request, ResponseHandler handler, WaitHandle wait) {
        // Refuse before any cryptographic work.
        if (request.body.size() > options_.max_message_size()) {
            PJDIR_LOG_INFO("Refused OHTTP request of " << request.body.size() << " bytes");
            handler(make_http_response(413));
            return;
        }

        std::vector<uint8_t> plaintext;
        auto context = std::make_shared<ohttp::ResponseContext>();
        if (gateway_.decapsulate(request.body, &plaintext, context.get()) != ohttp::OhttpErrorCode::SUCCESS) {
            handler(make_http_response(400, "application/problem+json", bytes(kKeyRejectionBody)));
            return;
        }

        // From here on every outcome, failures included, goes back sealed.
        InnerHandler respond = [this, context, handler](bhttp::Response inner) {
            std::vector<uint8_t> plain_response;
            bhttp::BhttpErrorCode encoded = bhttp::encode_response(inner, &plain_response);
            if (encoded != bhttp::BhttpErrorCode::SUCCESS) {
                PJDIR_LOG_ERROR("Unable to encode inner response: " << bhttp::BhttpErrorCodeToString(encoded));
                handler(make_http_response(500));
                return;
            }
            std::vector<uint8_t> enc_response;
            ohttp::OhttpErrorCode code = gateway_.encapsulate(*context, plain_response, &enc_response);
            if (code != ohttp::OhttpErrorCode::SUCCESS) {
                handler(make_http_response(500));
                return;
            }
            handler(make_http_response(200, kOhttpResponseContentType, std::move(enc_response)));
        };

        bhttp::Request inner;
        bhttp::BhttpErrorCode decoded = bhttp::decode_request(plaintext, options_.max_message_size(), &inner);
        if (decoded != bhttp::BhttpErrorCode::SUCCESS) {
            PJDIR_LOG_INFO("Rejected inner request: " << bhttp::BhttpErrorCodeToString(decoded));
            respond(bhttp::make_response(decoded == bhttp::BhttpErrorCode::ERR_OVERSIZE ? 413 : 400));
            return;
        }
        route_inner(inner, std::move(respond), wait);
    }

    void Relay::route_inner(const bhttp::Request& request, InnerHandler respond, WaitHandle wait) {
        std::string path;
        std::string query;
        split_target(request.path, &path, &query);

        if (request.method == "GET" && path == "/ohttp-keys") {
            std::vector<uint8_t> advertised;
            if (keys_.advertise_bytes(&advertised) != KeyErrorCode::SUCCESS) {
                respond(bhttp::make_response(500));
                return;
            }
            bhttp::Response response = bhttp::make_response(200, std::move(advertised));
            response.headers.push_back({"content-type", kOhttpKeysContentType});
            respond(std::move(response));
            return;
        }

        std::string session_id = single_segment(path);
        bool mailbox_method = request.method == "POST" || request.method == "PUT" || request.method == "GET";
        if (session_id.empty() || !mailbox_method) {
            respond(bhttp::make_response(404));
            return;
        }
        if (!is_valid_session_id(session_id, options_.max_session_id_length)) {
            PJDIR_LOG_INFO("Rejected malformed session id");
            respond(bhttp::make_response(400));
            return;
        }

        if (request.method == "GET") {
            poll_request(session_id, std::move(respond), wait);
            return;
        }
        if (request.content.size() > options_.max_payload_size) {
            PJDIR_LOG_INFO("Rejected payload of " << request.content.size() << " bytes");
            respond(bhttp::make_response(413));
            return;
        }
        if (request.method == "POST") {
            post_request(session_id, request.content, std::move(respond), wait);
        } else {
            put_response(session_id, request.content, std::move(respond));
        }
    }

    void Relay::post_request(const std::string& session_id, std::vector<uint8_t> payload, InnerHandler respond,
                             WaitHandle wait) {
        mailbox_.async_put(session_id, Direction::kRequest, std::move(payload),
                           [this, session_id, respond, wait](MailboxErrorCode code) {
            if (code != MailboxErrorCode::SUCCESS) {
                respond(bhttp::make_response(503));
                return;
            }
            mailbox_.async_wait_for(session_id, Direction::kResponse, deadline(),
                                    [respond](MailboxErrorCode code, std::vector<uint8_t> payload) {
                switch (code) {
                    case MailboxErrorCode::SUCCESS:
                        respond(bhttp::make_response(200, std::move(payload)));
                        break;
                    case MailboxErrorCode::ERR_TIMED_OUT:
                        respond(bhttp::make_response(202));
                        break;
                    case MailboxErrorCode::ERR_CANCELLED:
                        PJDIR_LOG_DEBUG("Client left while waiting for a response");
                        break;
                    default:
                        respond(bhttp::make_response(503));
                        break;
                }
            }, wait);
        });
    }

    void Relay::put_response(const std::string& session_id, std::vector<uint8_t> payload, InnerHandler respond) {
        mailbox_.async_put(session_id, Direction::kResponse, std::move(payload), [respond](MailboxErrorCode code) {
            respond(bhttp::make_response(code == MailboxErrorCode::SUCCESS ? 200 : 503));
        });
    }

    void Relay::poll_request(const std::string& session_id, InnerHandler respond, WaitHandle wait) {
        mailbox_.async_wait_for(session_id, Direction::kRequest, deadline(),
                                [respond](MailboxErrorCode code, std::vector<uint8_t> payload) {
            switch (code) {
                case MailboxErrorCode::SUCCESS:
                    respond(bhttp::make_response(200, std::move(payload)));
                    break;
                case MailboxErrorCode::ERR_TIMED_OUT:
                    respond(bhttp::make_response(202));
                    break;
                case MailboxErrorCode::ERR_CANCELLED:
                    PJDIR_LOG_DEBUG("Client left while waiting for a request");
                    break;
                default:
                    respond(bhttp::make_response(503));
                    break;
            }
        }, wait);
    }

    void Relay::serve_v1(const std::string& session_id, const std::string& query, const HttpRequest& request,
                         ResponseHandler handler, WaitHandle wait) {
        if (!is_valid_session_id(session_id, options_.max_session_id_length)) {
            handler(make_http_response(400));
            return;
        }
        if (request.body.size() > options_.max_payload_size) {
            handler(make_http_response(413));
            return;
        }
        if (!is_valid_utf8(request.body)) {
            handler(make_http_response(400, "application/json", bytes(kV1NotUtf8Body)));
            return;
        }

        // The receiver finds the sender's parameters after the first newline.
        std::vector<uint8_t> payload = request.body;
        payload.push_back('\n');
        payload.insert(payload.end(), query.begin(), query.end());

        mailbox_.async_put(session_id, Direction::kRequest, std::move(payload),
                           [this, session_id, handler, wait](MailboxErrorCode code) {
            if (code != MailboxErrorCode::SUCCESS) {
                handler(make_http_response(503));
                return;
            }
            mailbox_.async_wait_for(session_id, Direction::kResponse, deadline(),
                                    [handler](MailboxErrorCode code, std::vector<uint8_t> payload) {
                switch (code) {
                    case MailboxErrorCode::SUCCESS:
                        handler(make_http_response(200, "text/plain", std::move(payload)));
                        break;
                    case MailboxErrorCode::ERR_TIMED_OUT:
                        handler(make_http_response(503, "application/json", bytes(kV1UnavailableBody)));
                        break;
                    case MailboxErrorCode::ERR_CANCELLED:
                        PJDIR_LOG_DEBUG("v1 sender left while waiting");
                        break;
                    default:
                        handler(make_http_response(503));
                        break;
                }
            }, wait);
        });
    }

}  // namespace pjdir
