// Request routing for the directory: key advertisement, the OHTTP gateway
// endpoint and the unencrypted v1 fallback, independent of the transport.

#ifndef PJDIR_RELAY_H
#define PJDIR_RELAY_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "bhttp.h"
#include "gateway.h"
#include "key_epochs.h"
#include "mailbox.h"

namespace pjdir {

    constexpr char kOhttpKeysContentType[] = "application/ohttp-keys";
    constexpr char kOhttpRequestContentType[] = "message/ohttp-req";
    constexpr char kOhttpResponseContentType[] = "message/ohttp-res";

    // Room for BHTTP framing and headers plus the OHTTP header, enc and tag
    // on top of a payload of the maximum size.
    constexpr size_t kEnvelopeOverhead = 4096;

    struct HttpRequest {
        std::string method;
        std::string target;  // path and query
        std::string content_type;
        std::vector<uint8_t> body;
    };

    struct HttpResponse {
        unsigned status = 200;
        std::string content_type;
        std::vector<uint8_t> body;
    };

    using ResponseHandler = std::function<void(HttpResponse)>;

    struct RelayOptions {
        size_t max_payload_size = 65536;
        size_t max_session_id_length = 64;
        std::chrono::milliseconds long_poll_timeout = std::chrono::seconds(30);

        // Largest encapsulated request, and largest inner response.
        size_t max_message_size() const { return max_payload_size + kEnvelopeOverhead; }
    };

    // 1..max_length characters of [A-Za-z0-9_-].
    bool is_valid_session_id(const std::string& id, size_t max_length);

    bool is_valid_utf8(const std::vector<uint8_t>& bytes);

    class Relay {
      public:
        Relay(const KeyEpochManager& keys, MailboxStore& mailbox, RelayOptions options);

        // Serves one outer request. handler runs exactly once, possibly on
        // another thread, unless the returned handle is cancelled while a
        // long-poll is pending; then it never runs.
        WaitHandle handle(const HttpRequest& request, ResponseHandler handler);

        // Larger bodies get 413 from handle(); a transport may refuse them
        // earlier.
        size_t max_body_size() const { return options_.max_message_size(); }

      private:
        using InnerHandler = std::function<void(bhttp::Response)>;

        void serve_keys(const ResponseHandler& handler) const;
        void serve_gateway(const HttpRequest& request, ResponseHandler handler, WaitHandle wait);
        void serve_v1(const std::string& session_id, const std::string& query, const HttpRequest& request,
                      ResponseHandler handler, WaitHandle wait);

        void route_inner(const bhttp::Request& request, InnerHandler respond, WaitHandle wait);
        void post_request(const std::string& session_id, std::vector<uint8_t> payload, InnerHandler respond,
                          WaitHandle wait);
        void put_response(const std::string& session_id, std::vector<uint8_t> payload, InnerHandler respond);
        void poll_request(const std::string& session_id, InnerHandler respond, WaitHandle wait);

        std::chrono::steady_clock::time_point deadline() const;

        const KeyEpochManager& keys_;
        MailboxStore& mailbox_;
        RelayOptions options_;
        OhttpGateway gateway_;
    };

}  // namespace pjdir

#endif  // PJDIR_RELAY_H
