// Which OHTTP keys are advertised and which are still accepted.

#ifndef PJDIR_KEY_EPOCHS_H
#define PJDIR_KEY_EPOCHS_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ohttp.h"

namespace pjdir {

    enum class KeyErrorCode {
        SUCCESS = 0,
        ERR_NO_CURRENT_KEY,
        ERR_UNKNOWN_KEY,
        ERR_DUPLICATE_KEY_ID,
        ERR_NULL_KEY
    };
    inline std::string KeyErrorCodeToString(KeyErrorCode code) {
        switch (code) {
            case KeyErrorCode::SUCCESS: return "SUCCESS";
            case KeyErrorCode::ERR_NO_CURRENT_KEY: return "ERR_NO_CURRENT_KEY";
            case KeyErrorCode::ERR_UNKNOWN_KEY: return "ERR_UNKNOWN_KEY";
            case KeyErrorCode::ERR_DUPLICATE_KEY_ID: return "ERR_DUPLICATE_KEY_ID";
            case KeyErrorCode::ERR_NULL_KEY: return "ERR_NULL_KEY";
            default: return "Unknown error code";
        }
    }

    // Holds one current key and the keys it replaced. A replaced key keeps
    // decapsulating until its overlap window has passed.
    //
    // Readers take a snapshot of an immutable key set; rotate() publishes a
    // new set with a single pointer swap, so a reader never sees a partial
    // rotation. The manager has no timer of its own.
    class KeyEpochManager {
      public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit KeyEpochManager(Clock::duration overlap, bool advertise_previous = false,
                                 NowFn now = [] { return Clock::now(); });

        // Installs key as current; the old current key starts its overlap
        // window. Expired entries are dropped.
        KeyErrorCode rotate(std::shared_ptr<const ohttp::KeyPair> key);

        KeyErrorCode current(std::shared_ptr<const ohttp::KeyPair>* out) const;

        // application/ohttp-keys body: the current configuration, followed by
        // the still-valid previous ones when advertise_previous is set.
        KeyErrorCode advertise_bytes(std::vector<uint8_t>* out) const;

        // ERR_UNKNOWN_KEY when key_id is neither current nor within its
        // overlap window.
        KeyErrorCode resolve_for_decapsulation(uint8_t key_id, std::shared_ptr<const ohttp::KeyPair>* out) const;

        // Smallest identifier after the current one (wrapping at 256) that no
        // current or retained key uses.
        uint8_t next_key_id() const;

      private:
        struct Retired {
            std::shared_ptr<const ohttp::KeyPair> key;
            Clock::time_point expires_at;
        };

        struct KeySet {
            std::shared_ptr<const ohttp::KeyPair> current;
            std::vector<Retired> previous;
        };

        std::shared_ptr<const KeySet> snapshot() const;

        Clock::duration overlap_;
        bool advertise_previous_;
        NowFn now_;
        // Serializes writers only.
        std::mutex rotate_mutex_;
        std::shared_ptr<const KeySet> keys_;
    };

}  // namespace pjdir

#endif  // PJDIR_KEY_EPOCHS_H
