#include "key_epochs.h"

#include <atomic>

#include "logging.h"

namespace pjdir {

    KeyEpochManager::KeyEpochManager(Clock::duration overlap, bool advertise_previous, NowFn now)
        : overlap_(overlap),
          advertise_previous_(advertise_previous),
          now_(std::move(now)),
          keys_(std::make_shared<const KeySet>()) {}

    std::shared_ptr<const KeyEpochManager::KeySet> KeyEpochManager::snapshot() const {
        return std::atomic_load(&keys_);
    }

    KeyErrorCode KeyEpochManager::rotate(std::shared_ptr<const ohttp::KeyPair> key) {
        if (!key) {
            return KeyErrorCode::ERR_NULL_KEY;
        }
        std::lock_guard<std::mutex> lock(rotate_mutex_);
        std::shared_ptr<const KeySet> old = snapshot();
        Clock::time_point now = now_();

        auto next = std::make_shared<KeySet>();
        for (const Retired& retired : old->previous) {
            if (retired.expires_at > now) {
                next->previous.push_back(retired);
            }
        }
        if (old->current) {
            next->previous.push_back({old->current, now + overlap_});
        }
        for (const Retired& retired : next->previous) {
            if (retired.key->key_id() == key->key_id()) {
                return KeyErrorCode::ERR_DUPLICATE_KEY_ID;
            }
        }
        next->current = std::move(key);

        PJDIR_LOG_INFO("OHTTP key " << int(next->current->key_id()) << " is now current, "
                       << next->previous.size() << " previous key(s) retained");
        std::atomic_store(&keys_, std::shared_ptr<const KeySet>(std::move(next)));
        return KeyErrorCode::SUCCESS;
    }

    KeyErrorCode KeyEpochManager::current(std::shared_ptr<const ohttp::KeyPair>* out) const {
        std::shared_ptr<const KeySet> keys = snapshot();
        if (!keys->current) {
            return KeyErrorCode::ERR_NO_CURRENT_KEY;
        }
        *out = keys->current;
        return KeyErrorCode::SUCCESS;
    }

    KeyErrorCode KeyEpochManager::advertise_bytes(std::vector<uint8_t>* out) const {
        std::shared_ptr<const KeySet> keys = snapshot();
        if (!keys->current) {
            return KeyErrorCode::ERR_NO_CURRENT_KEY;
        }
        std::vector<ohttp::KeyConfig> configs = {keys->current->config()};
        if (advertise_previous_) {
            Clock::time_point now = now_();
            for (auto it = keys->previous.rbegin(); it != keys->previous.rend(); ++it) {
                if (it->expires_at > now) {
                    configs.push_back(it->key->config());
                }
            }
        }
        *out = ohttp::encode_key_config_list(configs);
        return KeyErrorCode::SUCCESS;
    }

    KeyErrorCode KeyEpochManager::resolve_for_decapsulation(uint8_t key_id,
                                                            std::shared_ptr<const ohttp::KeyPair>* out) const {
        std::shared_ptr<const KeySet> keys = snapshot();
        if (keys->current && keys->current->key_id() == key_id) {
            *out = keys->current;
            return KeyErrorCode::SUCCESS;
        }
        Clock::time_point now = now_();
        for (const Retired& retired : keys->previous) {
            if (retired.key->key_id() == key_id && retired.expires_at > now) {
                *out = retired.key;
                return KeyErrorCode::SUCCESS;
            }
        }
        return KeyErrorCode::ERR_UNKNOWN_KEY;
    }

    uint8_t KeyEpochManager::next_key_id() const {
        std::shared_ptr<const KeySet> keys = snapshot();
        if (!keys->current) {
            return 1;
        }
        Clock::time_point now = now_();
        uint8_t candidate = keys->current->key_id();
        for (int i = 0; i < 256; i++) {
            candidate = static_cast<uint8_t>(candidate + 1);
            bool in_use = candidate == keys->current->key_id();
            for (const Retired& retired : keys->previous) {
                if (retired.key->key_id() == candidate && retired.expires_at > now) {
                    in_use = true;
                }
            }
            if (!in_use) {
                return candidate;
            }
        }
        return static_cast<uint8_t>(keys->current->key_id() + 1);
    }

}  // namespace pjdir
