#include "local_storage.hh"
#include "core/logging.hh"

namespace mesh {

StoreResult LocalStorage::store(const DHTRecord& record, timestamp_t now) {
    if (record.value.size() > MAX_VALUE_SIZE) {
        return StoreResult::TOO_LARGE;
    }
    if (record.expiration_time <= now) {
        return StoreResult::EXPIRED;
    }

    StoredValue candidate{record.value, record.expiration_time, record.timestamp};

    std::lock_guard<std::mutex> lock(mutex_);
    auto& subkeys = data_[record.key];
    auto it = subkeys.find(record.subkey);

    if (it != subkeys.end() && it->second.value == candidate.value &&
        it->second.timestamp == candidate.timestamp &&
        it->second.expiration == candidate.expiration) {
        return StoreResult::STORED;  // Idempotent rewrite
    }

    if (it != subkeys.end() && !it->second.expired_at(now) && !supersedes(candidate, it->second)) {
        MESH_LOG_TRACE(log::dht) << "Stale write to " << record.key << "/" << record.subkey;
        return StoreResult::STALE;
    }

    subkeys[record.subkey] = std::move(candidate);
    return StoreResult::STORED;
}

std::optional<SubkeyMap> LocalStorage::get(const std::string& key, timestamp_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }

    SubkeyMap result;
    for (const auto& [subkey, value] : it->second) {
        if (!value.expired_at(now)) {
            result.emplace(subkey, value);
        }
    }

    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::optional<StoredValue> LocalStorage::get_subkey(const std::string& key,
                                                    const std::string& subkey,
                                                    timestamp_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    auto sit = it->second.find(subkey);
    if (sit == it->second.end() || sit->second.expired_at(now)) {
        return std::nullopt;
    }
    return sit->second;
}

std::size_t LocalStorage::remove_expired(timestamp_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto it = data_.begin(); it != data_.end();) {
        auto& subkeys = it->second;
        for (auto sit = subkeys.begin(); sit != subkeys.end();) {
            if (sit->second.expired_at(now)) {
                sit = subkeys.erase(sit);
                ++removed;
            } else {
                ++sit;
            }
        }
        if (subkeys.empty()) {
            it = data_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t LocalStorage::key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::size_t LocalStorage::value_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [key, subkeys] : data_) {
        count += subkeys.size();
    }
    return count;
}

}  // namespace mesh
