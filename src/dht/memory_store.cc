#include "memory_store.hh"
#include "core/error.hh"
#include "core/logging.hh"

namespace mesh {

// ============================================================================
// MemoryStoreHub Implementation
// ============================================================================

MemoryStoreHub::MemoryStoreHub(const Clock& clock, timestamp_t propagation_delay)
    : clock_(clock)
    , propagation_delay_(propagation_delay) {}

void MemoryStoreHub::attach(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    replica(name);
}

LocalStorage& MemoryStoreHub::replica(const std::string& name) {
    auto& slot = replicas_[name];
    if (!slot) {
        slot = std::make_unique<LocalStorage>();
    }
    return *slot;
}

StoreResult MemoryStoreHub::publish(const std::string& origin, const DHTRecord& record) {
    timestamp_t now = clock_.now();

    std::lock_guard<std::mutex> lock(mutex_);
    deliver_due(now, false);

    StoreResult result = replica(origin).store(record, now);
    if (result != StoreResult::STORED) {
        return result;
    }

    for (const auto& [name, storage] : replicas_) {
        if (name == origin) {
            continue;
        }
        pending_.push_back(PendingWrite{name, record, now + propagation_delay_});
    }
    deliver_due(now, false);
    return result;
}

std::optional<SubkeyMap> MemoryStoreHub::read(const std::string& name, const std::string& key) {
    timestamp_t now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    deliver_due(now, false);
    return replica(name).get(key, now);
}

std::optional<StoredValue> MemoryStoreHub::read_subkey(const std::string& name,
                                                       const std::string& key,
                                                       const std::string& subkey) {
    timestamp_t now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    deliver_due(now, false);
    return replica(name).get_subkey(key, subkey, now);
}

void MemoryStoreHub::propagate() {
    timestamp_t now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    deliver_due(now, true);
}

void MemoryStoreHub::set_propagation_delay(timestamp_t delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    propagation_delay_ = delay;
}

std::size_t MemoryStoreHub::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void MemoryStoreHub::deliver_due(timestamp_t now, bool all) {
    auto it = pending_.begin();
    while (it != pending_.end()) {
        if (!all && it->visible_at > now) {
            ++it;
            continue;
        }
        StoreResult result = replica(it->target).store(it->record, now);
        if (result != StoreResult::STORED) {
            MESH_LOG_TRACE(log::dht) << "Replica " << it->target << " kept its value for "
                                     << it->record.key << "/" << it->record.subkey
                                     << " (" << store_result_string(result) << ")";
        }
        it = pending_.erase(it);
    }
}

// ============================================================================
// MemoryStore Implementation
// ============================================================================

MemoryStore::MemoryStore(std::shared_ptr<MemoryStoreHub> hub,
                         std::string name,
                         std::shared_ptr<RecordValidator> validator)
    : hub_(std::move(hub))
    , name_(std::move(name))
    , validator_(std::move(validator)) {
    hub_->attach(name_);
}

void MemoryStore::require_available() const {
    if (!hub_->available()) {
        throw StoreUnavailable("memory store " + name_ + " is unavailable");
    }
}

bool MemoryStore::put(const std::string& key,
                      const std::string& subkey,
                      const bytes_t& value,
                      timestamp_t expires_at) {
    require_available();

    DHTRecord record{key, subkey, value, expires_at, hub_->clock().now()};

    if (validator_) {
        record.value = validator_->sign_value(record);
        if (!validator_->validate(record, RequestType::PUT)) {
            MESH_LOG_DEBUG(log::dht) << name_ << ": rejected write to " << key << "/" << subkey;
            return false;
        }
    }

    StoreResult result = hub_->publish(name_, record);
    if (result != StoreResult::STORED) {
        MESH_LOG_DEBUG(log::dht) << name_ << ": write to " << key << "/" << subkey
                                 << " not stored (" << store_result_string(result) << ")";
        return false;
    }
    return true;
}

std::optional<StoredValue> MemoryStore::open(const std::string& key,
                                             const std::string& subkey,
                                             const StoredValue& stored) const {
    if (!validator_) {
        return stored;
    }

    DHTRecord record{key, subkey, stored.value, stored.expiration, stored.timestamp};
    if (!validator_->validate(record, RequestType::GET)) {
        MESH_LOG_DEBUG(log::dht) << name_ << ": dropped invalid value at " << key << "/" << subkey;
        return std::nullopt;
    }

    StoredValue opened = stored;
    opened.value = validator_->strip_value(record);
    return opened;
}

std::optional<SubkeyMap> MemoryStore::get(const std::string& key) {
    require_available();

    auto raw = hub_->read(name_, key);
    if (!raw) {
        return std::nullopt;
    }

    SubkeyMap result;
    for (const auto& [subkey, stored] : *raw) {
        if (auto opened = open(key, subkey, stored)) {
            result.emplace(subkey, std::move(*opened));
        }
    }

    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::optional<StoredValue> MemoryStore::get_subkey(const std::string& key,
                                                   const std::string& subkey) {
    require_available();

    auto raw = hub_->read_subkey(name_, key, subkey);
    if (!raw) {
        return std::nullopt;
    }
    return open(key, subkey, *raw);
}

}  // namespace mesh
