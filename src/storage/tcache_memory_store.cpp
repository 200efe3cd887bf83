#include "storage/tcache_memory_store.hpp"
#include "tcache_logger.hpp"

namespace tcache {

MemoryStore::MemoryStore(size_t limit)
    : limit_(limit), memory_usage_(0), next_version_(1) {
}

std::unique_lock<std::mutex> MemoryStore::lock() const {
    return std::unique_lock<std::mutex>(mutex_);
}

bool MemoryStore::get(const Key& key, Value& value, CasToken* token) {
    auto guard = lock();
    MemoryItem* item = findLiveLocked(key);
    if (!item) {
        return false;
    }
    value = item->value;
    if (token) {
        *token = Utils::intToString(static_cast<int64_t>(item->version));
    }
    return true;
}

std::unordered_map<Key, Value> MemoryStore::getMulti(const std::vector<Key>& keys,
                                                     std::unordered_map<Key, CasToken>* tokens) {
    auto guard = lock();
    std::unordered_map<Key, Value> result;
    for (const auto& key : keys) {
        MemoryItem* item = findLiveLocked(key);
        if (!item) {
            continue;
        }
        result[key] = item->value;
        if (tokens) {
            (*tokens)[key] = Utils::intToString(static_cast<int64_t>(item->version));
        }
    }
    return result;
}

bool MemoryStore::set(const Key& key, const Value& value, int64_t expire) {
    auto guard = lock();
    return storeLocked(key, value, expire);
}

std::unordered_map<Key, bool> MemoryStore::setMulti(const KeyValueList& items, int64_t expire) {
    auto guard = lock();
    std::unordered_map<Key, bool> result;
    for (const auto& pair : items) {
        result[pair.first] = storeLocked(pair.first, pair.second, expire);
    }
    return result;
}

bool MemoryStore::del(const Key& key) {
    auto guard = lock();
    return eraseLocked(key);
}

std::unordered_map<Key, bool> MemoryStore::delMulti(const std::vector<Key>& keys) {
    auto guard = lock();
    std::unordered_map<Key, bool> result;
    for (const auto& key : keys) {
        result[key] = eraseLocked(key);
    }
    return result;
}

bool MemoryStore::add(const Key& key, const Value& value, int64_t expire) {
    auto guard = lock();
    if (findLiveLocked(key)) {
        return false;
    }
    return storeLocked(key, value, expire);
}

bool MemoryStore::replace(const Key& key, const Value& value, int64_t expire) {
    auto guard = lock();
    if (!findLiveLocked(key)) {
        return false;
    }
    return storeLocked(key, value, expire);
}

bool MemoryStore::cas(const CasToken& token, const Key& key, const Value& value, int64_t expire) {
    auto guard = lock();
    MemoryItem* item = findLiveLocked(key);
    if (!item) {
        return false;
    }
    if (Utils::intToString(static_cast<int64_t>(item->version)) != token) {
        TCACHE_LOG_DEBUG("CAS令牌不匹配，键: ", key);
        return false;
    }
    return storeLocked(key, value, expire);
}

bool MemoryStore::increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }
    return doIncrement(key, offset, initial, expire, result);
}

bool MemoryStore::decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }
    return doIncrement(key, -offset, initial, expire, result);
}

bool MemoryStore::doIncrement(const Key& key, int64_t delta, int64_t initial, int64_t expire, int64_t& result) {
    auto guard = lock();
    MemoryItem* item = findLiveLocked(key);
    if (!item) {
        // 键不存在，写入初始值
        if (!storeLocked(key, Utils::intToString(initial), expire)) {
            return false;
        }
        result = initial;
        return true;
    }

    // 非数值或负数不能自增
    if (!Utils::isInteger(item->value)) {
        return false;
    }
    int64_t current = Utils::stringToInt(item->value);
    if (current < 0) {
        return false;
    }

    int64_t next;
    if (!Utils::applyDelta(current, delta, next)) {
        TCACHE_LOG_DEBUG("计数器溢出: ", key);
        return false;
    }
    if (!storeLocked(key, Utils::intToString(next), expire)) {
        return false;
    }
    result = next;
    return true;
}

bool MemoryStore::touch(const Key& key, int64_t expire) {
    auto guard = lock();
    MemoryItem* item = findLiveLocked(key);
    if (!item) {
        return false;
    }

    Timestamp expire_time = Utils::expireToTimestamp(expire);
    if (expire_time != Timestamp::max() && expire_time <= Utils::getCurrentTime()) {
        // 设置为已过期等同于删除
        eraseLocked(key);
        onItemExpired(key);
        return true;
    }
    item->expire_time = expire_time;
    return true;
}

bool MemoryStore::flush() {
    auto guard = lock();
    items_.clear();
    lru_.clear();
    memory_usage_ = 0;
    onFlushed();
    return true;
}

size_t MemoryStore::size() const {
    auto guard = lock();
    return items_.size();
}

size_t MemoryStore::getMemoryUsage() const {
    auto guard = lock();
    return memory_usage_;
}

std::vector<Key> MemoryStore::keys() const {
    auto guard = lock();
    auto now = Utils::getCurrentTime();
    std::vector<Key> result;
    result.reserve(items_.size());
    for (const auto& pair : items_) {
        if (!pair.second.isExpired(now)) {
            result.push_back(pair.first);
        }
    }
    return result;
}

void MemoryStore::cleanupExpired() {
    auto guard = lock();
    auto now = Utils::getCurrentTime();
    size_t removed = 0;

    auto it = items_.begin();
    while (it != items_.end()) {
        if (it->second.isExpired(now)) {
            Key key = it->first;
            memory_usage_ -= itemSize(key, it->second.value);
            lru_.erase(it->second.lru_pos);
            it = items_.erase(it);
            onItemExpired(key);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        TCACHE_LOG_DEBUG("清理过期键 ", removed, " 个");
    }
}

MemoryItem* MemoryStore::findLiveLocked(const Key& key) {
    auto it = items_.find(key);
    if (it == items_.end()) {
        return nullptr;
    }
    if (it->second.isExpired(Utils::getCurrentTime())) {
        removeLocked(it);
        onItemExpired(key);
        return nullptr;
    }
    // 更新LRU位置
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return &it->second;
}

bool MemoryStore::storeLocked(const Key& key, const Value& value, int64_t expire) {
    Timestamp expire_time = Utils::expireToTimestamp(expire);
    if (expire_time != Timestamp::max() && expire_time <= Utils::getCurrentTime()) {
        // 写入一个已过期的值等同于删除
        auto it = items_.find(key);
        if (it != items_.end()) {
            removeLocked(it);
        }
        onItemExpired(key);
        return true;
    }

    size_t size = itemSize(key, value);
    if (limit_ > 0 && size > limit_) {
        TCACHE_LOG_WARNING("数据项大小 ", size, " 超过内存上限 ", limit_, "，拒绝写入键: ", key);
        return false;
    }

    auto it = items_.find(key);
    if (it != items_.end()) {
        memory_usage_ -= itemSize(key, it->second.value);
        it->second.value = value;
        it->second.expire_time = expire_time;
        it->second.version = next_version_++;
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    } else {
        lru_.push_front(key);
        MemoryItem item{value, expire_time, next_version_++, lru_.begin()};
        items_.emplace(key, std::move(item));
    }
    memory_usage_ += size;

    onItemStored(key);
    evictLocked();
    return true;
}

bool MemoryStore::eraseLocked(const Key& key) {
    if (!findLiveLocked(key)) {
        return false;
    }
    removeLocked(items_.find(key));
    return true;
}

size_t MemoryStore::itemSize(const Key& key, const Value& value) const {
    return key.size() + value.size() + sizeof(MemoryItem);
}

void MemoryStore::removeLocked(std::unordered_map<Key, MemoryItem>::iterator it) {
    memory_usage_ -= itemSize(it->first, it->second.value);
    lru_.erase(it->second.lru_pos);
    items_.erase(it);
}

void MemoryStore::evictLocked() {
    if (limit_ == 0) {
        return;
    }

    // 淘汰最久未访问的键，最近写入的键位于链表头部，不会被淘汰
    size_t evicted_count = 0;
    while (memory_usage_ > limit_ && lru_.size() > 1) {
        Key victim = lru_.back();
        auto it = items_.find(victim);
        if (it == items_.end()) {
            lru_.pop_back();
            continue;
        }
        removeLocked(it);
        evicted_count++;
        TCACHE_LOG_DEBUG("淘汰键: ", victim);
    }

    if (evicted_count > 0) {
        evicted_keys_ += evicted_count;
    }
}

} // namespace tcache
