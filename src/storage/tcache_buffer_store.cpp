#include "storage/tcache_buffer_store.hpp"

namespace tcache {

// 未提交的写入绝不能被淘汰，宁可耗尽内存
BufferStore::BufferStore() : MemoryStore(0) {
}

BufferState BufferStore::state(const Key& key) {
    auto guard = lock();
    if (findLiveLocked(key)) {
        return BufferState::PRESENT;
    }
    // 过期的数据项在findLiveLocked中被清理时已转为墓碑
    if (tombstones_.count(key) > 0) {
        return BufferState::TOMBSTONED;
    }
    return BufferState::UNKNOWN;
}

bool BufferStore::isTombstoned(const Key& key) {
    return state(key) == BufferState::TOMBSTONED;
}

void BufferStore::tombstone(const Key& key) {
    auto guard = lock();
    eraseLocked(key);
    tombstones_.insert(key);
}

void BufferStore::tombstoneMulti(const std::vector<Key>& keys) {
    auto guard = lock();
    for (const auto& key : keys) {
        eraseLocked(key);
        tombstones_.insert(key);
    }
}

bool BufferStore::del(const Key& key) {
    auto guard = lock();
    bool existed = eraseLocked(key);
    tombstones_.erase(key);
    return existed;
}

std::unordered_map<Key, bool> BufferStore::delMulti(const std::vector<Key>& keys) {
    auto guard = lock();
    std::unordered_map<Key, bool> result;
    for (const auto& key : keys) {
        result[key] = eraseLocked(key);
        tombstones_.erase(key);
    }
    return result;
}

size_t BufferStore::tombstoneCount() const {
    auto guard = lock();
    return tombstones_.size();
}

void BufferStore::onItemStored(const Key& key) {
    tombstones_.erase(key);
}

void BufferStore::onItemExpired(const Key& key) {
    tombstones_.insert(key);
}

void BufferStore::onFlushed() {
    tombstones_.clear();
}

} // namespace tcache
