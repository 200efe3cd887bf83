#pragma once

#include "tcache_key_value_store.hpp"
#include <list>
#include <mutex>
#include <atomic>
#include <unordered_map>

namespace tcache {

// 内存数据项
struct MemoryItem {
    Value value;
    Timestamp expire_time;              // Timestamp::max() 表示永不过期
    uint64_t version;                   // 每次写入递增，作为CAS令牌
    std::list<Key>::iterator lru_pos;   // 在LRU链表中的位置

    bool isExpired(Timestamp now) const {
        return expire_time != Timestamp::max() && expire_time <= now;
    }
};

// 进程内键值存储。limit为0时不限制内存，否则超过limit字节后按LRU淘汰。
class MemoryStore : public IKeyValueStore {
public:
    explicit MemoryStore(size_t limit = 0);
    ~MemoryStore() override = default;

    // 禁止拷贝和移动
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    bool get(const Key& key, Value& value, CasToken* token = nullptr) override;
    std::unordered_map<Key, Value> getMulti(const std::vector<Key>& keys,
                                            std::unordered_map<Key, CasToken>* tokens = nullptr) override;
    bool set(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) override;
    std::unordered_map<Key, bool> setMulti(const KeyValueList& items, int64_t expire = EXPIRE_NEVER) override;
    bool del(const Key& key) override;
    std::unordered_map<Key, bool> delMulti(const std::vector<Key>& keys) override;
    bool add(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) override;
    bool replace(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) override;
    bool cas(const CasToken& token, const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) override;
    bool increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) override;
    bool decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) override;
    bool touch(const Key& key, int64_t expire) override;
    bool flush() override;

    // 统计信息
    size_t size() const;
    size_t getMemoryUsage() const;
    size_t getLimit() const { return limit_; }
    uint64_t getEvictedKeys() const { return evicted_keys_.load(); }
    std::vector<Key> keys() const;

    // 清理已过期的键
    void cleanupExpired();

protected:
    // 子类钩子，均在持有mutex_时调用
    virtual void onItemStored(const Key& /*key*/) {}
    virtual void onItemExpired(const Key& /*key*/) {}
    virtual void onFlushed() {}

    std::unique_lock<std::mutex> lock() const;

    // 以下方法要求调用方已持有锁
    MemoryItem* findLiveLocked(const Key& key);
    bool storeLocked(const Key& key, const Value& value, int64_t expire);
    bool eraseLocked(const Key& key);

private:
    bool doIncrement(const Key& key, int64_t delta, int64_t initial, int64_t expire, int64_t& result);
    size_t itemSize(const Key& key, const Value& value) const;
    void removeLocked(std::unordered_map<Key, MemoryItem>::iterator it);
    void evictLocked();

    mutable std::mutex mutex_;
    std::unordered_map<Key, MemoryItem> items_;
    std::list<Key> lru_; // 头部为最近访问

    const size_t limit_;
    size_t memory_usage_;
    uint64_t next_version_;
    std::atomic<uint64_t> evicted_keys_{0};
};

} // namespace tcache
