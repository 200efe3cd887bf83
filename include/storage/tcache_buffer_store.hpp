#pragma once

#include "tcache_memory_store.hpp"
#include <unordered_set>

namespace tcache {

// 缓冲区中键的状态
enum class BufferState {
    UNKNOWN = 0,     // 缓冲区对该键没有任何信息
    PRESENT = 1,     // 缓冲区持有有效值
    TOMBSTONED = 2   // 已在本事务中删除（或已过期），但尚未提交
};

// 事务本地缓冲区：不限内存、从不淘汰，并记录墓碑。
// 墓碑表示"已知不存在"，读取时不能再回退到后端缓存。
class BufferStore : public MemoryStore {
public:
    BufferStore();
    ~BufferStore() override = default;

    // 查询键在缓冲区中的状态
    BufferState state(const Key& key);
    bool isTombstoned(const Key& key);

    // 把键标记为已删除
    void tombstone(const Key& key);
    void tombstoneMulti(const std::vector<Key>& keys);

    // 删除会让缓冲区完全忘记该键（包括墓碑）
    bool del(const Key& key) override;
    std::unordered_map<Key, bool> delMulti(const std::vector<Key>& keys) override;

    size_t tombstoneCount() const;

protected:
    void onItemStored(const Key& key) override;
    void onItemExpired(const Key& key) override;
    void onFlushed() override;

private:
    std::unordered_set<Key> tombstones_; // 受MemoryStore的锁保护
};

} // namespace tcache
