#ifndef TCACHE_TRANSACTIONAL_STORE_HPP
#define TCACHE_TRANSACTIONAL_STORE_HPP

#include "../storage/tcache_key_value_store.hpp"
#include "../storage/tcache_buffer_store.hpp"
#include "tcache_transaction.hpp"
#include <memory>
#include <vector>

namespace tcache {

// 支持嵌套事务的键值存储。
// begin()在当前最内层（后端缓存或外层事务）之上开启新事务；
// 没有打开的事务时，所有操作直接作用于后端缓存。
class TransactionalStore : public IKeyValueStore {
public:
    explicit TransactionalStore(IKeyValueStore& cache);
    ~TransactionalStore() override;

    // 禁止拷贝和移动
    TransactionalStore(const TransactionalStore&) = delete;
    TransactionalStore& operator=(const TransactionalStore&) = delete;

    // 事务控制
    void begin();
    bool commit();
    bool rollback();
    size_t depth() const { return levels_.size(); }

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

private:
    // 每层事务拥有自己的缓冲区
    struct Level {
        std::unique_ptr<BufferStore> buffer;
        std::unique_ptr<Transaction> transaction;
    };

    IKeyValueStore& current();

    IKeyValueStore& cache_;
    std::vector<Level> levels_;
};

} // namespace tcache

#endif // TCACHE_TRANSACTIONAL_STORE_HPP
