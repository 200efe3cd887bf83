#include "transaction/tcache_transactional_store.hpp"
#include "tcache_logger.hpp"

namespace tcache {

TransactionalStore::TransactionalStore(IKeyValueStore& cache) : cache_(cache) {
}

TransactionalStore::~TransactionalStore() {
    // 从内到外回滚仍然打开的事务
    while (!levels_.empty()) {
        TCACHE_LOG_WARNING("销毁时仍有未结束的事务，回滚第 ", levels_.size(), " 层");
        rollback();
    }
}

void TransactionalStore::begin() {
    Level level;
    level.buffer = std::make_unique<BufferStore>();
    level.transaction = std::make_unique<Transaction>(*level.buffer, current());
    levels_.push_back(std::move(level));
    TCACHE_LOG_DEBUG("开启事务，当前嵌套层数: ", levels_.size());
}

bool TransactionalStore::commit() {
    if (levels_.empty()) {
        TCACHE_LOG_ERROR("COMMIT时没有打开的事务");
        return false;
    }

    bool success = levels_.back().transaction->commit();
    levels_.pop_back();
    TCACHE_LOG_DEBUG("事务", success ? "提交成功" : "提交失败", "，当前嵌套层数: ", levels_.size());
    return success;
}

bool TransactionalStore::rollback() {
    if (levels_.empty()) {
        TCACHE_LOG_ERROR("ROLLBACK时没有打开的事务");
        return false;
    }

    bool success = levels_.back().transaction->rollback();
    levels_.pop_back();
    TCACHE_LOG_DEBUG("事务已回滚，当前嵌套层数: ", levels_.size());
    return success;
}

IKeyValueStore& TransactionalStore::current() {
    if (levels_.empty()) {
        return cache_;
    }
    return *levels_.back().transaction;
}

bool TransactionalStore::get(const Key& key, Value& value, CasToken* token) {
    return current().get(key, value, token);
}

std::unordered_map<Key, Value> TransactionalStore::getMulti(const std::vector<Key>& keys,
                                                            std::unordered_map<Key, CasToken>* tokens) {
    return current().getMulti(keys, tokens);
}

bool TransactionalStore::set(const Key& key, const Value& value, int64_t expire) {
    return current().set(key, value, expire);
}

std::unordered_map<Key, bool> TransactionalStore::setMulti(const KeyValueList& items, int64_t expire) {
    return current().setMulti(items, expire);
}

bool TransactionalStore::del(const Key& key) {
    return current().del(key);
}

std::unordered_map<Key, bool> TransactionalStore::delMulti(const std::vector<Key>& keys) {
    return current().delMulti(keys);
}

bool TransactionalStore::add(const Key& key, const Value& value, int64_t expire) {
    return current().add(key, value, expire);
}

bool TransactionalStore::replace(const Key& key, const Value& value, int64_t expire) {
    return current().replace(key, value, expire);
}

bool TransactionalStore::cas(const CasToken& token, const Key& key, const Value& value, int64_t expire) {
    return current().cas(token, key, value, expire);
}

bool TransactionalStore::increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    return current().increment(key, offset, initial, expire, result);
}

bool TransactionalStore::decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    return current().decrement(key, offset, initial, expire, result);
}

bool TransactionalStore::touch(const Key& key, int64_t expire) {
    return current().touch(key, expire);
}

bool TransactionalStore::flush() {
    return current().flush();
}

} // namespace tcache
