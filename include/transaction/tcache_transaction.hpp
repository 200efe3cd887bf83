#ifndef TCACHE_TRANSACTION_HPP
#define TCACHE_TRANSACTION_HPP

#include "../storage/tcache_key_value_store.hpp"
#include "../storage/tcache_buffer_store.hpp"
#include "tcache_deferred_action.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

namespace tcache {

// 事务状态
enum class TransactionState {
    ACTIVE = 0,       // 可继续读写，延迟队列可能非空
    COMMITTING = 1,   // 正在向后端重放
    COMMITTED = 2,    // 提交成功，状态已清空
    ROLLED_BACK = 3   // 已回滚，状态已清空
};

// 缓冲写事务。
//
// 每次写操作先写入本地缓冲区（本事务内后续读取立即可见），再把对应的后端写操作
// 追加到延迟队列。commit()按追加顺序把延迟队列重放到后端缓存；任何一步失败都会
// 中止重放并回滚：删除本次提交中已写过的所有键，避免后端留下不一致的数据。
//
// 读取优先查本地缓冲区；缓冲区不知道该键、没有墓碑、也没有未提交的flush时才访问后端。
//
// 后端CAS令牌在延迟写之后不再可靠，所以get()返回的是事务内的令牌，绑定读取时的
// 值快照；真正的后端CAS在提交时重新读取后端并比对快照后才执行。
//
// 非线程安全，一个实例同一时间只能由一个调用方使用。结束时必须调用commit()或
// rollback()，带着未提交的延迟操作销毁会终止进程。
class Transaction : public IKeyValueStore {
public:
    Transaction(BufferStore& local, IKeyValueStore& cache);
    ~Transaction() override;

    // 禁止拷贝和移动
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

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

    // 按顺序把延迟操作重放到后端，失败则回滚并返回false
    bool commit();
    // 使本次提交中写过的键失效并清空事务状态，总是返回true
    bool rollback();

    TransactionState getState() const { return state_; }
    bool hasPendingWork() const { return !deferred_.empty(); }
    const std::vector<DeferredAction>& getDeferredActions() const { return deferred_; }
    size_t getTokenCount() const { return tokens_.size(); }
    bool isReadSuspended() const { return suspend_reads_; }

private:
    // 本事务视角下的读取，不签发令牌
    bool lookup(const Key& key, Value& value);
    CasToken issueToken(bool found, const Value& value);
    // 计算自增/自减后的新值，键不存在时为initial
    bool nextCounterValue(const Key& key, int64_t delta, int64_t initial, int64_t& next);
    static std::string snapshotOf(bool found, const Value& value);

    void defer(DeferredAction action);
    bool replay(const DeferredAction& action);
    bool replayCas(const DeferredAction& action);
    void markActive();
    void clear();

    BufferStore& local_;
    IKeyValueStore& cache_;

    std::vector<DeferredAction> deferred_;              // 延迟队列，顺序即提交顺序
    std::unordered_map<CasToken, std::string> tokens_;  // 事务令牌 -> 值快照
    std::unordered_set<Key> touched_;                   // 本次提交中已写到后端的键
    bool suspend_reads_;                                // flush未提交前禁止读后端
    TransactionState state_;

    const uint64_t instance_id_;
    uint64_t token_sequence_;  // 不随clear()重置，令牌永不重复

    static std::atomic<uint64_t> instance_counter_;
};

} // namespace tcache

#endif // TCACHE_TRANSACTION_HPP
