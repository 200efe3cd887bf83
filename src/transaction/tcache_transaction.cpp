#include "transaction/tcache_transaction.hpp"
#include "tcache_logger.hpp"
#include <algorithm>
#include <exception>

namespace tcache {

std::atomic<uint64_t> Transaction::instance_counter_{1};

Transaction::Transaction(BufferStore& local, IKeyValueStore& cache)
    : local_(local), cache_(cache), suspend_reads_(false), state_(TransactionState::ACTIVE),
      instance_id_(instance_counter_.fetch_add(1)), token_sequence_(0) {
}

Transaction::~Transaction() {
    if (!deferred_.empty()) {
        TCACHE_LOG_CRITICAL("事务 ", instance_id_, " 在未提交或回滚的情况下被销毁，丢弃了 ",
                            deferred_.size(), " 个延迟操作");
        std::terminate();
    }
}

bool Transaction::get(const Key& key, Value& value, CasToken* token) {
    markActive();
    bool found = lookup(key, value);
    CasToken issued = issueToken(found, value);
    if (token) {
        *token = issued;
    }
    return found;
}

std::unordered_map<Key, Value> Transaction::getMulti(const std::vector<Key>& keys,
                                                     std::unordered_map<Key, CasToken>* tokens) {
    markActive();

    // 先取本地缓冲区中能取到的
    std::unordered_map<Key, Value> values = local_.getMulti(keys);

    // 有未提交的flush时不读后端
    if (!suspend_reads_) {
        std::vector<Key> missing;
        for (const auto& key : keys) {
            if (values.count(key) > 0 || local_.isTombstoned(key)) {
                continue;
            }
            if (std::find(missing.begin(), missing.end(), key) == missing.end()) {
                missing.push_back(key);
            }
        }

        if (!missing.empty()) {
            auto fetched = cache_.getMulti(missing);
            values.insert(fetched.begin(), fetched.end());
        }
    }

    // 后端令牌不可靠，为每个结果签发事务令牌
    for (const auto& pair : values) {
        CasToken issued = issueToken(true, pair.second);
        if (tokens) {
            (*tokens)[pair.first] = issued;
        }
    }
    return values;
}

bool Transaction::set(const Key& key, const Value& value, int64_t expire) {
    markActive();
    if (!local_.set(key, value, expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::SET, {key});
    action.value = value;
    action.expire = expire;
    defer(std::move(action));
    return true;
}

std::unordered_map<Key, bool> Transaction::setMulti(const KeyValueList& items, int64_t expire) {
    markActive();
    std::unordered_map<Key, bool> success = local_.setMulti(items, expire);

    // 只延迟写入本地成功的键
    KeyValueList accepted;
    std::vector<Key> keys;
    for (const auto& pair : items) {
        if (success[pair.first]) {
            accepted.push_back(pair);
            keys.push_back(pair.first);
        }
    }

    if (!accepted.empty()) {
        DeferredAction action(DeferredOp::SET_MULTI, std::move(keys));
        action.items = std::move(accepted);
        action.expire = expire;
        defer(std::move(action));
    }
    return success;
}

bool Transaction::del(const Key& key) {
    // 先确认键在本事务视角下存在，返回值与后端del一致
    Value current;
    if (!get(key, current)) {
        return false;
    }

    // 用墓碑而不是直接移除，否则后续读取会回退到尚未删除的后端值
    local_.tombstone(key);
    defer(DeferredAction(DeferredOp::DELETE, {key}));
    return true;
}

std::unordered_map<Key, bool> Transaction::delMulti(const std::vector<Key>& keys) {
    std::unordered_map<Key, Value> existing = getMulti(keys);

    std::unordered_map<Key, bool> result;
    std::vector<Key> to_delete;
    for (const auto& key : keys) {
        bool exists = existing.count(key) > 0;
        result[key] = exists;
        if (exists && std::find(to_delete.begin(), to_delete.end(), key) == to_delete.end()) {
            to_delete.push_back(key);
        }
    }

    if (to_delete.empty()) {
        return result;
    }

    local_.tombstoneMulti(to_delete);
    defer(DeferredAction(DeferredOp::DELETE_MULTI, std::move(to_delete)));
    return result;
}

bool Transaction::add(const Key& key, const Value& value, int64_t expire) {
    // 后端和缓冲区中都不能已有值
    Value current;
    if (get(key, current)) {
        return false;
    }
    if (!local_.set(key, value, expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::ADD, {key});
    action.value = value;
    action.expire = expire;
    defer(std::move(action));
    return true;
}

bool Transaction::replace(const Key& key, const Value& value, int64_t expire) {
    Value current;
    if (!get(key, current)) {
        return false;
    }
    if (!local_.set(key, value, expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::REPLACE, {key});
    action.value = value;
    action.expire = expire;
    defer(std::move(action));
    return true;
}

bool Transaction::cas(const CasToken& token, const Key& key, const Value& value, int64_t expire) {
    markActive();
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        TCACHE_LOG_DEBUG("未知的CAS令牌: ", token);
        return false;
    }
    std::string original = it->second;

    // 令牌签发后，本事务视角下的值已经变化
    Value current;
    bool found = get(key, current);
    if (snapshotOf(found, current) != original) {
        return false;
    }

    // 本地"CAS"，真正的CAS在提交时执行
    if (!local_.set(key, value, expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::CAS, {key});
    action.value = value;
    action.expire = expire;
    action.snapshot = original;
    defer(std::move(action));
    return true;
}

bool Transaction::increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }

    // 本地可能还没有值，以后端当前值为准；都没有时结果就是initial
    int64_t next;
    if (!nextCounterValue(key, offset, initial, next)) {
        return false;
    }
    if (!local_.set(key, Utils::intToString(next), expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::INCREMENT, {key});
    action.offset = offset;
    action.initial = initial;
    action.expire = expire;
    defer(std::move(action));

    result = next;
    return true;
}

bool Transaction::decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }

    int64_t next;
    if (!nextCounterValue(key, -offset, initial, next)) {
        return false;
    }
    if (!local_.set(key, Utils::intToString(next), expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::DECREMENT, {key});
    action.offset = offset;
    action.initial = initial;
    action.expire = expire;
    defer(std::move(action));

    result = next;
    return true;
}

bool Transaction::touch(const Key& key, int64_t expire) {
    // 取出当前值，带新的过期时间重新写入缓冲区
    Value current;
    if (!get(key, current)) {
        return false;
    }
    if (!local_.set(key, current, expire)) {
        return false;
    }

    DeferredAction action(DeferredOp::TOUCH, {key});
    action.expire = expire;
    defer(std::move(action));
    return true;
}

bool Transaction::flush() {
    markActive();
    if (!local_.flush()) {
        return false;
    }

    // flush会清掉一切，之前的延迟写已无意义
    clear();

    // 在flush提交之前，不能再从后端读到即将被清空的值
    suspend_reads_ = true;

    defer(DeferredAction(DeferredOp::FLUSH, {}));
    return true;
}

bool Transaction::commit() {
    state_ = TransactionState::COMMITTING;
    touched_.clear();

    size_t total = deferred_.size();
    TCACHE_LOG_DEBUG("事务 ", instance_id_, " 开始提交，延迟操作数: ", total);

    for (size_t i = 0; i < total; ++i) {
        const DeferredAction& action = deferred_[i];

        // 先记录键再判断结果，失败的操作本身也可能已写了一部分
        touched_.insert(action.keys.begin(), action.keys.end());

        if (!replay(action)) {
            TCACHE_LOG_WARNING("事务 ", instance_id_, " 重放 ", deferredOpToString(action.op),
                               " 失败（第 ", i + 1, "/", total, " 个操作），开始回滚");
            rollback();
            return false;
        }
    }

    clear();
    if (!local_.flush()) {
        TCACHE_LOG_WARNING("事务 ", instance_id_, " 提交后清空本地缓冲区失败");
    }
    state_ = TransactionState::COMMITTED;
    TCACHE_LOG_DEBUG("事务 ", instance_id_, " 提交成功");
    return true;
}

bool Transaction::rollback() {
    // 删除本次提交中写过的键，它们的值可能已不一致
    if (!touched_.empty()) {
        std::vector<Key> keys(touched_.begin(), touched_.end());
        std::unordered_map<Key, bool> deleted = cache_.delMulti(keys);

        // 后端无法区分"键本来就不存在"和"删除失败"，这里只记录，不再向上报告
        size_t missing = 0;
        for (const auto& key : keys) {
            if (!deleted[key]) {
                missing++;
            }
        }
        TCACHE_LOG_INFO("事务 ", instance_id_, " 回滚，使 ", keys.size(), " 个键失效，其中 ",
                        missing, " 个键在后端不存在或删除失败");
    }

    clear();
    if (!local_.flush()) {
        TCACHE_LOG_WARNING("事务 ", instance_id_, " 回滚后清空本地缓冲区失败");
    }
    state_ = TransactionState::ROLLED_BACK;
    return true;
}

bool Transaction::lookup(const Key& key, Value& value) {
    if (local_.get(key, value)) {
        return true;
    }
    value.clear();

    // flush尚未提交，不能读后端
    if (suspend_reads_) {
        return false;
    }

    // 本事务中已删除的键，后端还保留着旧值
    if (local_.isTombstoned(key)) {
        return false;
    }

    // 缓冲区没有该键的信息，读后端
    if (!cache_.get(key, value)) {
        value.clear();
        return false;
    }
    return true;
}

bool Transaction::nextCounterValue(const Key& key, int64_t delta, int64_t initial, int64_t& next) {
    Value current;
    if (!get(key, current)) {
        next = initial;
        return true;
    }

    // 非数值或负数不能自增
    if (!Utils::isInteger(current)) {
        return false;
    }
    int64_t base = Utils::stringToInt(current);
    if (base < 0) {
        return false;
    }
    if (!Utils::applyDelta(base, delta, next)) {
        TCACHE_LOG_DEBUG("计数器溢出: ", key);
        return false;
    }
    return true;
}

CasToken Transaction::issueToken(bool found, const Value& value) {
    // 只需在本进程内唯一：实例号 + 单调递增序号
    CasToken token = "tx" + std::to_string(instance_id_) + "-" + std::to_string(++token_sequence_);
    tokens_[token] = snapshotOf(found, value);
    return token;
}

std::string Transaction::snapshotOf(bool found, const Value& value) {
    return found ? "1:" + value : "0:";
}

void Transaction::defer(DeferredAction action) {
    deferred_.push_back(std::move(action));
}

bool Transaction::replay(const DeferredAction& action) {
    switch (action.op) {
        case DeferredOp::SET:
            return cache_.set(action.keys[0], action.value, action.expire);

        case DeferredOp::SET_MULTI: {
            std::unordered_map<Key, bool> success = cache_.setMulti(action.items, action.expire);
            return std::all_of(action.keys.begin(), action.keys.end(), [&success](const Key& key) {
                auto it = success.find(key);
                return it != success.end() && it->second;
            });
        }

        case DeferredOp::DELETE:
            // 键是否存在已经在缓冲区判断过，后端删除不存在的键不算失败
            if (!cache_.del(action.keys[0])) {
                TCACHE_LOG_DEBUG("后端中键已不存在: ", action.keys[0]);
            }
            return true;

        case DeferredOp::DELETE_MULTI: {
            std::unordered_map<Key, bool> deleted = cache_.delMulti(action.keys);
            TCACHE_LOG_DEBUG("批量删除 ", action.keys.size(), " 个键，后端实际存在 ",
                             std::count_if(deleted.begin(), deleted.end(),
                                           [](const std::pair<const Key, bool>& p) { return p.second; }),
                             " 个");
            return true;
        }

        case DeferredOp::ADD:
            return cache_.add(action.keys[0], action.value, action.expire);

        case DeferredOp::REPLACE:
            return cache_.replace(action.keys[0], action.value, action.expire);

        case DeferredOp::CAS:
            return replayCas(action);

        case DeferredOp::INCREMENT: {
            int64_t result = 0;
            return cache_.increment(action.keys[0], action.offset, action.initial, action.expire, result);
        }

        case DeferredOp::DECREMENT: {
            int64_t result = 0;
            return cache_.decrement(action.keys[0], action.offset, action.initial, action.expire, result);
        }

        case DeferredOp::TOUCH:
            return cache_.touch(action.keys[0], action.expire);

        case DeferredOp::FLUSH:
            return cache_.flush();

        default:
            TCACHE_LOG_ERROR("未知的延迟操作类型: ", static_cast<int>(action.op));
            return false;
    }
}

bool Transaction::replayCas(const DeferredAction& action) {
    const Key& key = action.keys[0];

    // 重新读取后端，拿到当前有效的后端令牌
    Value current;
    CasToken backend_token;
    bool found = cache_.get(key, current, &backend_token);

    // 原始读取之后，键被其他客户端修改过
    if (snapshotOf(found, current) != action.snapshot) {
        TCACHE_LOG_WARNING("键 ", key, " 在事务外被修改，CAS失败");
        return false;
    }

    return cache_.cas(backend_token, key, action.value, action.expire);
}

void Transaction::markActive() {
    if (state_ != TransactionState::ACTIVE) {
        state_ = TransactionState::ACTIVE;
    }
}

void Transaction::clear() {
    deferred_.clear();
    touched_.clear();
    tokens_.clear();
    suspend_reads_ = false;
}

} // namespace tcache
