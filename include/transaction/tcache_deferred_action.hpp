#ifndef TCACHE_DEFERRED_ACTION_HPP
#define TCACHE_DEFERRED_ACTION_HPP

#include "../tcache_core.hpp"
#include <string>
#include <vector>

namespace tcache {

// 延迟操作类型，提交时按类型分派到后端
enum class DeferredOp {
    SET = 0,
    SET_MULTI = 1,
    DELETE = 2,
    DELETE_MULTI = 3,
    ADD = 4,
    REPLACE = 5,
    CAS = 6,
    INCREMENT = 7,
    DECREMENT = 8,
    TOUCH = 9,
    FLUSH = 10
};

inline std::string deferredOpToString(DeferredOp op) {
    switch (op) {
        case DeferredOp::SET: return "SET";
        case DeferredOp::SET_MULTI: return "SET_MULTI";
        case DeferredOp::DELETE: return "DELETE";
        case DeferredOp::DELETE_MULTI: return "DELETE_MULTI";
        case DeferredOp::ADD: return "ADD";
        case DeferredOp::REPLACE: return "REPLACE";
        case DeferredOp::CAS: return "CAS";
        case DeferredOp::INCREMENT: return "INCREMENT";
        case DeferredOp::DECREMENT: return "DECREMENT";
        case DeferredOp::TOUCH: return "TOUCH";
        case DeferredOp::FLUSH: return "FLUSH";
        default: return "UNKNOWN";
    }
}

// 一条待提交的写操作：操作类型、参数以及它会写到的键。
// 未使用的参数保持默认值。
struct DeferredAction {
    DeferredOp op;
    std::vector<Key> keys;      // 受影响的键，提交失败时据此回滚
    Value value;
    KeyValueList items;         // SET_MULTI
    int64_t expire = EXPIRE_NEVER;
    int64_t offset = 0;         // INCREMENT/DECREMENT
    int64_t initial = 0;        // INCREMENT/DECREMENT
    std::string snapshot;       // CAS：签发令牌时的值快照

    DeferredAction(DeferredOp o, std::vector<Key> k) : op(o), keys(std::move(k)) {}
};

} // namespace tcache

#endif // TCACHE_DEFERRED_ACTION_HPP
