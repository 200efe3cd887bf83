#pragma once

#include "../tcache_core.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace tcache {

// 键值存储接口：后端缓存、本地缓冲区和事务都实现这一组操作。
// 所有操作以返回false表示"不存在"或"失败"。
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    // 读取键值，token非空时返回可用于cas()的令牌
    virtual bool get(const Key& key, Value& value, CasToken* token = nullptr) = 0;
    // 批量读取，只返回存在的键
    virtual std::unordered_map<Key, Value> getMulti(const std::vector<Key>& keys,
                                                    std::unordered_map<Key, CasToken>* tokens = nullptr) = 0;

    virtual bool set(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) = 0;
    virtual std::unordered_map<Key, bool> setMulti(const KeyValueList& items, int64_t expire = EXPIRE_NEVER) = 0;

    // 返回键在删除前是否存在
    virtual bool del(const Key& key) = 0;
    virtual std::unordered_map<Key, bool> delMulti(const std::vector<Key>& keys) = 0;

    // 仅当键不存在时写入
    virtual bool add(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) = 0;
    // 仅当键存在时写入
    virtual bool replace(const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) = 0;
    // 仅当键值自token签发以来未变化时写入
    virtual bool cas(const CasToken& token, const Key& key, const Value& value, int64_t expire = EXPIRE_NEVER) = 0;

    // offset必须为正、initial不能为负；键不存在时写入initial；结果不小于0
    virtual bool increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) = 0;
    virtual bool decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) = 0;

    virtual bool touch(const Key& key, int64_t expire) = 0;
    virtual bool flush() = 0;
};

} // namespace tcache
