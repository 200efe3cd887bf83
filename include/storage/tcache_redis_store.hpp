#pragma once

#include "tcache_key_value_store.hpp"
#include "../net/tcache_resp.hpp"
#include <mutex>
#include <string>

namespace tcache {

// 通过单条阻塞TCP连接（RESP2协议）访问Redis的键值存储。
// CAS令牌就是读取时的值本身，cas()用WATCH/MULTI/EXEC保证原子性。
class RedisStore : public IKeyValueStore {
public:
    RedisStore(const std::string& host, int port, int timeout_ms = 1000);
    ~RedisStore() override;

    // 禁止拷贝和移动
    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    // 连接管理
    bool connect();
    void disconnect();
    bool isConnected() const;

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }

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
    // 以下方法要求调用方已持有mutex_
    bool connectLocked();
    void disconnectLocked();
    bool sendAll(const std::string& data);
    bool readReply(RESPReply& reply);
    bool execute(const std::vector<std::string>& args, RESPReply& reply);
    // 放弃WATCH或MULTI，保证连接回到普通状态
    void unwatchLocked(const Key& key);
    void discardLocked();

    // 写入命令，mode为空、"NX"或"XX"
    bool storeLocked(const Key& key, const Value& value, int64_t expire, const std::string& mode);
    bool doIncrement(const Key& key, int64_t delta, int64_t initial, int64_t expire, int64_t& result);

    // 把过期时间追加到SET命令，已过期返回false
    static bool appendExpire(std::vector<std::string>& args, int64_t expire);

    const std::string host_;
    const int port_;
    const int timeout_ms_;

    mutable std::mutex mutex_;
    int sockfd_;
    std::string read_buffer_;
};

} // namespace tcache
