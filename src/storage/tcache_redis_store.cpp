#include "storage/tcache_redis_store.hpp"
#include "tcache_logger.hpp"
#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace tcache {

RedisStore::RedisStore(const std::string& host, int port, int timeout_ms)
    : host_(host), port_(port), timeout_ms_(timeout_ms), sockfd_(-1) {
}

RedisStore::~RedisStore() {
    disconnect();
}

bool RedisStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectLocked();
}

void RedisStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnectLocked();
}

bool RedisStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sockfd_ >= 0;
}

bool RedisStore::connectLocked() {
    if (sockfd_ >= 0) {
        return true;
    }

    // 解析地址，支持主机名
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* result = nullptr;
    int gai = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &result);
    if (gai != 0 || result == nullptr) {
        TCACHE_LOG_ERROR("无法解析Redis地址 ", host_, ": ", gai_strerror(gai));
        return false;
    }
    struct sockaddr_in addr;
    memcpy(&addr, result->ai_addr, sizeof(addr));
    freeaddrinfo(result);

    // 创建socket
    int sockfd = socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd < 0) {
        TCACHE_LOG_ERROR("创建socket失败: ", strerror(errno));
        return false;
    }

    // 设置套接字为非阻塞，以便连接超时
    int flags = fcntl(sockfd, F_GETFL, 0);
    if (flags < 0 || fcntl(sockfd, F_SETFL, flags | O_NONBLOCK) < 0) {
        TCACHE_LOG_ERROR("设置socket为非阻塞失败: ", strerror(errno));
        close(sockfd);
        return false;
    }

    int ret = ::connect(sockfd, (struct sockaddr*)&addr, sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        TCACHE_LOG_ERROR("连接Redis ", host_, ":", port_, " 失败: ", strerror(errno));
        close(sockfd);
        return false;
    }

    // 等待连接完成
    if (ret < 0) {
        fd_set writefds;
        struct timeval tv;

        FD_ZERO(&writefds);
        FD_SET(sockfd, &writefds);

        tv.tv_sec = timeout_ms_ / 1000;
        tv.tv_usec = (timeout_ms_ % 1000) * 1000;

        ret = select(sockfd + 1, nullptr, &writefds, nullptr, &tv);
        if (ret <= 0) {
            TCACHE_LOG_ERROR("连接Redis超时或出错: ", ret == 0 ? "timeout" : strerror(errno));
            close(sockfd);
            return false;
        }

        // 检查连接是否成功
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            TCACHE_LOG_ERROR("连接Redis ", host_, ":", port_, " 失败: ", strerror(so_error));
            close(sockfd);
            return false;
        }
    }

    // 恢复阻塞模式，读写依靠超时选项
    if (fcntl(sockfd, F_SETFL, flags) < 0) {
        TCACHE_LOG_ERROR("恢复socket阻塞模式失败: ", strerror(errno));
        close(sockfd);
        return false;
    }

    struct timeval tv;
    tv.tv_sec = timeout_ms_ / 1000;
    tv.tv_usec = (timeout_ms_ % 1000) * 1000;
    setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    int nodelay = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    sockfd_ = sockfd;
    read_buffer_.clear();
    TCACHE_LOG_INFO("已连接到Redis ", host_, ":", port_);
    return true;
}

void RedisStore::disconnectLocked() {
    if (sockfd_ >= 0) {
        close(sockfd_);
        sockfd_ = -1;
        TCACHE_LOG_DEBUG("已断开Redis连接");
    }
    read_buffer_.clear();
}

bool RedisStore::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            TCACHE_LOG_ERROR("发送Redis命令失败: ", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool RedisStore::readReply(RESPReply& reply) {
    char buffer[4096];
    while (true) {
        size_t pos = 0;
        RESPParseResult result = RESPProtocol::parseReply(read_buffer_, pos, reply);
        if (result == RESPParseResult::OK) {
            read_buffer_.erase(0, pos);
            return true;
        }
        if (result == RESPParseResult::ERROR) {
            TCACHE_LOG_ERROR("Redis回复格式错误");
            return false;
        }

        // 数据不完整，继续读取
        ssize_t n = recv(sockfd_, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            TCACHE_LOG_ERROR("读取Redis回复失败: ", strerror(errno));
            return false;
        }
        if (n == 0) {
            TCACHE_LOG_ERROR("Redis关闭了连接");
            return false;
        }
        read_buffer_.append(buffer, static_cast<size_t>(n));
    }
}

bool RedisStore::execute(const std::vector<std::string>& args, RESPReply& reply) {
    // 断线后自动重连
    if (sockfd_ < 0 && !connectLocked()) {
        return false;
    }

    if (!sendAll(RESPProtocol::serializeCommand(args)) || !readReply(reply)) {
        disconnectLocked();
        return false;
    }

    if (reply.isError()) {
        TCACHE_LOG_ERROR("Redis命令 ", args[0], " 出错: ", reply.str);
        return false;
    }
    return true;
}

void RedisStore::unwatchLocked(const Key& key) {
    if (sockfd_ < 0) {
        return;
    }
    RESPReply reply;
    if (!execute({"UNWATCH"}, reply)) {
        TCACHE_LOG_WARNING("UNWATCH失败: ", key);
    }
}

void RedisStore::discardLocked() {
    // 连接已断开时服务端会丢弃事务
    if (sockfd_ < 0) {
        return;
    }
    RESPReply reply;
    if (!execute({"DISCARD"}, reply)) {
        TCACHE_LOG_WARNING("DISCARD失败");
    }
}

bool RedisStore::appendExpire(std::vector<std::string>& args, int64_t expire) {
    int64_t ttl = Utils::expireToTTL(expire);
    if (ttl < 0) {
        return false;
    }
    if (ttl > 0) {
        args.push_back("EX");
        args.push_back(Utils::intToString(ttl));
    }
    return true;
}

bool RedisStore::get(const Key& key, Value& value, CasToken* token) {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    if (!execute({"GET", key}, reply) || reply.isNull()) {
        return false;
    }
    value = reply.str;
    if (token) {
        *token = reply.str;
    }
    return true;
}

std::unordered_map<Key, Value> RedisStore::getMulti(const std::vector<Key>& keys,
                                                    std::unordered_map<Key, CasToken>* tokens) {
    std::unordered_map<Key, Value> values;
    if (keys.empty()) {
        return values;
    }

    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.push_back("MGET");
    args.insert(args.end(), keys.begin(), keys.end());

    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    if (!execute(args, reply) || reply.elements.size() != keys.size()) {
        return values;
    }

    for (size_t i = 0; i < keys.size(); i++) {
        const RESPReply& element = reply.elements[i];
        if (element.isNull()) {
            continue;
        }
        values[keys[i]] = element.str;
        if (tokens) {
            (*tokens)[keys[i]] = element.str;
        }
    }
    return values;
}

bool RedisStore::storeLocked(const Key& key, const Value& value, int64_t expire, const std::string& mode) {
    RESPReply reply;
    std::vector<std::string> args = {"SET", key, value};
    if (!appendExpire(args, expire)) {
        // 已过期：直接删除，NX/XX仍需判断键是否存在
        if (mode.empty()) {
            return execute({"DEL", key}, reply);
        }
        if (!execute({"EXISTS", key}, reply)) {
            return false;
        }
        bool exists = reply.integer > 0;
        if (mode == "NX") {
            return !exists;
        }
        return exists && execute({"DEL", key}, reply);
    }

    if (!mode.empty()) {
        args.push_back(mode);
    }
    // NX/XX条件不满足时回复NULL
    return execute(args, reply) && reply.isOk();
}

bool RedisStore::set(const Key& key, const Value& value, int64_t expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    return storeLocked(key, value, expire, "");
}

std::unordered_map<Key, bool> RedisStore::setMulti(const KeyValueList& items, int64_t expire) {
    std::unordered_map<Key, bool> results;
    if (items.empty()) {
        return results;
    }

    int64_t ttl = Utils::expireToTTL(expire);
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    bool success = true;

    if (ttl < 0) {
        // 已过期，全部删除
        std::vector<std::string> args = {"DEL"};
        for (const auto& item : items) {
            args.push_back(item.first);
        }
        success = execute(args, reply);
    } else {
        std::vector<std::string> mset = {"MSET"};
        for (const auto& item : items) {
            mset.push_back(item.first);
            mset.push_back(item.second);
        }

        if (ttl == 0) {
            success = execute(mset, reply) && reply.isOk();
        } else {
            // MSET不支持过期时间，放进MULTI里逐个EXPIRE
            success = execute({"MULTI"}, reply) && execute(mset, reply);
            for (const auto& item : items) {
                if (!success) {
                    break;
                }
                success = execute({"EXPIRE", item.first, Utils::intToString(ttl)}, reply);
            }
            if (success) {
                success = execute({"EXEC"}, reply) && !reply.isNull();
            } else {
                discardLocked();
            }
        }
    }

    for (const auto& item : items) {
        results[item.first] = success;
    }
    return results;
}

bool RedisStore::del(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    return execute({"DEL", key}, reply) && reply.integer > 0;
}

std::unordered_map<Key, bool> RedisStore::delMulti(const std::vector<Key>& keys) {
    std::unordered_map<Key, bool> results;
    if (keys.empty()) {
        return results;
    }

    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.push_back("MGET");
    args.insert(args.end(), keys.begin(), keys.end());

    std::lock_guard<std::mutex> lock(mutex_);
    // DEL只返回删除数量，先用MGET确认每个键是否存在
    RESPReply existing;
    if (!execute(args, existing) || existing.elements.size() != keys.size()) {
        for (const auto& key : keys) {
            results[key] = false;
        }
        return results;
    }

    args[0] = "DEL";
    RESPReply reply;
    bool deleted = execute(args, reply);
    for (size_t i = 0; i < keys.size(); i++) {
        results[keys[i]] = deleted && !existing.elements[i].isNull();
    }
    return results;
}

bool RedisStore::add(const Key& key, const Value& value, int64_t expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    return storeLocked(key, value, expire, "NX");
}

bool RedisStore::replace(const Key& key, const Value& value, int64_t expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    return storeLocked(key, value, expire, "XX");
}

bool RedisStore::cas(const CasToken& token, const Key& key, const Value& value, int64_t expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    if (!execute({"WATCH", key}, reply)) {
        return false;
    }

    // 值仍与令牌一致才能写入
    if (!execute({"GET", key}, reply)) {
        unwatchLocked(key);
        return false;
    }
    if (reply.isNull() || reply.str != token) {
        unwatchLocked(key);
        return false;
    }

    std::vector<std::string> args = {"SET", key, value};
    if (!appendExpire(args, expire)) {
        args = {"DEL", key};
    }

    // 被WATCH的键在此期间变化时EXEC返回NULL
    if (!execute({"MULTI"}, reply)) {
        unwatchLocked(key);
        return false;
    }
    if (!execute(args, reply)) {
        discardLocked();
        return false;
    }
    return execute({"EXEC"}, reply) && !reply.isNull();
}

bool RedisStore::increment(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }
    return doIncrement(key, offset, initial, expire, result);
}

bool RedisStore::decrement(const Key& key, int64_t offset, int64_t initial, int64_t expire, int64_t& result) {
    if (offset <= 0 || initial < 0) {
        return false;
    }
    return doIncrement(key, -offset, initial, expire, result);
}

bool RedisStore::doIncrement(const Key& key, int64_t delta, int64_t initial, int64_t expire, int64_t& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    if (!execute({"WATCH", key}, reply)) {
        return false;
    }
    if (!execute({"GET", key}, reply)) {
        unwatchLocked(key);
        return false;
    }

    int64_t next = initial;
    if (!reply.isNull()) {
        // 非数值、负数或溢出时不能自增
        if (!Utils::isInteger(reply.str) || Utils::stringToInt(reply.str) < 0 ||
            !Utils::applyDelta(Utils::stringToInt(reply.str), delta, next)) {
            unwatchLocked(key);
            return false;
        }
    }

    std::vector<std::string> args = {"SET", key, Utils::intToString(next)};
    if (!appendExpire(args, expire)) {
        args = {"DEL", key};
    }

    if (!execute({"MULTI"}, reply)) {
        unwatchLocked(key);
        return false;
    }
    if (!execute(args, reply)) {
        discardLocked();
        return false;
    }
    if (!execute({"EXEC"}, reply) || reply.isNull()) {
        TCACHE_LOG_DEBUG("自增时键被并发修改: ", key);
        return false;
    }
    result = next;
    return true;
}

bool RedisStore::touch(const Key& key, int64_t expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    int64_t ttl = Utils::expireToTTL(expire);
    if (ttl < 0) {
        return execute({"DEL", key}, reply) && reply.integer > 0;
    }
    if (ttl == 0) {
        // 永不过期：存在的键返回成功
        if (!execute({"PERSIST", key}, reply)) {
            return false;
        }
        return execute({"EXISTS", key}, reply) && reply.integer > 0;
    }
    return execute({"EXPIRE", key, Utils::intToString(ttl)}, reply) && reply.integer > 0;
}

bool RedisStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    RESPReply reply;
    return execute({"FLUSHALL"}, reply) && reply.isOk();
}

} // namespace tcache
