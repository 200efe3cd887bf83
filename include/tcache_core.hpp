#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <chrono>

namespace tcache {

// 基础类型定义
using Key = std::string;
using Value = std::string;
using Timestamp = std::chrono::system_clock::time_point;

// CAS令牌，对调用方不透明
using CasToken = std::string;

// 有序的键值对列表（setMulti使用，保持调用方给出的顺序）
using KeyValueList = std::vector<std::pair<Key, Value>>;

// 过期时间约定（与memcached一致）：
// 0 表示永不过期；负数表示已过期；小于30天视为相对秒数；否则为unix绝对时间戳
const int64_t EXPIRE_NEVER = 0;
const int64_t EXPIRE_RELATIVE_LIMIT = 30 * 24 * 60 * 60;

// 命令类型枚举
enum class CommandType {
    UNKNOWN = -1,
    GET = 0,
    MGET = 1,
    SET = 2,
    MSET = 3,
    DEL = 4,
    ADD = 5,
    REPLACE = 6,
    CAS = 7,
    INCR = 8,
    DECR = 9,
    TOUCH = 10,
    FLUSH = 11,
    // 事务命令
    BEGIN = 12,
    COMMIT = 13,
    ROLLBACK = 14,
    QUIT = 15,
    GETS = 16      // 读取值和CAS令牌
};

// 响应状态枚举
enum class ResponseStatus {
    OK = 0,
    ERROR = 1,
    NOT_FOUND = 2,
    INVALID_COMMAND = 3
};

// 后端类型
enum class BackendType {
    MEMORY = 0,
    REDIS = 1
};

// 命令结构
struct Command {
    CommandType type;
    std::vector<std::string> args;

    Command() : type(CommandType::UNKNOWN) {}
    Command(CommandType t, const std::vector<std::string>& a) : type(t), args(a) {}
};

// 响应结构
struct Response {
    ResponseStatus status;
    std::string message;
    std::string data;

    Response() : status(ResponseStatus::OK) {}
    Response(ResponseStatus s, const std::string& m = "", const std::string& d = "")
        : status(s), message(m), data(d) {}
};

} // namespace tcache

#include "tcache_utils.hpp"
