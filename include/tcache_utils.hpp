#pragma once

#include <string>
#include <chrono>
#include "tcache_core.hpp"

namespace tcache {

// 工具函数
class Utils {
public:
    // 将字符串转换为命令类型（大小写不敏感）
    static CommandType stringToCommandType(const std::string& cmd);

    // 将命令类型转换为字符串
    static std::string commandTypeToString(CommandType type);

    // 获取当前时间戳
    static Timestamp getCurrentTime();

    // 检查字符串是否为整数（可带负号）
    static bool isInteger(const std::string& str);

    // 计数器加上delta，结果小于0时取0；溢出int64时返回false
    static bool applyDelta(int64_t current, int64_t delta, int64_t& result);

    // 字符串转整数
    static int64_t stringToInt(const std::string& str);

    // 整数转字符串
    static std::string intToString(int64_t value);

    // 把过期时间约定转换为绝对时间点，永不过期返回Timestamp::max()
    static Timestamp expireToTimestamp(int64_t expire);

    // 把过期时间约定转换为相对TTL秒数：0表示不过期，负数表示已过期
    static int64_t expireToTTL(int64_t expire);

    // 解析带单位（kb/mb/gb）的大小
    static bool parseSize(const std::string& str, size_t& size);
};

} // namespace tcache
