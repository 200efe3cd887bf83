#include "tcache_core.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <unordered_map>

namespace tcache {

// Utils 实现
CommandType Utils::stringToCommandType(const std::string& cmd) {
    static const std::unordered_map<std::string, CommandType> command_map = {
        {"GET", CommandType::GET},
        {"GETS", CommandType::GETS},
        {"MGET", CommandType::MGET},
        {"SET", CommandType::SET},
        {"MSET", CommandType::MSET},
        {"DEL", CommandType::DEL},
        {"ADD", CommandType::ADD},
        {"REPLACE", CommandType::REPLACE},
        {"CAS", CommandType::CAS},
        {"INCR", CommandType::INCR},
        {"DECR", CommandType::DECR},
        {"TOUCH", CommandType::TOUCH},
        {"FLUSH", CommandType::FLUSH},
        // 事务命令
        {"BEGIN", CommandType::BEGIN},
        {"COMMIT", CommandType::COMMIT},
        {"ROLLBACK", CommandType::ROLLBACK},
        {"QUIT", CommandType::QUIT},
    };

    std::string upper = cmd;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto it = command_map.find(upper);
    return (it != command_map.end()) ? it->second : CommandType::UNKNOWN;
}

std::string Utils::commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::GET: return "GET";
        case CommandType::GETS: return "GETS";
        case CommandType::MGET: return "MGET";
        case CommandType::SET: return "SET";
        case CommandType::MSET: return "MSET";
        case CommandType::DEL: return "DEL";
        case CommandType::ADD: return "ADD";
        case CommandType::REPLACE: return "REPLACE";
        case CommandType::CAS: return "CAS";
        case CommandType::INCR: return "INCR";
        case CommandType::DECR: return "DECR";
        case CommandType::TOUCH: return "TOUCH";
        case CommandType::FLUSH: return "FLUSH";
        case CommandType::BEGIN: return "BEGIN";
        case CommandType::COMMIT: return "COMMIT";
        case CommandType::ROLLBACK: return "ROLLBACK";
        case CommandType::QUIT: return "QUIT";
        default: return "UNKNOWN";
    }
}

Timestamp Utils::getCurrentTime() {
    return std::chrono::system_clock::now();
}

bool Utils::isInteger(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    size_t start = (str[0] == '-') ? 1 : 0;
    if (start == str.length()) {
        return false;
    }
    if (!std::all_of(str.begin() + start, str.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    // 超出int64范围的也不算
    try {
        std::stoll(str);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool Utils::applyDelta(int64_t current, int64_t delta, int64_t& result) {
    int64_t next;
    if (__builtin_add_overflow(current, delta, &next)) {
        return false;
    }
    result = next < 0 ? 0 : next;
    return true;
}

int64_t Utils::stringToInt(const std::string& str) {
    return std::stoll(str);
}

std::string Utils::intToString(int64_t value) {
    return std::to_string(value);
}

Timestamp Utils::expireToTimestamp(int64_t expire) {
    if (expire == EXPIRE_NEVER) {
        return Timestamp::max();
    }
    auto now = getCurrentTime();
    if (expire < 0) {
        return now - std::chrono::seconds(1);
    }
    if (expire < EXPIRE_RELATIVE_LIMIT) {
        return now + std::chrono::seconds(expire);
    }
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(expire));
}

int64_t Utils::expireToTTL(int64_t expire) {
    if (expire == EXPIRE_NEVER) {
        return 0;
    }
    if (expire < EXPIRE_RELATIVE_LIMIT) {
        return expire;
    }
    // 绝对时间戳
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        getCurrentTime().time_since_epoch()).count();
    int64_t ttl = expire - now;
    return ttl > 0 ? ttl : -1;
}

bool Utils::parseSize(const std::string& str, size_t& size) {
    if (str.empty()) {
        return false;
    }

    // 处理大小单位，支持kb、mb、gb
    std::string number = str;
    size_t multiplier = 1;
    if (str.length() > 2) {
        std::string unit = str.substr(str.length() - 2);
        std::transform(unit.begin(), unit.end(), unit.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (unit == "kb") {
            multiplier = 1024;
        } else if (unit == "mb") {
            multiplier = 1024 * 1024;
        } else if (unit == "gb") {
            multiplier = 1024 * 1024 * 1024;
        }
        if (multiplier != 1) {
            number = str.substr(0, str.length() - 2);
        }
    }

    if (number.empty() || !std::all_of(number.begin(), number.end(),
                                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    try {
        size = static_cast<size_t>(std::stoull(number)) * multiplier;
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace tcache
