#include "tcache_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tcache {

bool parseBackendType(const std::string& str, BackendType& backend) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "memory") {
        backend = BackendType::MEMORY;
    } else if (lower == "redis") {
        backend = BackendType::REDIS;
    } else {
        return false;
    }
    return true;
}

bool parseConfig(std::istream& in, Config& config) {
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        line_number++;

        // 跳过注释和空行
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) {
            TCACHE_LOG_ERROR("配置第 ", line_number, " 行缺少值: ", key);
            return false;
        }

        try {
            if (key == "log_level") {
                if (!parseLogLevel(value, config.log_level)) {
                    TCACHE_LOG_ERROR("无效的日志等级: ", value);
                    return false;
                }
            } else if (key == "log_file") {
                config.log_file = value;
            } else if (key == "backend") {
                if (!parseBackendType(value, config.backend)) {
                    TCACHE_LOG_ERROR("无效的后端类型: ", value);
                    return false;
                }
            } else if (key == "memory_limit") {
                if (!Utils::parseSize(value, config.memory_limit)) {
                    TCACHE_LOG_ERROR("无效的内存限制: ", value);
                    return false;
                }
            } else if (key == "redis_host") {
                config.redis_host = value;
            } else if (key == "redis_port") {
                int port = std::stoi(value);
                if (port <= 0 || port > 65535) {
                    TCACHE_LOG_ERROR("无效的Redis端口: ", value);
                    return false;
                }
                config.redis_port = port;
            } else if (key == "redis_timeout_ms") {
                int timeout = std::stoi(value);
                if (timeout <= 0) {
                    TCACHE_LOG_ERROR("无效的Redis超时: ", value);
                    return false;
                }
                config.redis_timeout_ms = timeout;
            } else {
                TCACHE_LOG_WARNING("忽略未知配置项: ", key);
            }
        } catch (const std::invalid_argument&) {
            TCACHE_LOG_ERROR("配置项 ", key, " 不是有效数字: ", value);
            return false;
        } catch (const std::out_of_range&) {
            TCACHE_LOG_ERROR("配置项 ", key, " 超出范围: ", value);
            return false;
        }
    }
    return true;
}

bool loadConfig(const std::string& config_file, Config& config) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        TCACHE_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }
    return parseConfig(file, config);
}

} // namespace tcache
