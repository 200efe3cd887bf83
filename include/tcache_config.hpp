#pragma once

#include "tcache_core.hpp"
#include "tcache_logger.hpp"
#include <istream>
#include <string>

namespace tcache {

// 运行配置，默认值即未配置时的行为
struct Config {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                 // 为空则不输出到文件
    BackendType backend = BackendType::MEMORY;
    size_t memory_limit = 0;              // 0表示不限制
    std::string redis_host = "127.0.0.1";
    int redis_port = 6379;
    int redis_timeout_ms = 1000;
};

// 解析后端名称（memory/redis，大小写不敏感）
bool parseBackendType(const std::string& str, BackendType& backend);

// 从流中读取"key value"格式的配置，#开头的行为注释
bool parseConfig(std::istream& in, Config& config);

// 从文件加载配置
bool loadConfig(const std::string& config_file, Config& config);

} // namespace tcache
