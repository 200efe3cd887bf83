#include "tcache_config.hpp"
#include "tcache_command_handler.hpp"
#include "tcache_logger.hpp"
#include "storage/tcache_memory_store.hpp"
#include "storage/tcache_redis_store.hpp"
#include "transaction/tcache_transactional_store.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace tcache {

// 打印帮助信息
void printHelp() {
    std::cout << "tcache - 带缓冲写事务的键值缓存客户端 v0.1\n" << std::endl;
    std::cout << "用法: tcache_cli [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -c, --config <file>     使用指定的配置文件" << std::endl;
    std::cout << "  -b, --backend <type>    后端类型（memory, redis, 默认：memory）" << std::endl;
    std::cout << "  -H, --host <host>       Redis主机（默认：127.0.0.1）" << std::endl;
    std::cout << "  -p, --port <port>       Redis端口（默认：6379）" << std::endl;
    std::cout << "  -l, --log-level <level> 设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>   设置日志文件路径" << std::endl;
    std::cout << "  -v, --version           显示版本信息" << std::endl;
    std::cout << "  -h, --help              显示帮助信息" << std::endl;
    std::cout << "\n命令（每行一条，从标准输入读取）:" << std::endl;
    std::cout << "  GET k | GETS k | MGET k...            读取" << std::endl;
    std::cout << "  SET k v [expire] | MSET k v [k v...]  写入" << std::endl;
    std::cout << "  ADD k v [expire] | REPLACE k v [expire] | CAS token k v [expire]" << std::endl;
    std::cout << "  INCR k [offset initial expire] | DECR k [offset initial expire]" << std::endl;
    std::cout << "  DEL k... | TOUCH k expire | FLUSH" << std::endl;
    std::cout << "  BEGIN | COMMIT | ROLLBACK | QUIT" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  tcache_cli                         # 使用内存后端" << std::endl;
    std::cout << "  tcache_cli -b redis -p 6380        # 连接本机6380端口的Redis" << std::endl;
    std::cout << "  tcache_cli -l debug -f tcache.log  # 启用调试日志并输出到文件" << std::endl;
}

// 打印版本信息
void printVersion() {
    std::cout << "tcache v0.1.0" << std::endl;
    std::cout << "基于现代C++17的缓冲写事务键值缓存" << std::endl;
}

// 命令行参数，未指定的项保持为空，由配置文件或默认值决定
struct CliOptions {
    std::string config_file;
    std::string backend;
    std::string host;
    std::string port;
    std::string log_level;
    std::string log_file;
    bool show_help = false;
    bool show_version = false;
};

// 解析命令行参数，参数错误时返回false
bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // 需要值的选项
        std::string* target = nullptr;
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            target = &options.config_file;
        } else if (arg == "-b" || arg == "--backend") {
            target = &options.backend;
        } else if (arg == "-H" || arg == "--host") {
            target = &options.host;
        } else if (arg == "-p" || arg == "--port") {
            target = &options.port;
        } else if (arg == "-l" || arg == "--log-level") {
            target = &options.log_level;
        } else if (arg == "-f" || arg == "--log-file") {
            target = &options.log_file;
        } else {
            std::cerr << "未知参数: " << arg << std::endl;
            std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
            return false;
        }

        if (target) {
            if (i + 1 >= argc) {
                std::cerr << "错误: " << arg << " 需要指定参数值" << std::endl;
                return false;
            }
            *target = argv[++i];
        }
    }
    return true;
}

// 命令行参数覆盖配置文件
bool applyOptions(const CliOptions& options, Config& config) {
    if (!options.backend.empty() && !parseBackendType(options.backend, config.backend)) {
        std::cerr << "无效的后端类型: " << options.backend << std::endl;
        return false;
    }
    if (!options.host.empty()) {
        config.redis_host = options.host;
    }
    if (!options.port.empty()) {
        try {
            config.redis_port = std::stoi(options.port);
        } catch (const std::invalid_argument&) {
            std::cerr << "无效的端口号: " << options.port << std::endl;
            return false;
        } catch (const std::out_of_range&) {
            std::cerr << "端口号超出范围: " << options.port << std::endl;
            return false;
        }
    }
    if (!options.log_level.empty() && !parseLogLevel(options.log_level, config.log_level)) {
        std::cerr << "无效的日志等级: " << options.log_level << std::endl;
        return false;
    }
    if (!options.log_file.empty()) {
        config.log_file = options.log_file;
    }
    return true;
}

// 根据配置创建后端存储
std::unique_ptr<IKeyValueStore> createBackend(const Config& config) {
    if (config.backend == BackendType::REDIS) {
        auto redis = std::make_unique<RedisStore>(config.redis_host, config.redis_port, config.redis_timeout_ms);
        if (!redis->connect()) {
            TCACHE_LOG_ERROR("无法连接到Redis ", config.redis_host, ":", config.redis_port);
            return nullptr;
        }
        return redis;
    }
    TCACHE_LOG_INFO("使用内存后端，内存限制: ", config.memory_limit, " 字节");
    return std::make_unique<MemoryStore>(config.memory_limit);
}

} // namespace tcache

int main(int argc, char* argv[]) {
    using namespace tcache;

    // 初始化日志系统
    auto& logger = Logger::getInstance();

    // 解析命令行参数
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        return 1;
    }

    // 处理帮助和版本信息
    if (options.show_help) {
        printHelp();
        return 0;
    }

    if (options.show_version) {
        printVersion();
        return 0;
    }

    // 加载配置文件（如果指定），命令行参数优先
    Config config;
    if (!options.config_file.empty()) {
        if (!loadConfig(options.config_file, config)) {
            TCACHE_LOG_ERROR("加载配置文件失败: ", options.config_file);
            return 1;
        }
        TCACHE_LOG_INFO("成功加载配置文件: ", options.config_file);
    }
    if (!applyOptions(options, config)) {
        return 1;
    }

    // 配置日志系统
    logger.setLogLevel(config.log_level);
    if (!config.log_file.empty()) {
        if (!logger.setLogFile(config.log_file)) {
            std::cerr << "无法打开日志文件: " << config.log_file << std::endl;
            return 1;
        }
        TCACHE_LOG_INFO("日志文件已设置为: ", config.log_file);
    }

    std::unique_ptr<IKeyValueStore> backend = createBackend(config);
    if (!backend) {
        return 1;
    }

    // 事务存储析构时回滚所有未结束的事务
    TransactionalStore store(*backend);
    CommandHandler handler(store);

    std::string line;
    while (std::getline(std::cin, line)) {
        Command command = CommandHandler::parseCommand(line);
        if (command.type == CommandType::UNKNOWN && command.args.empty() &&
            line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        Response response = handler.handleCommand(command);
        std::cout << CommandHandler::formatResponse(response) << std::endl;

        if (command.type == CommandType::QUIT) {
            break;
        }
    }

    if (store.depth() > 0) {
        TCACHE_LOG_WARNING("退出时仍有 ", store.depth(), " 层未结束的事务，全部回滚");
    }
    return 0;
}
