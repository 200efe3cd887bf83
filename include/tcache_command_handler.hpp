#ifndef TCACHE_COMMAND_HANDLER_HPP
#define TCACHE_COMMAND_HANDLER_HPP

#include "tcache_core.hpp"
#include "transaction/tcache_transactional_store.hpp"
#include <string>

namespace tcache {

// 命令处理器类，把文本命令映射到事务存储上的操作
class CommandHandler {
public:
    explicit CommandHandler(TransactionalStore& store);

    // 把一行文本解析为命令，空行返回UNKNOWN且参数为空
    static Command parseCommand(const std::string& line);

    // 把响应格式化为一行输出
    static std::string formatResponse(const Response& response);

    // 分发并执行命令
    Response handleCommand(const Command& command);

    // 读命令
    Response handleGetCommand(const Command& command);
    Response handleGetsCommand(const Command& command);
    Response handleMGetCommand(const Command& command);

    // 写命令
    Response handleSetCommand(const Command& command);
    Response handleMSetCommand(const Command& command);
    Response handleDelCommand(const Command& command);
    Response handleAddCommand(const Command& command);
    Response handleReplaceCommand(const Command& command);
    Response handleCasCommand(const Command& command);
    Response handleIncrCommand(const Command& command);
    Response handleDecrCommand(const Command& command);
    Response handleTouchCommand(const Command& command);
    Response handleFlushCommand(const Command& command);

    // 事务命令
    Response handleBeginCommand(const Command& command);
    Response handleCommitCommand(const Command& command);
    Response handleRollbackCommand(const Command& command);

private:
    // 解析整数参数，失败时返回false
    static bool parseInt(const std::string& str, int64_t& value);
    // 解析可选的过期时间参数（args[index]），缺省为永不过期
    static bool parseExpire(const Command& command, size_t index, int64_t& expire);

    Response handleCounterCommand(const Command& command, bool increment);

    TransactionalStore& store_;
};

} // namespace tcache

#endif // TCACHE_COMMAND_HANDLER_HPP
