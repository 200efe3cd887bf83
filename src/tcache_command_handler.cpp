#include "tcache_command_handler.hpp"
#include "tcache_logger.hpp"
#include <sstream>
#include <stdexcept>

namespace tcache {

CommandHandler::CommandHandler(TransactionalStore& store) : store_(store) {
}

Command CommandHandler::parseCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string name;
    if (!(iss >> name)) {
        return Command();
    }

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }
    return Command(Utils::stringToCommandType(name), args);
}

std::string CommandHandler::formatResponse(const Response& response) {
    switch (response.status) {
        case ResponseStatus::OK:
            return response.data.empty() ? response.message : response.data;
        case ResponseStatus::NOT_FOUND:
            return "(nil)";
        case ResponseStatus::ERROR:
        case ResponseStatus::INVALID_COMMAND:
        default:
            return "ERR " + response.message;
    }
}

bool CommandHandler::parseInt(const std::string& str, int64_t& value) {
    try {
        size_t pos = 0;
        value = std::stoll(str, &pos);
        return pos == str.length();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool CommandHandler::parseExpire(const Command& command, size_t index, int64_t& expire) {
    expire = EXPIRE_NEVER;
    if (command.args.size() <= index) {
        return true;
    }
    return parseInt(command.args[index], expire);
}

Response CommandHandler::handleCommand(const Command& command) {
    TCACHE_LOG_DEBUG("处理命令 ", Utils::commandTypeToString(command.type), "，参数 ", command.args.size(), " 个");
    switch (command.type) {
        case CommandType::GET: return handleGetCommand(command);
        case CommandType::GETS: return handleGetsCommand(command);
        case CommandType::MGET: return handleMGetCommand(command);
        case CommandType::SET: return handleSetCommand(command);
        case CommandType::MSET: return handleMSetCommand(command);
        case CommandType::DEL: return handleDelCommand(command);
        case CommandType::ADD: return handleAddCommand(command);
        case CommandType::REPLACE: return handleReplaceCommand(command);
        case CommandType::CAS: return handleCasCommand(command);
        case CommandType::INCR: return handleIncrCommand(command);
        case CommandType::DECR: return handleDecrCommand(command);
        case CommandType::TOUCH: return handleTouchCommand(command);
        case CommandType::FLUSH: return handleFlushCommand(command);
        case CommandType::BEGIN: return handleBeginCommand(command);
        case CommandType::COMMIT: return handleCommitCommand(command);
        case CommandType::ROLLBACK: return handleRollbackCommand(command);
        case CommandType::QUIT: return Response(ResponseStatus::OK, "BYE");
        default:
            TCACHE_LOG_DEBUG("未知命令");
            return Response(ResponseStatus::INVALID_COMMAND, "未知命令");
    }
}

Response CommandHandler::handleGetCommand(const Command& command) {
    if (command.args.size() != 1) {
        return Response(ResponseStatus::ERROR, "GET命令需要1个参数");
    }
    Value value;
    if (!store_.get(command.args[0], value)) {
        TCACHE_LOG_DEBUG("键 ", command.args[0], " 不存在");
        return Response(ResponseStatus::NOT_FOUND);
    }
    return Response(ResponseStatus::OK, "", value);
}

Response CommandHandler::handleGetsCommand(const Command& command) {
    if (command.args.size() != 1) {
        return Response(ResponseStatus::ERROR, "GETS命令需要1个参数");
    }
    Value value;
    CasToken token;
    if (!store_.get(command.args[0], value, &token)) {
        return Response(ResponseStatus::NOT_FOUND);
    }
    return Response(ResponseStatus::OK, token, value + " " + token);
}

Response CommandHandler::handleMGetCommand(const Command& command) {
    if (command.args.empty()) {
        return Response(ResponseStatus::ERROR, "MGET命令需要至少1个参数");
    }

    auto values = store_.getMulti(command.args);
    std::string data;
    for (const auto& key : command.args) {
        if (!data.empty()) {
            data += " ";
        }
        auto it = values.find(key);
        data += key + "=" + (it != values.end() ? it->second : "(nil)");
    }
    return Response(ResponseStatus::OK, "", data);
}

Response CommandHandler::handleSetCommand(const Command& command) {
    if (command.args.size() < 2 || command.args.size() > 3) {
        return Response(ResponseStatus::ERROR, "SET命令需要2到3个参数");
    }
    int64_t expire;
    if (!parseExpire(command, 2, expire)) {
        return Response(ResponseStatus::ERROR, "无效的过期时间");
    }
    if (!store_.set(command.args[0], command.args[1], expire)) {
        TCACHE_LOG_ERROR("设置键值失败: ", command.args[0]);
        return Response(ResponseStatus::ERROR, "设置键值失败");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleMSetCommand(const Command& command) {
    if (command.args.empty() || command.args.size() % 2 != 0) {
        return Response(ResponseStatus::ERROR, "MSET命令需要成对的键和值");
    }

    KeyValueList items;
    for (size_t i = 0; i < command.args.size(); i += 2) {
        items.emplace_back(command.args[i], command.args[i + 1]);
    }

    auto results = store_.setMulti(items);
    for (const auto& result : results) {
        if (!result.second) {
            return Response(ResponseStatus::ERROR, "设置键值失败: " + result.first);
        }
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleDelCommand(const Command& command) {
    if (command.args.empty()) {
        return Response(ResponseStatus::ERROR, "DEL命令需要至少1个参数");
    }

    int64_t deleted_count = 0;
    if (command.args.size() == 1) {
        deleted_count = store_.del(command.args[0]) ? 1 : 0;
    } else {
        for (const auto& result : store_.delMulti(command.args)) {
            if (result.second) {
                deleted_count++;
            }
        }
    }
    return Response(ResponseStatus::OK, "", Utils::intToString(deleted_count));
}

Response CommandHandler::handleAddCommand(const Command& command) {
    if (command.args.size() < 2 || command.args.size() > 3) {
        return Response(ResponseStatus::ERROR, "ADD命令需要2到3个参数");
    }
    int64_t expire;
    if (!parseExpire(command, 2, expire)) {
        return Response(ResponseStatus::ERROR, "无效的过期时间");
    }
    if (!store_.add(command.args[0], command.args[1], expire)) {
        return Response(ResponseStatus::ERROR, "键已存在");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleReplaceCommand(const Command& command) {
    if (command.args.size() < 2 || command.args.size() > 3) {
        return Response(ResponseStatus::ERROR, "REPLACE命令需要2到3个参数");
    }
    int64_t expire;
    if (!parseExpire(command, 2, expire)) {
        return Response(ResponseStatus::ERROR, "无效的过期时间");
    }
    if (!store_.replace(command.args[0], command.args[1], expire)) {
        return Response(ResponseStatus::ERROR, "键不存在");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleCasCommand(const Command& command) {
    if (command.args.size() < 3 || command.args.size() > 4) {
        return Response(ResponseStatus::ERROR, "CAS命令需要3到4个参数");
    }
    int64_t expire;
    if (!parseExpire(command, 3, expire)) {
        return Response(ResponseStatus::ERROR, "无效的过期时间");
    }
    if (!store_.cas(command.args[0], command.args[1], command.args[2], expire)) {
        return Response(ResponseStatus::ERROR, "CAS令牌不匹配");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleCounterCommand(const Command& command, bool increment) {
    const std::string name = increment ? "INCR" : "DECR";
    if (command.args.empty() || command.args.size() > 4) {
        return Response(ResponseStatus::ERROR, name + "命令需要1到4个参数");
    }

    int64_t offset = 1;
    int64_t initial = 0;
    int64_t expire = EXPIRE_NEVER;
    if ((command.args.size() > 1 && !parseInt(command.args[1], offset)) ||
        (command.args.size() > 2 && !parseInt(command.args[2], initial)) ||
        !parseExpire(command, 3, expire)) {
        return Response(ResponseStatus::ERROR, "值不是整数或超出范围");
    }

    int64_t result = 0;
    bool success = increment ? store_.increment(command.args[0], offset, initial, expire, result)
                             : store_.decrement(command.args[0], offset, initial, expire, result);
    if (!success) {
        return Response(ResponseStatus::ERROR, name + "失败: " + command.args[0]);
    }
    return Response(ResponseStatus::OK, "", Utils::intToString(result));
}

Response CommandHandler::handleIncrCommand(const Command& command) {
    return handleCounterCommand(command, true);
}

Response CommandHandler::handleDecrCommand(const Command& command) {
    return handleCounterCommand(command, false);
}

Response CommandHandler::handleTouchCommand(const Command& command) {
    if (command.args.size() != 2) {
        return Response(ResponseStatus::ERROR, "TOUCH命令需要2个参数");
    }
    int64_t expire;
    if (!parseExpire(command, 1, expire)) {
        return Response(ResponseStatus::ERROR, "无效的过期时间");
    }
    if (!store_.touch(command.args[0], expire)) {
        return Response(ResponseStatus::NOT_FOUND);
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleFlushCommand(const Command& command) {
    if (!command.args.empty()) {
        return Response(ResponseStatus::ERROR, "FLUSH命令不需要参数");
    }
    if (!store_.flush()) {
        return Response(ResponseStatus::ERROR, "清空失败");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleBeginCommand(const Command& command) {
    if (!command.args.empty()) {
        return Response(ResponseStatus::ERROR, "BEGIN命令不需要参数");
    }
    store_.begin();
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleCommitCommand(const Command& command) {
    if (!command.args.empty()) {
        return Response(ResponseStatus::ERROR, "COMMIT命令不需要参数");
    }
    if (store_.depth() == 0) {
        return Response(ResponseStatus::ERROR, "没有打开的事务");
    }
    if (!store_.commit()) {
        return Response(ResponseStatus::ERROR, "事务提交失败，已回滚");
    }
    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleRollbackCommand(const Command& command) {
    if (!command.args.empty()) {
        return Response(ResponseStatus::ERROR, "ROLLBACK命令不需要参数");
    }
    if (store_.depth() == 0) {
        return Response(ResponseStatus::ERROR, "没有打开的事务");
    }
    if (!store_.rollback()) {
        return Response(ResponseStatus::ERROR, "事务回滚失败");
    }
    return Response(ResponseStatus::OK, "OK");
}

} // namespace tcache
