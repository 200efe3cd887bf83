#include "net/tcache_resp.hpp"
#include <stdexcept>

namespace tcache {

// RESPProtocol 实现

std::string RESPProtocol::serializeCommand(const std::vector<std::string>& args) {
    return serializeArray(args);
}

RESPParseResult RESPProtocol::parseReply(const std::string& data, size_t& pos, RESPReply& reply) {
    size_t cursor = pos;
    RESPReply parsed;
    RESPParseResult result = parseAt(data, cursor, parsed);
    if (result == RESPParseResult::OK) {
        pos = cursor;
        reply = std::move(parsed);
    }
    return result;
}

RESPParseResult RESPProtocol::parseAt(const std::string& data, size_t& pos, RESPReply& reply) {
    if (pos >= data.length()) {
        return RESPParseResult::INCOMPLETE;
    }

    char type = data[pos];
    size_t cursor = pos + 1;
    std::string line;
    if (!readLine(data, cursor, line)) {
        return RESPParseResult::INCOMPLETE;
    }

    switch (type) {
        case '+':
            reply.type = RESPType::SIMPLE_STRING;
            reply.str = line;
            break;

        case '-':
            reply.type = RESPType::ERROR;
            reply.str = line;
            break;

        case ':':
            reply.type = RESPType::INTEGER;
            if (!parseInteger(line, reply.integer)) {
                return RESPParseResult::ERROR;
            }
            break;

        case '$': {
            reply.type = RESPType::BULK_STRING;
            int64_t length = 0;
            if (!parseInteger(line, length) || length < -1) {
                return RESPParseResult::ERROR;
            }
            // $-1 表示NULL
            if (length == -1) {
                reply.is_null = true;
                break;
            }
            size_t size = static_cast<size_t>(length);
            if (cursor + size + 2 > data.length()) {
                return RESPParseResult::INCOMPLETE;
            }
            if (data[cursor + size] != '\r' || data[cursor + size + 1] != '\n') {
                return RESPParseResult::ERROR;
            }
            reply.str = data.substr(cursor, size);
            cursor += size + 2;
            break;
        }

        case '*': {
            reply.type = RESPType::ARRAY;
            int64_t count = 0;
            if (!parseInteger(line, count) || count < -1) {
                return RESPParseResult::ERROR;
            }
            // *-1 表示NULL数组（例如WATCH的键被修改后EXEC的回复）
            if (count == -1) {
                reply.is_null = true;
                break;
            }
            reply.elements.reserve(static_cast<size_t>(count));
            for (int64_t i = 0; i < count; i++) {
                RESPReply element;
                RESPParseResult result = parseAt(data, cursor, element);
                if (result != RESPParseResult::OK) {
                    return result;
                }
                reply.elements.push_back(std::move(element));
            }
            break;
        }

        default:
            return RESPParseResult::ERROR;
    }

    pos = cursor;
    return RESPParseResult::OK;
}

std::string RESPProtocol::serializeSimpleString(const std::string& str) {
    return "+" + str + "\r\n";
}

std::string RESPProtocol::serializeError(const std::string& error) {
    return "-" + error + "\r\n";
}

std::string RESPProtocol::serializeInteger(int64_t value) {
    return ":" + std::to_string(value) + "\r\n";
}

std::string RESPProtocol::serializeBulkString(const std::string& str) {
    return "$" + std::to_string(str.length()) + "\r\n" + str + "\r\n";
}

std::string RESPProtocol::serializeNull() {
    return "$-1\r\n";
}

std::string RESPProtocol::serializeArray(const std::vector<std::string>& array) {
    std::string result = "*" + std::to_string(array.size()) + "\r\n";
    for (const auto& item : array) {
        result += serializeBulkString(item);
    }
    return result;
}

bool RESPProtocol::readLine(const std::string& data, size_t& pos, std::string& line) {
    size_t end = data.find("\r\n", pos);
    if (end == std::string::npos) {
        return false;
    }
    line = data.substr(pos, end - pos);
    pos = end + 2;
    return true;
}

bool RESPProtocol::parseInteger(const std::string& str, int64_t& value) {
    if (!Utils::isInteger(str)) {
        return false;
    }
    value = Utils::stringToInt(str);
    return true;
}

} // namespace tcache
