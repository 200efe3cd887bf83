#pragma once

#include "../tcache_core.hpp"
#include <string>
#include <vector>

namespace tcache {

// RESP协议类型
enum class RESPType {
    SIMPLE_STRING = '+',  // +
    ERROR = '-',          // -
    INTEGER = ':',        // :
    BULK_STRING = '$',    // $
    ARRAY = '*'           // *
};

// 一条RESP回复
struct RESPReply {
    RESPType type = RESPType::SIMPLE_STRING;
    std::string str;                  // 简单字符串、错误信息或批量字符串
    int64_t integer = 0;
    bool is_null = false;             // $-1 或 *-1
    std::vector<RESPReply> elements;  // 数组元素

    bool isError() const { return type == RESPType::ERROR; }
    bool isNull() const { return is_null; }
    bool isOk() const { return type == RESPType::SIMPLE_STRING && str == "OK"; }
};

// 解析结果
enum class RESPParseResult {
    OK = 0,
    INCOMPLETE = 1,  // 数据不完整，需要继续读取
    ERROR = 2        // 协议错误
};

// RESP协议编解码
class RESPProtocol {
public:
    // 把命令序列化为批量字符串数组
    static std::string serializeCommand(const std::vector<std::string>& args);

    // 解析一条回复，成功时pos移动到回复之后；数据不完整时pos保持不变
    static RESPParseResult parseReply(const std::string& data, size_t& pos, RESPReply& reply);

    // 序列化简单字符串
    static std::string serializeSimpleString(const std::string& str);

    // 序列化错误
    static std::string serializeError(const std::string& error);

    // 序列化整数
    static std::string serializeInteger(int64_t value);

    // 序列化批量字符串（空字符串也是合法值，不是NULL）
    static std::string serializeBulkString(const std::string& str);

    // 序列化空值
    static std::string serializeNull();

    // 序列化数组
    static std::string serializeArray(const std::vector<std::string>& array);

private:
    static RESPParseResult parseAt(const std::string& data, size_t& pos, RESPReply& reply);

    // 读取直到CRLF，数据不完整时返回false
    static bool readLine(const std::string& data, size_t& pos, std::string& line);

    static bool parseInteger(const std::string& str, int64_t& value);
};

} // namespace tcache
