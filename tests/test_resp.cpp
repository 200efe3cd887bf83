#include <gtest/gtest.h>
#include "net/tcache_resp.hpp"

using namespace tcache;

TEST(RESPTest, SerializeCommand) {
    EXPECT_EQ(RESPProtocol::serializeCommand({"SET", "key", "value"}),
              "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n");
    // 空字符串编码为长度0的批量字符串
    EXPECT_EQ(RESPProtocol::serializeCommand({"SET", "k", ""}),
              "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
}

TEST(RESPTest, ParseScalarReplies) {
    RESPReply reply;
    size_t pos = 0;

    std::string ok = RESPProtocol::serializeSimpleString("OK");
    ASSERT_EQ(RESPProtocol::parseReply(ok, pos, reply), RESPParseResult::OK);
    EXPECT_TRUE(reply.isOk());
    EXPECT_EQ(pos, ok.size());

    pos = 0;
    std::string error = RESPProtocol::serializeError("ERR wrong type");
    ASSERT_EQ(RESPProtocol::parseReply(error, pos, reply), RESPParseResult::OK);
    EXPECT_TRUE(reply.isError());
    EXPECT_EQ(reply.str, "ERR wrong type");

    pos = 0;
    std::string integer = RESPProtocol::serializeInteger(-12);
    ASSERT_EQ(RESPProtocol::parseReply(integer, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.type, RESPType::INTEGER);
    EXPECT_EQ(reply.integer, -12);
}

TEST(RESPTest, ParseBulkStrings) {
    RESPReply reply;
    size_t pos = 0;

    // 值中可以包含CRLF
    std::string bulk = RESPProtocol::serializeBulkString("a\r\nb");
    ASSERT_EQ(RESPProtocol::parseReply(bulk, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.type, RESPType::BULK_STRING);
    EXPECT_EQ(reply.str, "a\r\nb");
    EXPECT_FALSE(reply.isNull());

    pos = 0;
    std::string empty = RESPProtocol::serializeBulkString("");
    ASSERT_EQ(RESPProtocol::parseReply(empty, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.str, "");
    EXPECT_FALSE(reply.isNull());

    pos = 0;
    std::string null = RESPProtocol::serializeNull();
    ASSERT_EQ(RESPProtocol::parseReply(null, pos, reply), RESPParseResult::OK);
    EXPECT_TRUE(reply.isNull());
}

TEST(RESPTest, ParseArrays) {
    // MGET的回复：值、NULL、值
    std::string data = "*3\r\n$1\r\na\r\n$-1\r\n$1\r\nc\r\n";
    RESPReply reply;
    size_t pos = 0;
    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    ASSERT_EQ(reply.elements.size(), 3u);
    EXPECT_EQ(reply.elements[0].str, "a");
    EXPECT_TRUE(reply.elements[1].isNull());
    EXPECT_EQ(reply.elements[2].str, "c");

    // EXEC的回复：嵌套不同类型
    data = "*2\r\n+OK\r\n:1\r\n";
    pos = 0;
    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    ASSERT_EQ(reply.elements.size(), 2u);
    EXPECT_TRUE(reply.elements[0].isOk());
    EXPECT_EQ(reply.elements[1].integer, 1);

    // WATCH的键被修改后EXEC返回NULL数组
    data = "*-1\r\n";
    pos = 0;
    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.type, RESPType::ARRAY);
    EXPECT_TRUE(reply.isNull());
}

// 数据不完整时不移动位置，补全后可以继续解析
TEST(RESPTest, IncompleteInput) {
    std::string full = "*2\r\n$5\r\nhello\r\n$5\r\nworld\r\n";
    RESPReply reply;

    for (size_t cut = 0; cut < full.size(); cut++) {
        size_t pos = 0;
        EXPECT_EQ(RESPProtocol::parseReply(full.substr(0, cut), pos, reply), RESPParseResult::INCOMPLETE)
            << "cut at " << cut;
        EXPECT_EQ(pos, 0u);
    }

    size_t pos = 0;
    ASSERT_EQ(RESPProtocol::parseReply(full, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.elements[1].str, "world");
}

TEST(RESPTest, ConsecutiveReplies) {
    std::string data = "+QUEUED\r\n+QUEUED\r\n:3\r\n";
    RESPReply reply;
    size_t pos = 0;

    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.str, "QUEUED");
    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.str, "QUEUED");
    ASSERT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::OK);
    EXPECT_EQ(reply.integer, 3);
    EXPECT_EQ(pos, data.size());
    EXPECT_EQ(RESPProtocol::parseReply(data, pos, reply), RESPParseResult::INCOMPLETE);
}

TEST(RESPTest, MalformedInput) {
    RESPReply reply;
    size_t pos = 0;
    EXPECT_EQ(RESPProtocol::parseReply("?what\r\n", pos, reply), RESPParseResult::ERROR);

    pos = 0;
    EXPECT_EQ(RESPProtocol::parseReply(":12x\r\n", pos, reply), RESPParseResult::ERROR);

    pos = 0;
    EXPECT_EQ(RESPProtocol::parseReply("$-2\r\n", pos, reply), RESPParseResult::ERROR);

    // 长度与内容不符
    pos = 0;
    EXPECT_EQ(RESPProtocol::parseReply("$2\r\nabc\r\n", pos, reply), RESPParseResult::ERROR);
}
