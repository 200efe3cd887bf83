#include <gtest/gtest.h>
#include "storage/tcache_redis_store.hpp"
#include "transaction/tcache_transaction.hpp"
#include "tcache_logger.hpp"
#include "net/tcache_resp.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

using namespace tcache;

// 需要一个可写的Redis实例：TCACHE_REDIS_HOST=127.0.0.1 [TCACHE_REDIS_PORT=6379]
// 测试会执行FLUSHALL，不要指向生产实例
class RedisStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::CRITICAL);

        const char* host = std::getenv("TCACHE_REDIS_HOST");
        if (host == nullptr) {
            GTEST_SKIP() << "未设置TCACHE_REDIS_HOST，跳过Redis测试";
        }
        const char* port = std::getenv("TCACHE_REDIS_PORT");
        store_ = std::make_unique<RedisStore>(host, port ? std::atoi(port) : 6379);
        ASSERT_TRUE(store_->connect());
        ASSERT_TRUE(store_->flush());
    }

    std::unique_ptr<RedisStore> store_;
};

// 本地回环上按脚本依次回复的RESP服务端，只接受一个连接
class ScriptedRedisServer {
public:
    explicit ScriptedRedisServer(std::vector<std::string> replies)
        : replies_(std::move(replies)), next_(0), port_(0), client_fd_(-1) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int reuse = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) == 0 && listen(listen_fd_, 1) == 0) {
            socklen_t len = sizeof(addr);
            getsockname(listen_fd_, (struct sockaddr*)&addr, &len);
            port_ = ntohs(addr.sin_port);
        }
        thread_ = std::thread([this]() { serve(); });
    }

    ~ScriptedRedisServer() {
        shutdown(listen_fd_, SHUT_RDWR);
        int client = client_fd_.load();
        if (client >= 0) {
            shutdown(client, SHUT_RDWR);
        }
        thread_.join();
        close(listen_fd_);
    }

    int port() const { return port_; }

    std::vector<std::vector<std::string>> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    void serve() {
        int fd = accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            return;
        }
        client_fd_ = fd;

        std::string buffer;
        char chunk[4096];
        while (true) {
            size_t pos = 0;
            RESPReply command;
            RESPParseResult result = RESPProtocol::parseReply(buffer, pos, command);
            if (result == RESPParseResult::ERROR) {
                break;
            }
            if (result == RESPParseResult::OK) {
                buffer.erase(0, pos);
                std::string reply;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    std::vector<std::string> args;
                    for (const auto& element : command.elements) {
                        args.push_back(element.str);
                    }
                    received_.push_back(args);
                    reply = next_ < replies_.size() ? replies_[next_++]
                                                    : RESPProtocol::serializeError("ERR unexpected command");
                }
                if (send(fd, reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
                    break;
                }
                continue;
            }

            ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<size_t>(n));
        }
        client_fd_ = -1;
        close(fd);
    }

    std::vector<std::string> replies_;
    size_t next_;
    int port_;
    int listen_fd_;
    std::atomic<int> client_fd_;
    std::mutex mutex_;
    std::vector<std::vector<std::string>> received_;
    std::thread thread_;
};

using Commands = std::vector<std::vector<std::string>>;

class RedisStoreScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::CRITICAL);
    }

    static std::string ok() { return RESPProtocol::serializeSimpleString("OK"); }
    static std::string queued() { return RESPProtocol::serializeSimpleString("QUEUED"); }
};

TEST_F(RedisStoreScriptTest, CasMismatchUnwatches) {
    ScriptedRedisServer server({ok(), RESPProtocol::serializeBulkString("other"), ok()});
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    EXPECT_FALSE(store.cas("expected", "k", "v"));
    store.disconnect();

    Commands expected = {{"WATCH", "k"}, {"GET", "k"}, {"UNWATCH"}};
    EXPECT_EQ(server.received(), expected);
}

// 排队的命令出错时要DISCARD，后续命令不能被排进MULTI
TEST_F(RedisStoreScriptTest, CasQueueErrorDiscards) {
    ScriptedRedisServer server({
        ok(),
        RESPProtocol::serializeBulkString("expected"),
        ok(),
        RESPProtocol::serializeError("ERR syntax error"),
        ok(),
        RESPProtocol::serializeBulkString("after"),
    });
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    EXPECT_FALSE(store.cas("expected", "k", "v"));
    Value value;
    EXPECT_TRUE(store.get("other", value));
    EXPECT_EQ(value, "after");
    store.disconnect();

    Commands expected = {
        {"WATCH", "k"}, {"GET", "k"}, {"MULTI"}, {"SET", "k", "v"}, {"DISCARD"}, {"GET", "other"}};
    EXPECT_EQ(server.received(), expected);
}

TEST_F(RedisStoreScriptTest, IncrementQueueErrorDiscards) {
    ScriptedRedisServer server({
        ok(),
        RESPProtocol::serializeBulkString("5"),
        ok(),
        RESPProtocol::serializeError("ERR syntax error"),
        ok(),
    });
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    int64_t result = 0;
    EXPECT_FALSE(store.increment("n", 1, 0, EXPIRE_NEVER, result));
    store.disconnect();

    Commands commands = server.received();
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[3], (std::vector<std::string>{"SET", "n", "6"}));
    EXPECT_EQ(commands[4], (std::vector<std::string>{"DISCARD"}));
}

// 被WATCH的键被并发修改时EXEC回复NULL数组
TEST_F(RedisStoreScriptTest, IncrementFailsOnNullExec) {
    ScriptedRedisServer server({ok(), RESPProtocol::serializeBulkString("5"), ok(), queued(), "*-1\r\n"});
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    int64_t result = -1;
    EXPECT_FALSE(store.increment("n", 1, 0, EXPIRE_NEVER, result));
    EXPECT_EQ(result, -1);
    store.disconnect();

    Commands commands = server.received();
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[3], (std::vector<std::string>{"SET", "n", "6"}));
    EXPECT_EQ(commands[4], (std::vector<std::string>{"EXEC"}));
}

TEST_F(RedisStoreScriptTest, IncrementMissingKeyStoresInitial) {
    ScriptedRedisServer server({ok(), RESPProtocol::serializeNull(), ok(), queued(), "*1\r\n+OK\r\n"});
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    int64_t result = 0;
    EXPECT_TRUE(store.decrement("n", INT64_MAX, 7, EXPIRE_NEVER, result));
    EXPECT_EQ(result, 7);
    store.disconnect();

    Commands commands = server.received();
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[3], (std::vector<std::string>{"SET", "n", "7"}));
}

TEST_F(RedisStoreScriptTest, IncrementOverflowUnwatches) {
    ScriptedRedisServer server({ok(), RESPProtocol::serializeBulkString("9223372036854775807"), ok()});
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    int64_t result = 0;
    EXPECT_FALSE(store.increment("n", 1, 0, EXPIRE_NEVER, result));
    store.disconnect();

    Commands expected = {{"WATCH", "n"}, {"GET", "n"}, {"UNWATCH"}};
    EXPECT_EQ(server.received(), expected);
}

// 已过期的add/replace只检查存在性，不写入
TEST_F(RedisStoreScriptTest, ExpiredAddAndReplaceCheckExistence) {
    ScriptedRedisServer server({
        RESPProtocol::serializeInteger(1),
        RESPProtocol::serializeInteger(0),
        RESPProtocol::serializeInteger(1),
        RESPProtocol::serializeInteger(1),
        RESPProtocol::serializeInteger(0),
    });
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    EXPECT_FALSE(store.add("a", "1", -1));
    EXPECT_TRUE(store.add("a", "1", -1));
    EXPECT_TRUE(store.replace("a", "1", -1));
    EXPECT_FALSE(store.replace("a", "1", -1));
    store.disconnect();

    Commands expected = {{"EXISTS", "a"}, {"EXISTS", "a"}, {"EXISTS", "a"}, {"DEL", "a"}, {"EXISTS", "a"}};
    EXPECT_EQ(server.received(), expected);
}

TEST_F(RedisStoreScriptTest, DelMultiReportsExistence) {
    ScriptedRedisServer server({"*2\r\n$1\r\n1\r\n$-1\r\n", RESPProtocol::serializeInteger(1)});
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    auto deleted = store.delMulti({"a", "b"});
    EXPECT_TRUE(deleted["a"]);
    EXPECT_FALSE(deleted["b"]);
    store.disconnect();

    Commands expected = {{"MGET", "a", "b"}, {"DEL", "a", "b"}};
    EXPECT_EQ(server.received(), expected);
}

TEST_F(RedisStoreScriptTest, SetMultiWithExpiryDiscardsOnError) {
    ScriptedRedisServer server({
        ok(),
        queued(),
        RESPProtocol::serializeError("ERR value is not an integer"),
        ok(),
    });
    RedisStore store("127.0.0.1", server.port());
    ASSERT_TRUE(store.connect());

    auto stored = store.setMulti({{"a", "1"}, {"b", "2"}}, 100);
    EXPECT_FALSE(stored["a"]);
    EXPECT_FALSE(stored["b"]);
    store.disconnect();

    Commands expected = {
        {"MULTI"}, {"MSET", "a", "1", "b", "2"}, {"EXPIRE", "a", "100"}, {"DISCARD"}};
    EXPECT_EQ(server.received(), expected);
}

TEST(RedisStoreOfflineTest, ConnectFailureIsReported) {
    Logger::getInstance().setLogLevel(LogLevel::CRITICAL);

    // 端口1上通常没有服务监听
    RedisStore store("127.0.0.1", 1, 200);
    EXPECT_FALSE(store.connect());
    EXPECT_FALSE(store.isConnected());

    Value value;
    EXPECT_FALSE(store.get("a", value));
    EXPECT_FALSE(store.set("a", "1"));
}

TEST_F(RedisStoreTest, SetGetDelete) {
    Value value;
    CasToken token;
    EXPECT_FALSE(store_->get("a", value));

    EXPECT_TRUE(store_->set("a", "hello world"));
    EXPECT_TRUE(store_->get("a", value, &token));
    EXPECT_EQ(value, "hello world");
    EXPECT_EQ(token, "hello world");

    EXPECT_TRUE(store_->del("a"));
    EXPECT_FALSE(store_->del("a"));
}

TEST_F(RedisStoreTest, MultiOperations) {
    auto stored = store_->setMulti({{"a", "1"}, {"b", "2"}}, 100);
    EXPECT_TRUE(stored["a"]);
    EXPECT_TRUE(stored["b"]);

    auto values = store_->getMulti({"a", "b", "c"});
    EXPECT_EQ(values.size(), 2u);
    EXPECT_EQ(values["a"], "1");

    auto deleted = store_->delMulti({"a", "c"});
    EXPECT_TRUE(deleted["a"]);
    EXPECT_FALSE(deleted["c"]);
}

TEST_F(RedisStoreTest, AddReplaceAndExpiry) {
    EXPECT_FALSE(store_->replace("a", "1"));
    EXPECT_TRUE(store_->add("a", "1", 60));
    EXPECT_FALSE(store_->add("a", "2"));
    EXPECT_TRUE(store_->replace("a", "3"));

    // 已过期的写入等同于删除
    EXPECT_TRUE(store_->set("a", "4", -1));
    Value value;
    EXPECT_FALSE(store_->get("a", value));

    store_->set("b", "1");
    EXPECT_TRUE(store_->touch("b", 60));
    EXPECT_TRUE(store_->touch("b", -1));
    EXPECT_FALSE(store_->touch("b", 60));
}

TEST_F(RedisStoreTest, CasAndCounters) {
    store_->set("a", "1");

    Value value;
    CasToken token;
    ASSERT_TRUE(store_->get("a", value, &token));
    EXPECT_TRUE(store_->cas(token, "a", "2"));
    EXPECT_FALSE(store_->cas(token, "a", "3"));
    EXPECT_FALSE(store_->cas(token, "missing", "3"));

    int64_t result = 0;
    EXPECT_TRUE(store_->increment("n", 5, 10, EXPIRE_NEVER, result));
    EXPECT_EQ(result, 10);
    EXPECT_TRUE(store_->increment("n", 5, 10, EXPIRE_NEVER, result));
    EXPECT_EQ(result, 15);
    EXPECT_TRUE(store_->decrement("n", 100, 0, EXPIRE_NEVER, result));
    EXPECT_EQ(result, 0);

    store_->set("s", "text");
    EXPECT_FALSE(store_->increment("s", 1, 0, EXPIRE_NEVER, result));
}

// 事务在Redis后端上的完整提交流程
TEST_F(RedisStoreTest, TransactionCommit) {
    store_->set("a", "1");

    BufferStore buffer;
    Transaction tx(buffer, *store_);
    Value value;
    CasToken token;
    ASSERT_TRUE(tx.get("a", value, &token));
    EXPECT_TRUE(tx.cas(token, "a", "2"));
    EXPECT_TRUE(tx.set("b", "3"));
    EXPECT_TRUE(tx.commit());

    EXPECT_TRUE(store_->get("a", value));
    EXPECT_EQ(value, "2");
    EXPECT_TRUE(store_->get("b", value));
    EXPECT_EQ(value, "3");
}
