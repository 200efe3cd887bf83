#include "transaction/tcache_transaction.hpp"
#include "storage/tcache_memory_store.hpp"
#include "tcache_logger.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>
using namespace std;

namespace tcache {

// Google Benchmark的通用设置类
class TransactionBenchmark : public ::benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        cache_ = make_unique<MemoryStore>();

        // 初始化一些数据用于GET测试
        for (int i = 0; i < 1000; ++i) {
            cache_->set("bench_key_" + to_string(i), "value_" + to_string(i));
        }
    }

    void TearDown(const ::benchmark::State& state) override {
        cache_.reset();
    }

protected:
    unique_ptr<MemoryStore> cache_;
};

// 直接读取后端，作为基线
BENCHMARK_F(TransactionBenchmark, BM_BackendGet)(benchmark::State& state) {
    Value value;
    int64_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cache_->get("bench_key_" + to_string(i++ % 1000), value));
    }
}

// 事务内读取：回退到后端并签发令牌
BENCHMARK_F(TransactionBenchmark, BM_TransactionGet)(benchmark::State& state) {
    BufferStore buffer;
    Transaction tx(buffer, *cache_);
    Value value;
    int64_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(tx.get("bench_key_" + to_string(i++ % 1000), value));
    }
    tx.rollback();
}

// 每次迭代一个事务：写入若干键并提交
BENCHMARK_F(TransactionBenchmark, BM_TransactionCommit)(benchmark::State& state) {
    BufferStore buffer;
    Transaction tx(buffer, *cache_);
    int64_t i = 0;
    for (auto _ : state) {
        for (int j = 0; j < 10; ++j) {
            tx.set("bench_key_" + to_string((i + j) % 1000), "new_value");
        }
        benchmark::DoNotOptimize(tx.commit());
        ++i;
    }
}

// 读取后CAS并提交，提交时需要重新读取后端
BENCHMARK_F(TransactionBenchmark, BM_TransactionCas)(benchmark::State& state) {
    BufferStore buffer;
    Transaction tx(buffer, *cache_);
    Value value;
    CasToken token;
    int64_t i = 0;
    for (auto _ : state) {
        string key = "bench_key_" + to_string(i++ % 1000);
        tx.get(key, value, &token);
        tx.cas(token, key, "cas_value");
        benchmark::DoNotOptimize(tx.commit());
    }
}

} // namespace tcache

BENCHMARK_MAIN();
