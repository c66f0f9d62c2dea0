/**
 * @file bench_messages.cpp
 * @brief Benchmarks for message JSON conversion and object hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_adapter/core/checksum.h>
#include <kcenon/transfer_adapter/protocol/messages.h>

#include <nlohmann/json.hpp>

#include <random>
#include <string>

namespace kcenon::transfer_adapter::benchmark {

/**
 * @brief Converting a download request with N action headers to JSON
 */
static void BM_DownloadRequestToJson(::benchmark::State& state) {
    download_request request;
    request.oid = std::string(64, 'd');
    request.size = 1 << 20;
    request.link.href = "https://storage.example.com/" + request.oid;
    for (int64_t i = 0; i < state.range(0); ++i) {
        request.link.header["X-Header-" + std::to_string(i)] = "value-" + std::to_string(i);
    }

    for (auto _ : state) {
        nlohmann::json j = request;
        ::benchmark::DoNotOptimize(j);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Reading a completion with an embedded error from JSON
 */
static void BM_TransferResponseFromJson(::benchmark::State& state) {
    auto j = nlohmann::json::parse(
        R"({"event":"complete","oid":"abc","error":{"code":2,"message":"Explosion!"}})");

    for (auto _ : state) {
        auto response = j.get<transfer_response>();
        ::benchmark::DoNotOptimize(response);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief SHA-256 over object content, as used for download verification
 */
static void BM_Sha256(::benchmark::State& state) {
    std::string data(static_cast<std::size_t>(state.range(0)), '\0');
    std::mt19937 gen(42);
    for (auto& c : data) {
        c = static_cast<char>(gen() & 0xff);
    }

    for (auto _ : state) {
        sha256_hasher hasher;
        hasher.update(std::string_view(data));
        auto digest = hasher.finish();
        ::benchmark::DoNotOptimize(digest);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

BENCHMARK(BM_DownloadRequestToJson)->Arg(1)->Arg(16);
BENCHMARK(BM_TransferResponseFromJson);
BENCHMARK(BM_Sha256)->Arg(4 * 1024)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024);

}  // namespace kcenon::transfer_adapter::benchmark
