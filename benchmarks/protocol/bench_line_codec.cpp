/**
 * @file bench_line_codec.cpp
 * @brief Benchmarks for protocol line encoding, decoding and pipe framing
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_adapter/process/pipe_stream.h>
#include <kcenon/transfer_adapter/protocol/line_codec.h>

#include <string>
#include <thread>

#include <unistd.h>

namespace kcenon::transfer_adapter::benchmark {

namespace {

auto make_upload(std::size_t header_bytes) -> upload_request {
    upload_request request;
    request.oid = std::string(64, 'a');
    request.size = 10 * 1024 * 1024;
    request.path = "/repo/.git/lfs/objects/aa/aa/" + request.oid;
    request.link.href = "https://storage.example.com/objects/" + request.oid;
    request.link.header["Authorization"] = "Bearer " + std::string(header_bytes, 't');
    return request;
}

}  // namespace

/**
 * @brief Encoding an upload request with a growing Authorization header
 */
static void BM_EncodeUploadRequest(::benchmark::State& state) {
    auto request = make_upload(static_cast<std::size_t>(state.range(0)));

    std::size_t bytes = 0;
    for (auto _ : state) {
        auto line = encode_line(request);
        if (!line) {
            state.SkipWithError("encode failed");
            return;
        }
        bytes += line.value().size();
        ::benchmark::DoNotOptimize(line.value());
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}

/**
 * @brief Decoding a progress update, the most frequent response
 */
static void BM_DecodeProgress(::benchmark::State& state) {
    const std::string line =
        R"({"event":"progress","oid":")" + std::string(64, 'b') +
        R"(","bytesSoFar":3145728,"bytesSinceLast":1048576})";

    for (auto _ : state) {
        auto decoded = decode_line<progress_response, transfer_response>(line);
        if (!decoded) {
            state.SkipWithError("decode failed");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Decoding a completion that carries no event tag
 *
 * Candidates are tried in turn until one matches structurally.
 */
static void BM_DecodeUntaggedCompletion(::benchmark::State& state) {
    const std::string line =
        R"({"oid":")" + std::string(64, 'c') + R"(","path":"/tmp/lfs/incoming/object"})";

    for (auto _ : state) {
        auto decoded = decode_line<progress_response, transfer_response>(line);
        ::benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Framing many small lines through a real pipe
 */
static void BM_PipeLineThroughput(::benchmark::State& state) {
    const auto lines_per_batch = static_cast<int>(state.range(0));
    const std::string line =
        R"({"event":"progress","oid":"abc","bytesSoFar":1,"bytesSinceLast":1})"
        "\n";

    int fds[2];
    if (::pipe(fds) != 0) {
        state.SkipWithError("pipe failed");
        return;
    }
    pipe_line_reader reader{unique_fd{fds[0]}};
    pipe_writer writer{unique_fd{fds[1]}};

    for (auto _ : state) {
        std::thread producer([&] {
            for (int i = 0; i < lines_per_batch; ++i) {
                if (!writer.write_all(line)) {
                    return;
                }
            }
        });
        for (int i = 0; i < lines_per_batch; ++i) {
            auto read = reader.read_line();
            if (!read) {
                state.SkipWithError("read failed");
                break;
            }
            ::benchmark::DoNotOptimize(read.value());
        }
        producer.join();
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * lines_per_batch *
                            static_cast<int64_t>(line.size()));
}

BENCHMARK(BM_EncodeUploadRequest)->Arg(16)->Arg(1024)->Arg(64 * 1024);
BENCHMARK(BM_DecodeProgress);
BENCHMARK(BM_DecodeUntaggedCompletion);
BENCHMARK(BM_PipeLineThroughput)->Arg(100)->Arg(10000);

}  // namespace kcenon::transfer_adapter::benchmark
