#include <benchmark/benchmark.h>
#include "toolwire/framing.hpp"
#include <string>

using namespace toolwire;

static const std::string kBody =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"say_hello","arguments":{"name":"Ada"}}})";

static std::string make_stream(Framing framing, int frames) {
    std::string out;
    for (int i = 0; i < frames; ++i) out += encode_frame(kBody, framing);
    return out;
}

// Feeds the stream in chunks of state.range(0) bytes, as a pipe would.
static void decode_stream(benchmark::State& state, Framing framing) {
    const std::string stream = make_stream(framing, 1000);
    const size_t chunk = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        FrameDecoder decoder(framing);
        size_t frames = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            decoder.feed(std::string_view(stream).substr(off, chunk));
            while (auto f = decoder.next()) {
                benchmark::DoNotOptimize(f);
                ++frames;
            }
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}

static void BM_DecodeNewline(benchmark::State& state) {
    decode_stream(state, Framing::Newline);
}
BENCHMARK(BM_DecodeNewline)->Arg(64)->Arg(4096);

static void BM_DecodeContentLength(benchmark::State& state) {
    decode_stream(state, Framing::ContentLength);
}
BENCHMARK(BM_DecodeContentLength)->Arg(64)->Arg(4096);

static void BM_EncodeContentLength(benchmark::State& state) {
    for (auto _ : state) {
        auto frame = encode_frame(kBody, Framing::ContentLength);
        benchmark::DoNotOptimize(frame);
    }
}
BENCHMARK(BM_EncodeContentLength);
