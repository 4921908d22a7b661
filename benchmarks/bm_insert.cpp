#include <benchmark/benchmark.h>
#include <atomic>
#include <cstdint>
#include <vector>
#include "minhash/core/dataset.hpp"
#include "minhash/hash/family.hpp"
#include "minhash/sketch/atomic_minhash.hpp"
#include "minhash/sketch/minhash.hpp"

using minhash::sketch::AtomicMinHashSketch;
using minhash::sketch::MinHashSketch;

static const std::vector<std::uint64_t>& keys() {
    static const std::vector<std::uint64_t> k = [] {
        std::vector<std::uint64_t> v(1 << 16);
        for (std::size_t i = 0; i < v.size(); ++i) v[i] = minhash::datasets::draw_u64(123, i);
        return v;
    }();
    return k;
}

template <class Word, std::size_t P, class H>
static void BM_Insert(benchmark::State& st) {
    const auto& ks = keys();
    const H h{};
    MinHashSketch<Word, P> s;
    std::size_t i = 0;
    for (auto _ : st) {
        s.insert(ks[i], h);
        i = (i + 1) & (ks.size() - 1);
    }
    benchmark::DoNotOptimize(s);
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK_TEMPLATE(BM_Insert, std::uint64_t, 128, minhash::hashfn::SipHash13)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint64_t, 128, minhash::hashfn::Fnv)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint64_t, 128, minhash::hashfn::RapidHash)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint32_t, 128, minhash::hashfn::SipHash13)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint16_t, 128, minhash::hashfn::SipHash13)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint8_t, 128, minhash::hashfn::SipHash13)->Unit(benchmark::kNanosecond);
BENCHMARK_TEMPLATE(BM_Insert, std::uint64_t, 1024, minhash::hashfn::SipHash13)->Unit(benchmark::kNanosecond);

// Runtime-selected family through IHash, for comparison with the static calls above.
static void BM_InsertDynamic(benchmark::State& st) {
    const auto& ks = keys();
    const auto h = minhash::hashfn::make_hasher(static_cast<minhash::hashfn::HashFamily>(st.range(0)), 1, 2);
    MinHashSketch<std::uint64_t, 128> s;
    std::size_t i = 0;
    for (auto _ : st) {
        s.insert(ks[i], *h);
        i = (i + 1) & (ks.size() - 1);
    }
    benchmark::DoNotOptimize(s);
    st.SetLabel(minhash::hashfn::to_string(static_cast<minhash::hashfn::HashFamily>(st.range(0))));
}
BENCHMARK(BM_InsertDynamic)->DenseRange(0, 4)->Unit(benchmark::kNanosecond);

static void BM_MayContain(benchmark::State& st) {
    const auto& ks = keys();
    MinHashSketch<std::uint64_t, 128> s;
    for (std::size_t i = 0; i < 1000; ++i) s.insert(ks[i]);
    std::size_t i = 0, hits = 0;
    for (auto _ : st) {
        hits += s.may_contain(ks[i]);
        i = (i + 1) & (ks.size() - 1);
    }
    st.counters["hit_rate"] = double(hits) / double(st.iterations());
}
BENCHMARK(BM_MayContain)->Unit(benchmark::kNanosecond);

static void BM_Estimate(benchmark::State& st) {
    const auto& ks = keys();
    MinHashSketch<std::uint64_t, 128> a, b;
    for (std::size_t i = 0; i < 1000; ++i) { a.insert(ks[i]); b.insert(ks[i + 500]); }
    for (auto _ : st) benchmark::DoNotOptimize(a.estimate_jaccard_index(b));
}
BENCHMARK(BM_Estimate)->Unit(benchmark::kNanosecond);

// Shared atomic sketch, one instance across all benchmark threads.
static void BM_FetchInsert(benchmark::State& st) {
    static AtomicMinHashSketch<std::uint64_t, 128> shared;
    const auto& ks = keys();
    std::size_t i = static_cast<std::size_t>(st.thread_index()) * 997;
    for (auto _ : st) {
        shared.fetch_insert(ks[i & (ks.size() - 1)]);
        ++i;
    }
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK(BM_FetchInsert)->ThreadRange(1, 8)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
