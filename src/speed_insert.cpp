// speed_insert.cpp
// Insertion throughput of the MinHash sketches (P = 128).
//   serial     : MinHashSketch::insert, every hash family x {u32, u64}, `loops` passes
//   concurrent : AtomicMinHashSketch::fetch_insert from 1, 2, 4, ... T pinned threads
// Output CSV: mode,family,word,permutations,threads,seconds,ns_per_insert,checksum
//
// The checksum folds the final sketch so the work cannot be optimized away.

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "minhash/core/affinity.hpp"
#include "minhash/core/dataset.hpp"
#include "minhash/core/timer.hpp"
#include "minhash/core/word.hpp"
#include "minhash/hash/family.hpp"
#include "minhash/sketch/atomic_minhash.hpp"
#include "minhash/sketch/minhash.hpp"

#ifndef MINHASH_DEFAULT_OUT_DIR
#define MINHASH_DEFAULT_OUT_DIR "."
#endif

namespace {

    constexpr std::size_t PERMS = 128;

    template <class Sketch>
    std::uint64_t fold(const Sketch& s) {
        std::uint64_t c = 0;
        for (auto w : s) c = (c * 31) ^ std::uint64_t(w);
        return c;
    }

    struct Row {
        std::string mode, family, word;
        unsigned threads;
        double seconds;
        std::uint64_t checksum;
    };

    template <class Word>
    Row time_serial(const std::vector<std::uint64_t>& keys, std::size_t loops,
        minhash::hashfn::HashFamily f, const minhash::IHash& h) {
        std::uint64_t checksum = 0;
        double sec = 0.0;
        {
            minhash::ScopedTimer t(sec);
            for (std::size_t L = 0; L < loops; ++L) {
                minhash::sketch::MinHashSketch<Word, PERMS> s;
                for (auto k : keys) s.insert(k, h);
                checksum ^= fold(s);
            }
        }
        return { "serial", minhash::hashfn::to_string(f), minhash::word_name<Word>(), 1, sec, checksum };
    }

    Row time_concurrent(const std::vector<std::uint64_t>& keys, std::size_t loops, unsigned threads,
        minhash::hashfn::HashFamily f, const minhash::IHash& h) {
        std::uint64_t checksum = 0;
        double sec = 0.0;
        {
            minhash::ScopedTimer t(sec);
            for (std::size_t L = 0; L < loops; ++L) {
                minhash::sketch::AtomicMinHashSketch<std::uint64_t, PERMS> s;
                std::vector<std::thread> pool; pool.reserve(threads);
                for (unsigned tid = 0; tid < threads; ++tid) {
                    pool.emplace_back([&, tid] {
                        minhash::pin_current_thread_to_core(tid);
                        for (std::size_t i = tid; i < keys.size(); i += threads) s.fetch_insert(keys[i], h);
                        });
                }
                for (auto& th : pool) th.join();
                checksum ^= fold(s.snapshot());
            }
        }
        return { "concurrent", minhash::hashfn::to_string(f), "u64", threads, sec, checksum };
    }

} // namespace

int main(int argc, char** argv) {
    try {
        std::size_t N = 1'000'000;
        std::size_t loops = 5;
        std::uint64_t key0 = 0x0123456789ABCDEFull, key1 = 0xFEDCBA9876543210ull;
        std::string outfile = std::string(MINHASH_DEFAULT_OUT_DIR) + "/minhash_speed.csv";
        unsigned max_threads = std::thread::hardware_concurrency(); if (!max_threads) max_threads = 4;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() { if (i + 1 < argc) return std::string(argv[++i]); throw std::runtime_error("missing value for " + a); };
            if (a == "--elements") N = std::stoull(next());
            else if (a == "--loops") loops = std::stoull(next());
            else if (a == "--key0") key0 = std::stoull(next(), nullptr, 0);
            else if (a == "--key1") key1 = std::stoull(next(), nullptr, 0);
            else if (a == "--threads") max_threads = (unsigned)std::stoul(next());
            else if (a == "--out") outfile = next();
            else if (a == "--help" || a == "-h") {
                std::cout << "Usage: speed_insert [--elements N] [--loops L] [--threads T] [--key0 K] [--key1 K] [--out file.csv]\n"
                    << "CSV: mode,family,word,permutations,threads,seconds,ns_per_insert,checksum\n";
                return 0;
            }
            else throw std::runtime_error("unknown option " + a);
        }
        if (loops == 0 || N == 0) throw std::invalid_argument("--elements and --loops must be > 0");
        if (max_threads == 0) max_threads = 1;

        std::vector<std::uint64_t> keys(N);
        for (std::size_t i = 0; i < N; ++i) keys[i] = minhash::datasets::draw_u64(0xA5A5A5A5ull, i);
        std::cout << "keys: " << N << "  loops=" << loops << "  P=" << PERMS << "  max threads=" << max_threads << "\n";

        std::vector<Row> rows;
        for (auto f : minhash::hashfn::ALL_FAMILIES) {
            const auto h = minhash::hashfn::make_hasher(f, key0, key1);
            rows.push_back(time_serial<std::uint32_t>(keys, loops, f, *h));
            rows.push_back(time_serial<std::uint64_t>(keys, loops, f, *h));
            for (unsigned t = 1; t <= max_threads; t *= 2) rows.push_back(time_concurrent(keys, loops, t, f, *h));
            std::cout << "  " << minhash::hashfn::to_string(f) << " done\n";
        }

        std::ofstream out(outfile); if (!out) { std::cerr << "Cannot open " << outfile << "\n"; return 1; }
        out.setf(std::ios::fixed); out << std::setprecision(6);
        out << "mode,family,word,permutations,threads,seconds,ns_per_insert,checksum\n";
        const double inserts = double(N) * double(loops);
        for (const auto& r : rows) {
            out << r.mode << "," << r.family << "," << r.word << "," << PERMS << "," << r.threads << ","
                << r.seconds << "," << (r.seconds * 1e9 / inserts) << "," << r.checksum << "\n";
            std::cout << std::left << std::setw(11) << r.mode << std::setw(13) << r.family << std::setw(5) << r.word
                << " threads=" << std::setw(3) << r.threads << std::right << std::fixed << std::setprecision(2)
                << (r.seconds * 1e9 / inserts) << " ns/insert\n";
        }
        std::cout << "Wrote " << outfile << "\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
