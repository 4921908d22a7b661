// acc_jaccard.cpp
// MinHash accuracy: estimated vs exact Jaccard index, for every slot width and
// several permutation counts, on pairs of sets with a controlled overlap.
// Output CSV: elements,permutations,word,family,memory,rep,estimate,truth,abserr,micros
//
// Each rep draws a fresh OverlapPair (seed + rep), so unkeyed families vary too.
// Reps are spread over worker threads; each worker buffers its rows.

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "minhash/core/dataset.hpp"
#include "minhash/core/timer.hpp"
#include "minhash/core/word.hpp"
#include "minhash/hash/family.hpp"
#include "minhash/sketch/minhash.hpp"

#ifndef MINHASH_DEFAULT_OUT_DIR
#define MINHASH_DEFAULT_OUT_DIR "."
#endif

namespace {

    struct Job {
        std::size_t elements;
        std::size_t rep;
        const minhash::datasets::OverlapPair* pair;
        const minhash::IHash* hasher;
        const char* family;
    };

    template <class Word, std::size_t P>
    void run_one(const Job& job, double truth, std::ostringstream& buf) {
        double est = 0.0, sec = 0.0;
        {
            minhash::ScopedTimer t(sec);
            minhash::sketch::MinHashSketch<Word, P> a, b;
            for (auto k : job.pair->a()) a.insert(k, *job.hasher);
            for (auto k : job.pair->b()) b.insert(k, *job.hasher);
            est = a.estimate_jaccard_index(b);
        }
        buf << job.elements << "," << P << "," << minhash::word_name<Word>() << "," << job.family << ","
            << minhash::sketch::MinHashSketch<Word, P>::memory() << "," << (job.rep + 1) << ","
            << est << "," << truth << "," << std::fabs(est - truth) << "," << (sec * 1e6) << "\n";
    }

    template <class Word>
    void run_word(const Job& job, double truth, std::ostringstream& buf) {
        run_one<Word, 16>(job, truth, buf);
        run_one<Word, 32>(job, truth, buf);
        run_one<Word, 64>(job, truth, buf);
        run_one<Word, 128>(job, truth, buf);
        run_one<Word, 256>(job, truth, buf);
    }

} // namespace

int main(int argc, char** argv) {
    try {
        std::size_t R = 20;
        std::size_t max_elements = 100'000;
        double shared = 0.5;
        std::uint64_t seed = 0x5EEDull;
        std::uint64_t key0 = 0x0123456789ABCDEFull, key1 = 0xFEDCBA9876543210ull;
        std::string family_name = "sip13";
        std::string outfile = std::string(MINHASH_DEFAULT_OUT_DIR) + "/minhash_accuracy.csv";
        unsigned threads = std::thread::hardware_concurrency(); if (!threads) threads = 4;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() { if (i + 1 < argc) return std::string(argv[++i]); throw std::runtime_error("Missing value for " + a); };
            if (a == "--R") R = std::stoull(next());
            else if (a == "--max-elements") max_elements = std::stoull(next());
            else if (a == "--shared") shared = std::stod(next());
            else if (a == "--seed") seed = std::stoull(next(), nullptr, 0);
            else if (a == "--family") family_name = next();
            else if (a == "--key0") key0 = std::stoull(next(), nullptr, 0);
            else if (a == "--key1") key1 = std::stoull(next(), nullptr, 0);
            else if (a == "--out") outfile = next();
            else if (a == "--threads") threads = (unsigned)std::stoul(next());
            else if (a == "--help" || a == "-h") {
                std::cout << "Usage: acc_jaccard [--R 20] [--max-elements 100000] [--shared 0.5] [--seed S]\n"
                    << "                   [--family sip13|sip13_keyed|fnv|fnv_keyed|rapid] [--key0 K] [--key1 K]\n"
                    << "                   [--out file.csv] [--threads N]\n"
                    << "CSV: elements,permutations,word,family,memory,rep,estimate,truth,abserr,micros\n";
                return 0;
            }
            else throw std::runtime_error("Unknown option " + a);
        }
        if (threads == 0) threads = 1;
        if (shared < 0.0 || shared > 1.0) throw std::invalid_argument("--shared must be in [0,1]");

        const auto family = minhash::hashfn::parse_family(family_name);
        const auto hasher = minhash::hashfn::make_hasher(family, key0, key1);

        std::vector<std::size_t> sizes;
        for (std::size_t n = 100; n <= max_elements; n *= 10) sizes.push_back(n);

        std::cout << "MinHash accuracy, family=" << family_name << "  R=" << R
            << "  shared=" << shared << "  threads=" << threads << "\n"
            << "Writing: " << outfile << "\n";

        std::ofstream out(outfile, std::ios::binary); if (!out) { std::cerr << "Cannot open " << outfile << "\n"; return 1; }
        out.setf(std::ios::fixed); out << std::setprecision(8);
        out << "elements,permutations,word,family,memory,rep,estimate,truth,abserr,micros\n";

        std::mutex file_mtx, cout_mtx;
        std::atomic<std::size_t> done{ 0 };
        const std::size_t total = R * sizes.size();

        auto worker = [&](unsigned tid) {
            std::ostringstream buf;
            buf.setf(std::ios::fixed); buf << std::setprecision(8);
            for (std::size_t r = tid; r < R; r += threads) {
                for (std::size_t n : sizes) {
                    const minhash::datasets::OverlapPair pair(n, shared, seed + r);
                    const double truth = pair.jaccard();
                    const Job job{ n, r, &pair, hasher.get(), minhash::hashfn::to_string(family) };

                    run_word<std::uint8_t>(job, truth, buf);
                    run_word<std::uint16_t>(job, truth, buf);
                    run_word<std::uint32_t>(job, truth, buf);
                    run_word<std::uint64_t>(job, truth, buf);

                    const std::size_t k = done.fetch_add(1, std::memory_order_relaxed) + 1;
                    std::lock_guard<std::mutex> io(cout_mtx);
                    std::cout << "  job " << k << " / " << total
                        << " (" << (100.0 * double(k) / double(total)) << "%)\r" << std::flush;
                }
            }
            std::lock_guard<std::mutex> g(file_mtx);
            out << buf.str();
            };

        std::vector<std::thread> pool; pool.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) pool.emplace_back(worker, t);
        for (auto& th : pool) th.join();

        { std::lock_guard<std::mutex> io(cout_mtx); std::cout << "\n"; }
        if (!out) { std::cerr << "Write failed: " << outfile << "\n"; return 1; }
        std::cout << "Done.\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
