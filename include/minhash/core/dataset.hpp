#pragma once
// Deterministic synthetic sets for the drivers and tests.
//   - OverlapPair: two sets of 64-bit keys with a controlled shared fraction.
//   - populate_set: up to n keys drawn from [0, n) by a splitmix/xorshift walk.
//   - jaccard_true: exact |A n B| / |A u B| over distinct keys.

#include <cstdint>
#include <cstddef>
#include <vector>
#include <unordered_set>
#include <stdexcept>

#include "minhash/core/splitmix.hpp"
#include "minhash/core/word.hpp"

namespace minhash::datasets {

    // Counter-mode splitmix: the i-th draw of stream 'seed'.
    inline std::uint64_t draw_u64(std::uint64_t seed, std::uint64_t i) {
        return splitmix(seed + (i + 1) * GOLDEN_GAMMA);
    }

    class OverlapPair {
    public:
        // n keys per side; round(n * shared) keys appear on both sides.
        OverlapPair(std::size_t n, double shared, std::uint64_t seed) {
            if (shared < 0.0 || shared > 1.0) throw std::invalid_argument("OverlapPair: shared must be in [0,1]");
            const std::size_t common = static_cast<std::size_t>(double(n) * shared + 0.5);
            const std::size_t own = n - common;

            std::unordered_set<std::uint64_t> seen;
            seen.reserve(2 * n);
            std::uint64_t i = 0;
            auto fresh = [&]() {
                for (;;) {
                    const std::uint64_t k = draw_u64(seed, i++);
                    if (seen.insert(k).second) return k;
                }
                };

            A_.reserve(n); B_.reserve(n);
            for (std::size_t j = 0; j < common; ++j) { const auto k = fresh(); A_.push_back(k); B_.push_back(k); }
            for (std::size_t j = 0; j < own; ++j) A_.push_back(fresh());
            for (std::size_t j = 0; j < own; ++j) B_.push_back(fresh());
            common_ = common;
        }

        const std::vector<std::uint64_t>& a() const { return A_; }
        const std::vector<std::uint64_t>& b() const { return B_; }
        std::size_t common() const { return common_; }

        // Keys are distinct by construction, so the exact index is closed-form.
        double jaccard() const {
            const std::size_t uni = A_.size() + B_.size() - common_;
            return uni ? double(common_) / double(uni) : 1.0;
        }

    private:
        std::vector<std::uint64_t> A_, B_;
        std::size_t common_ = 0;
    };

    inline std::unordered_set<std::uint64_t> populate_set(std::size_t elements, std::uint64_t state) {
        std::unordered_set<std::uint64_t> out;
        if (elements == 0) return out;
        out.reserve(elements);
        state = splitmix(state);
        for (std::size_t i = 0; i < elements; ++i) {
            state = WordTraits<std::uint64_t>::advance(state);
            out.insert(state % elements);
        }
        return out;
    }

    template <class Set>
    double jaccard_true(const Set& A, const Set& B) {
        std::size_t inter = 0;
        if (A.size() < B.size()) { for (auto& k : A) inter += B.count(k); }
        else { for (auto& k : B) inter += A.count(k); }
        const std::size_t uni = A.size() + B.size() - inter;
        return uni ? double(inter) / double(uni) : 1.0;
    }

} // namespace minhash::datasets
