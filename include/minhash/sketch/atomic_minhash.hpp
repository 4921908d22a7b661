#pragma once
// AtomicMinHashSketch<Word, P>: MinHashSketch whose slots are independent atomics.
//
// Any number of threads may fetch_insert into the same instance without a lock.
// Each slot is reduced with an atomic fetch-min; min is commutative, associative
// and idempotent, so every interleaving ends in the state a sequential insertion
// of the same values would produce. There is no ordering between slots.
//
// The caller picks the memory order. Relaxed is enough for the reduction itself;
// use something stronger only to order the sketch against other program state.
// Merge and estimation go through snapshot() and must not race with writers.

#include <array>
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

#include "minhash/core/word.hpp"
#include "minhash/core/permutation.hpp"
#include "minhash/hash/bytes.hpp"
#include "minhash/hash/siphash13.hpp"
#include "minhash/hash/fnv.hpp"
#include "minhash/sketch/minhash.hpp"

namespace minhash::sketch {

    template <class Word, std::size_t P>
    class AtomicMinHashSketch {
    public:
        using word_type = Word;
        using traits = WordTraits<Word>;
        using stream_type = PermutationStream<Word, P>;
        using plain_type = MinHashSketch<Word, P>;

        static_assert(std::atomic<Word>::is_always_lock_free, "slot words must be lock-free atomics");

        static constexpr std::size_t PERMUTATIONS = P;

        AtomicMinHashSketch() noexcept {
            for (auto& w : words_) w.store(traits::max(), std::memory_order_relaxed);
        }

        explicit AtomicMinHashSketch(const plain_type& from) noexcept {
            for (std::size_t i = 0; i < P; ++i) words_[i].store(from[i], std::memory_order_relaxed);
        }

        AtomicMinHashSketch(const AtomicMinHashSketch&) = delete;
        AtomicMinHashSketch& operator=(const AtomicMinHashSketch&) = delete;

        // Atomic slot = min(slot, value). Returns the value held before the call.
        // When the slot is already <= value nothing is written.
        MINHASH_FORCEINLINE Word fetch_min(std::size_t i, Word value, std::memory_order order = std::memory_order_relaxed) noexcept {
            Word prev = words_[i].load(std::memory_order_relaxed);
            while (value < prev && !words_[i].compare_exchange_weak(prev, value, order)) {
            }
            return prev;
        }

        // ---- concurrent insertion ------------------------------------------

        void fetch_insert_seed(std::uint64_t seed, std::memory_order order = std::memory_order_relaxed) noexcept {
            stream_type(seed).for_each([this, order](std::size_t i, Word h) { fetch_min(i, h, order); });
        }

        template <class T, class H = hashfn::SipHash13>
        void fetch_insert(const T& value, const H& hasher = H{}, std::memory_order order = std::memory_order_relaxed) {
            fetch_insert_seed(hash_value(hasher, value), order);
        }

        template <class T>
        void fetch_insert_sip13(const T& value, std::memory_order order = std::memory_order_relaxed) {
            fetch_insert(value, hashfn::SipHash13{}, order);
        }

        template <class T>
        void fetch_insert_sip13(const T& value, std::uint64_t k0, std::uint64_t k1,
            std::memory_order order = std::memory_order_relaxed) {
            fetch_insert(value, hashfn::SipHash13(k0, k1), order);
        }

        template <class T>
        void fetch_insert_fnv(const T& value, std::memory_order order = std::memory_order_relaxed) {
            fetch_insert(value, hashfn::Fnv{}, order);
        }

        template <class T>
        void fetch_insert_fnv(const T& value, std::uint64_t key, std::memory_order order = std::memory_order_relaxed) {
            fetch_insert(value, hashfn::Fnv(key), order);
        }

        // ---- queries --------------------------------------------------------

        // Queries accept any memory order; release and acq_rel are weakened to
        // what a load can carry (relaxed and acquire).
        bool may_contain_seed(std::uint64_t seed, std::memory_order order = std::memory_order_relaxed) const noexcept {
            return stream_type(seed).all_of([this, order](std::size_t i, Word h) {
                return traits::is_min(words_[i].load(load_order(order)), h);
                });
        }

        template <class T, class H = hashfn::SipHash13>
        bool may_contain(const T& value, const H& hasher = H{}, std::memory_order order = std::memory_order_relaxed) const {
            return may_contain_seed(hash_value(hasher, value), order);
        }

        Word load(std::size_t i, std::memory_order order = std::memory_order_relaxed) const noexcept {
            return words_[i].load(load_order(order));
        }

        Word at(std::size_t i, std::memory_order order = std::memory_order_relaxed) const {
            if (i >= P) throw std::out_of_range("AtomicMinHashSketch::at: slot out of range");
            return words_[i].load(load_order(order));
        }

        bool is_empty() const noexcept {
            for (const auto& w : words_) if (w.load(std::memory_order_relaxed) != traits::max()) return false;
            return true;
        }

        bool is_full() const noexcept {
            for (const auto& w : words_) if (w.load(std::memory_order_relaxed) != traits::zero()) return false;
            return true;
        }

        static constexpr std::size_t memory() noexcept { return P * traits::bits; }
        static constexpr std::size_t permutations() noexcept { return P; }

        // Plain copy of the slots, slot by slot (not a consistent cut under writers).
        plain_type snapshot(std::memory_order order = std::memory_order_relaxed) const noexcept {
            plain_type out;
            for (std::size_t i = 0; i < P; ++i) out[i] = words_[i].load(load_order(order));
            return out;
        }

        // Concurrent-safe merge of a plain sketch: one fetch-min per slot.
        void fetch_merge(const plain_type& other, std::memory_order order = std::memory_order_relaxed) noexcept {
            for (std::size_t i = 0; i < P; ++i) fetch_min(i, other[i], order);
        }

        double estimate_jaccard_index(const AtomicMinHashSketch& other) const noexcept {
            return snapshot().estimate_jaccard_index(other.snapshot());
        }

    private:
        static constexpr std::memory_order load_order(std::memory_order order) noexcept {
            switch (order) {
            case std::memory_order_release: return std::memory_order_relaxed;
            case std::memory_order_acq_rel: return std::memory_order_acquire;
            default:                        return order;
            }
        }

        std::array<std::atomic<Word>, P> words_;
    };

} // namespace minhash::sketch
