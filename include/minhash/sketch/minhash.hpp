#pragma once
// MinHashSketch<Word, P>: P slot words, each the running minimum of one permutation.
//
// Every inserted value is hashed to a 64-bit seed by a hash family, the seed
// drives a PermutationStream of P words, and slot i keeps min(slot i, word i).
// Fresh slots hold Word max. Slots only ever move down.
//
// Not synchronized: callers own exclusive access. See atomic_minhash.hpp for
// the lock-free variant.
//
// Example:
//   minhash::sketch::MinHashSketch<std::uint64_t, 128> a, b;
//   for (auto k : A) a.insert(k);
//   for (auto k : B) b.insert(k);
//   double j = a.estimate_jaccard_index(b);

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstddef>
#include <span>
#include <stdexcept>

#include "minhash/core/word.hpp"
#include "minhash/core/permutation.hpp"
#include "minhash/hash/bytes.hpp"
#include "minhash/hash/siphash13.hpp"
#include "minhash/hash/fnv.hpp"

namespace minhash::sketch {

    template <class Word, std::size_t P>
    class MinHashSketch {
    public:
        using word_type = Word;
        using traits = WordTraits<Word>;
        using stream_type = PermutationStream<Word, P>;
        using const_iterator = typename std::array<Word, P>::const_iterator;

        static constexpr std::size_t PERMUTATIONS = P;

        MinHashSketch() noexcept { words_.fill(traits::max()); }

        // ---- insertion ------------------------------------------------------

        // Insert a precomputed 64-bit seed (the output of a hash family).
        MINHASH_FORCEINLINE void insert_seed(std::uint64_t seed) noexcept {
            stream_type(seed).for_each([this](std::size_t i, Word h) { traits::set_min(words_[i], h); });
        }

        template <class T, class H = hashfn::SipHash13>
        MINHASH_FORCEINLINE void insert(const T& value, const H& hasher = H{}) {
            insert_seed(hash_value(hasher, value));
        }

        template <class T>
        void insert_sip13(const T& value) { insert(value, hashfn::SipHash13{}); }

        template <class T>
        void insert_sip13(const T& value, std::uint64_t k0, std::uint64_t k1) { insert(value, hashfn::SipHash13(k0, k1)); }

        template <class T>
        void insert_fnv(const T& value) { insert(value, hashfn::Fnv{}); }

        template <class T>
        void insert_fnv(const T& value, std::uint64_t key) { insert(value, hashfn::Fnv(key)); }

        // ---- membership (one-sided) ----------------------------------------

        // True iff every slot is <= the seed's permutation word at that slot.
        // Never false for a value inserted with the same hasher, unless the
        // sketch was later merged with one built under another configuration.
        bool may_contain_seed(std::uint64_t seed) const noexcept {
            return stream_type(seed).all_of([this](std::size_t i, Word h) { return traits::is_min(words_[i], h); });
        }

        template <class T, class H = hashfn::SipHash13>
        bool may_contain(const T& value, const H& hasher = H{}) const {
            return may_contain_seed(hash_value(hasher, value));
        }

        template <class T>
        bool may_contain_sip13(const T& value) const { return may_contain(value, hashfn::SipHash13{}); }

        template <class T>
        bool may_contain_sip13(const T& value, std::uint64_t k0, std::uint64_t k1) const {
            return may_contain(value, hashfn::SipHash13(k0, k1));
        }

        template <class T>
        bool may_contain_fnv(const T& value) const { return may_contain(value, hashfn::Fnv{}); }

        template <class T>
        bool may_contain_fnv(const T& value, std::uint64_t key) const { return may_contain(value, hashfn::Fnv(key)); }

        // ---- state ----------------------------------------------------------

        // Vacuously true when P == 0.
        bool is_empty() const noexcept {
            return std::all_of(words_.begin(), words_.end(), [](Word w) { return w == traits::max(); });
        }

        // Every slot at zero. Vacuously true when P == 0.
        bool is_full() const noexcept {
            return std::all_of(words_.begin(), words_.end(), [](Word w) { return w == traits::zero(); });
        }

        // Footprint in bits.
        static constexpr std::size_t memory() noexcept { return P * traits::bits; }
        static constexpr std::size_t permutations() noexcept { return P; }

        // ---- merge ----------------------------------------------------------

        // Elementwise minimum. The result is the sketch of the UNION of the two
        // underlying sets. Associative, commutative, idempotent; a fresh sketch
        // is the identity.
        MinHashSketch& merge(const MinHashSketch& other) noexcept {
            for (std::size_t i = 0; i < P; ++i) traits::set_min(words_[i], other.words_[i]);
            return *this;
        }

        MinHashSketch& operator&=(const MinHashSketch& other) noexcept { return merge(other); }

        friend MinHashSketch operator&(MinHashSketch lhs, const MinHashSketch& rhs) noexcept {
            lhs.merge(rhs);
            return lhs;
        }

        // ---- estimation -----------------------------------------------------

        // Fraction of slots on which both sketches agree. Standard error is
        // O(1/sqrt(P)). With P == 0 there is no disagreeing slot: returns 1.0.
        double estimate_jaccard_index(const MinHashSketch& other) const noexcept {
            if constexpr (P == 0) {
                return 1.0;
            }
            else {
                std::size_t matches = 0;
                for (std::size_t i = 0; i < P; ++i) matches += (words_[i] == other.words_[i]);
                return double(matches) / double(P);
            }
        }

        // ---- slot access (inspection) --------------------------------------

        Word operator[](std::size_t i) const noexcept { return words_[i]; }
        Word& operator[](std::size_t i) noexcept { return words_[i]; }

        Word at(std::size_t i) const {
            if (i >= P) throw std::out_of_range("MinHashSketch::at: slot out of range");
            return words_[i];
        }

        std::span<const Word, P> words() const noexcept { return words_; }
        std::span<Word, P> words_mut() noexcept { return words_; }

        const_iterator begin() const noexcept { return words_.begin(); }
        const_iterator end() const noexcept { return words_.end(); }

        friend bool operator==(const MinHashSketch& a, const MinHashSketch& b) noexcept { return a.words_ == b.words_; }
        friend bool operator!=(const MinHashSketch& a, const MinHashSketch& b) noexcept { return !(a == b); }

    private:
        std::array<Word, P> words_;
    };

} // namespace minhash::sketch
