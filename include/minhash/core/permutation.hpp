#pragma once
// PermutationStream<Word, P>: P pseudorandom slot words derived from one 64-bit seed.
//
//   state = narrow<Word>( splitmix(splitmix(seed)) )
//   for i in [0, P):  state = advance(state); emit state
//
// The stream is lazy and restartable from the seed, never resumable mid-way.
// Position i of every stream acts as the i-th permutation of the hash space.

#include <cstdint>
#include <cstddef>
#include <iterator>

#include "minhash/core/word.hpp"
#include "minhash/core/word_codec.hpp"
#include "minhash/core/splitmix.hpp"

namespace minhash {

    template <class Word, std::size_t P>
    class PermutationStream {
    public:
        using traits = WordTraits<Word>;

        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Word;
            using difference_type = std::ptrdiff_t;
            using pointer = const Word*;
            using reference = Word;

            iterator() = default;
            constexpr iterator(Word state, std::size_t index) noexcept : state_(state), index_(index) {}

            constexpr Word operator*() const noexcept { return state_; }
            constexpr std::size_t index() const noexcept { return index_; }

            constexpr iterator& operator++() noexcept {
                state_ = traits::advance(state_);
                ++index_;
                return *this;
            }
            constexpr iterator operator++(int) noexcept { iterator t = *this; ++(*this); return t; }

            // Streams of equal length compare by position only.
            friend constexpr bool operator==(const iterator& a, const iterator& b) noexcept { return a.index_ == b.index_; }
            friend constexpr bool operator!=(const iterator& a, const iterator& b) noexcept { return !(a == b); }

        private:
            Word state_{ 0 };
            std::size_t index_{ 0 };
        };

        explicit constexpr PermutationStream(std::uint64_t seed) noexcept
            : start_(narrow_digest<Word>(mix_seed(seed))) {
        }

        constexpr iterator begin() const noexcept { return iterator(traits::advance(start_), 0); }
        constexpr iterator end() const noexcept { return iterator(start_, P); }
        static constexpr std::size_t size() noexcept { return P; }

        // Calls f(i, value) for every position; the hot path used by the sketches.
        template <class F>
        MINHASH_FORCEINLINE void for_each(F&& f) const {
            Word state = start_;
            for (std::size_t i = 0; i < P; ++i) {
                state = traits::advance(state);
                f(i, state);
            }
        }

        // Stops at the first position where pred(i, value) is false.
        template <class Pred>
        MINHASH_FORCEINLINE bool all_of(Pred&& pred) const {
            Word state = start_;
            for (std::size_t i = 0; i < P; ++i) {
                state = traits::advance(state);
                if (!pred(i, state)) return false;
            }
            return true;
        }

    private:
        Word start_;
    };

} // namespace minhash
