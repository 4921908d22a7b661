#pragma once
// Slot word capabilities, one template for every unsigned width.
//   max()      sentinel of an untouched slot
//   zero()     floor of a saturated slot
//   advance()  bijective xorshift step used to walk a permutation stream
//
// Widths: 8, 16, 32, 64 bits, and std::size_t (dispatched on its sizeof).

#include <cstdint>
#include <cstddef>
#include <limits>
#include <type_traits>

// ---- force-inline macro (local, guarded) -----------------------------------
#ifndef MINHASH_FORCEINLINE
#if defined(_MSC_VER)
#define MINHASH_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define MINHASH_FORCEINLINE inline __attribute__((always_inline))
#else
#define MINHASH_FORCEINLINE inline
#endif
#endif
// ---------------------------------------------------------------------------

namespace minhash {

    template <class Word>
    struct WordTraits {
        static_assert(std::is_integral_v<Word> && std::is_unsigned_v<Word> && !std::is_same_v<Word, bool>,
            "slot words must be unsigned integers");
        static_assert(sizeof(Word) == 1 || sizeof(Word) == 2 || sizeof(Word) == 4 || sizeof(Word) == 8,
            "slot words must be 8, 16, 32 or 64 bits wide");

        static constexpr std::size_t bits = sizeof(Word) * 8;

        static constexpr Word max() noexcept { return std::numeric_limits<Word>::max(); }
        static constexpr Word zero() noexcept { return Word(0); }

        // xorshift step; a bijection on the word's domain, 0 maps to 0.
        static constexpr Word advance(Word x) noexcept {
            if constexpr (sizeof(Word) == 8) {
                std::uint64_t y = x;
                y ^= y << 13;
                y ^= y >> 7;
                y ^= y << 17;
                return static_cast<Word>(y);
            }
            else if constexpr (sizeof(Word) == 4) {
                std::uint32_t y = x;
                y ^= y << 13;
                y ^= y >> 17;
                y ^= y << 5;
                return static_cast<Word>(y);
            }
            else if constexpr (sizeof(Word) == 2) {
                return static_cast<Word>(WordTraits<std::uint32_t>::advance(std::uint32_t(x)));
            }
            else {
                // Shifts are done in 8-bit arithmetic so the step stays a bijection.
                std::uint8_t y = x;
                y = static_cast<std::uint8_t>(y ^ (y << 3));
                y = static_cast<std::uint8_t>(y ^ (y >> 7));
                y = static_cast<std::uint8_t>(y ^ (y << 1));
                return static_cast<Word>(y);
            }
        }

        // In-place min; returns true when the slot moved.
        static MINHASH_FORCEINLINE bool set_min(Word& slot, Word candidate) noexcept {
            if (candidate < slot) { slot = candidate; return true; }
            return false;
        }

        // True when the slot does not exceed the candidate.
        static constexpr bool is_min(Word slot, Word candidate) noexcept { return slot <= candidate; }
    };

    template <class Word>
    inline constexpr std::size_t word_bits_v = WordTraits<Word>::bits;

    // Short names for the widths the drivers iterate over.
    template <class Word>
    constexpr const char* word_name() noexcept {
        if constexpr (std::is_same_v<Word, std::uint8_t>) return "u8";
        else if constexpr (std::is_same_v<Word, std::uint16_t>) return "u16";
        else if constexpr (std::is_same_v<Word, std::uint32_t>) return "u32";
        else if constexpr (std::is_same_v<Word, std::uint64_t>) return "u64";
        else return "usize";
    }

} // namespace minhash
