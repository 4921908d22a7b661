#pragma once
// Width conversion between unsigned words.
// Narrowing keeps the low-order bits, widening zero-extends. Always total.

#include <cstdint>
#include <type_traits>

namespace minhash {

    template <class To, class From>
    constexpr To convert(From v) noexcept {
        static_assert(std::is_unsigned_v<To> && std::is_unsigned_v<From>,
            "convert: unsigned words only");
        return static_cast<To>(v);
    }

    // 64-bit digest -> slot word.
    template <class Word>
    constexpr Word narrow_digest(std::uint64_t digest) noexcept {
        return convert<Word>(digest);
    }

    // Slot word -> 64 bits, zero-extended.
    template <class Word>
    constexpr std::uint64_t widen(Word w) noexcept {
        return convert<std::uint64_t>(w);
    }

} // namespace minhash
