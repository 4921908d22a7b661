#pragma once
// SipHash-1-3 (Aumasson & Bernstein): 1 compression round per 8-byte block,
// 3 finalization rounds, 64-bit output. Unkeyed means k0 = k1 = 0.
// Not used here for its security properties, only as a keyed, well-mixed seed.

#include <cstdint>
#include <cstddef>
#include <span>

#include "minhash/core/unaligned.hpp"
#include "minhash/hash/ihash.hpp"

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

namespace minhash::hashfn {

    class SipHash13 final : public IHash {
    public:
        SipHash13() = default;
        SipHash13(std::uint64_t k0, std::uint64_t k1) { set_params(k0, k1); }

        MINHASH_FORCEINLINE void set_params(std::uint64_t k0, std::uint64_t k1) {
            k0_ = k0;
            k1_ = k1;
        }

        void reseed(std::uint64_t s0, std::uint64_t s1 = 0) override { set_params(s0, s1); }

        std::uint64_t operator()(std::span<const std::byte> key) const override {
            return hash(key.data(), key.size());
        }

        MINHASH_FORCEINLINE std::uint64_t hash(const void* in, std::size_t len) const {
            const std::byte* p = static_cast<const std::byte*>(in);
            std::uint64_t v0 = k0_ ^ 0x736F6D6570736575ull;
            std::uint64_t v1 = k1_ ^ 0x646F72616E646F6Dull;
            std::uint64_t v2 = k0_ ^ 0x6C7967656E657261ull;
            std::uint64_t v3 = k1_ ^ 0x7465646279746573ull;

            const std::size_t blocks = len / 8;
            for (std::size_t i = 0; i < blocks; ++i, p += 8) {
                const std::uint64_t m = GET_U64(p, 0);
                v3 ^= m;
                round(v0, v1, v2, v3);
                v0 ^= m;
            }

            // Last block: remaining bytes, length byte on top.
            const std::uint64_t b = (std::uint64_t(len) << 56) | GET_TAIL_U64(p, len & 7u);
            v3 ^= b;
            round(v0, v1, v2, v3);
            v0 ^= b;

            v2 ^= 0xFFull;
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            round(v0, v1, v2, v3);
            return v0 ^ v1 ^ v2 ^ v3;
        }

        MINHASH_FORCEINLINE std::uint64_t k0() const { return k0_; }
        MINHASH_FORCEINLINE std::uint64_t k1() const { return k1_; }

    private:
        static MINHASH_FORCEINLINE std::uint64_t rotl(std::uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }

        static MINHASH_FORCEINLINE void round(std::uint64_t& v0, std::uint64_t& v1, std::uint64_t& v2, std::uint64_t& v3) {
            v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
            v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
            v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
            v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
        }

        std::uint64_t k0_{ 0 };
        std::uint64_t k1_{ 0 };
    };

} // namespace minhash::hashfn
