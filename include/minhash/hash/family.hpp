#pragma once
// Run-time selection of a hash family front end (used by the drivers).
//
//   sip13        SipHash-1-3, keys (0, 0)
//   sip13_keyed  SipHash-1-3, keys (k0, k1)
//   fnv          FNV from the offset basis
//   fnv_keyed    FNV from k0
//   rapid        RapidHash, seed k0 (RAPID_SEED when unkeyed)

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "minhash/hash/ihash.hpp"
#include "minhash/hash/siphash13.hpp"
#include "minhash/hash/fnv.hpp"
#include "minhash/hash/rapid.hpp"

namespace minhash::hashfn {

    enum class HashFamily {
        Sip13,
        Sip13Keyed,
        Fnv,
        FnvKeyed,
        Rapid,
    };

    inline constexpr HashFamily ALL_FAMILIES[] = {
        HashFamily::Sip13, HashFamily::Sip13Keyed, HashFamily::Fnv, HashFamily::FnvKeyed, HashFamily::Rapid,
    };

    inline const char* to_string(HashFamily f) {
        switch (f) {
        case HashFamily::Sip13:      return "sip13";
        case HashFamily::Sip13Keyed: return "sip13_keyed";
        case HashFamily::Fnv:        return "fnv";
        case HashFamily::FnvKeyed:   return "fnv_keyed";
        case HashFamily::Rapid:      return "rapid";
        }
        return "unknown";
    }

    inline HashFamily parse_family(std::string_view name) {
        for (HashFamily f : ALL_FAMILIES) {
            if (name == to_string(f)) return f;
        }
        throw std::invalid_argument("unknown hash family: " + std::string(name));
    }

    inline std::unique_ptr<IHash> make_hasher(HashFamily f, std::uint64_t k0 = 0, std::uint64_t k1 = 0) {
        switch (f) {
        case HashFamily::Sip13:      return std::make_unique<SipHash13>();
        case HashFamily::Sip13Keyed: return std::make_unique<SipHash13>(k0, k1);
        case HashFamily::Fnv:        return std::make_unique<Fnv>();
        case HashFamily::FnvKeyed:   return std::make_unique<Fnv>(k0);
        case HashFamily::Rapid:      return k0 ? std::make_unique<RapidHash>(k0) : std::make_unique<RapidHash>();
        }
        throw std::invalid_argument("make_hasher: bad family");
    }

} // namespace minhash::hashfn
