#pragma once
// Folds over the sketch operations.
//   merge_all(first, last)  : fresh sketch merged with every sketch in range
//   build_sketch(values, h) : fresh sketch with every value inserted

#include <cstddef>
#include <iterator>

#include "minhash/hash/siphash13.hpp"
#include "minhash/sketch/minhash.hpp"

namespace minhash::sketch {

    template <class It>
    typename std::iterator_traits<It>::value_type merge_all(It first, It last) {
        typename std::iterator_traits<It>::value_type out;
        for (; first != last; ++first) out.merge(*first);
        return out;
    }

    template <class Range>
    auto merge_all(const Range& sketches) {
        return merge_all(std::begin(sketches), std::end(sketches));
    }

    template <class Word, std::size_t P, class Range, class H = hashfn::SipHash13>
    MinHashSketch<Word, P> build_sketch(const Range& values, const H& hasher = H{}) {
        MinHashSketch<Word, P> out;
        for (const auto& v : values) out.insert(v, hasher);
        return out;
    }

} // namespace minhash::sketch
