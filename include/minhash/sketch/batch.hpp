#pragma once
// SketchBatch<Word, P, N>: N independent MinHashSketch instances in one allocation,
// e.g. one sketch per bucket. No invariant ties the entries together.

#include <array>
#include <cstddef>
#include <stdexcept>

#include "minhash/sketch/minhash.hpp"

namespace minhash::sketch {

    template <class Word, std::size_t P, std::size_t N>
    class SketchBatch {
    public:
        using sketch_type = MinHashSketch<Word, P>;
        using iterator = typename std::array<sketch_type, N>::iterator;
        using const_iterator = typename std::array<sketch_type, N>::const_iterator;

        SketchBatch() = default;

        sketch_type& operator[](std::size_t i) noexcept { return sketches_[i]; }
        const sketch_type& operator[](std::size_t i) const noexcept { return sketches_[i]; }

        sketch_type& at(std::size_t i) {
            if (i >= N) throw std::out_of_range("SketchBatch::at: index out of range");
            return sketches_[i];
        }
        const sketch_type& at(std::size_t i) const {
            if (i >= N) throw std::out_of_range("SketchBatch::at: index out of range");
            return sketches_[i];
        }

        static constexpr std::size_t size() noexcept { return N; }
        static constexpr std::size_t memory() noexcept { return N * sketch_type::memory(); }

        iterator begin() noexcept { return sketches_.begin(); }
        iterator end() noexcept { return sketches_.end(); }
        const_iterator begin() const noexcept { return sketches_.begin(); }
        const_iterator end() const noexcept { return sketches_.end(); }

        friend bool operator==(const SketchBatch& a, const SketchBatch& b) noexcept { return a.sketches_ == b.sketches_; }

    private:
        std::array<sketch_type, N> sketches_{};
    };

} // namespace minhash::sketch
