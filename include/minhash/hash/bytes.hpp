#pragma once
// Byte view of a hashable value.
//   - scalars and padding-free trivially copyable T : their object representation
//   - strings                                      : their characters, no terminator
//   - contiguous ranges (spans, arrays, vectors)   : the bytes of their elements

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace minhash {

    inline std::span<const std::byte> value_bytes(std::span<const std::byte> s) noexcept { return s; }

    inline std::span<const std::byte> value_bytes(std::string_view s) noexcept {
        return std::as_bytes(std::span<const char>(s.data(), s.size()));
    }

    inline std::span<const std::byte> value_bytes(const std::string& s) noexcept {
        return value_bytes(std::string_view(s));
    }

    inline std::span<const std::byte> value_bytes(const char* s) noexcept {
        return value_bytes(std::string_view(s));
    }

    // Any span or container over contiguous trivially copyable elements hashes
    // its contents, so equal contents in different buffers give equal digests.
    template <class R, class = std::enable_if_t<std::ranges::contiguous_range<const R&>
        && std::ranges::sized_range<const R&>
        && std::is_trivially_copyable_v<std::ranges::range_value_t<const R&>>>>
    std::span<const std::byte> value_bytes(const R& r) noexcept {
        return std::as_bytes(std::span(std::ranges::data(r), std::ranges::size(r)));
    }

    template <class T, class = std::enable_if_t<std::is_trivially_copyable_v<T>
        && std::has_unique_object_representations_v<T>
        && !std::is_pointer_v<T>
        && !std::ranges::contiguous_range<const T&>>, class = void>
    std::span<const std::byte> value_bytes(const T& v) noexcept {
        return std::as_bytes(std::span<const T, 1>(&v, 1));
    }

    // digest = h(bytes(v)); H is any IHash-shaped callable.
    template <class H, class T>
    std::uint64_t hash_value(const H& h, const T& v) {
        return h(value_bytes(v));
    }

} // namespace minhash
