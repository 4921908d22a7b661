#include <cstdint>
#include <cstddef>
#include <unordered_set>

#include <gtest/gtest.h>

#include "minhash/core/splitmix.hpp"
#include "minhash/core/word.hpp"
#include "minhash/core/word_codec.hpp"

namespace minhash {

TEST(WordTraits, SentinelsPerWidth) {
  EXPECT_EQ(WordTraits<std::uint8_t>::max(), 0xFFu);
  EXPECT_EQ(WordTraits<std::uint16_t>::max(), 0xFFFFu);
  EXPECT_EQ(WordTraits<std::uint32_t>::max(), 0xFFFFFFFFu);
  EXPECT_EQ(WordTraits<std::uint64_t>::max(), 0xFFFFFFFFFFFFFFFFull);
  EXPECT_EQ(WordTraits<std::uint32_t>::zero(), 0u);

  EXPECT_EQ(word_bits_v<std::uint8_t>, 8u);
  EXPECT_EQ(word_bits_v<std::uint16_t>, 16u);
  EXPECT_EQ(word_bits_v<std::uint32_t>, 32u);
  EXPECT_EQ(word_bits_v<std::uint64_t>, 64u);
  EXPECT_EQ(word_bits_v<std::size_t>, sizeof(std::size_t) * 8);
}

TEST(WordTraits, AdvanceMatchesXorshiftTriples) {
  // 64-bit: <<13 >>7 <<17, 32-bit: <<13 >>17 <<5.
  EXPECT_EQ(WordTraits<std::uint64_t>::advance(1), 0x40822041ull);
  EXPECT_EQ(WordTraits<std::uint32_t>::advance(1), 0x42021u);
  // 16-bit runs the 32-bit step and keeps the low half.
  EXPECT_EQ(WordTraits<std::uint16_t>::advance(1), std::uint16_t(0x2021u));
  EXPECT_EQ(WordTraits<std::size_t>::advance(1),
            sizeof(std::size_t) == 8 ? std::size_t(0x40822041ull) : std::size_t(0x42021u));
}

TEST(WordTraits, ZeroIsFixedPoint) {
  EXPECT_EQ(WordTraits<std::uint8_t>::advance(0), 0u);
  EXPECT_EQ(WordTraits<std::uint16_t>::advance(0), 0u);
  EXPECT_EQ(WordTraits<std::uint32_t>::advance(0), 0u);
  EXPECT_EQ(WordTraits<std::uint64_t>::advance(0), 0u);
}

TEST(WordTraits, NarrowAdvanceIsBijection) {
  std::unordered_set<unsigned> seen8;
  for (unsigned x = 0; x < 256; ++x) seen8.insert(WordTraits<std::uint8_t>::advance(std::uint8_t(x)));
  EXPECT_EQ(seen8.size(), 256u);

  std::unordered_set<unsigned> seen16;
  for (unsigned x = 0; x < 65536; ++x) seen16.insert(WordTraits<std::uint16_t>::advance(std::uint16_t(x)));
  EXPECT_EQ(seen16.size(), 65536u);
}

TEST(WordTraits, SetMinOnlyMovesDown) {
  std::uint32_t slot = 10;
  EXPECT_FALSE(WordTraits<std::uint32_t>::set_min(slot, 11));
  EXPECT_EQ(slot, 10u);
  EXPECT_FALSE(WordTraits<std::uint32_t>::set_min(slot, 10));
  EXPECT_TRUE(WordTraits<std::uint32_t>::set_min(slot, 3));
  EXPECT_EQ(slot, 3u);
  EXPECT_TRUE(WordTraits<std::uint32_t>::is_min(3, 3));
  EXPECT_FALSE(WordTraits<std::uint32_t>::is_min(4, 3));
}

TEST(WordCodec, NarrowKeepsLowBits) {
  const std::uint64_t d = 0x0123456789ABCDEFull;
  EXPECT_EQ(narrow_digest<std::uint8_t>(d), 0xEFu);
  EXPECT_EQ(narrow_digest<std::uint16_t>(d), 0xCDEFu);
  EXPECT_EQ(narrow_digest<std::uint32_t>(d), 0x89ABCDEFu);
  EXPECT_EQ(narrow_digest<std::uint64_t>(d), d);
}

TEST(WordCodec, WidenZeroExtends) {
  EXPECT_EQ(widen(std::uint8_t(0xFF)), 0xFFull);
  EXPECT_EQ(widen(std::uint16_t(0x8000)), 0x8000ull);
  EXPECT_EQ((convert<std::uint32_t>(std::uint16_t(0xFFFF))), 0xFFFFu);
  EXPECT_EQ((convert<std::uint16_t>(std::uint32_t(0x12345678))), 0x5678u);
}

TEST(SplitMix, ScrambleIsStateless) {
  EXPECT_EQ(splitmix(42), splitmix(42));
  EXPECT_NE(splitmix(42), splitmix(43));
  EXPECT_EQ(splitmix(0), 0u);
  EXPECT_EQ(mix_seed(42), 0x97EA87F7E45C00A5ull);
  EXPECT_EQ(mix_seed(42), splitmix(splitmix(42)));
}

}  // namespace minhash
