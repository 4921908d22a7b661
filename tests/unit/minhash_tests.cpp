#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "minhash/core/dataset.hpp"
#include "minhash/hash/family.hpp"
#include "minhash/sketch/minhash.hpp"

namespace minhash::sketch {

namespace {

std::vector<std::uint64_t> keys(std::size_t n, std::uint64_t seed) {
  std::vector<std::uint64_t> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = datasets::draw_u64(seed, i);
  return out;
}

}  // namespace

TEST(MinHashSketch, FreshSketchIsEmptyAndNotFull) {
  MinHashSketch<std::uint64_t, 128> s;
  EXPECT_TRUE(s.is_empty());
  EXPECT_FALSE(s.is_full());
  for (auto w : s) EXPECT_EQ(w, WordTraits<std::uint64_t>::max());
  EXPECT_FALSE(s.may_contain(std::uint64_t(42)));

  s.insert(std::uint64_t(42));
  EXPECT_FALSE(s.is_empty());
}

TEST(MinHashSketch, MemoryAccounting) {
  EXPECT_EQ((MinHashSketch<std::uint32_t, 128>::memory()), 4096u);
  EXPECT_EQ((MinHashSketch<std::uint64_t, 128>::memory()), 128u * 64u);
  EXPECT_EQ((MinHashSketch<std::uint8_t, 16>::memory()), 128u);
  EXPECT_EQ((MinHashSketch<std::uint16_t, 3>::permutations()), 3u);
}

TEST(MinHashSketch, InsertIsMonotone) {
  MinHashSketch<std::uint32_t, 64> s;
  for (auto k : keys(500, 1)) {
    const auto before = s;
    s.insert(k);
    for (std::size_t i = 0; i < s.permutations(); ++i) EXPECT_LE(s[i], before[i]);
  }
}

TEST(MinHashSketch, InsertIsIdempotent) {
  MinHashSketch<std::uint64_t, 128> once, twice;
  once.insert(std::string("alpha"));
  twice.insert(std::string("alpha"));
  twice.insert(std::string("alpha"));
  EXPECT_EQ(once, twice);
}

TEST(MinHashSketch, InsertOrderDoesNotMatter) {
  auto ks = keys(1000, 2);
  // Duplicates make it a multiset.
  ks.insert(ks.end(), ks.begin(), ks.begin() + 100);

  MinHashSketch<std::uint16_t, 64> forward, shuffled;
  for (auto k : ks) forward.insert(k);

  std::mt19937_64 gen(7);
  std::shuffle(ks.begin(), ks.end(), gen);
  for (auto k : ks) shuffled.insert(k);
  EXPECT_EQ(forward, shuffled);
}

TEST(MinHashSketch, NoFalseNegatives) {
  const std::uint64_t k0 = 0x0123456789ABCDEFull, k1 = 0xFEDCBA9876543210ull;
  MinHashSketch<std::uint64_t, 128> sip, sip_keyed, fnv, fnv_keyed;
  const auto ks = keys(2000, 3);
  for (auto k : ks) {
    sip.insert_sip13(k);
    sip_keyed.insert_sip13(k, k0, k1);
    fnv.insert_fnv(k);
    fnv_keyed.insert_fnv(k, k0);
  }
  for (auto k : ks) {
    ASSERT_TRUE(sip.may_contain_sip13(k));
    ASSERT_TRUE(sip_keyed.may_contain_sip13(k, k0, k1));
    ASSERT_TRUE(fnv.may_contain_fnv(k));
    ASSERT_TRUE(fnv_keyed.may_contain_fnv(k, k0));
  }
}

TEST(MinHashSketch, DefaultHasherIsUnkeyedSip13) {
  MinHashSketch<std::uint32_t, 32> a, b;
  a.insert(std::uint64_t(5));
  b.insert_sip13(std::uint64_t(5));
  EXPECT_EQ(a, b);
}

TEST(MinHashSketch, RuntimeSelectedFamily) {
  const std::uint64_t k0 = 11, k1 = 22;
  for (hashfn::HashFamily f : hashfn::ALL_FAMILIES) {
    auto h = hashfn::make_hasher(f, k0, k1);
    MinHashSketch<std::uint64_t, 64> s;
    for (std::uint64_t k = 0; k < 100; ++k) s.insert(k, *h);
    for (std::uint64_t k = 0; k < 100; ++k) EXPECT_TRUE(s.may_contain(k, *h)) << hashfn::to_string(f);
  }

  MinHashSketch<std::uint64_t, 64> via_factory, direct;
  via_factory.insert(std::uint64_t(9), *hashfn::make_hasher(hashfn::HashFamily::FnvKeyed, k0));
  direct.insert_fnv(std::uint64_t(9), k0);
  EXPECT_EQ(via_factory, direct);
}

TEST(MinHashSketch, KeysChangeTheSketch) {
  MinHashSketch<std::uint64_t, 64> unkeyed, keyed;
  unkeyed.insert_sip13(std::uint64_t(1));
  keyed.insert_sip13(std::uint64_t(1), 1, 2);
  EXPECT_NE(unkeyed, keyed);
}

TEST(MinHashSketch, MergeLaws) {
  using S = MinHashSketch<std::uint32_t, 128>;
  S a, b, c;
  for (auto k : keys(300, 10)) a.insert(k);
  for (auto k : keys(300, 11)) b.insert(k);
  for (auto k : keys(300, 12)) c.insert(k);

  EXPECT_EQ(a & b, b & a);
  EXPECT_EQ((a & b) & c, a & (b & c));
  EXPECT_EQ(a & a, a);
  EXPECT_EQ(S{} & a, a);

  S twice = a;
  twice &= b;
  twice &= b;
  EXPECT_EQ(twice, a & b);
}

TEST(MinHashSketch, MergeIsSketchOfUnion) {
  const auto left = keys(400, 20), right = keys(400, 21);
  MinHashSketch<std::uint64_t, 128> a, b, u;
  for (auto k : left) { a.insert(k); u.insert(k); }
  for (auto k : right) { b.insert(k); u.insert(k); }
  EXPECT_EQ(a.merge(b), u);
}

TEST(MinHashSketch, EstimateOfIdenticalAndDisjointSets) {
  MinHashSketch<std::uint64_t, 128> a, b, d;
  for (auto k : keys(1000, 30)) { a.insert(k); b.insert(k); }
  for (auto k : keys(1000, 31)) d.insert(k);
  EXPECT_DOUBLE_EQ(a.estimate_jaccard_index(b), 1.0);
  EXPECT_LT(a.estimate_jaccard_index(d), 0.1);
  const double j = a.estimate_jaccard_index(d);
  EXPECT_GE(j, 0.0);
  EXPECT_LE(j, 1.0);
}

TEST(MinHashSketch, ZeroPermutationsPolicy) {
  MinHashSketch<std::uint64_t, 0> a, b;
  a.insert(std::uint64_t(1));
  EXPECT_TRUE(a.is_empty());
  EXPECT_TRUE(a.is_full());
  EXPECT_EQ(a.memory(), 0u);
  EXPECT_DOUBLE_EQ(a.estimate_jaccard_index(b), 1.0);
}

TEST(MinHashSketch, NarrowWordsSaturate) {
  // An 8-bit stream stuck at zero pins every slot, and with 65536 inserts some
  // seed narrows to zero with overwhelming probability.
  MinHashSketch<std::uint8_t, 16> s;
  for (std::uint64_t k = 0; k < 65536; ++k) s.insert(k);
  EXPECT_TRUE(s.is_full());
}

TEST(MinHashSketch, WideWordsDoNotSaturateUnderRandomLoad) {
  MinHashSketch<std::uint64_t, 128> s;
  for (auto k : keys(10000, 40)) s.insert(k);
  EXPECT_FALSE(s.is_full());
  EXPECT_FALSE(s.is_empty());
}

TEST(MinHashSketch, SlotAccess) {
  MinHashSketch<std::uint32_t, 8> s;
  s[3] = 5;
  EXPECT_EQ(s.at(3), 5u);
  EXPECT_EQ(s.words()[3], 5u);
  EXPECT_THROW(s.at(8), std::out_of_range);
  s.words_mut()[0] = 1;
  EXPECT_EQ(s[0], 1u);
}

TEST(MinHashSketch, ByteSpansHashTheirContents) {
  std::vector<std::byte> buf = {std::byte(0xDE), std::byte(0xAD), std::byte(0xBE), std::byte(0xEF)};
  const std::vector<std::byte> buf_copy = buf;
  const std::vector<std::uint8_t> octets = {1, 2, 3};
  const std::vector<std::uint8_t> octets_copy = octets;

  MinHashSketch<std::uint64_t, 128> s;
  s.insert(std::span<std::byte>(buf));
  s.insert(std::span<const std::uint8_t>(octets));

  EXPECT_TRUE(s.may_contain(std::span<const std::byte>(buf_copy)));
  EXPECT_TRUE(s.may_contain(std::span<const std::uint8_t>(octets_copy)));
  EXPECT_TRUE(s.may_contain(octets_copy));

  MinHashSketch<std::uint64_t, 128> from_copies;
  from_copies.insert(std::span<const std::byte>(buf_copy));
  from_copies.insert(octets_copy);
  EXPECT_EQ(s, from_copies);
}

TEST(MinHashSketch, PlatformWidthWords) {
  MinHashSketch<std::size_t, 32> s;
  s.insert(std::string("x"));
  EXPECT_TRUE(s.may_contain(std::string("x")));
  EXPECT_EQ(s.memory(), 32u * sizeof(std::size_t) * 8u);
}

}  // namespace minhash::sketch
