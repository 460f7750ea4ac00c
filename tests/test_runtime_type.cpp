/**
 * @file test_runtime_type.cpp
 * @brief Tests for RuntimeType descriptors and the process type table.
 */
#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "unmanaged/types/runtime_type.hpp"

using unmanaged::Errc;
using unmanaged::types::RuntimeType;

// Defined in runtime_type_peer.cpp.
RuntimeType   peer_pos_type();
std::uint32_t peer_lambda_raw();

namespace {

struct Vec3 {
  float x, y, z;
};

struct Sample {
  std::int64_t stamp;
  std::uint8_t flags;
};

struct Contended {
  std::uint32_t a, b;
};

struct Pos {
  int v;
};

} // namespace

TEST(RuntimeType, Get_IsStable) {
  const RuntimeType a = RuntimeType::get<int>();
  const RuntimeType b = RuntimeType::get<int>();
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.raw(), b.raw());
  EXPECT_TRUE(a.is_valid());
}

TEST(RuntimeType, Size_MatchesSizeof) {
  EXPECT_EQ(RuntimeType::get<double>().size(), sizeof(double));
  EXPECT_EQ(RuntimeType::get<Vec3>().size(), sizeof(Vec3));
  EXPECT_EQ(RuntimeType::get<Sample>().size(), sizeof(Sample));
}

TEST(RuntimeType, DistinctTypes_DistinctIds) {
  std::set<std::uint16_t> ids{
    RuntimeType::get<int>().id(),      RuntimeType::get<unsigned>().id(),
    RuntimeType::get<float>().id(),    RuntimeType::get<double>().id(),
    RuntimeType::get<Vec3>().id(),     RuntimeType::get<Sample>().id(),
    RuntimeType::get<std::int8_t>().id()};
  EXPECT_EQ(ids.size(), 7u);
  EXPECT_EQ(ids.count(0), 0u);
}

TEST(RuntimeType, CvQualifiers_Ignored) {
  EXPECT_EQ(RuntimeType::get<const int>(), RuntimeType::get<int>());
  EXPECT_EQ(RuntimeType::get<volatile Vec3>(), RuntimeType::get<Vec3>());
}

/**
 * @test Raw_Layout
 * @brief id in the low half, size in the high half; from_raw restores both.
 */
TEST(RuntimeType, Raw_Layout) {
  const RuntimeType t = RuntimeType::get<Vec3>();
  EXPECT_EQ(t.raw() & 0xFFFFu, t.id());
  EXPECT_EQ(t.raw() >> 16, t.size());

  const RuntimeType back = RuntimeType::from_raw(t.raw());
  EXPECT_EQ(back, t);
  EXPECT_EQ(back.size(), t.size());
}

TEST(RuntimeType, Is_Checks) {
  const RuntimeType t = RuntimeType::get<float>();
  EXPECT_TRUE(t.is<float>());
  EXPECT_FALSE(t.is<int>());
  EXPECT_TRUE(unmanaged::types::is<float>(t));
}

TEST(RuntimeType, Default_IsInvalid) {
  const RuntimeType none;
  EXPECT_FALSE(none.is_valid());
  EXPECT_EQ(none.id(), 0u);
  EXPECT_EQ(none.size(), 0u);
  EXPECT_TRUE(none.name().empty());
  EXPECT_EQ(none.alignment(), 1u);
}

TEST(RuntimeType, AlignmentAndName) {
  EXPECT_EQ(RuntimeType::get<double>().alignment(), alignof(double));
  EXPECT_EQ(RuntimeType::get<Sample>().alignment(), alignof(Sample));
  EXPECT_EQ(RuntimeType::get<double>().name(), "double");
  EXPECT_NE(RuntimeType::get<Vec3>().name().find("Vec3"), std::string_view::npos);
}

TEST(RuntimeType, CombinedHash_OrderIndependent) {
  const std::array<RuntimeType, 2> ab{RuntimeType::get<int>(), RuntimeType::get<float>()};
  const std::array<RuntimeType, 2> ba{RuntimeType::get<float>(), RuntimeType::get<int>()};
  const std::array<RuntimeType, 2> ad{RuntimeType::get<int>(), RuntimeType::get<double>()};

  EXPECT_EQ(RuntimeType::combined_hash(ab), RuntimeType::combined_hash(ba));
  EXPECT_NE(RuntimeType::combined_hash(ab), RuntimeType::combined_hash(ad));
}

/**
 * @test ConcurrentFirstUse_SameDescriptor
 * @brief Racing first calls for a fresh type all observe one id.
 */
TEST(RuntimeType, ConcurrentFirstUse_SameDescriptor) {
  constexpr int kThreads = 8;
  std::vector<std::uint32_t> raws(kThreads, 0);
  std::vector<std::thread> workers;
  for (int i = 0; i < kThreads; ++i) {
    workers.emplace_back([&raws, i] { raws[i] = RuntimeType::get<Contended>().raw(); });
  }
  for (auto& w : workers) w.join();
  for (std::uint32_t r : raws) EXPECT_EQ(r, raws[0]);
  EXPECT_NE(raws[0] & 0xFFFFu, 0u);
}

/**
 * @test SameSpelling_OtherTranslationUnit_Distinct
 * @brief Anonymous-namespace types sharing a name across translation units
 *        get their own ids, and neither matches the other's is<T>().
 */
TEST(RuntimeType, SameSpelling_OtherTranslationUnit_Distinct) {
  const RuntimeType local = RuntimeType::get<Pos>();
  const RuntimeType peer  = peer_pos_type();

  EXPECT_EQ(local.name(), peer.name());
  EXPECT_NE(local.id(), peer.id());
  EXPECT_NE(local, peer);
  EXPECT_EQ(local.size(), sizeof(Pos));
  EXPECT_EQ(peer.size(), 3 * sizeof(double));
  EXPECT_FALSE(peer.is<Pos>());
  EXPECT_TRUE(local.is<Pos>());
}

TEST(RuntimeType, Lambdas_OtherTranslationUnit_Distinct) {
  auto fn = [](int v) { return v + 1; };
  EXPECT_NE(RuntimeType::get<decltype(fn)>().raw(), peer_lambda_raw());
}

TEST(RuntimeType, Equality_ComparesSize) {
  const RuntimeType t = RuntimeType::get<std::uint32_t>();
  const RuntimeType resized = RuntimeType::from_raw(t.raw() + (1u << 16));
  EXPECT_EQ(resized.id(), t.id());
  EXPECT_NE(resized, t);
  EXPECT_FALSE(resized.is<std::uint32_t>());
}

/**
 * @test TypeTable_Full_ReportsError
 * @brief Once all 65535 non-zero ids are assigned the next type is refused;
 *        known keys still resolve.
 */
TEST(RuntimeType, TypeTable_Full_ReportsError) {
  unmanaged::types::detail::TypeTable table;
  std::vector<char> keys(0x10000);

  std::set<std::uint16_t> ids;
  for (std::size_t i = 0; i < 0xFFFFu; ++i) {
    auto id = table.add(&keys[i], "t" + std::to_string(i), 1, 1);
    ASSERT_TRUE(id.has_value()) << "key " << i;
    EXPECT_NE(*id, 0u);
    ids.insert(*id);
  }
  EXPECT_EQ(ids.size(), 0xFFFFu);
  EXPECT_EQ(table.size(), 0xFFFFu);

  auto full = table.add(&keys[0xFFFF], "t65535", 1, 1);
  ASSERT_FALSE(full.has_value());
  EXPECT_EQ(full.error().code, Errc::TypeTableFull);

  auto known = table.add(&keys[0], "t0", 1, 1);
  ASSERT_TRUE(known.has_value());
  ASSERT_NE(table.find(*known), nullptr);
  EXPECT_EQ(table.find(*known)->name, "t0");
}
