/**
 * @file test_collections.cpp
 * @brief Tests for UnsafeBuffer / UnsafeArray<T> and RawList / UnsafeList<T>.
 *
 * Validates:
 *  - index checks in every build profile (OutOfBounds)
 *  - typed reinterpretation guarded by RuntimeType (TypeMismatch)
 *  - list growth policy and stable / swap-back removal
 */
#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "test_support.hpp"
#include "unmanaged/collections/unsafe_array.hpp"
#include "unmanaged/collections/unsafe_list.hpp"

using unmanaged::Errc;
using unmanaged::collections::RawList;
using unmanaged::collections::UnsafeArray;
using unmanaged::collections::UnsafeBuffer;
using unmanaged::collections::UnsafeList;
using unmanaged::types::RuntimeType;
using unmanaged::testing::RegistryTest;

namespace {

struct Particle {
  float         x, y;
  std::uint32_t id;
};

template <class T>
std::vector<T> to_vector(const UnsafeList<T>& list) {
  std::vector<T> out;
  auto items = list.as_span();
  if (items) out.assign(items->begin(), items->end());
  return out;
}

} // namespace

using UnsafeArrayTest = RegistryTest;
using UnsafeListTest  = RegistryTest;

// =========================== UnsafeArray ====================================

TEST_F(UnsafeArrayTest, Create_ZeroLength_Rejected) {
  auto a = UnsafeArray<int>::create(0, registry);
  ASSERT_FALSE(a);
  EXPECT_EQ(a.error().code, Errc::ZeroCapacity);
  EXPECT_EQ(registry.count(), 0u);
}

TEST_F(UnsafeArrayTest, Create_ZeroInitialized_GetSet) {
  auto a = UnsafeArray<std::int32_t>::create(4, registry);
  ASSERT_TRUE(a);
  EXPECT_EQ(a->length(), 4u);
  for (std::size_t i = 0; i < 4; ++i) EXPECT_EQ(*a->get(i), 0);

  ASSERT_TRUE(a->set(2, 42));
  EXPECT_EQ(*a->get(2), 42);
  ASSERT_TRUE(a->free());
}

/**
 * @test Index_OutOfBounds_AlwaysChecked
 * @brief get/set/get_ref at length() fail with OutOfBounds in every build.
 */
TEST_F(UnsafeArrayTest, Index_OutOfBounds_AlwaysChecked) {
  auto a = UnsafeArray<std::int32_t>::create(3, registry);
  ASSERT_TRUE(a);
  EXPECT_EQ(a->get(3).error().code, Errc::OutOfBounds);
  EXPECT_EQ(a->set(3, 1).error().code, Errc::OutOfBounds);
  EXPECT_EQ(a->get_ref(100).error().code, Errc::OutOfBounds);
  ASSERT_TRUE(a->free());
}

TEST_F(UnsafeArrayTest, GetRef_WritesThrough) {
  auto a = UnsafeArray<Particle>::create(2, registry);
  ASSERT_TRUE(a);
  auto p = a->get_ref(1);
  ASSERT_TRUE(p);
  (*p)->id = 7;
  (*p)->x  = 1.5f;
  EXPECT_EQ(a->get(1)->id, 7u);
  EXPECT_EQ(a->get(1)->x, 1.5f);
  ASSERT_TRUE(a->free());
}

TEST_F(UnsafeArrayTest, CreateFromSpan_IndexOf_Contains) {
  const std::array<std::uint16_t, 5> src{5, 4, 3, 4, 1};
  auto a = UnsafeArray<std::uint16_t>::create(std::span<const std::uint16_t>(src), registry);
  ASSERT_TRUE(a);
  EXPECT_EQ(a->length(), 5u);

  auto idx = a->try_index_of(4);
  ASSERT_TRUE(idx);
  ASSERT_TRUE(idx->has_value());
  EXPECT_EQ(**idx, 1u);
  EXPECT_EQ(*a->index_of(4), 1u);

  EXPECT_TRUE(*a->contains(1));
  EXPECT_FALSE(*a->contains(9));
  EXPECT_FALSE(a->try_index_of(9)->has_value());
  EXPECT_EQ(a->index_of(9).error().code, Errc::KeyNotFound);

  auto span = a->as_span();
  ASSERT_TRUE(span);
  EXPECT_EQ(span->size(), 5u);
  EXPECT_EQ((*span)[4], 1u);
  ASSERT_TRUE(a->free());
}

/**
 * @test Resize_GrowZeroes_ShrinkKeepsPrefix
 * @brief Growing keeps old elements and zeroes new slots.
 */
TEST_F(UnsafeArrayTest, Resize_GrowZeroes_ShrinkKeepsPrefix) {
  auto a = UnsafeArray<std::int64_t>::create(2, registry);
  ASSERT_TRUE(a);
  ASSERT_TRUE(a->set(0, -1));
  ASSERT_TRUE(a->set(1, -2));

  ASSERT_TRUE(a->resize(6));
  EXPECT_EQ(a->length(), 6u);
  EXPECT_EQ(*a->get(1), -2);
  for (std::size_t i = 2; i < 6; ++i) EXPECT_EQ(*a->get(i), 0);

  ASSERT_TRUE(a->resize(1));
  EXPECT_EQ(*a->get(0), -1);
  EXPECT_EQ(a->get(1).error().code, Errc::OutOfBounds);

  EXPECT_EQ(a->resize(0).error().code, Errc::ZeroCapacity);
  if (unmanaged::config::track_allocations) EXPECT_EQ(registry.count(), 1u);
  ASSERT_TRUE(a->free());
}

TEST_F(UnsafeArrayTest, Clear_And_CopyElementTo) {
  auto a = UnsafeArray<std::uint32_t>::create(3, registry);
  auto b = UnsafeArray<std::uint32_t>::create(2, registry);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  ASSERT_TRUE(a->set(2, 99));

  ASSERT_TRUE(a->copy_element_to(2, *b, 0));
  EXPECT_EQ(*b->get(0), 99u);
  EXPECT_EQ(a->copy_element_to(0, *b, 2).error().code, Errc::OutOfBounds);

  ASSERT_TRUE(a->clear());
  EXPECT_EQ(*a->get(2), 0u);
  ASSERT_TRUE(a->free());
  ASSERT_TRUE(b->free());
}

/**
 * @test FromRaw_TypeMismatch
 * @brief A float buffer cannot be adopted as int elements; the buffer survives.
 */
TEST_F(UnsafeArrayTest, FromRaw_TypeMismatch) {
  auto raw = UnsafeBuffer::create(RuntimeType::get<float>(), 4, registry);
  ASSERT_TRUE(raw);

  auto wrong = UnsafeArray<std::int32_t>::from_raw(std::move(*raw));
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error().code, Errc::TypeMismatch);
  EXPECT_FALSE(raw->is_null());
  EXPECT_EQ(raw->as<std::int32_t>().error().code, Errc::TypeMismatch);

  auto right = UnsafeArray<float>::from_raw(std::move(*raw));
  ASSERT_TRUE(right);
  EXPECT_EQ(right->length(), 4u);
  EXPECT_EQ(*right->get(3), 0.0f);
  ASSERT_TRUE(right->free());
}

TEST_F(UnsafeArrayTest, Buffer_ElementBytes_SizeChecked) {
  auto raw = UnsafeBuffer::create(RuntimeType::get<std::uint16_t>(), 2, registry);
  ASSERT_TRUE(raw);
  const std::array<std::byte, 4> four{};
  EXPECT_EQ(raw->set_element_bytes(0, four).error().code, Errc::TypeMismatch);
  EXPECT_EQ(raw->byte_length(), 4u);
  EXPECT_EQ(UnsafeBuffer::create(RuntimeType{}, 2, registry).error().code, Errc::TypeMismatch);
  ASSERT_TRUE(raw->free());
}

TEST_F(UnsafeArrayTest, UseAfterFree_AlreadyDisposed) {
  if (!unmanaged::config::track_allocations) GTEST_SKIP() << "needs UNMANAGED_TRACK_ALLOCATIONS=ON";
  auto a = UnsafeArray<int>::create(2, registry);
  ASSERT_TRUE(a);
  ASSERT_TRUE(a->free());
  EXPECT_EQ(a->get(0).error().code, Errc::AlreadyDisposed);
  EXPECT_EQ(a->free().error().code, Errc::AlreadyDisposed);
}

// =========================== UnsafeList =====================================

/**
 * @test Add_DoublesCapacityWhenFull
 * @brief 1 → 2 → 4 → 8 as elements are appended.
 */
TEST_F(UnsafeListTest, Add_DoublesCapacityWhenFull) {
  auto l = UnsafeList<int>::create(1, registry);
  ASSERT_TRUE(l);
  EXPECT_EQ(l->capacity(), 1u);
  EXPECT_TRUE(l->empty());

  std::vector<std::size_t> caps;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(l->add(i * 10));
    caps.push_back(l->capacity());
  }
  EXPECT_EQ(caps, (std::vector<std::size_t>{1, 2, 4, 4, 8}));
  EXPECT_EQ(l->count(), 5u);
  EXPECT_EQ(to_vector(*l), (std::vector<int>{0, 10, 20, 30, 40}));
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, ZeroCapacity_GrowsOnFirstAdd) {
  auto l = UnsafeList<double>::create(0, registry);
  ASSERT_TRUE(l);
  EXPECT_EQ(l->capacity(), 0u);
  ASSERT_TRUE(l->add(3.5));
  EXPECT_EQ(l->capacity(), 1u);
  EXPECT_EQ(*l->get(0), 3.5);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, Insert_PreservesOrder) {
  auto l = UnsafeList<int>::create(2, registry);
  ASSERT_TRUE(l);
  ASSERT_TRUE(l->add(1));
  ASSERT_TRUE(l->add(3));
  ASSERT_TRUE(l->insert(1, 2));
  ASSERT_TRUE(l->insert(0, 0));
  ASSERT_TRUE(l->insert(l->count(), 4));
  EXPECT_EQ(to_vector(*l), (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(l->insert(l->count() + 1, 9).error().code, Errc::OutOfBounds);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, RemoveAt_StableAndSwapBack) {
  const std::array<int, 5> src{10, 20, 30, 40, 50};
  auto l = UnsafeList<int>::create(std::span<const int>(src), registry);
  ASSERT_TRUE(l);
  EXPECT_EQ(l->capacity(), 5u);

  auto removed = l->remove_at(1);
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 20);
  EXPECT_EQ(to_vector(*l), (std::vector<int>{10, 30, 40, 50}));

  auto swapped = l->remove_at_by_swap_back(0);
  ASSERT_TRUE(swapped);
  EXPECT_EQ(*swapped, 10);
  EXPECT_EQ(to_vector(*l), (std::vector<int>{50, 30, 40}));

  auto last = l->remove_at_by_swap_back(2);
  ASSERT_TRUE(last);
  EXPECT_EQ(*last, 40);
  EXPECT_EQ(to_vector(*l), (std::vector<int>{50, 30}));

  EXPECT_EQ(l->remove_at(2).error().code, Errc::OutOfBounds);
  EXPECT_EQ(l->get(2).error().code, Errc::OutOfBounds);
  EXPECT_EQ(l->capacity(), 5u);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, AddRange_AddDefault_SetCapacity) {
  auto l = UnsafeList<Particle>::create(1, registry);
  ASSERT_TRUE(l);

  const std::array<Particle, 3> ps{{{1, 1, 1}, {2, 2, 2}, {3, 3, 3}}};
  ASSERT_TRUE(l->add_range(std::span<const Particle>(ps)));
  EXPECT_EQ(l->count(), 3u);
  EXPECT_GE(l->capacity(), 3u);

  ASSERT_TRUE(l->add_default(2));
  EXPECT_EQ(l->count(), 5u);
  EXPECT_EQ(l->get(4)->id, 0u);
  EXPECT_EQ(l->get(2)->id, 3u);

  EXPECT_EQ(l->set_capacity(4).error().code, Errc::OutOfBounds);
  ASSERT_TRUE(l->set_capacity(32));
  EXPECT_EQ(l->capacity(), 32u);
  EXPECT_EQ(l->get(1)->id, 2u);

  l->clear();
  EXPECT_EQ(l->count(), 0u);
  EXPECT_EQ(l->capacity(), 32u);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, IndexOf_SetAndGetRef) {
  auto l = UnsafeList<std::uint8_t>::create(4, registry);
  ASSERT_TRUE(l);
  for (std::uint8_t i = 0; i < 4; ++i) ASSERT_TRUE(l->add(i));

  ASSERT_TRUE(l->set(3, 200));
  auto ref = l->get_ref(0);
  ASSERT_TRUE(ref);
  **ref = 100;

  EXPECT_EQ(*l->index_of(200), 3u);
  EXPECT_EQ(*l->index_of(100), 0u);
  EXPECT_FALSE(*l->contains(0));
  EXPECT_EQ(l->set(4, 1).error().code, Errc::OutOfBounds);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, ContentHash_TracksContent) {
  auto a = UnsafeList<int>::create(4, registry);
  auto b = UnsafeList<int>::create(16, registry);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(a->add(i));
    ASSERT_TRUE(b->add(i));
  }
  EXPECT_EQ(*a->content_hash(), *b->content_hash());

  ASSERT_TRUE(b->set(2, 7));
  EXPECT_NE(*a->content_hash(), *b->content_hash());
  ASSERT_TRUE(a->free());
  ASSERT_TRUE(b->free());
}

TEST_F(UnsafeListTest, RawList_TypeChecks) {
  auto raw = RawList::create(RuntimeType::get<std::uint32_t>(), 2, registry);
  ASSERT_TRUE(raw);
  const std::array<std::byte, 2> two{};
  EXPECT_EQ(raw->add(two).error().code, Errc::TypeMismatch);
  const std::array<std::byte, 6> six{};
  EXPECT_EQ(raw->add_range(six).error().code, Errc::TypeMismatch);

  auto wrong = UnsafeList<float>::from_raw(std::move(*raw));
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error().code, Errc::TypeMismatch);

  auto right = UnsafeList<std::uint32_t>::from_raw(std::move(*raw));
  ASSERT_TRUE(right);
  ASSERT_TRUE(right->add(5u));
  EXPECT_EQ(right->raw().count(), 1u);
  ASSERT_TRUE(right->free());
}

TEST_F(UnsafeListTest, Growth_KeepsSingleLiveRecord) {
  if (!unmanaged::config::track_allocations) GTEST_SKIP() << "needs UNMANAGED_TRACK_ALLOCATIONS=ON";
  auto l = UnsafeList<std::uint64_t>::create(1, registry);
  ASSERT_TRUE(l);
  for (std::uint64_t i = 0; i < 1000; ++i) ASSERT_TRUE(l->add(i));
  EXPECT_EQ(registry.count(), 1u);
  EXPECT_EQ(registry.total_bytes(), l->capacity() * sizeof(std::uint64_t));
  EXPECT_EQ(*l->get(999), 999u);
  ASSERT_TRUE(l->free());
  EXPECT_EQ(registry.count(), 0u);
}

/**
 * @test Add_OwnElement_WhenFull
 * @brief Appending an element read through get_ref() survives the growth
 *        that frees the storage it points into.
 */
TEST_F(UnsafeListTest, Add_OwnElement_WhenFull) {
  auto l = UnsafeList<std::uint64_t>::create(1, registry);
  ASSERT_TRUE(l);
  ASSERT_TRUE(l->add(42u));
  ASSERT_EQ(l->count(), l->capacity());

  auto first = l->get_ref(0);
  ASSERT_TRUE(first);
  ASSERT_TRUE(l->add(**first));
  EXPECT_EQ(l->capacity(), 2u);
  EXPECT_EQ(to_vector(*l), (std::vector<std::uint64_t>{42, 42}));

  auto last = l->get_ref(1);
  ASSERT_TRUE(last);
  ASSERT_TRUE(l->insert(0, **last));
  EXPECT_EQ(to_vector(*l), (std::vector<std::uint64_t>{42, 42, 42}));
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, Insert_OwnElement_ShiftedTail) {
  auto l = UnsafeList<int>::create(8, registry);
  ASSERT_TRUE(l);
  for (int v : {1, 2, 3}) ASSERT_TRUE(l->add(v));

  auto one = l->get_ref(0);
  ASSERT_TRUE(one);
  ASSERT_TRUE(l->insert(0, **one));  // value sits in the shifted range, no growth
  EXPECT_EQ(to_vector(*l), (std::vector<int>{1, 1, 2, 3}));
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, AddRange_OwnElements_WhenFull) {
  const std::array<int, 3> src{7, 8, 9};
  auto l = UnsafeList<int>::create(std::span<const int>(src), registry);
  ASSERT_TRUE(l);

  auto items = l->as_span();
  ASSERT_TRUE(items);
  ASSERT_TRUE(l->add_range(std::span<const int>(*items)));
  EXPECT_EQ(to_vector(*l), (std::vector<int>{7, 8, 9, 7, 8, 9}));
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, Remove_FirstMatch_ReturnsIndex) {
  const std::array<int, 5> src{4, 6, 8, 6, 2};
  auto l = UnsafeList<int>::create(std::span<const int>(src), registry);
  ASSERT_TRUE(l);

  auto removed = l->remove(6);
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 1u);
  EXPECT_EQ(to_vector(*l), (std::vector<int>{4, 8, 6, 2}));

  EXPECT_EQ(l->remove(5).error().code, Errc::KeyNotFound);
  EXPECT_EQ(l->count(), 4u);

  auto at = l->try_index_of(6);
  ASSERT_TRUE(at);
  ASSERT_TRUE(at->has_value());
  EXPECT_EQ(**at, 2u);
  EXPECT_FALSE(l->try_index_of(5)->has_value());
  EXPECT_EQ(l->index_of(5).error().code, Errc::KeyNotFound);
  ASSERT_TRUE(l->free());
}

TEST_F(UnsafeListTest, AsSpan_Ranges) {
  const std::array<int, 5> src{0, 1, 2, 3, 4};
  auto l = UnsafeList<int>::create(std::span<const int>(src), registry);
  ASSERT_TRUE(l);
  ASSERT_TRUE(l->set_capacity(16));

  auto tail = l->as_span(3);
  ASSERT_TRUE(tail);
  EXPECT_EQ(std::vector<int>(tail->begin(), tail->end()), (std::vector<int>{3, 4}));

  auto mid = l->as_span(1, 3);
  ASSERT_TRUE(mid);
  EXPECT_EQ(std::vector<int>(mid->begin(), mid->end()), (std::vector<int>{1, 2, 3}));

  EXPECT_TRUE(l->as_span(5, 0));
  EXPECT_EQ(l->as_span(5).error().code, Errc::OutOfBounds);
  EXPECT_EQ(l->as_span(4, 2).error().code, Errc::OutOfBounds);
  EXPECT_EQ(l->as_span(6, 0).error().code, Errc::OutOfBounds);
  ASSERT_TRUE(l->free());
}

/**
 * @test CopyTo_ListAndSpan
 * @brief Element copy between lists requires both indices in range; the span
 *        form copies the source tail and refuses a destination that is too short.
 */
TEST_F(UnsafeListTest, CopyTo_ListAndSpan) {
  const std::array<int, 4> a_src{10, 20, 30, 40};
  const std::array<int, 2> b_src{0, 0};
  auto a = UnsafeList<int>::create(std::span<const int>(a_src), registry);
  auto b = UnsafeList<int>::create(std::span<const int>(b_src), registry);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);

  ASSERT_TRUE(a->copy_to(2, *b, 1));
  EXPECT_EQ(to_vector(*b), (std::vector<int>{0, 30}));
  EXPECT_EQ(a->copy_to(4, *b, 0).error().code, Errc::OutOfBounds);
  EXPECT_EQ(a->copy_to(0, *b, 2).error().code, Errc::OutOfBounds);

  std::array<int, 5> out{};
  ASSERT_TRUE(a->copy_to(1, std::span<int>(out), 2));
  EXPECT_EQ(out, (std::array<int, 5>{0, 0, 20, 30, 40}));
  EXPECT_EQ(a->copy_to(0, std::span<int>(out), 2).error().code, Errc::OutOfBounds);
  EXPECT_EQ(a->copy_to(4, std::span<int>(out), 0).error().code, Errc::OutOfBounds);

  ASSERT_TRUE(a->free());
  ASSERT_TRUE(b->free());
}

TEST_F(UnsafeListTest, RawList_CopyElement_TypeChecked) {
  auto ints   = RawList::create(RuntimeType::get<std::uint32_t>(), 1, registry);
  auto floats = RawList::create(RuntimeType::get<float>(), 1, registry);
  ASSERT_TRUE(ints);
  ASSERT_TRUE(floats);
  ASSERT_TRUE(ints->add_default(1));
  ASSERT_TRUE(floats->add_default(1));
  EXPECT_EQ(ints->copy_element_to(0, *floats, 0).error().code, Errc::TypeMismatch);
  ASSERT_TRUE(ints->free());
  ASSERT_TRUE(floats->free());
}
