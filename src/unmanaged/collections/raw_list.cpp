/**
 * @file raw_list.cpp
 * @brief RawList growth, insertion and removal.
 */
#include "unmanaged/collections/raw_list.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace unmanaged::collections {

using namespace unmanaged::config::constants;

namespace {

bool fits(std::size_t count, std::size_t element_size) noexcept {
  return element_size != 0 && count <= std::numeric_limits<std::size_t>::max() / element_size;
}

/// true when @p bytes lies (partly) inside the allocation of @p h.
bool overlaps(std::span<const std::byte> bytes, const mem::MemoryAddress& h) noexcept {
  if (bytes.empty() || h.is_null()) return false;
  const auto begin = reinterpret_cast<std::uintptr_t>(bytes.data());
  return begin < h.address() + h.length() && h.address() < begin + bytes.size();
}

} // namespace

Result<RawList> RawList::create(types::RuntimeType type, std::size_t capacity,
                                mem::AllocationRegistry& registry, const Site& site) {
  if (!type.is_valid()) return fail(Errc::TypeMismatch);
  if (!fits(capacity, type.size())) return fail(Errc::AllocationFailed);

  auto items = mem::MemoryAddress::allocate(capacity * type.size(), registry, site);
  if (!items) return unmanaged_detail::unexpected<Error>(items.error());

  RawList list;
  list.type_     = type;
  list.capacity_ = capacity;
  list.items_    = std::move(*items);
  return list;
}

Status RawList::free(const Site& site) {
  return items_.free(site);
}

Status RawList::check_element(std::span<const std::byte> bytes) const {
  if (bytes.size() != type_.size()) return fail(Errc::TypeMismatch, items_.address());
  return {};
}

//------------------------------- Element access -------------------------------

Result<std::span<std::byte>> RawList::element_bytes(std::size_t index, const Site& site) const {
  if (index >= count_) return fail(Errc::OutOfBounds, items_.address());
  const std::size_t size = type_.size();
  return items_.view().bytes(index * size, size, site);
}

Status RawList::set_element_bytes(std::size_t index, std::span<const std::byte> bytes,
                                  const Site& site) {
  if (auto st = check_element(bytes); !st) return st;
  if (index >= count_) return fail(Errc::OutOfBounds, items_.address());
  return items_.view().copy_from(bytes, index * type_.size(), site);
}

Status RawList::copy_element_to(std::size_t source_index, RawList& destination,
                                std::size_t destination_index, const Site& site) const {
  if (!(destination.type_ == type_)) return fail(Errc::TypeMismatch, destination.items_.address());
  if (source_index >= count_) return fail(Errc::OutOfBounds, items_.address());
  if (destination_index >= destination.count_) {
    return fail(Errc::OutOfBounds, destination.items_.address());
  }
  const std::size_t size = type_.size();
  return items_.view().copy_to(destination.items_.view(), source_index * size,
                               destination_index * size, size, site);
}

Result<std::span<std::byte>> RawList::bytes(const Site& site) const {
  return items_.view().bytes(0, count_ * type_.size(), site);
}

//------------------------------- Capacity -------------------------------------

Status RawList::set_capacity(std::size_t capacity, const Site& site) {
  if (capacity < count_) return fail(Errc::OutOfBounds, items_.address());
  if (!fits(capacity, type_.size())) return fail(Errc::AllocationFailed, items_.address());
  if (capacity == capacity_) return {};

  if (auto st = mem::MemoryAddress::resize(items_, capacity * type_.size(), site); !st) return st;
  capacity_ = capacity;
  return {};
}

Status RawList::reserve(std::size_t required, const Site& site) {
  if (required <= capacity_) return {};
  std::size_t grown = capacity_ * LIST_GROWTH_FACTOR;
  grown = std::max({grown, capacity_ + 1, required});
  return set_capacity(grown, site);
}

//------------------------------- Mutation -------------------------------------

Status RawList::add(std::span<const std::byte> bytes, const Site& site) {
  if (auto st = check_element(bytes); !st) return st;
  // Growth frees the old storage; an element taken from this list is copied out first.
  std::vector<std::byte> staged;
  if (overlaps(bytes, items_)) {
    staged.assign(bytes.begin(), bytes.end());
    bytes = staged;
  }
  if (auto st = reserve(count_ + 1, site); !st) return st;
  if (auto st = items_.view().copy_from(bytes, count_ * type_.size(), site); !st) return st;
  ++count_;
  return {};
}

Status RawList::add_range(std::span<const std::byte> bytes, const Site& site) {
  const std::size_t size = type_.size();
  if (size == 0 || bytes.size() % size != 0) return fail(Errc::TypeMismatch, items_.address());
  const std::size_t n = bytes.size() / size;
  if (n == 0) return {};

  std::vector<std::byte> staged;
  if (overlaps(bytes, items_)) {
    staged.assign(bytes.begin(), bytes.end());
    bytes = staged;
  }
  if (auto st = reserve(count_ + n, site); !st) return st;
  if (auto st = items_.view().copy_from(bytes, count_ * size, site); !st) return st;
  count_ += n;
  return {};
}

Status RawList::add_default(std::size_t n, const Site& site) {
  if (n == 0) return {};
  const std::size_t size = type_.size();
  if (auto st = reserve(count_ + n, site); !st) return st;
  if (auto st = items_.view().clear(count_ * size, n * size, site); !st) return st;
  count_ += n;
  return {};
}

Status RawList::insert(std::size_t index, std::span<const std::byte> bytes, const Site& site) {
  if (auto st = check_element(bytes); !st) return st;
  if (index > count_) return fail(Errc::OutOfBounds, items_.address());
  // Both growth and the tail shift below can overwrite an element of this list.
  std::vector<std::byte> staged;
  if (overlaps(bytes, items_)) {
    staged.assign(bytes.begin(), bytes.end());
    bytes = staged;
  }
  if (auto st = reserve(count_ + 1, site); !st) return st;

  const std::size_t size = type_.size();
  const mem::MemoryView view = items_.view();
  if (auto st = view.copy_to(view, index * size, (index + 1) * size, (count_ - index) * size, site); !st) {
    return st;
  }
  if (auto st = view.copy_from(bytes, index * size, site); !st) return st;
  ++count_;
  return {};
}

Status RawList::remove_at(std::size_t index, const Site& site) {
  if (index >= count_) return fail(Errc::OutOfBounds, items_.address());

  const std::size_t size = type_.size();
  const mem::MemoryView view = items_.view();
  const std::size_t tail = count_ - index - 1;
  if (tail != 0) {
    if (auto st = view.copy_to(view, (index + 1) * size, index * size, tail * size, site); !st) {
      return st;
    }
  }
  --count_;
  return {};
}

Status RawList::remove_at_by_swap_back(std::size_t index, const Site& site) {
  if (index >= count_) return fail(Errc::OutOfBounds, items_.address());

  const std::size_t last = count_ - 1;
  if (index != last) {
    const std::size_t size = type_.size();
    const mem::MemoryView view = items_.view();
    if (auto st = view.copy_to(view, last * size, index * size, size, site); !st) return st;
  }
  --count_;
  return {};
}

//------------------------------- Hashing --------------------------------------

Result<std::uint64_t> RawList::content_hash(const Site& site) const {
  auto content = bytes(site);
  if (!content) return unmanaged_detail::unexpected<Error>(content.error());

  std::uint64_t hash = HASH_SEED;
  auto mix = [&hash](std::uint64_t word, int width) {
    for (int shift = 0; shift < width; shift += 8) {
      hash ^= (word >> shift) & 0xFFu;
      hash *= HASH_PRIME;
    }
  };
  mix(type_.raw(), 32);
  mix(static_cast<std::uint64_t>(count_), 64);
  for (std::byte b : *content) {
    hash ^= std::to_integer<std::uint64_t>(b);
    hash *= HASH_PRIME;
  }
  return hash;
}

} // namespace unmanaged::collections
