/**
 * @file raw_dictionary.cpp
 * @brief RawDictionary probing, growth and tombstone handling.
 */
#include "unmanaged/collections/raw_dictionary.hpp"

#include <bit>
#include <cstring>
#include <limits>
#include <vector>

namespace unmanaged::collections {

using namespace unmanaged::config::constants;

namespace {

struct Storage {
  mem::MemoryAddress keys;
  mem::MemoryAddress values;
  mem::MemoryAddress states;
};

bool fits(std::size_t count, std::size_t element_size) noexcept {
  return element_size != 0 && count <= std::numeric_limits<std::size_t>::max() / element_size;
}

/// true when @p bytes lies (partly) inside the allocation of @p h.
bool overlaps(std::span<const std::byte> bytes, const mem::MemoryAddress& h) noexcept {
  if (bytes.empty() || h.is_null()) return false;
  const auto begin = reinterpret_cast<std::uintptr_t>(bytes.data());
  return begin < h.address() + h.length() && h.address() < begin + bytes.size();
}

/// Free @p h if it still owns memory; keeps the first failure in @p first.
void release(mem::MemoryAddress& h, const Site& site, Status& first) {
  if (h.is_null() || h.is_freed()) return;
  if (auto st = h.free(site); !st && first) first = st;
}

Status release_all(Storage& s, const Site& site) {
  Status first{};
  release(s.keys, site, first);
  release(s.values, site, first);
  release(s.states, site, first);
  return first;
}

Result<Storage> allocate_storage(types::RuntimeType key_type, types::RuntimeType value_type,
                                 std::size_t capacity, mem::AllocationRegistry& registry,
                                 const Site& site) {
  if (!fits(capacity, key_type.size()) || !fits(capacity, value_type.size())) {
    return fail(Errc::AllocationFailed);
  }

  Storage s;
  auto keys = mem::MemoryAddress::allocate(capacity * key_type.size(), registry, site);
  if (!keys) return unmanaged_detail::unexpected<Error>(keys.error());
  s.keys = std::move(*keys);

  auto values = mem::MemoryAddress::allocate(capacity * value_type.size(), registry, site);
  if (!values) {
    if (auto st = release_all(s, site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    return unmanaged_detail::unexpected<Error>(values.error());
  }
  s.values = std::move(*values);

  // Zeroed: every slot starts SlotState::Empty.
  auto states = mem::MemoryAddress::allocate_zeroed(capacity, registry, site);
  if (!states) {
    if (auto st = release_all(s, site); !st) return unmanaged_detail::unexpected<Error>(st.error());
    return unmanaged_detail::unexpected<Error>(states.error());
  }
  s.states = std::move(*states);
  return s;
}

} // namespace

//------------------------------- Lifetime -------------------------------------

Result<RawDictionary> RawDictionary::create(types::RuntimeType key_type, types::RuntimeType value_type,
                                            std::size_t capacity, mem::AllocationRegistry& registry,
                                            const Site& site) {
  if (!key_type.is_valid() || !value_type.is_valid()) return fail(Errc::TypeMismatch);
  if (capacity == 0) return fail(Errc::ZeroCapacity);
  if (capacity > (std::numeric_limits<std::size_t>::max() >> 1) + 1) return fail(Errc::AllocationFailed);

  const std::size_t slots = std::bit_ceil(capacity);
  auto storage = allocate_storage(key_type, value_type, slots, registry, site);
  if (!storage) return unmanaged_detail::unexpected<Error>(storage.error());

  RawDictionary d;
  d.key_type_   = key_type;
  d.value_type_ = value_type;
  d.capacity_   = slots;
  d.keys_       = std::move(storage->keys);
  d.values_     = std::move(storage->values);
  d.states_     = std::move(storage->states);
  d.registry_   = &registry;
  return d;
}

Status RawDictionary::free(const Site& site) {
  if (keys_.is_null()) return fail(Errc::NotLive);
  Status first{};
  if (auto st = keys_.free(site); !st) first = st;
  if (auto st = values_.free(site); !st && first) first = st;
  if (auto st = states_.free(site); !st && first) first = st;
  return first;
}

//------------------------------- Helpers --------------------------------------

Result<RawDictionary::Slots> RawDictionary::view_slots(const mem::MemoryAddress& keys,
                                                       const mem::MemoryAddress& values,
                                                       const mem::MemoryAddress& states,
                                                       const Site& site) {
  auto k = keys.view().bytes(0, keys.length(), site);
  if (!k) return unmanaged_detail::unexpected<Error>(k.error());
  auto v = values.view().bytes(0, values.length(), site);
  if (!v) return unmanaged_detail::unexpected<Error>(v.error());
  auto s = states.view().bytes(0, states.length(), site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  return Slots{*k, *v, *s};
}

Result<RawDictionary::Slots> RawDictionary::slots(const Site& site) const {
  if (capacity_ == 0 || keys_.is_null()) return fail(Errc::NotLive);
  return view_slots(keys_, values_, states_, site);
}

Status RawDictionary::check_key(std::span<const std::byte> key) const {
  if (key.size() != key_type_.size()) return fail(Errc::TypeMismatch, keys_.address());
  return {};
}

Status RawDictionary::check_value(std::span<const std::byte> value) const {
  if (value.size() != value_type_.size()) return fail(Errc::TypeMismatch, values_.address());
  return {};
}

std::uint64_t RawDictionary::hash_key(std::span<const std::byte> key) const noexcept {
  std::uint64_t hash = HASH_SEED ^ key_type_.raw();
  for (std::byte b : key) {
    hash ^= std::to_integer<std::uint64_t>(b);
    hash *= HASH_PRIME;
  }
  // Spread high bits into the low bits used by the slot mask.
  hash ^= hash >> 33;
  hash *= 0xff51afd7ed558ccdULL;
  hash ^= hash >> 33;
  return hash;
}

RawDictionary::Probe RawDictionary::probe(const Slots& s, std::size_t capacity,
                                          std::span<const std::byte> key) const noexcept {
  const std::size_t ksize = key_type_.size();
  const std::size_t mask  = capacity - 1;
  std::size_t first_removed = npos;

  std::size_t i = static_cast<std::size_t>(hash_key(key)) & mask;
  for (std::size_t n = 0; n < capacity; ++n, i = (i + 1) & mask) {
    switch (static_cast<SlotState>(s.states[i])) {
      case SlotState::Empty:
        return Probe{npos, first_removed != npos ? first_removed : i};
      case SlotState::Removed:
        if (first_removed == npos) first_removed = i;
        break;
      case SlotState::Occupied:
        if (std::memcmp(s.keys.data() + i * ksize, key.data(), ksize) == 0) return Probe{i, npos};
        break;
    }
  }
  return Probe{npos, first_removed};
}

Status RawDictionary::rehash(std::size_t new_capacity, const Site& site) {
  auto fresh = allocate_storage(key_type_, value_type_, new_capacity, *registry_, site);
  if (!fresh) return unmanaged_detail::unexpected<Error>(fresh.error());

  // On failure the fresh table is dropped and the current one stays in place.
  auto abandon = [&](const Error& e) -> Status {
    if (auto st = release_all(*fresh, site); !st) return st;
    return unmanaged_detail::unexpected<Error>(e);
  };

  auto old_slots = slots(site);
  if (!old_slots) return abandon(old_slots.error());
  auto new_slots = view_slots(fresh->keys, fresh->values, fresh->states, site);
  if (!new_slots) return abandon(new_slots.error());

  const std::size_t ksize = key_type_.size();
  const std::size_t vsize = value_type_.size();
  for (std::size_t i = 0; i < capacity_; ++i) {
    if (static_cast<SlotState>(old_slots->states[i]) != SlotState::Occupied) continue;
    const auto key = std::span<const std::byte>(old_slots->keys.subspan(i * ksize, ksize));
    const std::size_t at = probe(*new_slots, new_capacity, key).insert_at;
    std::memcpy(new_slots->keys.data() + at * ksize, key.data(), ksize);
    std::memcpy(new_slots->values.data() + at * vsize, old_slots->values.data() + i * vsize, vsize);
    new_slots->states[at] = static_cast<std::byte>(SlotState::Occupied);
  }

  // Swap the new table in, then release the old one.
  Storage old;
  old.keys   = std::move(keys_);
  old.values = std::move(values_);
  old.states = std::move(states_);
  keys_      = std::move(fresh->keys);
  values_    = std::move(fresh->values);
  states_    = std::move(fresh->states);
  capacity_  = new_capacity;
  removed_   = 0;
  return release_all(old, site);
}

Status RawDictionary::insert_new(std::span<const std::byte> key, std::span<const std::byte> value,
                                 const Site& site) {
  // A rehash frees the current slots, so key or value bytes read from this
  // dictionary are copied out before it runs.
  std::vector<std::byte> staged_key;
  std::vector<std::byte> staged_value;
  if (overlaps(key, keys_) || overlaps(key, values_)) {
    staged_key.assign(key.begin(), key.end());
    key = staged_key;
  }
  if (overlaps(value, keys_) || overlaps(value, values_)) {
    staged_value.assign(value.begin(), value.end());
    value = staged_value;
  }

  const bool grow  = (count_ + 1) * DICTIONARY_MAX_LOAD_DEN > capacity_ * DICTIONARY_MAX_LOAD_NUM;
  const bool purge = (count_ + removed_ + 1) * DICTIONARY_MAX_LOAD_DEN > capacity_ * DICTIONARY_MAX_LOAD_NUM;
  if (grow) {
    if (auto st = rehash(capacity_ * 2, site); !st) return st;
  } else if (purge) {
    if (auto st = rehash(capacity_, site); !st) return st;
  }

  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  const std::size_t at = probe(*s, capacity_, key).insert_at;
  if (at == npos) return fail(Errc::OutOfBounds, keys_.address());

  if (static_cast<SlotState>(s->states[at]) == SlotState::Removed) --removed_;
  std::memcpy(s->keys.data() + at * key_type_.size(), key.data(), key.size());
  std::memcpy(s->values.data() + at * value_type_.size(), value.data(), value.size());
  s->states[at] = static_cast<std::byte>(SlotState::Occupied);
  ++count_;
  return {};
}

//------------------------------- Operations -----------------------------------

Status RawDictionary::add(std::span<const std::byte> key, std::span<const std::byte> value,
                          const Site& site) {
  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  if (auto st = check_key(key); !st) return st;
  if (auto st = check_value(value); !st) return st;
  if (probe(*s, capacity_, key).found != npos) return fail(Errc::DuplicateKey, keys_.address());
  return insert_new(key, value, site);
}

Status RawDictionary::set(std::span<const std::byte> key, std::span<const std::byte> value,
                          const Site& site) {
  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  if (auto st = check_key(key); !st) return st;
  if (auto st = check_value(value); !st) return st;
  const std::size_t found = probe(*s, capacity_, key).found;
  if (found == npos) return insert_new(key, value, site);
  std::memmove(s->values.data() + found * value_type_.size(), value.data(), value.size());
  return {};
}

Result<bool> RawDictionary::contains_key(std::span<const std::byte> key, const Site& site) const {
  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  if (auto st = check_key(key); !st) return unmanaged_detail::unexpected<Error>(st.error());
  return probe(*s, capacity_, key).found != npos;
}

Result<std::span<std::byte>> RawDictionary::value_bytes(std::span<const std::byte> key,
                                                        const Site& site) const {
  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  if (auto st = check_key(key); !st) return unmanaged_detail::unexpected<Error>(st.error());
  const std::size_t found = probe(*s, capacity_, key).found;
  if (found == npos) return fail(Errc::KeyNotFound, keys_.address());
  const std::size_t vsize = value_type_.size();
  return s->values.subspan(found * vsize, vsize);
}

Status RawDictionary::remove(std::span<const std::byte> key, const Site& site) {
  auto s = slots(site);
  if (!s) return unmanaged_detail::unexpected<Error>(s.error());
  if (auto st = check_key(key); !st) return st;
  const std::size_t found = probe(*s, capacity_, key).found;
  if (found == npos) return fail(Errc::KeyNotFound, keys_.address());
  s->states[found] = static_cast<std::byte>(SlotState::Removed);
  --count_;
  ++removed_;
  return {};
}

Status RawDictionary::clear(const Site& site) {
  if (capacity_ == 0 || states_.is_null()) return fail(Errc::NotLive);
  if (auto st = states_.view().clear(site); !st) return st;
  count_   = 0;
  removed_ = 0;
  return {};
}

} // namespace unmanaged::collections
