/**
 * @file unsafe_dictionary.hpp
 * @brief Typed hash map over a RawDictionary.
 *
 * Keys compare by bytes, so K must have unique object representations
 * (no padding, no floating point). Value pointers returned by get_ref() are
 * invalidated by any insertion that grows the table.
 *
 * @tparam K Key type (KeyTraits<K>::ok).
 * @tparam V Trivially copyable value type.
 */
#pragma once

#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <utility>

#include "unmanaged/collections/raw_dictionary.hpp"
#include "unmanaged/core/traits.hpp"

namespace unmanaged::collections {

template <class K, class V>
class UnsafeDictionary final {
  static_assert(KeyTraits<K>::ok,
                "UnsafeDictionary<K, V>: K must be trivially copyable with unique object representations");
  static_assert(UnmanagedTraits<V>::ok, "UnsafeDictionary<K, V>: V must be trivially copyable");

public:
  using key_type    = K;
  using mapped_type = V;

  UnsafeDictionary() noexcept = default;

  UnsafeDictionary(const UnsafeDictionary&)            = delete;
  UnsafeDictionary& operator=(const UnsafeDictionary&) = delete;
  UnsafeDictionary(UnsafeDictionary&&) noexcept            = default;
  UnsafeDictionary& operator=(UnsafeDictionary&&) noexcept = default;

  static Result<UnsafeDictionary>
  create(std::size_t capacity = config::constants::DEFAULT_DICTIONARY_CAPACITY,
         mem::AllocationRegistry& registry = mem::default_registry(),
         const Site& site = Site::current()) {
    auto key_type = types::RuntimeType::lookup<K>();
    if (!key_type) return unmanaged_detail::unexpected<Error>(key_type.error());
    auto value_type = types::RuntimeType::lookup<V>();
    if (!value_type) return unmanaged_detail::unexpected<Error>(value_type.error());
    auto d = RawDictionary::create(*key_type, *value_type, capacity, registry, site);
    if (!d) return unmanaged_detail::unexpected<Error>(d.error());
    return UnsafeDictionary(std::move(*d));
  }

  /// @brief Adopt a type-erased dictionary; TypeMismatch (untouched) unless it maps K to V.
  static Result<UnsafeDictionary> from_raw(RawDictionary&& d) {
    if (!d.key_type().template is<K>() || !d.value_type().template is<V>()) {
      return fail(Errc::TypeMismatch, d.key_storage().address());
    }
    return UnsafeDictionary(std::move(d));
  }

  Status free(const Site& site = Site::current()) { return map_.free(site); }

  std::size_t count()    const noexcept { return map_.count(); }
  std::size_t capacity() const noexcept { return map_.capacity(); }
  bool        empty()    const noexcept { return map_.empty(); }
  bool        is_null()  const noexcept { return map_.is_null(); }

  const RawDictionary& raw() const noexcept { return map_; }

  /// @brief Insert; DuplicateKey if @p key is present.
  Status add(const K& key, const V& value, const Site& site = Site::current()) {
    return map_.add(bytes_of(key), bytes_of(value), site);
  }

  /// @brief Insert or overwrite.
  Status set(const K& key, const V& value, const Site& site = Site::current()) {
    return map_.set(bytes_of(key), bytes_of(value), site);
  }

  Result<bool> contains_key(const K& key, const Site& site = Site::current()) const {
    return map_.contains_key(bytes_of(key), site);
  }

  /// @brief Pointer to the stored value; KeyNotFound when absent.
  Result<V*> get_ref(const K& key, const Site& site = Site::current()) const {
    auto bytes = map_.value_bytes(bytes_of(key), site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    return reinterpret_cast<V*>(bytes->data());
  }

  Result<V> get(const K& key, const Site& site = Site::current()) const {
    auto bytes = map_.value_bytes(bytes_of(key), site);
    if (!bytes) return unmanaged_detail::unexpected<Error>(bytes.error());
    V out;
    std::memcpy(&out, bytes->data(), sizeof(V));
    return out;
  }

  /// @brief Copy of the value, nullopt when absent. Other failures still propagate.
  Result<std::optional<V>> try_get(const K& key, const Site& site = Site::current()) const {
    auto value = get(key, site);
    if (value) return std::optional<V>(*value);
    if (value.error() == Errc::KeyNotFound) return std::optional<V>{};
    return unmanaged_detail::unexpected<Error>(value.error());
  }

  /// @brief Remove @p key; KeyNotFound when absent.
  Status remove(const K& key, const Site& site = Site::current()) {
    return map_.remove(bytes_of(key), site);
  }

  Status clear(const Site& site = Site::current()) { return map_.clear(site); }

  /// @brief Call fn(const K&, V&) for every entry (slot order, not insertion order).
  template <class Fn>
  Status for_each(Fn&& fn, const Site& site = Site::current()) const {
    return map_.for_each(
      [&fn](std::span<const std::byte> k, std::span<std::byte> v) {
        K key;
        std::memcpy(&key, k.data(), sizeof(K));
        fn(static_cast<const K&>(key), *reinterpret_cast<V*>(v.data()));
      },
      site);
  }

private:
  explicit UnsafeDictionary(RawDictionary&& d) noexcept : map_(std::move(d)) {}

  template <class T>
  static std::span<const std::byte> bytes_of(const T& value) noexcept {
    return std::as_bytes(std::span<const T, 1>(&value, 1));
  }

  RawDictionary map_{};
};

} // namespace unmanaged::collections
