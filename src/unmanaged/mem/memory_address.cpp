/**
 * @file memory_address.cpp
 * @brief Allocation, release and byte-level operations for MemoryAddress / MemoryView.
 */
#include "unmanaged/mem/memory_address.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace unmanaged::mem {

using Tracking = detail::ActiveTracking;

namespace {

/// malloc(0) may return null or a shared sentinel; always ask for at least one
/// byte so a zero-length allocation still owns a unique, registrable address.
inline std::size_t native_size(std::size_t byte_length) noexcept {
  return std::max<std::size_t>(byte_length, 1);
}

} // namespace

//------------------------------- MemoryView -----------------------------------

Result<std::span<std::byte>> MemoryView::bytes(std::size_t byte_offset, std::size_t byte_length,
                                               const Site& site) const {
  if (auto st = check(byte_offset, byte_length, site); !st) {
    return unmanaged_detail::unexpected<Error>(st.error());
  }
  return std::span<std::byte>(data_ + byte_offset, byte_length);
}

Status MemoryView::fill(std::size_t byte_offset, std::size_t byte_length, std::byte value,
                        const Site& site) const {
  if (auto st = check(byte_offset, byte_length, site); !st) return st;
  if (byte_length != 0) std::memset(data_ + byte_offset, std::to_integer<int>(value), byte_length);
  return {};
}

Status MemoryView::fill(std::byte value, const Site& site) const {
  return fill(0, length_, value, site);
}

Status MemoryView::clear(std::size_t byte_offset, std::size_t byte_length, const Site& site) const {
  return fill(byte_offset, byte_length, std::byte{0}, site);
}

Status MemoryView::clear(const Site& site) const {
  return fill(0, length_, std::byte{0}, site);
}

Status MemoryView::copy_to(const MemoryView& destination, std::size_t source_offset,
                           std::size_t destination_offset, std::size_t byte_length,
                           const Site& site) const {
  if (auto st = check(source_offset, byte_length, site); !st) return st;
  if (auto st = destination.check(destination_offset, byte_length, site); !st) return st;
  if (byte_length != 0) {
    std::memmove(destination.data_ + destination_offset, data_ + source_offset, byte_length);
  }
  return {};
}

Status MemoryView::copy_from(std::span<const std::byte> source, std::size_t byte_offset,
                             const Site& site) const {
  if (auto st = check(byte_offset, source.size(), site); !st) return st;
  if (!source.empty()) std::memmove(data_ + byte_offset, source.data(), source.size());
  return {};
}

//------------------------------- MemoryAddress --------------------------------

Result<MemoryAddress> MemoryAddress::adopt(void* ptr, std::size_t byte_length,
                                           AllocationRegistry& registry, const Site& site) {
  if (ptr == nullptr) return fail(Errc::AllocationFailed);

  const auto address = reinterpret_cast<std::uintptr_t>(ptr);
  auto id = Tracking::on_allocate(registry, address, byte_length, site);
  if (!id) {
    std::free(ptr);
    return unmanaged_detail::unexpected<Error>(id.error());
  }

  MemoryAddress h;
  h.ptr_      = static_cast<std::byte*>(ptr);
  h.length_   = byte_length;
  h.id_       = *id;
  h.registry_ = &registry;
  return h;
}

Result<MemoryAddress> MemoryAddress::allocate(std::size_t byte_length,
                                              AllocationRegistry& registry, const Site& site) {
  return adopt(std::malloc(native_size(byte_length)), byte_length, registry, site);
}

Result<MemoryAddress> MemoryAddress::allocate_zeroed(std::size_t byte_length,
                                                     AllocationRegistry& registry,
                                                     const Site& site) {
  return adopt(std::calloc(native_size(byte_length), 1), byte_length, registry, site);
}

Status MemoryAddress::free(const Site& site) {
  if (ptr_ == nullptr) return fail(Errc::NotLive);

  if (freed_) {
    if constexpr (Tracking::enabled) {
      // Ids are never reused, so this reports AlreadyDisposed with the disposal site.
      return registry_->unregister(address(), site, id_);
    }
    return fail(Errc::AlreadyDisposed, address());
  }

  if (auto st = Tracking::on_free(*registry_, address(), id_, site); !st) return st;
  std::free(ptr_);
  freed_ = true;
  return {};
}

Status MemoryAddress::resize(MemoryAddress& handle, std::size_t new_byte_length, const Site& site) {
  if (handle.ptr_ == nullptr) return fail(Errc::NotLive);
  if (handle.freed_) {
    if constexpr (Tracking::enabled) {
      return handle.registry_->require_live(handle.address(), handle.id_, site);
    }
    return fail(Errc::AlreadyDisposed, handle.address());
  }
  if (auto st = Tracking::require_live(handle.registry_, handle.address(), handle.id_, site); !st) {
    return st;
  }

  const std::uintptr_t old_address = handle.address();
  void* moved = std::realloc(handle.ptr_, native_size(new_byte_length));
  if (moved == nullptr) return fail(Errc::AllocationFailed, old_address); // old block still valid

  const auto new_address = reinterpret_cast<std::uintptr_t>(moved);
  handle.ptr_    = static_cast<std::byte*>(moved);
  handle.length_ = new_byte_length;
  return Tracking::on_resize(*handle.registry_, old_address, handle.id_, new_address,
                             new_byte_length, site);
}

} // namespace unmanaged::mem
