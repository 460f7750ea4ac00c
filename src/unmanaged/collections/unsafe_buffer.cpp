// =============================================================
// File: src/unmanaged/collections/unsafe_buffer.cpp
// =============================================================
#include "unmanaged/collections/unsafe_buffer.hpp"

#include <limits>

namespace unmanaged::collections {

Result<UnsafeBuffer> UnsafeBuffer::create(types::RuntimeType type, std::size_t length,
                                          mem::AllocationRegistry& registry, const Site& site) {
  if (!type.is_valid()) return fail(Errc::TypeMismatch);
  if (length == 0) return fail(Errc::ZeroCapacity);
  if (length > std::numeric_limits<std::size_t>::max() / type.size()) {
    return fail(Errc::AllocationFailed);
  }

  auto storage = mem::MemoryAddress::allocate_zeroed(length * type.size(), registry, site);
  if (!storage) return unmanaged_detail::unexpected<Error>(storage.error());

  UnsafeBuffer b;
  b.type_    = type;
  b.length_  = length;
  b.storage_ = std::move(*storage);
  return b;
}

Status UnsafeBuffer::free(const Site& site) {
  return storage_.free(site);
}

Result<std::span<std::byte>> UnsafeBuffer::element_bytes(std::size_t index, const Site& site) const {
  if (index >= length_) return fail(Errc::OutOfBounds, storage_.address());
  const std::size_t size = type_.size();
  return storage_.view().bytes(index * size, size, site);
}

Status UnsafeBuffer::set_element_bytes(std::size_t index, std::span<const std::byte> bytes,
                                       const Site& site) {
  if (bytes.size() != type_.size()) return fail(Errc::TypeMismatch, storage_.address());
  if (index >= length_) return fail(Errc::OutOfBounds, storage_.address());
  return storage_.view().copy_from(bytes, index * type_.size(), site);
}

Status UnsafeBuffer::copy_element_to(std::size_t source_index, const UnsafeBuffer& destination,
                                     std::size_t destination_index, const Site& site) const {
  if (!(destination.type_ == type_)) return fail(Errc::TypeMismatch, destination.storage_.address());
  if (source_index >= length_) return fail(Errc::OutOfBounds, storage_.address());
  if (destination_index >= destination.length_) {
    return fail(Errc::OutOfBounds, destination.storage_.address());
  }
  const std::size_t size = type_.size();
  return storage_.view().copy_to(destination.storage_.view(), source_index * size,
                                 destination_index * size, size, site);
}

Status UnsafeBuffer::resize(std::size_t new_length, bool zero_new_slots, const Site& site) {
  if (new_length == 0) return fail(Errc::ZeroCapacity, storage_.address());
  const std::size_t size = type_.size();
  if (size == 0 || new_length > std::numeric_limits<std::size_t>::max() / size) {
    return fail(Errc::AllocationFailed, storage_.address());
  }

  const std::size_t old_bytes = length_ * size;
  const std::size_t new_bytes = new_length * size;
  if (auto st = mem::MemoryAddress::resize(storage_, new_bytes, site); !st) return st;
  length_ = new_length;

  if (zero_new_slots && new_bytes > old_bytes) {
    return storage_.view().clear(old_bytes, new_bytes - old_bytes, site);
  }
  return {};
}

Status UnsafeBuffer::clear(const Site& site) {
  return storage_.view().clear(site);
}

} // namespace unmanaged::collections
