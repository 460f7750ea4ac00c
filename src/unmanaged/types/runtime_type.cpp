/**
 * @file runtime_type.cpp
 * @brief Process type table backing RuntimeType ids, names and alignments.
 */
#include "unmanaged/types/runtime_type.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "unmanaged/config/constants.hpp"

namespace unmanaged::types {

using namespace unmanaged::config::constants;

namespace {

std::uint32_t name_hash(std::string_view name) noexcept {
    std::uint32_t hash = 0;
    for (char c : name) {
        hash = (hash << 5) - hash + static_cast<std::uint32_t>(static_cast<unsigned char>(c)) * TYPE_ID_REHASH;
    }
    return hash;
}

} // namespace

namespace detail {

Result<std::uint16_t> TypeTable::add(const void* key, std::string_view name, std::size_t size,
                                     std::size_t alignment) {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = by_key_.find(key); it != by_key_.end()) return it->second;
    if (by_id_.size() >= 0xFFFFu) return fail(Errc::TypeTableFull, reinterpret_cast<std::uintptr_t>(key));

    // 0 is the "no type" id; collisions step by a fixed odd constant. An odd
    // step visits every 16-bit value, so a free id is always reached.
    std::uint32_t hash = name_hash(name);
    std::uint16_t id   = static_cast<std::uint16_t>(hash);
    while (id == 0 || by_id_.count(id) != 0) {
        hash += TYPE_ID_REHASH;
        id = static_cast<std::uint16_t>(hash);
    }

    by_id_.emplace(id, Info{std::string(name), size, alignment});
    by_key_.emplace(key, id);
    return id;
}

const TypeTable::Info* TypeTable::find(std::uint16_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : &it->second;
}

std::size_t TypeTable::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_id_.size();
}

TypeTable& process_types() {
    static TypeTable t;
    return t;
}

void type_table_exhausted(std::string_view name) {
    std::fprintf(stderr, "[unmanaged] type table full: no RuntimeType id left for %.*s\n",
                 static_cast<int>(name.size()), name.data());
    std::abort();
}

} // namespace detail

std::size_t RuntimeType::alignment() const noexcept {
    const detail::TypeTable::Info* info = detail::process_types().find(id_);
    return info ? info->alignment : 1;
}

std::string_view RuntimeType::name() const noexcept {
    const detail::TypeTable::Info* info = detail::process_types().find(id_);
    return info ? std::string_view(info->name) : std::string_view{};
}

std::uint64_t RuntimeType::combined_hash(std::span<const RuntimeType> types) {
    std::vector<std::uint32_t> raws;
    raws.reserve(types.size());
    for (const RuntimeType& t : types) raws.push_back(t.raw());
    std::sort(raws.begin(), raws.end());

    std::uint64_t hash = HASH_SEED;
    for (std::uint32_t raw : raws) {
        for (int shift = 0; shift < 32; shift += 8) {
            hash ^= static_cast<std::uint64_t>((raw >> shift) & 0xFFu);
            hash *= HASH_PRIME;
        }
    }
    return hash;
}

} // namespace unmanaged::types
