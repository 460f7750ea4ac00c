#pragma once
/**
 * @file runtime_type.hpp
 * @brief Compact descriptor of a concrete trivially-copyable type.
 *
 * A RuntimeType packs {size, id} into 32 bits so it can be stored inside raw
 * buffers next to the data it describes. Ids come from the process type
 * table, keyed by a per-instantiation tag address: the type's name seeds the
 * id hash, collisions re-hash, and the result is memoized per T in a
 * function-local static. Types that share a spelling (anonymous-namespace
 * types of different translation units, lambdas) still get distinct ids.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include "unmanaged/core/error.hpp"
#include "unmanaged/core/traits.hpp"

namespace unmanaged::types {

namespace detail {

/// @brief Compiler-provided spelling of T (e.g. "int", "demo::Vec3").
template <class T>
inline std::string_view type_name() noexcept {
#if defined(__clang__) || defined(__GNUC__)
    const std::string_view fn = __PRETTY_FUNCTION__;
    const std::size_t start = fn.find("T = ") + 4;
    const std::size_t end   = fn.find_first_of(";]", start);
    return fn.substr(start, end - start);
#elif defined(_MSC_VER)
    const std::string_view fn = __FUNCSIG__;
    const std::size_t start = fn.find("type_name<") + 10;
    const std::size_t end   = fn.rfind(">(void)");
    return fn.substr(start, end - start);
#else
    return "unknown";
#endif
}

/// One object per instantiation; its address identifies T in the type table.
template <class T>
inline constexpr char type_tag{};

/**
 * @class TypeTable
 * @brief Registered types keyed by tag address, with the reverse id lookup.
 *
 * Entries are never erased, so views into a registered name stay valid for
 * the table's lifetime. All members are thread-safe.
 */
class TypeTable {
public:
    struct Info {
        std::string name;
        std::size_t size{0};
        std::size_t alignment{1};
    };

    /// @brief Id of @p key, assigning one on first sight. TypeTableFull when all ids are taken.
    Result<std::uint16_t> add(const void* key, std::string_view name, std::size_t size,
                              std::size_t alignment);

    /// @brief Registration for @p id, nullptr when unknown.
    const Info* find(std::uint16_t id) const;

    std::size_t size() const;

private:
    mutable std::mutex                                mu_;
    std::unordered_map<std::uint16_t, Info>           by_id_;
    std::unordered_map<const void*, std::uint16_t>    by_key_;
};

/// @brief The process type table behind RuntimeType::get<T>().
TypeTable& process_types();

/// @brief Reports an exhausted type table for @p name and aborts.
[[noreturn]] void type_table_exhausted(std::string_view name);

} // namespace detail

class RuntimeType final {
public:
    /// @brief The "no type" descriptor (id 0, size 0).
    constexpr RuntimeType() noexcept = default;

    /**
     * @brief Descriptor of T, computed on first call and cached for the process.
     * @tparam T Trivially copyable type no larger than 65535 bytes.
     * @return TypeTableFull when every 16-bit id is already assigned.
     */
    template <class T>
    static Result<RuntimeType> lookup() {
        using U = std::remove_cv_t<T>;
        static_assert(UnmanagedTraits<U>::ok, "RuntimeType::lookup<T>: T must be trivially copyable");
        static_assert(sizeof(U) <= 0xFFFF, "RuntimeType::lookup<T>: T is larger than 65535 bytes");
        static const Result<RuntimeType> cached = []() -> Result<RuntimeType> {
            auto id = detail::process_types().add(&detail::type_tag<U>, detail::type_name<U>(),
                                                  sizeof(U), alignof(U));
            if (!id) return unmanaged_detail::unexpected<Error>(id.error());
            return RuntimeType(*id, static_cast<std::uint16_t>(sizeof(U)));
        }();
        return cached;
    }

    /// @brief lookup<T>() for callers that cannot proceed without a descriptor; aborts on TypeTableFull.
    template <class T>
    static RuntimeType get() {
        auto t = lookup<T>();
        if (!t) detail::type_table_exhausted(detail::type_name<std::remove_cv_t<T>>());
        return *t;
    }

    /// @brief Rebuild a descriptor from raw().
    static constexpr RuntimeType from_raw(std::uint32_t raw) noexcept {
        return RuntimeType(static_cast<std::uint16_t>(raw & 0xFFFFu),
                           static_cast<std::uint16_t>(raw >> 16));
    }

    /// @brief Order-independent hash of a set of descriptors.
    static std::uint64_t combined_hash(std::span<const RuntimeType> types);

    constexpr std::uint16_t size() const noexcept { return size_; }
    constexpr std::uint16_t id()   const noexcept { return id_; }
    constexpr bool          is_valid() const noexcept { return id_ != 0; }

    /// @brief id in the low 16 bits, size in the high 16 bits.
    constexpr std::uint32_t raw() const noexcept {
        return static_cast<std::uint32_t>(id_) | (static_cast<std::uint32_t>(size_) << 16);
    }

    /// @brief false for every descriptor when T could not be registered.
    template <class T>
    bool is() const {
        auto t = lookup<T>();
        return t && *t == *this;
    }

    /// @brief alignof(T) recorded at registration; 1 for unknown ids.
    std::size_t alignment() const noexcept;

    /// @brief Registered type name; empty for unknown ids.
    std::string_view name() const noexcept;

    friend constexpr bool operator==(RuntimeType a, RuntimeType b) noexcept { return a.raw() == b.raw(); }

private:
    constexpr RuntimeType(std::uint16_t id, std::uint16_t size) noexcept : size_(size), id_(id) {}

    std::uint16_t size_{0};
    std::uint16_t id_{0};
};

static_assert(sizeof(RuntimeType) == 4, "RuntimeType must stay 4 bytes");

/// @brief true when @p descriptor describes T.
template <class T>
bool is(RuntimeType descriptor) { return descriptor.template is<T>(); }

} // namespace unmanaged::types
