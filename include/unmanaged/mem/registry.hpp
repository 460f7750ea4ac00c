#pragma once
// unmanaged: AllocationRegistry
// Bookkeeping of every live native allocation handed out by MemoryAddress.
//   • live table:     address → {length, id, allocation site}
//   • disposal table: address → {id, disposal site} (diagnoses use-after-free)
//   • leak audit:     anything still live at finalize() is reported, fatal by default.
// Concurrency Model: one internal std::mutex guards both tables. Every call is
// safe from any thread; the memory regions themselves are not synchronized.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "unmanaged/core/error.hpp"
#include "unmanaged/mem/allocation_record.hpp"
#include "unmanaged/obs/observability.hpp"

namespace unmanaged::mem {

/// What finalize() does when the leak audit is not clean.
enum class LeakPolicy : std::uint8_t {
    Abort = 0,   ///< Report through the observer, then std::abort()
    Report = 1   ///< Report through the observer only
};

/** @struct RegistryConfig
 *  @brief Construction parameters for an AllocationRegistry.
 */
struct RegistryConfig {
    LeakPolicy     leak_policy{LeakPolicy::Abort}; ///< Teardown behavior on leaks
    bool           report_faults{true};            ///< Forward rejected calls to the observer
    obs::Observer* observer{nullptr};              ///< nullptr → obs::make_simple_observer()
};

// -----------------------------------------------------------------------------
// AllocationRegistry class
// -----------------------------------------------------------------------------
///
/// Context object: tests build their own instance, production code uses
/// default_registry(). The destructor runs finalize(), so the default
/// registry audits leaks at process teardown.
///
/// Non-copyable and non-movable: handles keep a pointer to their registry.
//
class AllocationRegistry final {
public:
    AllocationRegistry();
    explicit AllocationRegistry(const RegistryConfig& cfg);
    ~AllocationRegistry();

    AllocationRegistry(const AllocationRegistry&)            = delete;
    AllocationRegistry& operator=(const AllocationRegistry&) = delete;

    // --------------------------- Mutations -----------------------------------
    /// Start tracking @p address. Fails with DoubleRegistration if already live.
    Result<AllocationId> register_address(std::uintptr_t address, std::size_t byte_length,
                                          const Site& site = Site::current());

    /// Stop tracking @p address and remember the disposal site.
    /// NotLive if never registered, AlreadyDisposed if freed before or if the
    /// address now belongs to a newer allocation than @p id.
    Status unregister(std::uintptr_t address, const Site& site = Site::current(),
                      AllocationId id = kAnyAllocation);

    /// In-place update after a reallocation: same id and allocation site,
    /// new address and length.
    Status relocate(std::uintptr_t old_address, AllocationId id,
                    std::uintptr_t new_address, std::size_t new_byte_length,
                    const Site& site = Site::current());

    // --------------------------- Checks --------------------------------------
    [[nodiscard]] bool is_live(std::uintptr_t address) const;

    /// Gate passed by every handle operation.
    Status require_live(std::uintptr_t address, AllocationId id = kAnyAllocation,
                        const Site& site = Site::current()) const;

    /// require_live plus [offset, offset + size) ⊆ [0, byte_length).
    Status require_range(std::uintptr_t address, AllocationId id,
                         std::size_t offset, std::size_t size,
                         const Site& site = Site::current()) const;

    /// Tracked length of a live address.
    Result<std::size_t> byte_length(std::uintptr_t address) const;

    /// Site that freed @p address, if it is in the disposal table.
    [[nodiscard]] std::optional<Site> disposal_site(std::uintptr_t address) const;

    // --------------------------- Diagnostics ---------------------------------
    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] bool any() const;
    [[nodiscard]] std::vector<LiveAllocation> all() const;
    [[nodiscard]] std::size_t total_bytes() const;

    /// Snapshot of everything still live.
    [[nodiscard]] LeakReport audit() const;

    /// Teardown audit. Returns true when clean. On leaks the report goes to the
    /// observer and, under LeakPolicy::Abort, the process aborts. Runs once.
    bool finalize();

    [[nodiscard]] const RegistryConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] obs::Observer& observer() const noexcept { return *cfg_.observer; }

private:
    struct Record {
        std::size_t  byte_length{0};
        AllocationId id{0};
        Site         site{};
    };
    struct Disposal {
        AllocationId id{0};
        Site         site{};
    };

    using LiveMap     = std::unordered_map<std::uintptr_t, Record>;
    using DisposalMap = std::unordered_map<std::uintptr_t, Disposal>;

    /// Classify a missing/mismatched address. Caller holds mu_.
    Error classify_locked(std::uintptr_t address, AllocationId id) const;

    /// Forward a rejected call to the observer (never under mu_) and return it.
    unmanaged_detail::unexpected<Error> reject(const char* operation, const Error& e,
                                               const Site& caller) const;

    RegistryConfig      cfg_;
    mutable std::mutex  mu_;
    LiveMap             live_;
    DisposalMap         disposed_;
    AllocationId        next_id_{1};
    bool                finalized_{false};
};

/// Process-wide registry, configured from the environment on first use
/// (see config::Loader). Audited when static objects are destroyed.
AllocationRegistry& default_registry();

} // namespace unmanaged::mem
