// AllocationRegistry: Implementation Notes
// Both tables are hash maps keyed by native address, so register / unregister /
// lookup are O(1) amortized. The observer is always called after mu_ is
// released: a sink that allocates through the same registry cannot deadlock.

#include "unmanaged/mem/registry.hpp"

#include <cstdlib>

#include "unmanaged/config/config_loader.hpp"
#include "unmanaged/config/constants.hpp"

namespace unmanaged::mem {

using namespace unmanaged::config::constants;

AllocationRegistry::AllocationRegistry() : AllocationRegistry(RegistryConfig{}) {}

AllocationRegistry::AllocationRegistry(const RegistryConfig& cfg) : cfg_(cfg) {
    if (cfg_.observer == nullptr) cfg_.observer = obs::make_simple_observer();
    live_.reserve(REGISTRY_RESERVE);
}

AllocationRegistry::~AllocationRegistry() {
    finalize();
}

//------------------------------- Helpers --------------------------------------

Error AllocationRegistry::classify_locked(std::uintptr_t address, AllocationId id) const {
    auto it = live_.find(address);
    if (it != live_.end() && id != kAnyAllocation && it->second.id != id) {
        // Address was reissued: the caller's allocation is gone.
        return Error{Errc::AlreadyDisposed, address, {}};
    }
    auto d = disposed_.find(address);
    if (d != disposed_.end()) {
        return Error{Errc::AlreadyDisposed, address, d->second.site};
    }
    return Error{Errc::NotLive, address, {}};
}

unmanaged_detail::unexpected<Error>
AllocationRegistry::reject(const char* operation, const Error& e, const Site& caller) const {
    if (cfg_.report_faults) {
        cfg_.observer->record(obs::FaultEvent{e, operation, caller});
    }
    return unmanaged_detail::unexpected<Error>(e);
}

//------------------------------- Mutations ------------------------------------

Result<AllocationId> AllocationRegistry::register_address(std::uintptr_t address,
                                                          std::size_t byte_length,
                                                          const Site& site) {
    Error err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = live_.find(address);
        if (it == live_.end()) {
            const AllocationId id = next_id_++;
            live_.emplace(address, Record{byte_length, id, site});
            disposed_.erase(address); // address reused: old disposal no longer relevant
            return id;
        }
        err = Error{Errc::DoubleRegistration, address, it->second.site};
    }
    return reject("register", err, site);
}

Status AllocationRegistry::unregister(std::uintptr_t address, const Site& site, AllocationId id) {
    Error err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = live_.find(address);
        if (it != live_.end() && (id == kAnyAllocation || it->second.id == id)) {
            disposed_.insert_or_assign(address, Disposal{it->second.id, site});
            live_.erase(it);
            return {};
        }
        err = classify_locked(address, id);
    }
    return reject("unregister", err, site);
}

Status AllocationRegistry::relocate(std::uintptr_t old_address, AllocationId id,
                                    std::uintptr_t new_address, std::size_t new_byte_length,
                                    const Site& site) {
    Error err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = live_.find(old_address);
        if (it != live_.end() && (id == kAnyAllocation || it->second.id == id)) {
            if (new_address == old_address) {
                it->second.byte_length = new_byte_length;
                return {};
            }
            auto clash = live_.find(new_address);
            if (clash != live_.end()) {
                err = Error{Errc::DoubleRegistration, new_address, clash->second.site};
            } else {
                Record moved = it->second;
                moved.byte_length = new_byte_length;
                live_.erase(it);
                live_.emplace(new_address, moved);
                disposed_.erase(new_address);
                // The old block was released by the move; stale views report it disposed.
                disposed_.insert_or_assign(old_address, Disposal{moved.id, site});
                return {};
            }
        } else {
            err = classify_locked(old_address, id);
        }
    }
    return reject("relocate", err, site);
}

//------------------------------- Checks ---------------------------------------

bool AllocationRegistry::is_live(std::uintptr_t address) const {
    std::lock_guard<std::mutex> lk(mu_);
    return live_.find(address) != live_.end();
}

Status AllocationRegistry::require_live(std::uintptr_t address, AllocationId id,
                                        const Site& site) const {
    Error err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = live_.find(address);
        if (it != live_.end() && (id == kAnyAllocation || it->second.id == id)) return {};
        err = classify_locked(address, id);
    }
    return reject("require_live", err, site);
}

Status AllocationRegistry::require_range(std::uintptr_t address, AllocationId id,
                                         std::size_t offset, std::size_t size,
                                         const Site& site) const {
    Error err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = live_.find(address);
        if (it != live_.end() && (id == kAnyAllocation || it->second.id == id)) {
            const std::size_t len = it->second.byte_length;
            if (size <= len && offset <= len - size) return {};
            err = Error{Errc::OutOfBounds, address, {}};
        } else {
            err = classify_locked(address, id);
        }
    }
    return reject("require_range", err, site);
}

Result<std::size_t> AllocationRegistry::byte_length(std::uintptr_t address) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(address);
    if (it == live_.end()) return unmanaged_detail::unexpected<Error>(classify_locked(address, kAnyAllocation));
    return it->second.byte_length;
}

std::optional<Site> AllocationRegistry::disposal_site(std::uintptr_t address) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto d = disposed_.find(address);
    if (d == disposed_.end()) return std::nullopt;
    return d->second.site;
}

//------------------------------- Diagnostics ----------------------------------

std::size_t AllocationRegistry::count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return live_.size();
}

bool AllocationRegistry::any() const {
    std::lock_guard<std::mutex> lk(mu_);
    return !live_.empty();
}

std::vector<LiveAllocation> AllocationRegistry::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<LiveAllocation> out;
    out.reserve(live_.size());
    for (const auto& [address, rec] : live_) {
        out.push_back(LiveAllocation{address, rec.byte_length, rec.id, rec.site});
    }
    return out;
}

std::size_t AllocationRegistry::total_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t total = 0;
    for (const auto& kv : live_) total += kv.second.byte_length;
    return total;
}

LeakReport AllocationRegistry::audit() const {
    return LeakReport{all()};
}

bool AllocationRegistry::finalize() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (finalized_) return live_.empty();
        finalized_ = true;
    }
    LeakReport report = audit();
    if (report.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        disposed_.clear();
        return true;
    }
    cfg_.observer->record(report);
    if (cfg_.leak_policy == LeakPolicy::Abort) {
        std::abort(); // leaks are fatal: nothing is reclaimed implicitly
    }
    return false;
}

AllocationRegistry& default_registry() {
    static AllocationRegistry registry(
        config::Loader::to_registry_config(config::Loader::load_from_env()));
    return registry;
}

} // namespace unmanaged::mem
