/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "unmanaged/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace unmanaged::obs {

    std::string format_leak_report(const mem::LeakReport& r) {
        std::string out = std::to_string(r.size());
        out += " unmanaged allocation(s) were not freed:\n";
        char addr[32];
        for (const auto& leak : r.leaks) {
            std::snprintf(addr, sizeof(addr), "0x%llx",
                          static_cast<unsigned long long>(leak.address));
            out += "  ";
            out += addr;
            out += " (";
            out += std::to_string(leak.byte_length);
            out += " bytes) allocated at: ";
            const std::string where = format_site(leak.site);
            out += where.empty() ? std::string("<unknown>") : where;
            out += '\n';
        }
        return out;
    }

    class SimpleObserver : public Observer {
    public:
        void record(const FaultEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.faults++;
            const std::string what   = describe(e.error);
            const std::string caller = format_site(e.caller);
            // JSON-ish line (swap for structured logger later)
            std::fprintf(stderr,
              R"({"event":"fault","op":"%s","code":"%s","detail":"%s","caller":"%s"})" "\n",
              e.operation, std::string(to_string(e.error.code)).c_str(),
              what.c_str(), caller.c_str());
            std::fflush(stderr);
        }
        void record(const mem::LeakReport& r) override {
            std::lock_guard<std::mutex> lk(mu_);
            if (r.empty()) return;
            ctr_.leak_audits++;
            ctr_.leaked_allocations += r.size();
            std::fprintf(stderr, R"({"event":"leak","count":%zu})" "\n%s",
                         r.size(), format_leak_report(r).c_str());
            std::fflush(stderr);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace unmanaged::obs
