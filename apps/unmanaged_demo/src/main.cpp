/**
 * @file main.cpp
 * @brief unmanaged_demo: walks through the handle, registry and container layers.
 *
 * **Scenarios**
 * 1. Write an int32 into a 16-byte block, grow it to 32 bytes, read it back.
 * 2. Free a block twice and print the diagnostic naming the first free.
 * 3. Build a list and a dictionary, query them, free them.
 * 4. Leak one block into a report-only registry and print the audit.
 *
 * Everything allocated through the default registry is freed before exit,
 * so the teardown audit stays silent. Exit code 1 on the first failure.
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>

#include "unmanaged/collections/unsafe_dictionary.hpp"
#include "unmanaged/collections/unsafe_list.hpp"
#include "unmanaged/config/config_loader.hpp"
#include "unmanaged/mem/memory_address.hpp"
#include "unmanaged/version.hpp"

namespace {

using unmanaged::mem::MemoryAddress;

int fail_with(const char* step, const unmanaged::Error& e) {
  std::cerr << "[demo] " << step << " failed: " << unmanaged::describe(e) << "\n";
  return 1;
}

int write_resize_read() {
  auto h = MemoryAddress::allocate(16);
  if (!h) return fail_with("allocate", h.error());
  if (auto st = h->write<std::int32_t>(0, 1337); !st) return fail_with("write", st.error());
  if (auto st = MemoryAddress::resize(*h, 32); !st) return fail_with("resize", st.error());

  auto v = h->read<std::int32_t>(0);
  if (!v) return fail_with("read", v.error());
  std::cout << "  1) wrote 1337, resized 16 -> " << h->length() << " bytes, read " << *v << "\n";

  if (auto st = h->free(); !st) return fail_with("free", st.error());
  return 0;
}

int double_free() {
  auto h = MemoryAddress::allocate(4);
  if (!h) return fail_with("allocate", h.error());
  if (auto st = h->free(); !st) return fail_with("free", st.error());

  auto again = h->free();
  if (again) {
    std::cerr << "[demo] second free unexpectedly succeeded\n";
    return 1;
  }
  std::cout << "  2) second free rejected: " << unmanaged::describe(again.error()) << "\n";
  return 0;
}

int containers() {
  using unmanaged::collections::UnsafeDictionary;
  using unmanaged::collections::UnsafeList;

  auto primes = UnsafeList<std::uint32_t>::create();
  if (!primes) return fail_with("list create", primes.error());
  for (std::uint32_t n = 2; primes->count() < 10; ++n) {
    bool prime = true;
    for (std::uint32_t d = 2; d * d <= n; ++d) prime = prime && (n % d != 0);
    if (!prime) continue;
    if (auto st = primes->add(n); !st) return fail_with("list add", st.error());
  }

  auto index = UnsafeDictionary<std::uint32_t, std::uint32_t>::create();
  if (!index) return fail_with("dictionary create", index.error());
  auto items = primes->as_span();
  if (!items) return fail_with("as_span", items.error());
  for (std::size_t i = 0; i < items->size(); ++i) {
    if (auto st = index->add((*items)[i], static_cast<std::uint32_t>(i)); !st) {
      return fail_with("dictionary add", st.error());
    }
  }

  auto pos = index->get(29);
  if (!pos) return fail_with("dictionary get", pos.error());
  std::cout << "  3) " << primes->count() << " primes in a list (capacity " << primes->capacity()
            << "), 29 is at index " << *pos << "\n";

  if (auto st = index->free(); !st) return fail_with("dictionary free", st.error());
  if (auto st = primes->free(); !st) return fail_with("list free", st.error());
  return 0;
}

int leak_audit() {
  using namespace unmanaged;
  // Report-only registry: the leak is printed by the default observer, not fatal.
  config::RuntimeConfig rc = config::Loader::load_from_env();
  rc.leak_policy = mem::LeakPolicy::Report;
  mem::AllocationRegistry registry(config::Loader::to_registry_config(rc));

  std::uintptr_t leaked = 0;
  {
    auto h = MemoryAddress::allocate(8, registry);
    if (!h) return fail_with("allocate", h.error());
    leaked = h->address();
  }
  const mem::LeakReport report = registry.audit();
  std::cout << "  4) leak audit found " << report.size()
            << " allocation(s); teardown report follows on stderr\n" << std::flush;
  const bool clean = registry.finalize();
  std::free(reinterpret_cast<void*>(leaked));
  if (clean) {
    std::cerr << "[demo] leak went unreported\n";
    return 1;
  }
  return 0;
}

} // namespace

int main() {
  std::cout << "unmanaged " << unmanaged::version_string << " demo ("
            << (unmanaged::config::track_allocations ? "tracked" : "untracked") << ")\n"
            << "--------------------------------------------------\n";

  if (int rc = write_resize_read()) return rc;
  if (int rc = double_free()) return rc;
  if (int rc = containers()) return rc;
  if (unmanaged::config::track_allocations) {
    if (int rc = leak_audit()) return rc;
  }

  std::cout << std::flush;
  return 0;
}
