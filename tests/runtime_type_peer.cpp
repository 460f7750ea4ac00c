/**
 * @file runtime_type_peer.cpp
 * @brief Second translation unit for the RuntimeType identity tests.
 *
 * Declares an anonymous-namespace Pos whose spelling matches the one in
 * test_runtime_type.cpp but whose layout differs.
 */
#include <cstdint>

#include "unmanaged/types/runtime_type.hpp"

namespace {

struct Pos {
  double x, y, z;
};

} // namespace

unmanaged::types::RuntimeType peer_pos_type() {
  return unmanaged::types::RuntimeType::get<Pos>();
}

std::uint32_t peer_lambda_raw() {
  auto fn = [](int v) { return v + 1; };
  return unmanaged::types::RuntimeType::get<decltype(fn)>().raw();
}
