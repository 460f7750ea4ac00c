/**
 * @file expected.hpp
 * @brief unmanaged_detail::expected / unexpected, the carriers behind Result<T> and Status.
 *
 * Resolves to std::expected when the standard library ships it, otherwise to
 * tl::expected (<tl/expected.hpp>), which has the same interface.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace unmanaged_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace unmanaged_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
