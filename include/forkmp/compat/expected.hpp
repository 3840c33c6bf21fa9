/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * This header provides a unified alias for expected/unexpected so the rest
 * of the codebase does not depend directly on a specific implementation.
 *
 * - With a standard library that ships <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, a header-only
 *   backport by TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only the value/error accessors are used by forkmp, so the first
 * standardised revision (202202L) is enough.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace forkmp_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace forkmp_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
