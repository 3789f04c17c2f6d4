/**
 * @file expected.hpp
 * @brief Result channel used by meshroute::Result / meshroute::Status.
 *
 * Resolves meshroute_detail::expected / unexpected to std::expected when the
 * standard library ships it (libstdc++ 12 reports 202202L), otherwise to
 * tl::expected. Only has_value(), error(), operator* / operator-> and
 * unexpected construction are used, all present in both.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
#include <expected>

namespace meshroute_detail {
template <class T, class E>
using expected = std::expected<T, E>;
template <class E>
using unexpected = std::unexpected<E>;
} // namespace meshroute_detail

#else
#include <tl/expected.hpp>

namespace meshroute_detail {
template <class T, class E>
using expected = tl::expected<T, E>;
template <class E>
using unexpected = tl::unexpected<E>;
} // namespace meshroute_detail

#endif
