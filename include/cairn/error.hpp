#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes grouped by family (1xxx io, 3xxx integrity, 4xxx validation,
 *   6xxx lookup, 7xxx availability, 9xxx internal) for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace cairn::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,          /**< IOError */
  permission_denied = 1002,  /**< PermissionError */
  data_integrity = 3001,     /**< Corruption */
  version_mismatch = 3002,   /**< incompatible on-disk format */
  invalid_argument = 4001,   /**< ValidationError */
  not_found = 6001,
  already_exists = 6002,     /**< DuplicateName */
  lock_held = 7001,          /**< another client owns the directory */
  closed = 7002,             /**< handle used after close() */
  read_only = 7003,          /**< write attempted on a recovery-mode client */
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "catalog.sqlite" */
};

/** \brief Stable lower-case name of an error code ("io_failed", ...). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::permission_denied: return "permission_denied";
    case error_code::data_integrity: return "data_integrity";
    case error_code::version_mismatch: return "version_mismatch";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_found: return "not_found";
    case error_code::already_exists: return "already_exists";
    case error_code::lock_held: return "lock_held";
    case error_code::closed: return "closed";
    case error_code::read_only: return "read_only";
    case error_code::internal: return "internal";
  }
  return "internal";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace cairn::core
