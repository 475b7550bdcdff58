#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against record metadata.
 */

#include <cstdint>
#include <expected>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/filter_expr.hpp"
#include "cairn/metadata/metadata.hpp"

namespace cairn::filter_eval {

// Evaluate whether a record with the given metadata matches the expression.
auto matches(const filter_expr& expr, const metadata::Metadata& md) -> bool;

// Reject malformed expressions (empty field names, inverted or non-finite ranges).
auto validate(const filter_expr& expr) -> std::expected<void, core::error>;

} // namespace cairn::filter_eval
