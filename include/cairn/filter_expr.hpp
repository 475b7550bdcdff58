#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for metadata predicates ("where" clauses).
 *
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <string>
#include <variant>
#include <vector>

#include "cairn/metadata/metadata.hpp"

namespace cairn {

/** \brief Typed equality predicate field == value. int64 and double compare numerically. */
struct term {
  std::string field;              /**< attribute name */
  metadata::MetadataValue value;  /**< expected value */
};

/** \brief A numeric range predicate min_value <= field <= max_value. */
struct range {
  std::string field; /**< attribute name */
  double min_value{}; /**< inclusive */
  double max_value{}; /**< inclusive */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, and_t, or_t, not_t> node; /**< root node */
};

} // namespace cairn
