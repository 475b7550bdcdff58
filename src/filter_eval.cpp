#include "cairn/filter_eval.hpp"

#include <cmath>

namespace cairn::filter_eval {

static auto values_equal(const metadata::MetadataValue& a, const metadata::MetadataValue& b) -> bool {
  const auto na = metadata::as_number(a);
  const auto nb = metadata::as_number(b);
  if (na && nb) return *na == *nb;
  return a == b;
}

static auto matches_node(const filter_expr& e, const metadata::Metadata& md) -> bool {
  if (std::holds_alternative<term>(e.node)) {
    const auto& t = std::get<term>(e.node);
    auto it = md.find(t.field);
    return it != md.end() && values_equal(it->second, t.value);
  } else if (std::holds_alternative<range>(e.node)) {
    const auto& r = std::get<range>(e.node);
    auto it = md.find(r.field);
    if (it == md.end()) return false;
    const auto v = metadata::as_number(it->second);
    if (!v) return false;
    return (*v >= r.min_value) && (*v <= r.max_value);
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches_node(c, md)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches_node(c, md)) return true;
    return false; // or([]) == false
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    const auto& n = std::get<filter_expr::not_t>(e.node);
    bool v = true; // not([]) == true
    for (const auto& c : n.children) v = v && (!matches_node(c, md));
    return v;
  }
  return false;
}

auto matches(const filter_expr& expr, const metadata::Metadata& md) -> bool {
  return matches_node(expr, md);
}

auto validate(const filter_expr& expr) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (const auto* t = std::get_if<term>(&expr.node)) {
    if (t->field.empty()) {
      return std::unexpected(error{error_code::invalid_argument, "filter term has empty field", "filter"});
    }
    return {};
  }
  if (const auto* r = std::get_if<range>(&expr.node)) {
    if (r->field.empty()) {
      return std::unexpected(error{error_code::invalid_argument, "filter range has empty field", "filter"});
    }
    if (std::isnan(r->min_value) || std::isnan(r->max_value) || r->min_value > r->max_value) {
      return std::unexpected(error{error_code::invalid_argument, "filter range bounds invalid for '" + r->field + "'", "filter"});
    }
    return {};
  }
  const std::vector<filter_expr>* children = nullptr;
  if (const auto* a = std::get_if<filter_expr::and_t>(&expr.node)) children = &a->children;
  else if (const auto* o = std::get_if<filter_expr::or_t>(&expr.node)) children = &o->children;
  else if (const auto* n = std::get_if<filter_expr::not_t>(&expr.node)) children = &n->children;
  if (children) {
    for (const auto& c : *children) {
      if (auto r = validate(c); !r) return r;
    }
  }
  return {};
}

} // namespace cairn::filter_eval
