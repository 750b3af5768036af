#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "stanza/value.hh"

namespace stanza::test {

inline ordered_node yaml(const std::string &text) { return ordered_node::deserialize(text); }

inline ordered_node str(const std::string &s) { return internal::make_string(s); }
inline ordered_node num(std::int64_t i) { return internal::make_int(i); }
inline ordered_node real(double d) { return internal::make_float(d); }
inline ordered_node boolean(bool b) { return internal::make_bool(b); }
inline ordered_node null() { return ordered_node(); }

inline ordered_node list(std::initializer_list<ordered_node> items) {
  return internal::make_node_from(std::vector<ordered_node>(items));
}

inline ordered_node map(std::initializer_list<std::pair<std::string, ordered_node>> items) {
  ordered_node m = ordered_node::mapping();
  for (const auto &[k, v] : items) m[k] = v;
  return m;
}

}  // namespace stanza::test
