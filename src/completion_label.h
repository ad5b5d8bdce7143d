#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ferry {

// LSP CompletionItemKind.
enum class completion_item_kind : int {
  text = 1,
  method = 2,
  function = 3,
  constructor = 4,
  field = 5,
  variable = 6,
  class_ = 7,
  interface_ = 8,
  module = 9,
  property = 10,
  unit = 11,
  value = 12,
  enum_ = 13,
  keyword = 14,
  snippet = 15,
  color = 16,
  file = 17,
  reference = 18,
  folder = 19,
  enum_member = 20,
  constant = 21,
  struct_ = 22,
  event = 23,
  operator_ = 24,
  type_parameter = 25,
};

struct completion_item {
  std::optional<completion_item_kind> kind;
  std::optional<std::string> detail;
  std::string label;
};

// Display text plus the [filter_begin, filter_end) byte range matched against
// what the user typed.
struct code_label {
  std::string text;
  std::size_t filter_begin{ 0 };
  std::size_t filter_end{ 0 };
};

code_label code_label_plain(std::string text);

// "{detail} - {label}" for reference items that carry detail text; nullopt
// (default rendering) for everything else.
std::optional<code_label> format_completion_label(completion_item const &item);

}  // namespace ferry
