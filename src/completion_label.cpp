#include "completion_label.h"

#include <utility>

namespace ferry {

code_label code_label_plain(std::string text) {
  auto const size{ text.size() };
  return code_label{ .text = std::move(text), .filter_begin = 0, .filter_end = size };
}

std::optional<code_label> format_completion_label(completion_item const &item) {
  if (item.kind != completion_item_kind::reference || !item.detail) { return std::nullopt; }
  return code_label_plain(*item.detail + " - " + item.label);
}

}  // namespace ferry
