#include "completion_label.h"

#include "doctest/doctest.h"

TEST_CASE("format_completion_label renders reference items with detail") {
  auto const label{ ferry::format_completion_label(
      { .kind = ferry::completion_item_kind::reference, .detail = "Heading", .label = "intro" }) };
  REQUIRE(label.has_value());
  CHECK(label->text == "Heading - intro");
  CHECK(label->filter_begin == 0);
  CHECK(label->filter_end == label->text.size());
}

TEST_CASE("format_completion_label defers for references without detail") {
  CHECK_FALSE(ferry::format_completion_label(
                  { .kind = ferry::completion_item_kind::reference, .label = "intro" })
                  .has_value());
}

TEST_CASE("format_completion_label defers for other kinds") {
  for (int k{ 1 }; k <= 25; ++k) {
    auto const kind{ static_cast<ferry::completion_item_kind>(k) };
    if (kind == ferry::completion_item_kind::reference) { continue; }
    INFO("kind ", k);
    CHECK_FALSE(
        ferry::format_completion_label({ .kind = kind, .detail = "Heading", .label = "intro" })
            .has_value());
  }
  CHECK_FALSE(ferry::format_completion_label({ .detail = "Heading", .label = "intro" }).has_value());
}

TEST_CASE("completion_item_kind mirrors the protocol numbering") {
  CHECK(static_cast<int>(ferry::completion_item_kind::text) == 1);
  CHECK(static_cast<int>(ferry::completion_item_kind::reference) == 18);
  CHECK(static_cast<int>(ferry::completion_item_kind::type_parameter) == 25);
}
