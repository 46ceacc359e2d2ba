#include "stagecraft/value.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#define CATEGORY test_value

using stagecraft::value;

TEST(CATEGORY, split_path) {
  EXPECT_EQ(
    stagecraft::split_path("a.b.0.c"),
    (std::vector<std::string>{"a", "b", "0", "c"})
  );
  EXPECT_EQ(
    stagecraft::split_path(" a .. b. "), (std::vector<std::string>{"a", "b"})
  );
  EXPECT_TRUE(stagecraft::split_path("").empty());
}

TEST(CATEGORY, resolve_path) {
  value v{{"a", {{"b", value::array({10, 20})}}}, {"n", nullptr}};
  auto found = stagecraft::resolve_path(v, {"a", "b", "1"});
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(*found, 20);
  EXPECT_EQ(stagecraft::resolve_path(v, {}), &v);
  EXPECT_EQ(stagecraft::resolve_path(v, {"a", "b", "2"}), nullptr);
  EXPECT_EQ(stagecraft::resolve_path(v, {"a", "b", "x"}), nullptr);
  EXPECT_EQ(stagecraft::resolve_path(v, {"a", "c"}), nullptr);
  EXPECT_EQ(stagecraft::resolve_path(v, {"n", "deeper"}), nullptr);
  // a present null is not the same as a missing key
  EXPECT_NE(stagecraft::resolve_path(v, {"n"}), nullptr);
}

TEST(CATEGORY, truthy) {
  value falsy = value::array(
    {nullptr, false, 0, 0.0, "", value::array(), value::object()}
  );
  for (auto const& f : falsy) {
    EXPECT_FALSE(stagecraft::truthy(&f)) << f.dump();
  }
  value truthy = value::array(
    {true, 1, -1, 0.5, "0", "false", value::array({0}), value{{"k", 0}}}
  );
  for (auto const& t : truthy) {
    EXPECT_TRUE(stagecraft::truthy(&t)) << t.dump();
  }
  EXPECT_FALSE(stagecraft::truthy(nullptr));
}

TEST(CATEGORY, stringify) {
  value s = "text";
  value n = 12;
  value b = true;
  value o = {{"k", 1}};
  value z = nullptr;
  EXPECT_EQ(stagecraft::stringify(&s), "text");
  EXPECT_EQ(stagecraft::stringify(&n), "12");
  EXPECT_EQ(stagecraft::stringify(&b), "true");
  EXPECT_EQ(stagecraft::stringify(&o), "{\"k\":1}");
  EXPECT_EQ(stagecraft::stringify(&z), "null");
  EXPECT_EQ(stagecraft::stringify(nullptr), "undefined");

  value whole = value::parse(R"({"n": 1.0, "neg": -3.0, "zero": -0.0})");
  EXPECT_EQ(stagecraft::stringify(&whole["n"]), "1");
  EXPECT_EQ(stagecraft::stringify(&whole["neg"]), "-3");
  EXPECT_EQ(stagecraft::stringify(&whole["zero"]), "0");
  value half = 2.5;
  EXPECT_EQ(stagecraft::stringify(&half), "2.5");
}

TEST(CATEGORY, as_number) {
  value n = 2.5;
  value s = " 17 ";
  value bad = "17 apples";
  value empty = "";
  value b = true;
  EXPECT_EQ(stagecraft::as_number(&n), 2.5);
  EXPECT_EQ(stagecraft::as_number(&s), 17.0);
  EXPECT_FALSE(stagecraft::as_number(&bad).has_value());
  EXPECT_FALSE(stagecraft::as_number(&empty).has_value());
  EXPECT_FALSE(stagecraft::as_number(&b).has_value());
  EXPECT_FALSE(stagecraft::as_number(nullptr).has_value());
}

TEST(CATEGORY, to_value) {
  EXPECT_EQ(stagecraft::to_value(std::string("x")), value("x"));
  EXPECT_EQ(stagecraft::to_value(std::vector<int>{1, 2}), value::array({1, 2}));
  EXPECT_EQ(stagecraft::trim("  a b \t"), "a b");
}
