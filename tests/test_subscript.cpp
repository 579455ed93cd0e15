#include <lantern_json/lantern_json.hpp>
#include <gtest/gtest.h>
#include <functional>
#include <string>

using namespace lantern::json;

static Value sample() {
  return parse(
      R"({"user":{"name":"Ada","tags":["a","b"]},"n":1,"list":[10,20,30]})");
}

static void expect_subscript_error(const std::function<void()> &fn,
                                   const std::string &what) {
  try {
    fn();
    ADD_FAILURE() << "expected subscript error: " << what;
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Subscript);
    EXPECT_EQ(std::string(e.what()), what);
  }
}

TEST(Subscript, Construction) {
  Subscript key("name");
  EXPECT_TRUE(key.is_key());
  EXPECT_FALSE(key.is_index());
  EXPECT_EQ(key.key(), "name");
  EXPECT_EQ(key.to_string(), "\"name\"");

  Subscript index(3);
  EXPECT_TRUE(index.is_index());
  EXPECT_EQ(index.index(), 3);
  EXPECT_EQ(index.to_string(), "[3]");

  EXPECT_TRUE(Subscript(std::string("k")) == Subscript("k"));
  EXPECT_FALSE(Subscript(size_t{1}) == Subscript("1"));
}

TEST(Subscript, GetFallsBackToNull) {
  const Value doc = sample();
  EXPECT_EQ(doc.get("n"), Value(1));
  EXPECT_TRUE(doc.get("missing").is_null());
  EXPECT_TRUE(doc.get(0).is_null());
  EXPECT_TRUE(doc.get("n").get("x").is_null());
  EXPECT_EQ(doc.get("list").get(2), Value(30));
  EXPECT_TRUE(doc.get("list").get(3).is_null());
  EXPECT_TRUE(doc.get("list").get(-1).is_null());
}

TEST(Subscript, GetPath) {
  const Value doc = sample();
  EXPECT_EQ(doc.get_path({"user", "name"}), Value("Ada"));
  EXPECT_EQ(doc.get_path({"user", "tags", 1}), Value("b"));
  EXPECT_TRUE(doc.get_path({"user", "tags", 5}).is_null());
  EXPECT_TRUE(doc.get_path({"user", "nope", "deeper"}).is_null());
  EXPECT_TRUE(doc.get_path({}).is_null());
}

TEST(Subscript, FindReturnsPointer) {
  const Value doc = sample();
  ASSERT_NE(doc.find("n"), nullptr);
  EXPECT_EQ(*doc.find("n"), Value(1));
  EXPECT_EQ(doc.find("missing"), nullptr);
  EXPECT_EQ(doc.find(0), nullptr);
}

TEST(Subscript, TryGetReportsFailingStep) {
  const Value doc = sample();
  EXPECT_EQ(doc.try_get("n"), Value(1));
  EXPECT_EQ(doc.try_get_path({"list", 0}), Value(10));

  expect_subscript_error([&] { doc.try_get("missing"); },
                         "No value for subscript \"missing\"");
  expect_subscript_error([&] { doc.try_get_path({"user", "tags", 2}); },
                         "Index 2 out of bounds for array of size 2");
  expect_subscript_error([&] { doc.try_get_path({"n", "x"}); },
                         "Value of type number is not subscriptable by \"x\"");
  expect_subscript_error([&] { doc.try_get(0); },
                         "Value of type object is not subscriptable by [0]");
  expect_subscript_error([&] { doc.try_get_path({}); },
                         "Path must contain at least one subscript");
  expect_subscript_error([&] { doc.get("list").try_get(-1); },
                         "Index -1 out of bounds for array of size 3");
}

TEST(Subscript, ConstOperators) {
  const Value doc = sample();
  EXPECT_EQ(doc["user"]["name"], Value("Ada"));
  EXPECT_TRUE(doc["nope"]["still"].is_null());
  EXPECT_EQ(doc["list"][1], Value(20));
  EXPECT_TRUE(doc["list"][9].is_null());
}

TEST(Subscript, SetReplacesAndInserts) {
  Value doc = sample();
  doc.set("n", 2);
  doc.set("new", "v");
  EXPECT_EQ(doc.get("n"), Value(2));
  EXPECT_EQ(doc.get("new"), Value("v"));

  doc.set_path({"user", "tags", 0}, "z");
  EXPECT_EQ(doc.get_path({"user", "tags"}), Value::array({"z", "b"}));
  doc.set_path({"user", "age"}, 36);
  EXPECT_EQ(doc.get_path({"user", "age"}), Value(36));
}

TEST(Subscript, SetErrors) {
  Value doc = sample();
  expect_subscript_error([&] { doc.set_path({"list", 3}, 1); },
                         "Index 3 out of bounds for array of size 3");
  expect_subscript_error([&] { doc.set_path({"n", "x"}, 1); },
                         "Value of type number is not subscriptable by \"x\"");
  expect_subscript_error([&] { doc.set_path({"nope", "x"}, 1); },
                         "No value for subscript \"nope\"");
  expect_subscript_error([&] { doc.set_path({}, 1); },
                         "Path must contain at least one subscript");
  expect_subscript_error([&] { doc.set(0, 1); },
                         "Value of type object is not subscriptable by [0]");
}

TEST(Subscript, Remove) {
  Value doc = sample();
  doc.remove("n");
  EXPECT_FALSE(doc.contains("n"));
  doc.remove("missing");
  EXPECT_EQ(doc.size(), 2u);

  doc.remove_path({"user", "tags", 0});
  EXPECT_EQ(doc.get_path({"user", "tags"}), Value::array({"b"}));
  doc.remove_path({"list", 1});
  EXPECT_EQ(doc.get("list"), Value::array({10, 30}));

  expect_subscript_error([&] { doc.remove_path({"list", 2}); },
                         "Index 2 out of bounds for array of size 2");
  expect_subscript_error([&] { doc.remove_path({"user", "name", "x"}); },
                         "Value of type string is not subscriptable by \"x\"");
  expect_subscript_error([&] { doc.remove_path({}); },
                         "Path must contain at least one subscript");
}

TEST(Subscript, MutableKeyAccessAutoVivifies) {
  Value v;
  v["a"]["b"] = 1;
  v["a"]["c"] = Value::array({true});
  EXPECT_EQ(v, Value::object(
                   {{"a", Value::object({{"b", 1}, {"c", Value::array({true})}})}}));

  Value n(1);
  expect_subscript_error([&] { n["x"] = 2; },
                         "Value of type number is not subscriptable by \"x\"");
}

TEST(Subscript, MutableIndexAccessIsChecked) {
  Value arr = Value::array({1, 2});
  arr[1] = 5;
  EXPECT_EQ(arr, Value::array({1, 5}));
  expect_subscript_error([&] { arr[5] = 0; },
                         "Index 5 out of bounds for array of size 2");
}
