// benchmarks/bench_codable.cpp
// Record encode/decode through LANTERN_DEFINE_JSON vs nlohmann/json
// adl_serializer vs hand-written yyjson.

#include "utils.hpp"
#include <lantern_json/lantern_json.hpp>
#include <nlohmann/json.hpp>
#include <yyjson.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

struct Person {
  std::string name;
  int age = 0;
  std::string email;
  std::optional<std::string> nickname;

  bool operator==(const Person &other) const {
    return name == other.name && age == other.age && email == other.email &&
           nickname == other.nickname;
  }
};

LANTERN_DEFINE_JSON(Person, name, age, email, nickname)

namespace nlohmann {
template <> struct adl_serializer<Person> {
  static void to_json(json &j, const Person &p) {
    j = json{{"name", p.name}, {"age", p.age}, {"email", p.email}};
    j["nickname"] = p.nickname ? json(*p.nickname) : json(nullptr);
  }

  static void from_json(const json &j, Person &p) {
    j.at("name").get_to(p.name);
    j.at("age").get_to(p.age);
    j.at("email").get_to(p.email);
    auto it = j.find("nickname");
    if (it != j.end() && !it->is_null())
      p.nickname = it->get<std::string>();
    else
      p.nickname.reset();
  }
};
} // namespace nlohmann

int main() {
  constexpr int iterations = 10000;
  bench::print_header("Codable Benchmark");
  std::cout << "Record: Person { name, age, email, optional nickname }\n";
  std::cout << "Iterations: " << iterations << "\n\n";

  const Person original{"Alice Smith", 30, "alice@example.com", "Al"};
  std::vector<bench::Result> results;

  // 1. lantern::json
  {
    bench::Timer serialize_timer, deserialize_timer;
    std::string json_str;
    Person result;

    serialize_timer.start();
    for (int i = 0; i < iterations; ++i)
      json_str = lantern::json::stringify(lantern::json::encode(original));
    double serialize_ns = serialize_timer.elapsed_ns() / iterations;

    bool correct = true;
    deserialize_timer.start();
    for (int i = 0; i < iterations; ++i) {
      try {
        result = lantern::json::decode<Person>(lantern::json::parse(json_str));
      } catch (const lantern::json::Error &e) {
        std::cerr << "lantern decode failed: " << e.format() << "\n";
        correct = false;
        break;
      }
    }
    double deserialize_ns = deserialize_timer.elapsed_ns() / iterations;

    results.push_back({"lantern", json_str.size(), deserialize_ns, serialize_ns,
                       correct && result == original});
  }

  // 2. nlohmann/json
  {
    bench::Timer serialize_timer, deserialize_timer;
    std::string json_str;
    Person result;

    serialize_timer.start();
    for (int i = 0; i < iterations; ++i) {
      nlohmann::json j = original;
      json_str = j.dump();
    }
    double serialize_ns = serialize_timer.elapsed_ns() / iterations;

    deserialize_timer.start();
    for (int i = 0; i < iterations; ++i)
      result = nlohmann::json::parse(json_str).get<Person>();
    double deserialize_ns = deserialize_timer.elapsed_ns() / iterations;

    results.push_back({"nlohmann", json_str.size(), deserialize_ns,
                       serialize_ns, result == original});
  }

  // 3. yyjson (manual)
  {
    bench::Timer serialize_timer, deserialize_timer;
    char *json_str = nullptr;
    size_t json_len = 0;
    Person result;

    serialize_timer.start();
    for (int i = 0; i < iterations; ++i) {
      yyjson_mut_doc *doc = yyjson_mut_doc_new(nullptr);
      yyjson_mut_val *root = yyjson_mut_obj(doc);
      yyjson_mut_doc_set_root(doc, root);

      yyjson_mut_obj_add_strcpy(doc, root, "name", original.name.c_str());
      yyjson_mut_obj_add_int(doc, root, "age", original.age);
      yyjson_mut_obj_add_strcpy(doc, root, "email", original.email.c_str());
      if (original.nickname)
        yyjson_mut_obj_add_strcpy(doc, root, "nickname",
                                  original.nickname->c_str());
      else
        yyjson_mut_obj_add_null(doc, root, "nickname");

      if (json_str)
        free(json_str);
      json_str = yyjson_mut_write(doc, 0, &json_len);
      yyjson_mut_doc_free(doc);
    }
    double serialize_ns = serialize_timer.elapsed_ns() / iterations;

    deserialize_timer.start();
    for (int i = 0; i < iterations; ++i) {
      yyjson_doc *doc = yyjson_read(json_str, json_len, 0);
      yyjson_val *root = yyjson_doc_get_root(doc);

      result.name = yyjson_get_str(yyjson_obj_get(root, "name"));
      result.age = static_cast<int>(yyjson_get_int(yyjson_obj_get(root, "age")));
      result.email = yyjson_get_str(yyjson_obj_get(root, "email"));
      yyjson_val *nick = yyjson_obj_get(root, "nickname");
      if (nick && yyjson_is_str(nick))
        result.nickname = yyjson_get_str(nick);
      else
        result.nickname.reset();

      yyjson_doc_free(doc);
    }
    double deserialize_ns = deserialize_timer.elapsed_ns() / iterations;

    results.push_back({"yyjson", json_len, deserialize_ns, serialize_ns,
                       result == original});
    if (json_str)
      free(json_str);
  }

  for (const auto &r : results)
    r.print();
  return 0;
}
