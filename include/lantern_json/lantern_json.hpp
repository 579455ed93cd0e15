/**
 * @file lantern_json.hpp
 * @brief Lantern JSON - header-only JSON value library
 * @version 0.1.0
 *
 * Features:
 * - Closed value model: array, object, number (int / double), string, literal
 * - Encoding detection (UTF-8 / UTF-16 / UTF-32, with and without BOM)
 * - State-machine number lexer with lossless string fallback on overflow
 * - Recursive descent parser with bounded and unbounded depth entry points
 * - Serializer with compact / pretty / null-skipping / slash options
 * - Subscript and path access (get, try_get, set, remove)
 * - Codable bridge: encode<T>() / decode<T>() and LANTERN_DEFINE_JSON
 * - std::future based async wrappers
 *
 * Requires C++20. No dependencies beyond the standard library.
 *
 * License: MIT
 */

#ifndef LANTERN_JSON_HPP
#define LANTERN_JSON_HPP

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <list>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define LANTERN_INLINE __attribute__((always_inline)) inline
#define LANTERN_LIKELY(x) __builtin_expect(!!(x), 1)
#define LANTERN_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define LANTERN_INLINE inline
#define LANTERN_LIKELY(x) (x)
#define LANTERN_UNLIKELY(x) (x)
#endif

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
#error "Lantern JSON requires a C++20 compatible compiler."
#endif

namespace lantern {
namespace json {

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorKind : uint8_t {
  Unknown = 0,
  Parse,
  Encoding,
  Decoding,
  Casting,
  Subscript,
  DepthExceeded
};

inline const char *error_message(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Unknown:
    return "Unknown error";
  case ErrorKind::Parse:
    return "Parse error";
  case ErrorKind::Encoding:
    return "Encoding error";
  case ErrorKind::Decoding:
    return "Decoding error";
  case ErrorKind::Casting:
    return "Casting error";
  case ErrorKind::Subscript:
    return "Subscript error";
  case ErrorKind::DepthExceeded:
    return "Maximum depth exceeded";
  }
  return "Unknown error";
}

class Error : public std::runtime_error {
  ErrorKind kind_;
  size_t offset_;
  std::source_location where_;

  static std::string or_default(const std::string &msg) {
    return msg.empty() ? std::string("The operation couldn't be completed.")
                       : msg;
  }

public:
  // Marks errors that do not refer to a position in the input.
  static constexpr size_t npos = static_cast<size_t>(-1);

  explicit Error(const std::string &msg, ErrorKind kind = ErrorKind::Unknown,
                 size_t offset = npos,
                 std::source_location where = std::source_location::current())
      : std::runtime_error(or_default(msg)), kind_(kind), offset_(offset),
        where_(where) {}

  ErrorKind kind() const noexcept { return kind_; }
  size_t offset() const noexcept { return offset_; }
  bool has_offset() const noexcept { return offset_ != npos; }
  const std::source_location &where() const noexcept { return where_; }

  // file:function:line:column of the throw site
  std::string callsite() const {
    std::ostringstream oss;
    oss << where_.file_name() << ':' << where_.function_name() << ':'
        << where_.line() << ':' << where_.column();
    return oss.str();
  }

  std::string format() const {
    std::ostringstream oss;
    oss << error_message(kind_) << " at " << callsite() << " - " << what();
    return oss.str();
  }
};

namespace detail {

// Lexer states that cannot be reached by a correct caller end the process.
[[noreturn]] inline void invalid_state(const char *what) {
  std::fprintf(stderr, "lantern::json: invalid internal state: %s\n", what);
  std::abort();
}

} // namespace detail

// ============================================================================
// Options
// ============================================================================

enum class Options : uint32_t {
  None = 0,
  NullSkipsKey = 1u << 0,
  PrettyPrinted = 1u << 1,
  SortedKeys = 1u << 2,
  FragmentsAllowed = 1u << 4,
  WithoutEscapingSlashes = 1u << 5,
  Default = FragmentsAllowed
};

constexpr Options operator|(Options a, Options b) {
  return static_cast<Options>(static_cast<uint32_t>(a) |
                              static_cast<uint32_t>(b));
}

constexpr Options operator&(Options a, Options b) {
  return static_cast<Options>(static_cast<uint32_t>(a) &
                              static_cast<uint32_t>(b));
}

constexpr Options &operator|=(Options &a, Options b) { return a = a | b; }

constexpr bool has_option(Options set, Options flag) {
  return flag != Options::None && (set & flag) == flag;
}

// ============================================================================
// Encoding Detection
// ============================================================================

enum class Encoding : uint8_t { Utf8, Utf16LE, Utf16BE, Utf32LE, Utf32BE };

inline const char *encoding_name(Encoding encoding) {
  switch (encoding) {
  case Encoding::Utf8:
    return "UTF-8";
  case Encoding::Utf16LE:
    return "UTF-16LE";
  case Encoding::Utf16BE:
    return "UTF-16BE";
  case Encoding::Utf32LE:
    return "UTF-32LE";
  case Encoding::Utf32BE:
    return "UTF-32BE";
  }
  return "unknown";
}

struct EncodingInfo {
  Encoding encoding = Encoding::Utf8;
  size_t bom_length = 0;
};

// Classifies the input from its first four bytes. A byte order mark wins;
// otherwise the position of NUL bytes around the first (ASCII) character
// identifies the code unit width and order.
inline EncodingInfo detect_encoding(const uint8_t *data,
                                    size_t size) noexcept {
  if (size < 2)
    return {};

  const uint8_t b0 = data[0];
  const uint8_t b1 = data[1];
  const bool has_b2 = size > 2;
  const bool has_b3 = size > 3;
  const uint8_t b2 = has_b2 ? data[2] : 0;
  const uint8_t b3 = has_b3 ? data[3] : 0;

  if (has_b3 && b0 == 0x00 && b1 == 0x00 && b2 == 0xFE && b3 == 0xFF)
    return {Encoding::Utf32BE, 4};
  if (has_b3 && b0 == 0xFF && b1 == 0xFE && b2 == 0x00 && b3 == 0x00)
    return {Encoding::Utf32LE, 4};
  if (b0 == 0xFE && b1 == 0xFF)
    return {Encoding::Utf16BE, 2};
  if (has_b2 && b0 == 0xEF && b1 == 0xBB && b2 == 0xBF)
    return {Encoding::Utf8, 3};
  if (b0 == 0xFF && b1 == 0xFE)
    return {Encoding::Utf16LE, 2};

  if (has_b2 && b0 == 0x00 && b1 == 0x00 && b2 == 0x00)
    return {Encoding::Utf32BE, 0};
  if (has_b3 && b1 == 0x00 && b2 == 0x00 && b3 == 0x00)
    return {Encoding::Utf32LE, 0};
  if (b0 == 0x00)
    return {Encoding::Utf16BE, 0};
  if (b1 == 0x00)
    return {Encoding::Utf16LE, 0};
  return {};
}

inline EncodingInfo detect_encoding(std::string_view data) noexcept {
  return detect_encoding(reinterpret_cast<const uint8_t *>(data.data()),
                         data.size());
}

// ============================================================================
// Scalars
// ============================================================================

enum class Literal : uint8_t { True, False, Null };

namespace detail {

// Shortest round-trip form; integral values keep a ".0" so they read back as
// doubles.
inline size_t format_double(double value, char (&buf)[40]) {
  auto result = std::to_chars(buf, buf + 32, value);
  size_t len = static_cast<size_t>(result.ptr - buf);
  if (std::find_if(buf, result.ptr, [](char c) {
        return c == '.' || c == 'e' || c == 'n' || c == 'i';
      }) == result.ptr) {
    buf[len++] = '.';
    buf[len++] = '0';
  }
  return len;
}

inline std::optional<int64_t> exact_int(double value) noexcept {
  // [-2^63, 2^63) is the representable range of int64_t.
  if (!(value >= -9223372036854775808.0 && value < 9223372036854775808.0))
    return std::nullopt;
  if (std::trunc(value) != value)
    return std::nullopt;
  return static_cast<int64_t>(value);
}

} // namespace detail

class Number {
public:
  enum class Kind : uint8_t { Int, Double };

  Number() noexcept : kind_(Kind::Int), int_(0) {}
  explicit Number(int64_t value) noexcept : kind_(Kind::Int), int_(value) {}
  explicit Number(double value) noexcept
      : kind_(Kind::Double), double_(value) {}

  Kind kind() const noexcept { return kind_; }
  bool is_int() const noexcept { return kind_ == Kind::Int; }
  bool is_double() const noexcept { return kind_ == Kind::Double; }

  // Exact integer view; non-integral or out-of-range doubles fail.
  std::optional<int64_t> exact_int() const noexcept {
    if (kind_ == Kind::Int)
      return int_;
    return detail::exact_int(double_);
  }

  int64_t int_value(
      std::source_location where = std::source_location::current()) const {
    if (auto value = exact_int())
      return *value;
    throw Error("Number " + to_string() + " is not representable as an integer",
                ErrorKind::Casting, Error::npos, where);
  }

  double double_value() const noexcept {
    return kind_ == Kind::Int ? static_cast<double>(int_) : double_;
  }

  std::string to_string() const {
    if (kind_ == Kind::Int)
      return std::to_string(int_);
    char buf[40];
    return std::string(buf, detail::format_double(double_, buf));
  }

  friend bool operator==(const Number &a, const Number &b) noexcept {
    if (a.kind_ == b.kind_) {
      return a.kind_ == Kind::Int ? a.int_ == b.int_ : a.double_ == b.double_;
    }
    const int64_t i = a.kind_ == Kind::Int ? a.int_ : b.int_;
    const double d = a.kind_ == Kind::Double ? a.double_ : b.double_;
    auto exact = detail::exact_int(d);
    return exact && *exact == i;
  }

private:
  Kind kind_;
  union {
    int64_t int_;
    double double_;
  };
};

// ============================================================================
// Subscripts
// ============================================================================

// One step into a value: an object key or an array index.
class Subscript {
  std::variant<std::string, int64_t> value_;

public:
  Subscript(const char *key) : value_(std::string(key)) {}
  Subscript(std::string key) : value_(std::move(key)) {}
  Subscript(std::string_view key) : value_(std::string(key)) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                             int> = 0>
  Subscript(T index) : value_(static_cast<int64_t>(index)) {}

  bool is_key() const noexcept { return value_.index() == 0; }
  bool is_index() const noexcept { return value_.index() == 1; }

  const std::string &key() const { return std::get<std::string>(value_); }
  int64_t index() const { return std::get<int64_t>(value_); }

  std::string to_string() const {
    if (is_key())
      return "\"" + key() + "\"";
    return "[" + std::to_string(index()) + "]";
  }

  bool operator==(const Subscript &other) const {
    return value_ == other.value_;
  }
};

using Path = std::vector<Subscript>;

// ============================================================================
// Data Types
// ============================================================================

enum class ValueType : uint8_t { Array, Object, Number, String, Literal };

inline const char *type_name(ValueType type) {
  switch (type) {
  case ValueType::Array:
    return "array";
  case ValueType::Object:
    return "object";
  case ValueType::Number:
    return "number";
  case ValueType::String:
    return "string";
  case ValueType::Literal:
    return "literal";
  }
  return "unknown";
}

class Value;
class Array;
class Object;
struct Member;

class Array {
  std::vector<Value> items_;

public:
  using value_type = Value;
  using iterator = std::vector<Value>::iterator;
  using const_iterator = std::vector<Value>::const_iterator;

  Array();
  Array(std::initializer_list<Value> init);
  Array(const Array &other);
  Array(Array &&other) noexcept;
  Array &operator=(const Array &other);
  Array &operator=(Array &&other) noexcept;
  ~Array();

  void push_back(const Value &v);
  void push_back(Value &&v);
  void reserve(size_t n);
  size_t size() const;
  bool empty() const;

  Value &operator[](size_t index);
  const Value &operator[](size_t index) const;

  iterator erase(const_iterator pos);

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
};

class Object {
  // Members sorted by key; keys are unique.
  std::vector<Member> fields_;

public:
  using key_type = std::string;
  using mapped_type = Value;
  using value_type = Member;
  using iterator = std::vector<Member>::iterator;
  using const_iterator = std::vector<Member>::const_iterator;

  Object();
  // Adopts members in any order; for a repeated key the last one wins.
  explicit Object(std::vector<Member> members);
  Object(const Object &other);
  Object(Object &&other) noexcept;
  Object &operator=(const Object &other);
  Object &operator=(Object &&other) noexcept;
  ~Object();

  // Inserting an existing key replaces its value.
  void insert(std::string key, Value value);

  bool contains(std::string_view key) const;
  const Value *find(std::string_view key) const;
  Value *find(std::string_view key);
  size_t erase(std::string_view key);
  iterator erase(const_iterator pos);
  template <typename Pred> size_t erase_if(Pred pred);

  Value &operator[](std::string_view key);
  const Value &operator[](std::string_view key) const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
  size_t size() const;
  bool empty() const;
};

class Value {
  ValueType type_;

  union {
    Array array_val;
    Object object_val;
    Number number_val;
    std::string string_val;
    Literal literal_val;
  };

public:
  Value() noexcept : type_(ValueType::Literal), literal_val(Literal::Null) {}
  Value(std::nullptr_t) noexcept
      : type_(ValueType::Literal), literal_val(Literal::Null) {}
  Value(Literal literal) noexcept
      : type_(ValueType::Literal), literal_val(literal) {}
  Value(bool b) noexcept
      : type_(ValueType::Literal), literal_val(b ? Literal::True : Literal::False) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                             int> = 0>
  Value(T i) : type_(ValueType::Number) {
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
      if (i > static_cast<T>(std::numeric_limits<int64_t>::max()))
        throw Error("Integer " + std::to_string(i) +
                        " exceeds the signed 64-bit range",
                    ErrorKind::Encoding);
    }
    new (&number_val) Number(static_cast<int64_t>(i));
  }

  Value(double d) noexcept : type_(ValueType::Number), number_val(d) {}
  Value(float f) noexcept
      : type_(ValueType::Number), number_val(static_cast<double>(f)) {}
  Value(Number n) noexcept : type_(ValueType::Number), number_val(n) {}

  Value(const char *s) : type_(ValueType::String) {
    new (&string_val) std::string(s);
  }
  Value(std::string s) : type_(ValueType::String) {
    new (&string_val) std::string(std::move(s));
  }
  Value(std::string_view sv) : type_(ValueType::String) {
    new (&string_val) std::string(sv);
  }

  Value(Array a) : type_(ValueType::Array) {
    new (&array_val) Array(std::move(a));
  }
  Value(Object o) : type_(ValueType::Object) {
    new (&object_val) Object(std::move(o));
  }

  Value(const Value &other) : type_(other.type_) { copy_from(other); }
  Value(Value &&other) noexcept : type_(other.type_) {
    move_from(std::move(other));
  }

  Value &operator=(const Value &other) {
    if (this != &other) {
      Value copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  Value &operator=(Value &&other) noexcept {
    if (this != &other) {
      destroy();
      type_ = other.type_;
      move_from(std::move(other));
    }
    return *this;
  }

  ~Value() { destroy(); }

  static Value null() { return Value(); }
  static Value array(std::initializer_list<Value> items = {});
  static Value
  object(std::initializer_list<std::pair<const std::string, Value>> members = {});

  ValueType type() const noexcept { return type_; }
  bool is_array() const noexcept { return type_ == ValueType::Array; }
  bool is_object() const noexcept { return type_ == ValueType::Object; }
  bool is_number() const noexcept { return type_ == ValueType::Number; }
  bool is_string() const noexcept { return type_ == ValueType::String; }
  bool is_literal() const noexcept { return type_ == ValueType::Literal; }
  bool is_bool() const noexcept {
    return is_literal() && literal_val != Literal::Null;
  }
  bool is_null() const noexcept {
    return is_literal() && literal_val == Literal::Null;
  }

  const Array &as_array() const {
    if (!is_array())
      throw_cast("array");
    return array_val;
  }
  Array &as_array() {
    if (!is_array())
      throw_cast("array");
    return array_val;
  }
  const Object &as_object() const {
    if (!is_object())
      throw_cast("object");
    return object_val;
  }
  Object &as_object() {
    if (!is_object())
      throw_cast("object");
    return object_val;
  }
  const Number &as_number() const {
    if (!is_number())
      throw_cast("number");
    return number_val;
  }
  const std::string &as_string() const {
    if (!is_string())
      throw_cast("string");
    return string_val;
  }
  std::string &as_string() {
    if (!is_string())
      throw_cast("string");
    return string_val;
  }
  Literal as_literal() const {
    if (!is_literal())
      throw_cast("literal");
    return literal_val;
  }
  int64_t as_int() const { return as_number().int_value(); }
  double as_double() const { return as_number().double_value(); }
  bool as_bool() const {
    if (!is_bool())
      throw_cast("boolean");
    return literal_val == Literal::True;
  }

  std::optional<int64_t> get_int() const noexcept {
    return is_number() ? number_val.exact_int() : std::nullopt;
  }
  std::optional<double> get_double() const noexcept {
    if (is_number())
      return number_val.double_value();
    return std::nullopt;
  }
  std::optional<std::string> get_string() const {
    if (is_string())
      return string_val;
    return std::nullopt;
  }
  std::optional<bool> get_bool() const noexcept {
    if (is_bool())
      return literal_val == Literal::True;
    return std::nullopt;
  }

  size_t size() const noexcept {
    if (is_array())
      return array_val.size();
    if (is_object())
      return object_val.size();
    return 0;
  }
  bool empty() const noexcept { return size() == 0; }
  bool contains(std::string_view key) const {
    return is_object() && object_val.contains(key);
  }

  // Subscript access. get() never throws and falls back to null; try_get()
  // reports the failing step.
  const Value *find(const Subscript &subscript) const noexcept;
  const Value &get(const Subscript &subscript) const noexcept;
  const Value &get_path(const Path &path) const noexcept;
  const Value &try_get(const Subscript &subscript) const;
  const Value &try_get_path(const Path &path) const;

  void set(const Subscript &subscript, Value value);
  void set_path(const Path &path, Value value);
  void remove(const Subscript &subscript);
  void remove_path(const Path &path);

  // Mutable key access turns null into an object and inserts missing keys.
  Value &operator[](std::string_view key);
  const Value &operator[](std::string_view key) const noexcept;
  Value &operator[](size_t index);
  const Value &operator[](size_t index) const noexcept;

  std::string dump(Options options = Options::Default) const;

private:
  [[noreturn]] void throw_cast(
      const char *expected,
      std::source_location where = std::source_location::current()) const;

  void destroy() noexcept;
  void copy_from(const Value &other);
  void move_from(Value &&other) noexcept;
};

// ============================================================================
// Array & Object Implementation (out of line, Value is complete here)
// ============================================================================

struct Member {
  std::string first;
  Value second;
};

inline Array::Array() = default;
inline Array::Array(std::initializer_list<Value> init) : items_(init) {}
inline Array::Array(const Array &other) = default;
inline Array::Array(Array &&other) noexcept = default;
inline Array &Array::operator=(const Array &other) = default;
inline Array &Array::operator=(Array &&other) noexcept = default;
inline Array::~Array() = default;

inline void Array::push_back(const Value &v) { items_.push_back(v); }
inline void Array::push_back(Value &&v) { items_.push_back(std::move(v)); }
inline void Array::reserve(size_t n) { items_.reserve(n); }
inline size_t Array::size() const { return items_.size(); }
inline bool Array::empty() const { return items_.empty(); }

inline Value &Array::operator[](size_t index) { return items_[index]; }
inline const Value &Array::operator[](size_t index) const {
  return items_[index];
}

inline Array::iterator Array::erase(const_iterator pos) {
  return items_.erase(pos);
}

inline Array::iterator Array::begin() { return items_.begin(); }
inline Array::iterator Array::end() { return items_.end(); }
inline Array::const_iterator Array::begin() const { return items_.begin(); }
inline Array::const_iterator Array::end() const { return items_.end(); }

inline Object::Object() = default;
inline Object::Object(const Object &other) = default;
inline Object::Object(Object &&other) noexcept = default;
inline Object &Object::operator=(const Object &other) = default;
inline Object &Object::operator=(Object &&other) noexcept = default;
inline Object::~Object() = default;

namespace detail {
inline auto key_less = [](const Member &member, std::string_view key) {
  return std::string_view(member.first) < key;
};
} // namespace detail

inline Object::Object(std::vector<Member> members)
    : fields_(std::move(members)) {
  std::stable_sort(fields_.begin(), fields_.end(),
                   [](const Member &a, const Member &b) {
                     return a.first < b.first;
                   });
  auto out = fields_.begin();
  for (auto it = fields_.begin(); it != fields_.end(); ++it) {
    auto next = std::next(it);
    if (next != fields_.end() && next->first == it->first)
      continue;
    if (out != it)
      *out = std::move(*it);
    ++out;
  }
  fields_.erase(out, fields_.end());
}

inline void Object::insert(std::string key, Value value) {
  auto it = std::lower_bound(fields_.begin(), fields_.end(),
                             std::string_view(key), detail::key_less);
  if (it != fields_.end() && it->first == key) {
    it->second = std::move(value);
    return;
  }
  fields_.insert(it, Member{std::move(key), std::move(value)});
}

inline const Value *Object::find(std::string_view key) const {
  auto it =
      std::lower_bound(fields_.begin(), fields_.end(), key, detail::key_less);
  if (it != fields_.end() && it->first == key)
    return &it->second;
  return nullptr;
}

inline Value *Object::find(std::string_view key) {
  return const_cast<Value *>(std::as_const(*this).find(key));
}

inline bool Object::contains(std::string_view key) const {
  return find(key) != nullptr;
}

inline size_t Object::erase(std::string_view key) {
  auto it =
      std::lower_bound(fields_.begin(), fields_.end(), key, detail::key_less);
  if (it != fields_.end() && it->first == key) {
    fields_.erase(it);
    return 1;
  }
  return 0;
}

inline Object::iterator Object::erase(const_iterator pos) {
  return fields_.erase(pos);
}

template <typename Pred> size_t Object::erase_if(Pred pred) {
  return static_cast<size_t>(std::erase_if(fields_, pred));
}

inline Value &Object::operator[](std::string_view key) {
  auto it =
      std::lower_bound(fields_.begin(), fields_.end(), key, detail::key_less);
  if (it != fields_.end() && it->first == key)
    return it->second;
  return fields_.insert(it, Member{std::string(key), Value()})->second;
}

inline const Value &Object::operator[](std::string_view key) const {
  if (const Value *found = find(key))
    return *found;
  static const Value null_value;
  return null_value;
}

inline Object::iterator Object::begin() { return fields_.begin(); }
inline Object::iterator Object::end() { return fields_.end(); }
inline Object::const_iterator Object::begin() const { return fields_.begin(); }
inline Object::const_iterator Object::end() const { return fields_.end(); }
inline size_t Object::size() const { return fields_.size(); }
inline bool Object::empty() const { return fields_.empty(); }

inline Value Value::array(std::initializer_list<Value> items) {
  return Value(Array(items));
}

inline Value
Value::object(std::initializer_list<std::pair<const std::string, Value>> members) {
  Object obj;
  for (const auto &[key, value] : members)
    obj.insert(key, value);
  return Value(std::move(obj));
}

inline void Value::destroy() noexcept {
  switch (type_) {
  case ValueType::String:
    string_val.~basic_string();
    break;
  case ValueType::Array:
    array_val.~Array();
    break;
  case ValueType::Object:
    object_val.~Object();
    break;
  case ValueType::Number:
  case ValueType::Literal:
    break;
  }
}

inline void Value::copy_from(const Value &other) {
  switch (other.type_) {
  case ValueType::Literal:
    literal_val = other.literal_val;
    break;
  case ValueType::Number:
    new (&number_val) Number(other.number_val);
    break;
  case ValueType::String:
    new (&string_val) std::string(other.string_val);
    break;
  case ValueType::Array:
    new (&array_val) Array(other.array_val);
    break;
  case ValueType::Object:
    new (&object_val) Object(other.object_val);
    break;
  }
}

inline void Value::move_from(Value &&other) noexcept {
  switch (other.type_) {
  case ValueType::Literal:
    literal_val = other.literal_val;
    break;
  case ValueType::Number:
    new (&number_val) Number(other.number_val);
    break;
  case ValueType::String:
    new (&string_val) std::string(std::move(other.string_val));
    break;
  case ValueType::Array:
    new (&array_val) Array(std::move(other.array_val));
    break;
  case ValueType::Object:
    new (&object_val) Object(std::move(other.object_val));
    break;
  }
}

namespace detail {

inline const Value &null_sentinel() noexcept {
  static const Value null_value;
  return null_value;
}

inline const char *describe(const Value &value) {
  if (value.is_literal())
    return value.is_null() ? "null" : "boolean";
  return type_name(value.type());
}

inline Error subscript_error(
    const Value &value, const Subscript &subscript,
    std::source_location where = std::source_location::current()) {
  if (subscript.is_key() && value.is_object()) {
    return Error("No value for subscript " + subscript.to_string(),
                 ErrorKind::Subscript, Error::npos, where);
  }
  if (subscript.is_index() && value.is_array()) {
    return Error("Index " + std::to_string(subscript.index()) +
                     " out of bounds for array of size " +
                     std::to_string(value.size()),
                 ErrorKind::Subscript, Error::npos, where);
  }
  return Error(std::string("Value of type ") + describe(value) +
                   " is not subscriptable by " + subscript.to_string(),
               ErrorKind::Subscript, Error::npos, where);
}

inline Error empty_path_error(
    std::source_location where = std::source_location::current()) {
  return Error("Path must contain at least one subscript",
               ErrorKind::Subscript, Error::npos, where);
}

} // namespace detail

inline void Value::throw_cast(const char *expected,
                              std::source_location where) const {
  throw Error(std::string("Expected ") + expected + " but found " +
                  detail::describe(*this),
              ErrorKind::Casting, Error::npos, where);
}

// ============================================================================
// Subscript & Path Access
// ============================================================================

inline const Value *Value::find(const Subscript &subscript) const noexcept {
  if (subscript.is_key())
    return is_object() ? object_val.find(subscript.key()) : nullptr;
  const int64_t index = subscript.index();
  if (!is_array() || index < 0 ||
      static_cast<uint64_t>(index) >= array_val.size())
    return nullptr;
  return &array_val[static_cast<size_t>(index)];
}

inline const Value &Value::get(const Subscript &subscript) const noexcept {
  const Value *found = find(subscript);
  return found ? *found : detail::null_sentinel();
}

inline const Value &Value::get_path(const Path &path) const noexcept {
  if (path.empty())
    return detail::null_sentinel();
  const Value *current = this;
  for (const auto &subscript : path) {
    current = current->find(subscript);
    if (!current)
      return detail::null_sentinel();
  }
  return *current;
}

inline const Value &Value::try_get(const Subscript &subscript) const {
  if (const Value *found = find(subscript))
    return *found;
  throw detail::subscript_error(*this, subscript);
}

inline const Value &Value::try_get_path(const Path &path) const {
  if (path.empty())
    throw detail::empty_path_error();
  const Value *current = this;
  for (const auto &subscript : path)
    current = &current->try_get(subscript);
  return *current;
}

inline void Value::set(const Subscript &subscript, Value value) {
  if (subscript.is_key() && is_object()) {
    object_val.insert(subscript.key(), std::move(value));
    return;
  }
  if (subscript.is_index() && is_array()) {
    const_cast<Value &>(try_get(subscript)) = std::move(value);
    return;
  }
  throw detail::subscript_error(*this, subscript);
}

inline void Value::set_path(const Path &path, Value value) {
  if (path.empty())
    throw detail::empty_path_error();
  Value *parent = this;
  for (size_t i = 0; i + 1 < path.size(); ++i)
    parent = const_cast<Value *>(&parent->try_get(path[i]));
  parent->set(path.back(), std::move(value));
}

inline void Value::remove(const Subscript &subscript) {
  if (subscript.is_key() && is_object()) {
    object_val.erase(subscript.key());
    return;
  }
  if (subscript.is_index() && is_array()) {
    try_get(subscript);
    array_val.erase(array_val.begin() + subscript.index());
    return;
  }
  throw detail::subscript_error(*this, subscript);
}

inline void Value::remove_path(const Path &path) {
  if (path.empty())
    throw detail::empty_path_error();
  Value *parent = this;
  for (size_t i = 0; i + 1 < path.size(); ++i)
    parent = const_cast<Value *>(&parent->try_get(path[i]));
  parent->remove(path.back());
}

inline Value &Value::operator[](std::string_view key) {
  if (is_null())
    *this = Value(Object());
  if (!is_object())
    throw detail::subscript_error(*this, Subscript(key));
  return object_val[key];
}

inline const Value &Value::operator[](std::string_view key) const noexcept {
  const Value *found = is_object() ? object_val.find(key) : nullptr;
  return found ? *found : detail::null_sentinel();
}

inline Value &Value::operator[](size_t index) {
  return const_cast<Value &>(try_get(Subscript(index)));
}

inline const Value &Value::operator[](size_t index) const noexcept {
  return get(Subscript(index));
}

// ============================================================================
// Equality
// ============================================================================

inline bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type())
    return false;
  switch (a.type()) {
  case ValueType::Literal:
    return a.as_literal() == b.as_literal();
  case ValueType::Number:
    return a.as_number() == b.as_number();
  case ValueType::String:
    return a.as_string() == b.as_string();
  case ValueType::Array: {
    const auto &aa = a.as_array();
    const auto &ab = b.as_array();
    if (aa.size() != ab.size())
      return false;
    for (size_t i = 0; i < aa.size(); i++) {
      if (!(aa[i] == ab[i]))
        return false;
    }
    return true;
  }
  case ValueType::Object: {
    // Both sides are key-sorted, so member order is canonical.
    const auto &oa = a.as_object();
    const auto &ob = b.as_object();
    if (oa.size() != ob.size())
      return false;
    auto it = ob.begin();
    for (const auto &member : oa) {
      if (member.first != it->first || !(member.second == it->second))
        return false;
      ++it;
    }
    return true;
  }
  }
  return false;
}

inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

// ============================================================================
// Serialization
// ============================================================================

class StringBuffer {
  std::vector<char> buffer_;

public:
  StringBuffer() { buffer_.reserve(4096); }

  void put(char c) { buffer_.push_back(c); }

  void write(const char *data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
  }

  void write(const char *data) { write(data, std::strlen(data)); }

  void clear() { buffer_.clear(); }

  std::string str() const {
    return std::string(buffer_.data(), buffer_.size());
  }

  std::vector<uint8_t> bytes() const {
    return std::vector<uint8_t>(buffer_.begin(), buffer_.end());
  }

  const char *data() const { return buffer_.data(); }
  size_t size() const { return buffer_.size(); }
};

namespace detail {

inline void append_uint(StringBuffer &out, uint64_t value) {
  char buf[24];
  char *ptr = buf + sizeof(buf);
  do {
    *--ptr = static_cast<char>('0' + (value % 10));
    value /= 10;
  } while (value > 0);
  out.write(ptr, static_cast<size_t>((buf + sizeof(buf)) - ptr));
}

inline void append_int(StringBuffer &out, int64_t value) {
  if (value < 0) {
    out.put('-');
    append_uint(out, static_cast<uint64_t>(-(value + 1)) + 1);
  } else {
    append_uint(out, static_cast<uint64_t>(value));
  }
}

} // namespace detail

class Serializer {
  StringBuffer &out_;
  Options options_;

public:
  explicit Serializer(StringBuffer &out, Options options = Options::Default)
      : out_(out), options_(options) {}

  void write(const Value &root) {
    if (!has_option(options_, Options::FragmentsAllowed) && !root.is_object()) {
      throw Error(std::string("Top-level ") + detail::describe(root) +
                      " cannot be serialized without fragments allowed",
                  ErrorKind::Encoding);
    }
    write_value(root, 0);
  }

private:
  bool pretty() const { return has_option(options_, Options::PrettyPrinted); }

  void write_value(const Value &v, size_t depth) {
    switch (v.type()) {
    case ValueType::Literal:
      write_literal(v.as_literal());
      break;
    case ValueType::Number:
      write_number(v.as_number());
      break;
    case ValueType::String:
      write_string(v.as_string());
      break;
    case ValueType::Array:
      write_array(v.as_array(), depth);
      break;
    case ValueType::Object:
      write_object(v.as_object(), depth);
      break;
    }
  }

  void write_literal(Literal literal) {
    switch (literal) {
    case Literal::True:
      out_.write("true", 4);
      break;
    case Literal::False:
      out_.write("false", 5);
      break;
    case Literal::Null:
      out_.write("null", 4);
      break;
    }
  }

  void write_number(const Number &n) {
    if (n.is_int()) {
      detail::append_int(out_, *n.exact_int());
      return;
    }
    const double d = n.double_value();
    if (!std::isfinite(d)) {
      throw Error("Cannot serialize non-finite number " + n.to_string(),
                  ErrorKind::Encoding);
    }
    char buf[40];
    out_.write(buf, detail::format_double(d, buf));
  }

  // Arrays stay on one line; nested objects indent from the current depth.
  void write_array(const Array &arr, size_t depth) {
    out_.put('[');
    bool first = true;
    for (const auto &item : arr) {
      if (!first) {
        if (pretty())
          out_.write(", ", 2);
        else
          out_.put(',');
      }
      first = false;
      write_value(item, depth);
    }
    out_.put(']');
  }

  // Object storage is key-sorted, so SortedKeys output needs no extra pass.
  void write_object(const Object &obj, size_t depth) {
    const bool skip_null = has_option(options_, Options::NullSkipsKey);
    out_.put('{');
    bool first = true;
    for (const auto &member : obj) {
      if (skip_null && member.second.is_null())
        continue;
      if (!first)
        out_.put(',');
      first = false;
      if (pretty()) {
        out_.put('\n');
        write_indent(depth + 1);
      }
      write_string(member.first);
      out_.put(':');
      if (pretty())
        out_.put(' ');
      write_value(member.second, depth + 1);
    }
    if (pretty() && !first) {
      out_.put('\n');
      write_indent(depth);
    }
    out_.put('}');
  }

  void write_indent(size_t depth) {
    for (size_t i = 0; i < depth; ++i)
      out_.put('\t');
  }

  void write_string(std::string_view str) {
    const bool escape_slash =
        !has_option(options_, Options::WithoutEscapingSlashes);
    out_.put('"');

    const char *p = str.data();
    const char *end = p + str.size();
    const char *last = p;

    while (p < end) {
      const unsigned char c = static_cast<unsigned char>(*p);

      if (LANTERN_LIKELY(c >= 0x20 && c != '"' && c != '\\' &&
                         (c != '/' || !escape_slash))) {
        p++;
        continue;
      }

      if (p > last)
        out_.write(last, static_cast<size_t>(p - last));

      switch (c) {
      case '"':
        out_.write("\\\"", 2);
        break;
      case '\\':
        out_.write("\\\\", 2);
        break;
      case '/':
        out_.write("\\/", 2);
        break;
      case '\b':
        out_.write("\\b", 2);
        break;
      case '\f':
        out_.write("\\f", 2);
        break;
      case '\n':
        out_.write("\\n", 2);
        break;
      case '\r':
        out_.write("\\r", 2);
        break;
      case '\t':
        out_.write("\\t", 2);
        break;
      default: {
        out_.write("\\u00", 4);
        char hex[2];
        hex[0] = "0123456789ABCDEF"[(c >> 4) & 0xF];
        hex[1] = "0123456789ABCDEF"[c & 0xF];
        out_.write(hex, 2);
      } break;
      }

      p++;
      last = p;
    }

    if (p > last)
      out_.write(last, static_cast<size_t>(p - last));

    out_.put('"');
  }
};

inline std::string stringify(const Value &value,
                             Options options = Options::Default) {
  StringBuffer buf;
  Serializer ser(buf, options);
  ser.write(value);
  return buf.str();
}

inline std::vector<uint8_t> serialize(const Value &value,
                                      Options options = Options::Default) {
  StringBuffer buf;
  Serializer ser(buf, options);
  ser.write(value);
  return buf.bytes();
}

inline std::string Value::dump(Options options) const {
  return stringify(*this, options);
}

inline std::ostream &operator<<(std::ostream &os, const Value &v) {
  return os << v.dump();
}

// ============================================================================
// Lexing
// ============================================================================

namespace lookup {

LANTERN_INLINE bool is_whitespace(uint8_t c) {
  // Bitmap: ' '=32, '\t'=9, '\n'=10, '\r'=13
  return c <= 32 && ((0x100002600ULL >> c) & 1);
}

LANTERN_INLINE bool is_digit(uint8_t c) {
  return static_cast<uint8_t>(c - '0') <= 9;
}

LANTERN_INLINE int hex_value(uint8_t c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace lookup

namespace detail {

inline Error
parse_error(size_t offset, uint8_t c, const char *title = nullptr,
            std::source_location where = std::source_location::current()) {
  std::string msg = title ? std::string(title) + " - unexpected "
                          : std::string("Unexpected ");
  if (c >= 0x21 && c < 0x7F)
    msg += static_cast<char>(c);
  else
    msg += "character";
  msg += " at offset " + std::to_string(offset);
  return Error(msg, ErrorKind::Parse, offset, where);
}

inline Error
end_of_stream(size_t offset,
              std::source_location where = std::source_location::current()) {
  return Error("Unexpected end of stream at offset " + std::to_string(offset),
               ErrorKind::Parse, offset, where);
}

// Explicit state machine over the JSON number grammar. Each transition
// consumes input from the current offset and selects the next state; digit
// runs are reported through a callback so callers choose the accumulation.
class NumberLexer {
public:
  enum class State : uint8_t {
    LeadingMinus,
    LeadingZero,
    PreDecimalDigit,
    DecimalPoint,
    PostDecimalDigit,
    ExponentLetter,
    ExponentSign,
    ExponentDigit,
    Complete
  };

  NumberLexer(const uint8_t *input, size_t size, size_t offset,
              State state) noexcept
      : input_(input), size_(size), offset_(offset), state_(state) {}

  State state() const noexcept { return state_; }
  size_t offset() const noexcept { return offset_; }

  void leading_minus() {
    assert(state_ == State::LeadingMinus);
    ++offset_;
    const uint8_t c = require_byte();
    if (c == '0')
      state_ = State::LeadingZero;
    else if (lookup::is_digit(c))
      state_ = State::PreDecimalDigit;
    else
      throw parse_error(offset_, c);
  }

  void leading_zero() {
    assert(state_ == State::LeadingZero);
    ++offset_;
    if (offset_ < size_ && lookup::is_digit(input_[offset_]))
      throw parse_error(offset_, input_[offset_], "Invalid number");
    state_ = after_integer();
  }

  // Returns false as soon as on_digit refuses a digit.
  template <typename F> bool pre_decimal_digit(F &&on_digit) {
    assert(state_ == State::PreDecimalDigit);
    while (offset_ < size_ && lookup::is_digit(input_[offset_])) {
      if (!on_digit(input_[offset_]))
        return false;
      ++offset_;
    }
    state_ = after_integer();
    return true;
  }

  void decimal_point() {
    assert(state_ == State::DecimalPoint);
    ++offset_;
    const uint8_t c = require_byte();
    if (!lookup::is_digit(c))
      throw parse_error(offset_, c);
    state_ = State::PostDecimalDigit;
  }

  template <typename F> void post_decimal_digit(F &&on_digit) {
    assert(state_ == State::PostDecimalDigit);
    while (offset_ < size_ && lookup::is_digit(input_[offset_])) {
      on_digit(input_[offset_]);
      ++offset_;
    }
    if (offset_ < size_ && (input_[offset_] == 'e' || input_[offset_] == 'E'))
      state_ = State::ExponentLetter;
    else
      state_ = State::Complete;
  }

  // Returns the exponent sign.
  int exponent_letter() {
    assert(state_ == State::ExponentLetter);
    ++offset_;
    const uint8_t c = require_byte();
    if (c == '-') {
      state_ = State::ExponentSign;
      return -1;
    }
    if (c == '+')
      state_ = State::ExponentSign;
    else if (lookup::is_digit(c))
      state_ = State::ExponentDigit;
    else
      throw parse_error(offset_, c);
    return 1;
  }

  void exponent_sign() {
    assert(state_ == State::ExponentSign);
    ++offset_;
    const uint8_t c = require_byte();
    if (!lookup::is_digit(c))
      throw parse_error(offset_, c);
    state_ = State::ExponentDigit;
  }

  template <typename F> void exponent_digit(F &&on_digit) {
    assert(state_ == State::ExponentDigit);
    while (offset_ < size_ && lookup::is_digit(input_[offset_])) {
      on_digit(input_[offset_]);
      ++offset_;
    }
    state_ = State::Complete;
  }

private:
  uint8_t require_byte() const {
    if (offset_ >= size_)
      throw end_of_stream(offset_);
    return input_[offset_];
  }

  State after_integer() const {
    if (offset_ >= size_)
      return State::Complete;
    const uint8_t c = input_[offset_];
    if (c == '.')
      return State::DecimalPoint;
    if (c == 'e' || c == 'E')
      return State::ExponentLetter;
    return State::Complete;
  }

  const uint8_t *input_;
  size_t size_;
  size_t offset_;
  State state_;
};

// Decodes the four hex digits after "\u" (and a following "\uXXXX" trail
// surrogate when the first unit is a lead surrogate) into UTF-8.
class UnicodeEscapeDecoder {
public:
  UnicodeEscapeDecoder(const uint8_t *input, size_t size,
                       size_t offset) noexcept
      : input_(input), size_(size), offset_(offset) {}

  size_t offset() const noexcept { return offset_; }

  void decode_into(std::string &out) {
    const size_t start = offset_;
    const uint16_t unit = read_code_unit();
    uint32_t code_point = unit;

    if (unit >= 0xD800 && unit <= 0xDBFF) {
      if (size_ - offset_ < 2 || input_[offset_] != '\\' ||
          input_[offset_ + 1] != 'u') {
        throw Error("Invalid unicode escape - unpaired lead surrogate at "
                    "offset " +
                        std::to_string(start),
                    ErrorKind::Parse, start);
      }
      offset_ += 2;
      const size_t trail_start = offset_;
      const uint16_t trail = read_code_unit();
      if (trail < 0xDC00 || trail > 0xDFFF) {
        throw Error("Invalid unicode escape - expected trail surrogate at "
                    "offset " +
                        std::to_string(trail_start),
                    ErrorKind::Parse, trail_start);
      }
      code_point = 0x10000 + ((static_cast<uint32_t>(unit) - 0xD800) << 10) +
                   (static_cast<uint32_t>(trail) - 0xDC00);
    } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
      throw Error("Invalid unicode escape - unpaired trail surrogate at "
                  "offset " +
                      std::to_string(start),
                  ErrorKind::Parse, start);
    }

    append_utf8(out, code_point);
  }

private:
  uint16_t read_code_unit() {
    if (size_ - offset_ < 4) {
      throw Error("Invalid unicode escape - expected 4 hex digits at offset " +
                      std::to_string(offset_),
                  ErrorKind::Parse, offset_);
    }
    uint16_t unit = 0;
    for (size_t i = 0; i < 4; ++i) {
      const int h = lookup::hex_value(input_[offset_ + i]);
      if (h < 0)
        throw parse_error(offset_ + i, input_[offset_ + i],
                          "Invalid unicode escape");
      unit = static_cast<uint16_t>((unit << 4) | h);
    }
    offset_ += 4;
    return unit;
  }

  static void append_utf8(std::string &out, uint32_t cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  const uint8_t *input_;
  size_t size_;
  size_t offset_;
};

} // namespace detail

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
  // Nesting beyond this is always rejected.
  static constexpr size_t kHardDepthLimit = 2048;
  // Exclusive nesting limit of parse().
  static constexpr size_t kBoundedDepth = 1024;
  static constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

  Parser(const uint8_t *data, size_t size, Options options = Options::Default,
         size_t max_depth = kUnbounded)
      : input_(data), size_(size), options_(options), max_depth_(max_depth) {}

  Value parse() {
    const EncodingInfo info = detect_encoding(input_, size_);
    if (info.encoding != Encoding::Utf8) {
      throw Error(std::string("Unsupported string encoding (") +
                      encoding_name(info.encoding) + ")",
                  ErrorKind::Parse, 0);
    }
    offset_ = info.bom_length;

    if (!has_option(options_, Options::FragmentsAllowed)) {
      skip_whitespace();
      if (offset_ >= size_)
        throw detail::end_of_stream(offset_);
      if (input_[offset_] != '{')
        throw detail::parse_error(offset_, input_[offset_],
                                  "Top-level value must be an object");
    }

    Value root = parse_value();
    skip_whitespace();
    if (offset_ < size_)
      throw detail::parse_error(offset_, input_[offset_]);
    return root;
  }

  size_t offset() const { return offset_; }
  // Zero-based count of line breaks consumed so far.
  size_t line() const { return line_; }

private:
  using State = detail::NumberLexer::State;

  struct DepthScope {
    Parser &parser;
    explicit DepthScope(Parser &p) : parser(p) {
      const size_t next = parser.depth_ + 1;
      if (next >= parser.max_depth_ || next > kHardDepthLimit) {
        throw Error("Maximum parse depth exceeded at offset " +
                        std::to_string(parser.offset_),
                    ErrorKind::DepthExceeded, parser.offset_);
      }
      parser.depth_ = next;
    }
    ~DepthScope() { --parser.depth_; }
    DepthScope(const DepthScope &) = delete;
    DepthScope &operator=(const DepthScope &) = delete;
  };

  LANTERN_INLINE void skip_whitespace() {
    while (offset_ < size_ && lookup::is_whitespace(input_[offset_])) {
      if (input_[offset_] == '\n' || input_[offset_] == '\r')
        ++line_;
      ++offset_;
    }
  }

  Value parse_value() {
    while (offset_ < size_) {
      const uint8_t c = input_[offset_];
      switch (c) {
      case '[':
        return parse_array();
      case '{':
        return parse_object();
      case '"':
        return Value(parse_string());
      case 't':
        return parse_literal("true", Literal::True);
      case 'f':
        return parse_literal("false", Literal::False);
      case 'n':
        return parse_literal("null", Literal::Null);
      case '-':
        return parse_number(State::LeadingMinus);
      case '0':
        return parse_number(State::LeadingZero);
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7':
      case '8':
      case '9':
        return parse_number(State::PreDecimalDigit);
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        skip_whitespace();
        break;
      default:
        throw detail::parse_error(offset_, c);
      }
    }
    throw detail::end_of_stream(offset_);
  }

  // Separators are skipped without enforcing their placement.
  Value parse_array() {
    DepthScope scope(*this);
    ++offset_;
    Array items;
    while (offset_ < size_) {
      switch (input_[offset_]) {
      case ']':
        ++offset_;
        return Value(std::move(items));
      case ',':
        ++offset_;
        break;
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        skip_whitespace();
        break;
      default:
        items.push_back(parse_value());
        break;
      }
    }
    throw detail::end_of_stream(offset_);
  }

  Value parse_object() {
    DepthScope scope(*this);
    ++offset_;
    // Sorted and reduced once at '}'.
    std::vector<Member> pending;
    std::optional<std::string> key;
    bool has_value = false;

    while (offset_ < size_) {
      const uint8_t c = input_[offset_];
      switch (c) {
      case '}': {
        if (key && !has_value)
          throw detail::parse_error(offset_, c);
        ++offset_;
        Object members(std::move(pending));
        if (has_option(options_, Options::NullSkipsKey))
          members.erase_if([](const Member &m) { return m.second.is_null(); });
        return Value(std::move(members));
      }
      case ':':
        if (!key || has_value)
          throw detail::parse_error(offset_, c);
        ++offset_;
        pending.push_back(Member{std::move(*key), parse_value()});
        has_value = true;
        break;
      case ',':
        if (!key || !has_value)
          throw detail::parse_error(offset_, c);
        ++offset_;
        key.reset();
        has_value = false;
        break;
      case '"':
        if (key)
          throw detail::parse_error(offset_, c);
        key = parse_string();
        break;
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        skip_whitespace();
        break;
      default:
        throw detail::parse_error(offset_, c);
      }
    }
    throw detail::end_of_stream(offset_);
  }

  Value parse_literal(std::string_view word, Literal literal) {
    if (size_ - offset_ < word.size())
      throw detail::end_of_stream(size_);
    for (size_t i = 0; i < word.size(); ++i) {
      const uint8_t c = input_[offset_ + i];
      if (c != static_cast<uint8_t>(word[i]))
        throw detail::parse_error(offset_ + i, c);
    }
    offset_ += word.size();
    return Value(literal);
  }

  std::string parse_string() {
    ++offset_;
    scratch_.clear();
    while (offset_ < size_) {
      size_t run = offset_;
      while (run < size_ && input_[run] != '"' && input_[run] != '\\')
        ++run;
      scratch_.append(reinterpret_cast<const char *>(input_ + offset_),
                      run - offset_);
      offset_ = run;
      if (offset_ >= size_)
        break;
      if (input_[offset_] == '"') {
        ++offset_;
        return scratch_;
      }
      parse_escape();
    }
    throw detail::end_of_stream(offset_);
  }

  void parse_escape() {
    ++offset_;
    if (offset_ >= size_)
      throw detail::end_of_stream(offset_);
    const uint8_t c = input_[offset_];
    switch (c) {
    case '"':
      scratch_.push_back('"');
      break;
    case '\\':
      scratch_.push_back('\\');
      break;
    case '/':
      scratch_.push_back('/');
      break;
    case 'b':
      scratch_.push_back('\b');
      break;
    case 'f':
      scratch_.push_back('\f');
      break;
    case 'n':
      scratch_.push_back('\n');
      break;
    case 'r':
      scratch_.push_back('\r');
      break;
    case 't':
      scratch_.push_back('\t');
      break;
    case 'u': {
      detail::UnicodeEscapeDecoder decoder(input_, size_, offset_ + 1);
      decoder.decode_into(scratch_);
      offset_ = decoder.offset();
      return;
    }
    default:
      throw detail::parse_error(offset_, c, "Invalid escape");
    }
    ++offset_;
  }

  Value parse_number(State initial) {
    const size_t start = offset_;
    if (auto number = decode_numeric(detail::NumberLexer(input_, size_, start,
                                                         initial)))
      return Value(*number);
    return decode_number_as_string(start, initial);
  }

  // nullopt means the value does not fit and must be kept as text.
  std::optional<Number> decode_numeric(detail::NumberLexer lexer) {
    const size_t start = lexer.offset();
    int64_t sign = 1;
    int64_t value = 0;
    const auto accumulate = [&value](uint8_t c) {
      const int64_t digit = c - '0';
      if (value > (std::numeric_limits<int64_t>::max() - digit) / 10)
        return false;
      value = value * 10 + digit;
      return true;
    };

    while (lexer.state() != State::Complete) {
      switch (lexer.state()) {
      case State::LeadingMinus:
        sign = -1;
        lexer.leading_minus();
        break;
      case State::LeadingZero:
        lexer.leading_zero();
        break;
      case State::PreDecimalDigit:
        if (!lexer.pre_decimal_digit(accumulate))
          return std::nullopt;
        break;
      case State::DecimalPoint:
      case State::ExponentLetter:
        return decode_floating_point(lexer, start);
      default:
        detail::invalid_state("integer number lexer");
      }
    }

    offset_ = lexer.offset();
    return Number(sign * value);
  }

  // The lexer validates the token; the value comes from the token text so
  // it is correctly rounded.
  std::optional<Number> decode_floating_point(detail::NumberLexer &lexer,
                                              size_t start) {
    const auto ignore = [](uint8_t) {};
    while (lexer.state() != State::Complete) {
      switch (lexer.state()) {
      case State::DecimalPoint:
        lexer.decimal_point();
        break;
      case State::PostDecimalDigit:
        lexer.post_decimal_digit(ignore);
        break;
      case State::ExponentLetter:
        lexer.exponent_letter();
        break;
      case State::ExponentSign:
        lexer.exponent_sign();
        break;
      case State::ExponentDigit:
        lexer.exponent_digit(ignore);
        break;
      default:
        detail::invalid_state("floating point number lexer");
      }
    }

    const char *first = reinterpret_cast<const char *>(input_ + start);
    const char *last = reinterpret_cast<const char *>(input_ + lexer.offset());
    double result = 0.0;
    const auto [ptr, ec] = std::from_chars(first, last, result);
    // Overflow to infinity and underflow to zero both report
    // result_out_of_range.
    if (ec != std::errc() || ptr != last || std::isinf(result))
      return std::nullopt;

    offset_ = lexer.offset();
    return Number(result);
  }

  // Re-lexes the number from its first byte and keeps the raw text.
  Value decode_number_as_string(size_t start, State initial) {
    detail::NumberLexer lexer(input_, size_, start, initial);
    const auto ignore = [](uint8_t) {};
    while (lexer.state() != State::Complete) {
      switch (lexer.state()) {
      case State::LeadingMinus:
        lexer.leading_minus();
        break;
      case State::LeadingZero:
        lexer.leading_zero();
        break;
      case State::PreDecimalDigit:
        lexer.pre_decimal_digit([](uint8_t) { return true; });
        break;
      case State::DecimalPoint:
        lexer.decimal_point();
        break;
      case State::PostDecimalDigit:
        lexer.post_decimal_digit(ignore);
        break;
      case State::ExponentLetter:
        lexer.exponent_letter();
        break;
      case State::ExponentSign:
        lexer.exponent_sign();
        break;
      case State::ExponentDigit:
        lexer.exponent_digit(ignore);
        break;
      case State::Complete:
        break;
      }
    }
    offset_ = lexer.offset();
    return Value(std::string(reinterpret_cast<const char *>(input_ + start),
                             offset_ - start));
  }

  const uint8_t *input_;
  size_t size_;
  size_t offset_ = 0;
  size_t depth_ = 0;
  size_t line_ = 0;
  Options options_;
  size_t max_depth_;
  std::string scratch_;
};

// ============================================================================
// Global API
// ============================================================================

// Nesting of kBoundedDepth or more is rejected.
inline Value parse(const uint8_t *data, size_t size,
                   Options options = Options::Default) {
  Parser parser(data, size, options, Parser::kBoundedDepth);
  return parser.parse();
}

inline Value parse(std::string_view json, Options options = Options::Default) {
  return parse(reinterpret_cast<const uint8_t *>(json.data()), json.size(),
               options);
}

inline Value parse(const std::vector<uint8_t> &bytes,
                   Options options = Options::Default) {
  return parse(bytes.data(), bytes.size(), options);
}

// Only the hard depth limit applies.
inline Value parse_unbounded(const uint8_t *data, size_t size,
                             Options options = Options::Default) {
  Parser parser(data, size, options, Parser::kUnbounded);
  return parser.parse();
}

inline Value parse_unbounded(std::string_view json,
                             Options options = Options::Default) {
  return parse_unbounded(reinterpret_cast<const uint8_t *>(json.data()),
                         json.size(), options);
}

inline Value parse_unbounded(const std::vector<uint8_t> &bytes,
                             Options options = Options::Default) {
  return parse_unbounded(bytes.data(), bytes.size(), options);
}

inline std::optional<Value> try_parse(std::string_view json,
                                      Options options = Options::Default) {
  try {
    return parse(json, options);
  } catch (const Error &) {
    return std::nullopt;
  }
}

inline Value load_file(const std::string &filename,
                       Options options = Options::Default) {
  std::ifstream file(filename, std::ios::binary);
  if (!file)
    throw Error("Cannot open: " + filename);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return parse(bytes, options);
}

inline void save_file(const Value &value, const std::string &filename,
                      Options options = Options::Default) {
  const std::string text = stringify(value, options);
  std::ofstream file(filename, std::ios::binary);
  if (!file)
    throw Error("Cannot write: " + filename);
  file.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!file)
    throw Error("Write failed: " + filename);
}

// ============================================================================
// Codable
// ============================================================================
// A type is encodable through a member `Value to_json() const` or an ADL
// `void to_json(Value &, const T &)`, and decodable through a static
// `T from_json(const Value &)` or an ADL `void from_json(const Value &, T &)`.

template <typename T> Value encode(const T &value);
template <typename T> T decode(const Value &value);

namespace detail {

template <typename T, typename = void>
struct has_member_to_json : std::false_type {};

template <typename T>
struct has_member_to_json<
    T, std::void_t<decltype(std::declval<const T &>().to_json())>>
    : std::is_convertible<decltype(std::declval<const T &>().to_json()),
                          Value> {};

template <typename T, typename = void>
struct has_static_from_json : std::false_type {};

template <typename T>
struct has_static_from_json<
    T, std::void_t<decltype(T::from_json(std::declval<const Value &>()))>>
    : std::is_same<decltype(T::from_json(std::declval<const Value &>())), T> {
};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool>;

[[noreturn]] inline void
decoding_failed(const char *target, const Value &value,
                std::source_location where = std::source_location::current()) {
  throw Error(std::string("Cannot decode ") + target + " from " +
                  describe(value),
              ErrorKind::Decoding, Error::npos, where);
}

} // namespace detail

// Encoders
inline void to_json(Value &out, const Value &value) { out = value; }
inline void to_json(Value &out, bool value) { out = Value(value); }
inline void to_json(Value &out, double value) { out = Value(value); }
inline void to_json(Value &out, float value) { out = Value(value); }
inline void to_json(Value &out, const std::string &value) { out = Value(value); }
inline void to_json(Value &out, std::string_view value) { out = Value(value); }
inline void to_json(Value &out, const char *value) { out = Value(value); }

// Unsigned values above INT64_MAX throw Encoding from the Value constructor.
template <typename T, std::enable_if_t<detail::is_integer_v<T>, int> = 0>
void to_json(Value &out, T value) {
  out = Value(value);
}

namespace detail {

template <typename Seq> void encode_sequence(Value &out, const Seq &items) {
  Array arr;
  arr.reserve(items.size());
  for (const auto &item : items)
    arr.push_back(encode(item));
  out = Value(std::move(arr));
}

template <typename Map> void encode_map(Value &out, const Map &members) {
  Object obj;
  for (const auto &[key, item] : members)
    obj.insert(key, encode(item));
  out = Value(std::move(obj));
}

} // namespace detail

template <typename T> void to_json(Value &out, const std::vector<T> &items) {
  detail::encode_sequence(out, items);
}
template <typename T> void to_json(Value &out, const std::list<T> &items) {
  detail::encode_sequence(out, items);
}
template <typename T> void to_json(Value &out, const std::set<T> &items) {
  detail::encode_sequence(out, items);
}
template <typename T>
void to_json(Value &out, const std::unordered_set<T> &items) {
  detail::encode_sequence(out, items);
}
template <typename T>
void to_json(Value &out, const std::map<std::string, T> &members) {
  detail::encode_map(out, members);
}
template <typename T>
void to_json(Value &out, const std::unordered_map<std::string, T> &members) {
  detail::encode_map(out, members);
}
template <typename T> void to_json(Value &out, const std::optional<T> &opt) {
  out = opt ? encode(*opt) : Value();
}

// Decoders
inline void from_json(const Value &v, Value &out) { out = v; }

inline void from_json(const Value &v, bool &out) {
  if (v.is_bool()) {
    out = v.as_bool();
    return;
  }
  if (v.is_number()) {
    auto exact = v.as_number().exact_int();
    if (exact && (*exact == 0 || *exact == 1)) {
      out = *exact == 1;
      return;
    }
  } else if (v.is_string()) {
    if (v.as_string() == "true" || v.as_string() == "false") {
      out = v.as_string() == "true";
      return;
    }
  }
  detail::decoding_failed("bool", v);
}

template <typename T, std::enable_if_t<detail::is_integer_v<T>, int> = 0>
void from_json(const Value &v, T &out) {
  int64_t wide = 0;
  bool ok = false;
  if (v.is_number()) {
    if (auto exact = v.as_number().exact_int()) {
      wide = *exact;
      ok = true;
    }
  } else if (v.is_string()) {
    const std::string &s = v.as_string();
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), wide);
    ok = ec == std::errc() && ptr == s.data() + s.size() && !s.empty();
  } else if (v.is_bool()) {
    wide = v.as_bool() ? 1 : 0;
    ok = true;
  }
  if (ok) {
    if constexpr (std::is_unsigned_v<T>) {
      ok = wide >= 0 && static_cast<uint64_t>(wide) <=
                            static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else {
      ok = wide >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
           wide <= static_cast<int64_t>(std::numeric_limits<T>::max());
    }
  }
  if (!ok)
    detail::decoding_failed("integer", v);
  out = static_cast<T>(wide);
}

inline void from_json(const Value &v, double &out) {
  if (v.is_number()) {
    out = v.as_double();
    return;
  }
  if (v.is_string()) {
    const std::string &s = v.as_string();
    double parsed = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec == std::errc() && ptr == s.data() + s.size() && !s.empty()) {
      out = parsed;
      return;
    }
  }
  detail::decoding_failed("double", v);
}

inline void from_json(const Value &v, float &out) {
  double d = 0;
  from_json(v, d);
  out = static_cast<float>(d);
}

inline void from_json(const Value &v, std::string &out) {
  switch (v.type()) {
  case ValueType::String:
    out = v.as_string();
    return;
  case ValueType::Number:
    out = v.as_number().to_string();
    return;
  case ValueType::Literal:
    if (v.is_bool()) {
      out = v.as_bool() ? "true" : "false";
      return;
    }
    break;
  default:
    break;
  }
  detail::decoding_failed("string", v);
}

template <typename T> void from_json(const Value &v, std::vector<T> &out) {
  if (!v.is_array())
    detail::decoding_failed("array", v);
  out.clear();
  out.reserve(v.size());
  for (const auto &item : v.as_array())
    out.push_back(decode<T>(item));
}

template <typename T> void from_json(const Value &v, std::list<T> &out) {
  if (!v.is_array())
    detail::decoding_failed("list", v);
  out.clear();
  for (const auto &item : v.as_array())
    out.push_back(decode<T>(item));
}

template <typename T> void from_json(const Value &v, std::set<T> &out) {
  if (!v.is_array())
    detail::decoding_failed("set", v);
  out.clear();
  for (const auto &item : v.as_array())
    out.insert(decode<T>(item));
}

template <typename T>
void from_json(const Value &v, std::unordered_set<T> &out) {
  if (!v.is_array())
    detail::decoding_failed("set", v);
  out.clear();
  for (const auto &item : v.as_array())
    out.insert(decode<T>(item));
}

template <typename T>
void from_json(const Value &v, std::map<std::string, T> &out) {
  if (!v.is_object())
    detail::decoding_failed("map", v);
  out.clear();
  for (const auto &member : v.as_object())
    out.emplace(member.first, decode<T>(member.second));
}

template <typename T>
void from_json(const Value &v, std::unordered_map<std::string, T> &out) {
  if (!v.is_object())
    detail::decoding_failed("map", v);
  out.clear();
  for (const auto &member : v.as_object())
    out.emplace(member.first, decode<T>(member.second));
}

// null means absent
template <typename T> void from_json(const Value &v, std::optional<T> &out) {
  if (v.is_null())
    out.reset();
  else
    out = decode<T>(v);
}

template <typename T> Value encode(const T &value) {
  if constexpr (detail::has_member_to_json<T>::value) {
    return value.to_json();
  } else {
    Value out;
    to_json(out, value);
    return out;
  }
}

// Any failure below surfaces as ErrorKind::Decoding.
template <typename T> T decode(const Value &value) {
  try {
    if constexpr (detail::has_static_from_json<T>::value) {
      return T::from_json(value);
    } else {
      T out{};
      from_json(value, out);
      return out;
    }
  } catch (const Error &e) {
    if (e.kind() == ErrorKind::Decoding)
      throw;
    throw Error(e.what(), ErrorKind::Decoding, e.offset(), e.where());
  }
}

template <typename T> std::optional<T> try_decode(const Value &value) {
  try {
    return decode<T>(value);
  } catch (const Error &) {
    return std::nullopt;
  }
}

namespace detail {

// Optional fields tolerate a missing key; everything else must be present.
template <typename T>
void decode_member(const Value &object, std::string_view key, T &field) {
  if constexpr (is_optional<T>::value) {
    if (!object.is_object())
      throw subscript_error(object, Subscript(key));
    field = decode<T>(object.get(key));
  } else {
    field = decode<T>(object.try_get(key));
  }
}

} // namespace detail

// ============================================================================
// Async
// ============================================================================

inline std::future<Value> parse_async(std::string json,
                                      Options options = Options::Default) {
  return std::async(std::launch::async,
                    [json = std::move(json), options] {
                      return parse_unbounded(json, options);
                    });
}

inline std::future<Value> parse_async(std::vector<uint8_t> bytes,
                                      Options options = Options::Default) {
  return std::async(std::launch::async,
                    [bytes = std::move(bytes), options] {
                      return parse_unbounded(bytes, options);
                    });
}

inline std::future<std::vector<uint8_t>>
serialize_async(Value value, Options options = Options::Default) {
  return std::async(std::launch::async,
                    [value = std::move(value), options] {
                      return serialize(value, options);
                    });
}

inline std::future<std::string>
stringify_async(Value value, Options options = Options::Default) {
  return std::async(std::launch::async,
                    [value = std::move(value), options] {
                      return stringify(value, options);
                    });
}

template <typename T> std::future<Value> encode_async(T value) {
  return std::async(std::launch::async,
                    [value = std::move(value)] { return encode(value); });
}

template <typename T> std::future<T> decode_async(Value value) {
  return std::async(std::launch::async,
                    [value = std::move(value)] { return decode<T>(value); });
}

} // namespace json
} // namespace lantern

// ============================================================================
// Record Macro
// ============================================================================
// LANTERN_DEFINE_JSON(Type, field1, field2, ...) defines to_json/from_json for
// a plain struct, one object member per field (up to 16 fields). Invoke it in
// the namespace of Type.

#define LANTERN_JSON_EXPAND(x) x
#define LANTERN_JSON_GET_MACRO(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11,   \
                               _12, _13, _14, _15, _16, _17, NAME, ...)        \
  NAME
#define LANTERN_JSON_PASTE(...)                                                \
  LANTERN_JSON_EXPAND(LANTERN_JSON_GET_MACRO(                                  \
      __VA_ARGS__, LANTERN_JSON_PASTE17, LANTERN_JSON_PASTE16,                 \
      LANTERN_JSON_PASTE15, LANTERN_JSON_PASTE14, LANTERN_JSON_PASTE13,        \
      LANTERN_JSON_PASTE12, LANTERN_JSON_PASTE11, LANTERN_JSON_PASTE10,        \
      LANTERN_JSON_PASTE9, LANTERN_JSON_PASTE8, LANTERN_JSON_PASTE7,           \
      LANTERN_JSON_PASTE6, LANTERN_JSON_PASTE5, LANTERN_JSON_PASTE4,           \
      LANTERN_JSON_PASTE3, LANTERN_JSON_PASTE2,                                \
      LANTERN_JSON_PASTE1)(__VA_ARGS__))
#define LANTERN_JSON_PASTE1(func)
#define LANTERN_JSON_PASTE2(func, v1) func(v1)
#define LANTERN_JSON_PASTE3(func, v1, v2)                                      \
  LANTERN_JSON_PASTE2(func, v1) LANTERN_JSON_PASTE2(func, v2)
#define LANTERN_JSON_PASTE4(func, v1, v2, v3)                                  \
  LANTERN_JSON_PASTE2(func, v1) LANTERN_JSON_PASTE3(func, v2, v3)
#define LANTERN_JSON_PASTE5(func, v1, v2, v3, v4)                              \
  LANTERN_JSON_PASTE2(func, v1) LANTERN_JSON_PASTE4(func, v2, v3, v4)
#define LANTERN_JSON_PASTE6(func, v1, v2, v3, v4, v5)                          \
  LANTERN_JSON_PASTE2(func, v1) LANTERN_JSON_PASTE5(func, v2, v3, v4, v5)
#define LANTERN_JSON_PASTE7(func, v1, v2, v3, v4, v5, v6)                      \
  LANTERN_JSON_PASTE2(func, v1) LANTERN_JSON_PASTE6(func, v2, v3, v4, v5, v6)
#define LANTERN_JSON_PASTE8(func, v1, v2, v3, v4, v5, v6, v7)                  \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE7(func, v2, v3, v4, v5, v6, v7)
#define LANTERN_JSON_PASTE9(func, v1, v2, v3, v4, v5, v6, v7, v8)              \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE8(func, v2, v3, v4, v5, v6, v7, v8)
#define LANTERN_JSON_PASTE10(func, v1, v2, v3, v4, v5, v6, v7, v8, v9)         \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE9(func, v2, v3, v4, v5, v6, v7, v8, v9)
#define LANTERN_JSON_PASTE11(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10)    \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE10(func, v2, v3, v4, v5, v6, v7, v8, v9, v10)
#define LANTERN_JSON_PASTE12(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11)                                              \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE11(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11)
#define LANTERN_JSON_PASTE13(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11, v12)                                         \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE12(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11, v12)
#define LANTERN_JSON_PASTE14(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11, v12, v13)                                    \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE13(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11, v12,    \
                       v13)
#define LANTERN_JSON_PASTE15(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11, v12, v13, v14)                               \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE14(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11, v12,    \
                       v13, v14)
#define LANTERN_JSON_PASTE16(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11, v12, v13, v14, v15)                          \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE15(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11, v12,    \
                       v13, v14, v15)
#define LANTERN_JSON_PASTE17(func, v1, v2, v3, v4, v5, v6, v7, v8, v9, v10,    \
                             v11, v12, v13, v14, v15, v16)                     \
  LANTERN_JSON_PASTE2(func, v1)                                                \
  LANTERN_JSON_PASTE16(func, v2, v3, v4, v5, v6, v7, v8, v9, v10, v11, v12,    \
                       v13, v14, v15, v16)

#define LANTERN_JSON_TO(field)                                                 \
  out.set(#field, ::lantern::json::encode(record.field));
#define LANTERN_JSON_FROM(field)                                               \
  ::lantern::json::detail::decode_member(value, #field, record.field);

#define LANTERN_DEFINE_JSON(Type, ...)                                         \
  inline void to_json(::lantern::json::Value &out, const Type &record) {       \
    out = ::lantern::json::Value::object();                                    \
    LANTERN_JSON_EXPAND(LANTERN_JSON_PASTE(LANTERN_JSON_TO, __VA_ARGS__))      \
  }                                                                            \
  inline void from_json(const ::lantern::json::Value &value, Type &record) {   \
    LANTERN_JSON_EXPAND(LANTERN_JSON_PASTE(LANTERN_JSON_FROM, __VA_ARGS__))    \
  }

#endif // LANTERN_JSON_HPP
