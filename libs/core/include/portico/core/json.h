/**
 * @file json.h
 * @brief JSON wrapper using yyjson
 *
 * Usage:
 *   auto doc = JsonDocument::parse(text);
 *   KJ_IF_SOME(port, doc.root().get("port")) { ... }
 *
 *   auto builder = JsonBuilder::object();
 *   builder.put("error", "not_found").put("status", 404);
 *   kj::String body = builder.build();
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

// Forward declarations for yyjson types to avoid including C header
struct yyjson_doc;
struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace portico::core {

class JsonValue;

/**
 * @brief Owning handle for a parsed (immutable) yyjson document
 */
class JsonDocument {
public:
  JsonDocument();
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse JSON text
   * @throws kj::Exception if the text is not valid JSON
   */
  static JsonDocument parse(kj::StringPtr text);

  /**
   * @brief Read and parse a JSON file, resolving relative paths against the working directory
   * @throws kj::Exception if the file cannot be read or parsed
   */
  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;

  [[nodiscard]] bool is_valid() const {
    return doc_ != nullptr;
  }

private:
  explicit JsonDocument(yyjson_doc* doc);
  yyjson_doc* doc_;
};

/**
 * @brief Read-only view of a value inside a JsonDocument
 *
 * Does not own anything. The document must outlive the view.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr);

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_int() const;
  bool is_real() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  bool get_bool(bool default_val = false) const;
  int64_t get_int(int64_t default_val = 0) const;
  double get_double(double default_val = 0.0) const;
  kj::String get_string(kj::StringPtr default_val = ""_kj) const;

  /// Zero-copy access to a string value; kj::none when not a string.
  kj::Maybe<kj::StringPtr> get_string_ptr() const;

  /// Number of array elements or object members, 0 otherwise.
  size_t size() const;

  JsonValue operator[](size_t index) const;
  JsonValue operator[](kj::StringPtr key) const;

  /// Object member lookup.
  kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const;
  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;

  kj::Vector<kj::String> keys() const;

  bool is_valid() const {
    return val_ != nullptr;
  }

private:
  yyjson_val* val_;
};

/**
 * @brief Fluent builder for JSON objects and arrays
 *
 * put() appends object members, add() appends array elements. Calling the wrong one for
 * the current container is ignored.
 */
class JsonBuilder {
public:
  static JsonBuilder object();
  static JsonBuilder array();

  ~JsonBuilder();
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, uint value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, decltype(nullptr));
  JsonBuilder& put(kj::StringPtr key, kj::ArrayPtr<const kj::String> values);

  JsonBuilder& put_object(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);

  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(bool value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(double value);
  JsonBuilder& add_object(kj::FunctionParam<void(JsonBuilder&)> builder);

  /**
   * @brief Serialize the document
   * @param pretty Pretty print with indentation
   */
  kj::String build(bool pretty = false) const;

private:
  enum class Type { Object, Array };
  explicit JsonBuilder(Type type);

  JsonBuilder& put_value(kj::StringPtr key, yyjson_mut_val* value);
  JsonBuilder& nest(yyjson_mut_val* container, bool is_object, kj::Maybe<kj::StringPtr> key,
                    kj::FunctionParam<void(JsonBuilder&)> builder);

  struct Impl;
  kj::Own<Impl> impl_;
};

} // namespace portico::core
