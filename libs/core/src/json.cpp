#include "portico/core/json.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/filesystem.h>
#include <yyjson.h>

namespace portico::core {

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::JsonDocument() : doc_(nullptr) {}

JsonDocument::JsonDocument(yyjson_doc* doc) : doc_(doc) {}

JsonDocument::~JsonDocument() {
  if (doc_) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr text) {
  yyjson_read_err err;
  // yyjson copies when YYJSON_READ_INSITU is not set, so the cast is safe.
  yyjson_doc* doc =
      yyjson_read_opts(const_cast<char*>(text.cStr()), text.size(), 0, nullptr, &err);
  if (!doc) {
    KJ_FAIL_REQUIRE("JSON parse error", err.pos, err.msg ? err.msg : "unknown error");
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path) {
  auto fs = kj::newDiskFilesystem();
  auto resolved = fs->getCurrentPath().eval(path);
  auto file = fs->getRoot().openFile(resolved);
  auto text = file->readAllText();
  return parse(text);
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue
// ============================================================================

JsonValue::JsonValue(yyjson_val* val) : val_(val) {}

bool JsonValue::is_null() const {
  return val_ && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ && yyjson_is_int(val_);
}

bool JsonValue::is_real() const {
  return val_ && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  return is_bool() ? yyjson_get_bool(val_) : default_val;
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (!is_number()) {
    return default_val;
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  // Reals are truncated toward zero and saturate at the int64 range
  double real = yyjson_get_real(val_);
  if (real != real) {
    return default_val;
  }
  if (real >= 9223372036854775807.0) {
    return kj::maxValue;
  }
  if (real <= -9223372036854775808.0) {
    return kj::minValue;
  }
  return static_cast<int64_t>(real);
}

double JsonValue::get_double(double default_val) const {
  return is_number() ? yyjson_get_num(val_) : default_val;
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  KJ_IF_SOME(str, get_string_ptr()) {
    return kj::str(str);
  }
  return kj::str(default_val);
}

kj::Maybe<kj::StringPtr> JsonValue::get_string_ptr() const {
  if (!is_string()) {
    return kj::none;
  }
  const char* str = yyjson_get_str(val_);
  if (str == nullptr) {
    return kj::none;
  }
  return kj::StringPtr(str, yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!is_array()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_arr_get(val_, index));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  if (!is_object()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_obj_getn(val_, key.cStr(), key.size()));
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  auto child = (*this)[key];
  if (!child.is_valid()) {
    return kj::none;
  }
  return child;
}

void JsonValue::for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx, max;
  yyjson_val* item;
  yyjson_arr_foreach(val_, idx, max, item) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  size_t idx, max;
  yyjson_val* key;
  yyjson_val* val;
  yyjson_obj_foreach(val_, idx, max, key, val) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(val));
  }
}

kj::Vector<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> result;
  for_each_object([&](kj::StringPtr key, const JsonValue&) { result.add(kj::str(key)); });
  return result;
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::Impl {
  yyjson_mut_doc* doc = nullptr;
  yyjson_mut_val* current = nullptr;
  bool is_object = true;

  ~Impl() {
    if (doc) {
      yyjson_mut_doc_free(doc);
    }
  }

  yyjson_mut_val* key(kj::StringPtr k) {
    return yyjson_mut_strncpy(doc, k.cStr(), k.size());
  }
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->is_object = type == Type::Object;
  impl_->doc = yyjson_mut_doc_new(nullptr);
  KJ_ASSERT(impl_->doc != nullptr, "yyjson allocation failed");
  impl_->current = impl_->is_object ? yyjson_mut_obj(impl_->doc) : yyjson_mut_arr(impl_->doc);
  yyjson_mut_doc_set_root(impl_->doc, impl_->current);
}

JsonBuilder::~JsonBuilder() = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : impl_(kj::mv(other.impl_)) {}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    impl_ = kj::mv(other.impl_);
  }
  return *this;
}

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

JsonBuilder& JsonBuilder::put_value(kj::StringPtr key, yyjson_mut_val* value) {
  if (impl_->is_object && value != nullptr) {
    yyjson_mut_obj_add(impl_->current, impl_->key(key), value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  return put(key, kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  return put_value(key, yyjson_mut_strncpy(impl_->doc, value.cStr(), value.size()));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  return put_value(key, yyjson_mut_bool(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  return put_value(key, yyjson_mut_sint(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint value) {
  return put_value(key, yyjson_mut_uint(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  return put_value(key, yyjson_mut_sint(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  return put_value(key, yyjson_mut_uint(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  return put_value(key, yyjson_mut_real(impl_->doc, value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, decltype(nullptr)) {
  return put_value(key, yyjson_mut_null(impl_->doc));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::ArrayPtr<const kj::String> values) {
  yyjson_mut_val* arr = yyjson_mut_arr(impl_->doc);
  for (auto& v : values) {
    yyjson_mut_arr_add_strncpy(impl_->doc, arr, v.cStr(), v.size());
  }
  return put_value(key, arr);
}

JsonBuilder& JsonBuilder::nest(yyjson_mut_val* container, bool is_object,
                               kj::Maybe<kj::StringPtr> key,
                               kj::FunctionParam<void(JsonBuilder&)> builder) {
  yyjson_mut_val* parent = impl_->current;
  bool parent_is_object = impl_->is_object;

  impl_->current = container;
  impl_->is_object = is_object;
  builder(*this);
  impl_->current = parent;
  impl_->is_object = parent_is_object;

  KJ_IF_SOME(k, key) {
    yyjson_mut_obj_add(parent, impl_->key(k), container);
  } else {
    yyjson_mut_arr_append(parent, container);
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key,
                                     kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  return nest(yyjson_mut_obj(impl_->doc), true, key, builder);
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key,
                                    kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  return nest(yyjson_mut_arr(impl_->doc), false, key, builder);
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_strncpy(impl_->doc, impl_->current, value.cStr(), value.size());
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(bool value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_bool(impl_->doc, impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_sint(impl_->doc, impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_real(impl_->doc, impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    return *this;
  }
  return nest(yyjson_mut_obj(impl_->doc), true, kj::none, builder);
}

kj::String JsonBuilder::build(bool pretty) const {
  size_t len = 0;
  yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : 0;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(impl_->doc, flags, nullptr, &len, &err);
  KJ_REQUIRE(json != nullptr, "JSON write error", err.msg ? err.msg : "unknown error");
  kj::String result = kj::heapString(json, len);
  std::free(json);
  return result;
}

} // namespace portico::core
