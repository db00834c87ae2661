#include "kj/test.h"
#include "portico/core/json.h"

using namespace portico::core;

namespace {

KJ_TEST("JSON: parse object members") {
  auto doc = JsonDocument::parse(R"({"name": "users", "port": 8080, "tls": true})"_kj);
  auto root = doc.root();

  KJ_EXPECT(root.is_object());
  KJ_EXPECT(root.size() == 3);
  KJ_EXPECT(root["name"].get_string() == "users");
  KJ_EXPECT(root["port"].get_int() == 8080);
  KJ_EXPECT(root["tls"].get_bool());
  KJ_EXPECT(root.get("missing") == kj::none);
  KJ_EXPECT(root["missing"].get_int(7) == 7);
}

KJ_TEST("JSON: get_int reads reals and saturates out-of-range values") {
  auto doc = JsonDocument::parse(R"({"exp": 1.7e9, "neg": -2.9, "huge": 1e300, "tiny": -1e300})");
  auto root = doc.root();
  KJ_EXPECT(root["exp"].get_int() == 1700000000);
  KJ_EXPECT(root["neg"].get_int() == -2);
  KJ_EXPECT(root["huge"].get_int() == kj::maxValue);
  KJ_EXPECT(root["tiny"].get_int() == kj::minValue);
}

KJ_TEST("JSON: iterate arrays and objects") {
  auto doc = JsonDocument::parse(R"({"methods": ["GET", "POST"], "meta": {"a": "1", "b": "2"}})"_kj);
  auto root = doc.root();

  kj::Vector<kj::String> methods;
  root["methods"].for_each_array(
      [&](const JsonValue& v) { methods.add(v.get_string()); });
  KJ_ASSERT(methods.size() == 2);
  KJ_EXPECT(methods[0] == "GET");
  KJ_EXPECT(methods[1] == "POST");

  auto keys = root["meta"].keys();
  KJ_ASSERT(keys.size() == 2);
  KJ_EXPECT(keys[0] == "a");
}

KJ_TEST("JSON: invalid input throws") {
  auto result = kj::runCatchingExceptions([]() { JsonDocument::parse("{not json"_kj); });
  KJ_EXPECT(result != kj::none);
}

KJ_TEST("JsonBuilder: nested object and array") {
  auto builder = JsonBuilder::object();
  builder.put("error", "not_found")
      .put("status", 404)
      .put("ok", false)
      .put_object("detail", [](JsonBuilder& b) { b.put("path", "/x"); })
      .put_array("roles", [](JsonBuilder& b) { b.add("admin"_kj).add("user"_kj); });

  auto doc = JsonDocument::parse(builder.build());
  auto root = doc.root();
  KJ_EXPECT(root["error"].get_string() == "not_found");
  KJ_EXPECT(root["status"].get_int() == 404);
  KJ_EXPECT(!root["ok"].get_bool(true));
  KJ_EXPECT(root["detail"]["path"].get_string() == "/x");
  KJ_EXPECT(root["roles"].size() == 2);
  KJ_EXPECT(root["roles"][1].get_string() == "user");
}

KJ_TEST("JsonBuilder: strings are escaped") {
  auto builder = JsonBuilder::object();
  builder.put("msg", "quote \" and \n newline");
  auto doc = JsonDocument::parse(builder.build());
  KJ_EXPECT(doc.root()["msg"].get_string() == "quote \" and \n newline");
}

} // namespace
