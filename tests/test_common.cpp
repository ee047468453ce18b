#include "test_framework.hpp"

#include "apiari/common/fs.hpp"
#include "apiari/common/json_codec.hpp"
#include "apiari/common/json_util.hpp"
#include "apiari/common/result.hpp"
#include "apiari/common/toml.hpp"

#include <string>
#include <vector>

namespace {

struct Probe {
  std::string payload;
};

struct BrokenProbe {};

} // namespace

namespace apiari::common {

template <> struct JsonCodec<Probe> {
  static Result<std::string> encode(const Probe &probe) {
    return Result<std::string>::success(probe.payload);
  }
  static Result<Probe> decode(const std::string &json) {
    if (json_skip_ws(json, 0) < json.size() && json[json_skip_ws(json, 0)] == '[') {
      return Result<Probe>::failure("arrays are not probes");
    }
    return Result<Probe>::success(Probe{.payload = json});
  }
};

template <> struct JsonCodec<BrokenProbe> {
  static Result<std::string> encode(const BrokenProbe &) {
    return Result<std::string>::failure("cannot encode");
  }
  static Result<BrokenProbe> decode(const std::string &) {
    return Result<BrokenProbe>::failure("cannot decode");
  }
};

} // namespace apiari::common

void register_common_tests(std::vector<apiari::tests::TestCase> &tests) {
  using apiari::tests::require;
  namespace c = apiari::common;

  tests.push_back({"common_result_carries_kind", [] {
                     auto ok = c::Result<int>::success(7);
                     require(ok.ok(), "success should be ok");
                     require(ok.kind() == c::ErrorKind::None, "success kind should be None");
                     require(ok.value() == 7, "value mismatch");

                     auto failed = c::Result<int>::failure("boom", c::ErrorKind::Decode);
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.kind() == c::ErrorKind::Decode, "kind mismatch");
                     require(failed.status().kind() == c::ErrorKind::Decode,
                             "status should keep kind");
                     require(failed.status().error() == "boom", "status should keep message");

                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                   }});

  tests.push_back({"common_error_kind_names", [] {
                     require(std::string(c::error_kind_name(c::ErrorKind::ReadFailed)) ==
                                 "read failed",
                             "read failed label");
                     require(std::string(c::error_kind_name(c::ErrorKind::WriteFailed)) ==
                                 "write failed",
                             "write failed label");
                     require(std::string(c::error_kind_name(c::ErrorKind::CorruptState)) ==
                                 "corrupt state",
                             "corrupt state label");
                     require(std::string(c::error_kind_name(c::ErrorKind::Encode)) ==
                                 "encode error",
                             "encode label");
                   }});

  tests.push_back({"common_trim_and_lower", [] {
                     require(c::trim("  a b \r\n") == "a b", "trim mismatch");
                     require(c::to_lower("MiXeD") == "mixed", "to_lower mismatch");
                     require(c::starts_with("--config=x", "--config="), "starts_with mismatch");
                   }});

  tests.push_back({"common_json_is_valid_accepts_values", [] {
                     require(c::json_is_valid("{}"), "empty object");
                     require(c::json_is_valid("[]"), "empty array");
                     require(c::json_is_valid("  {\"a\": [1, 2.5, -3e2, true, null]}  "),
                             "nested object");
                     require(c::json_is_valid("\"esc \\\" \\u00e9\""), "escaped string");
                     require(c::json_is_valid("0"), "bare zero");
                     require(c::json_is_valid("false"), "bare literal");
                   }});

  tests.push_back({"common_json_is_valid_rejects_garbage", [] {
                     require(!c::json_is_valid(""), "empty text");
                     require(!c::json_is_valid("not json"), "plain text");
                     require(!c::json_is_valid("{\"a\":1"), "unterminated object");
                     require(!c::json_is_valid("{\"a\":1,}"), "trailing comma");
                     require(!c::json_is_valid("{a:1}"), "unquoted key");
                     require(!c::json_is_valid("[1] [2]"), "two values");
                     require(!c::json_is_valid("01"), "leading zero");
                     require(!c::json_is_valid("\"line\nbreak\""), "raw newline in string");
                     require(!c::json_is_valid("\"bad \\x escape\""), "unknown escape");
                     require(!c::json_is_valid("tru"), "truncated literal");
                     require(!c::json_is_valid(std::string(600, '[') + std::string(600, ']')),
                             "nesting limit");
                   }});

  tests.push_back({"common_json_pretty_indents", [] {
                     const std::string pretty =
                         c::json_pretty("{\"a\":1,\"b\":[1,2],\"c\":{}}", 2);
                     const std::string expected = "{\n"
                                                  "  \"a\": 1,\n"
                                                  "  \"b\": [\n"
                                                  "    1,\n"
                                                  "    2\n"
                                                  "  ],\n"
                                                  "  \"c\": {}\n"
                                                  "}";
                     require(pretty == expected, "pretty output mismatch: " + pretty);
                     require(c::json_is_valid(pretty), "pretty output must stay valid");
                   }});

  tests.push_back({"common_json_pretty_compacts_and_keeps_strings", [] {
                     require(c::json_pretty("{ \"a b\" : [ 1 , 2 ] }", 0) == "{\"a b\":[1,2]}",
                             "compact output mismatch");
                     require(c::json_pretty("[\"x, y: {z}\"]", 0) == "[\"x, y: {z}\"]",
                             "string content must be untouched");
                     require(c::json_pretty("{broken", 2) == "{broken",
                             "invalid input returned unchanged");
                   }});

  tests.push_back({"common_json_escape_never_spans_lines", [] {
                     const std::string escaped = c::json_escape("a\"b\\c\nd\re\tf\x01");
                     require(escaped == "a\\\"b\\\\c\\nd\\re\\tf\\u0001",
                             "escape mismatch: " + escaped);
                     require(escaped.find('\n') == std::string::npos, "raw newline leaked");
                   }});

  tests.push_back({"common_json_unescape_unicode", [] {
                     require(c::json_unescape("caf\\u00e9") == "caf\xC3\xA9", "BMP escape");
                     require(c::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair");
                     require(c::json_unescape("a\\nb\\\"c") == "a\nb\"c", "named escapes");
                   }});

  tests.push_back({"common_json_field_extraction", [] {
                     const std::string json =
                         R"({"name":"hive \"one\"","count": 42,"on":true,"tags":["a","b"],)"
                         R"("nested":{"x":1}})";
                     require(c::json_get_string(json, "name") == "hive \"one\"", "string field");
                     require(c::json_get_number(json, "count") == "42", "number field");
                     require(c::json_get_bool(json, "on") == "true", "bool field");
                     require(c::json_get_bool(json, "count").empty(), "number is not bool");
                     require(c::json_get_object(json, "nested") == "{\"x\":1}", "object field");
                     const auto tags = c::json_get_string_array(json, "tags");
                     require(tags.size() == 2 && tags[0] == "a" && tags[1] == "b", "tags");

                     const auto flat = c::json_parse_flat(R"({"k\"ey":"v","n":3})");
                     require(flat.at("k\"ey") == "v", "flat key unescaped");
                     require(flat.at("n") == "3", "flat number");
                   }});

  tests.push_back({"common_encode_json_rejects_bad_codec_output", [] {
                     auto good = c::encode_json(Probe{.payload = R"({"a":1})"});
                     require(good.ok(), good.error());

                     auto invalid = c::encode_json(Probe{.payload = "{oops"});
                     require(!invalid.ok(), "invalid JSON must fail");
                     require(invalid.kind() == c::ErrorKind::Encode, "kind should be Encode");

                     auto multiline = c::encode_json(Probe{.payload = "{\n\"a\":1}"});
                     require(!multiline.ok(), "multi-line output must fail");
                     require(multiline.kind() == c::ErrorKind::Encode, "kind should be Encode");

                     auto broken = c::encode_json(BrokenProbe{});
                     require(!broken.ok() && broken.kind() == c::ErrorKind::Encode,
                             "codec failure should be Encode");
                   }});

  tests.push_back({"common_decode_json_reports_decode_kind", [] {
                     auto malformed = c::decode_json<Probe>("{nope");
                     require(!malformed.ok() && malformed.kind() == c::ErrorKind::Decode,
                             "malformed text should be Decode");

                     auto rejected = c::decode_json<Probe>("[1,2]");
                     require(!rejected.ok() && rejected.kind() == c::ErrorKind::Decode,
                             "codec rejection should be Decode");

                     auto ok = c::decode_json<Probe>("{\"a\":1}");
                     require(ok.ok(), ok.error());
                     require(ok.value().payload == "{\"a\":1}", "payload mismatch");
                   }});

  tests.push_back({"common_toml_parses_sections_and_values", [] {
                     const std::string content = "# top comment\n"
                                                 "[stream]\n"
                                                 "poll_interval_ms = 1_500 # inline\n"
                                                 "\n"
                                                 "[state]\n"
                                                 "indent = 4\n"
                                                 "temp_suffix = '.part'\n"
                                                 "label = \"a \\\"b\\\" # c\"\n";
                     auto parsed = c::parse_toml(content);
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.has("stream.poll_interval_ms"), "key missing");
                     require(doc.get_u64("stream.poll_interval_ms", 0) == 1500,
                             "underscore integer");
                     require(doc.get_int("state.indent", 0) == 4, "int value");
                     require(doc.get_string("state.temp_suffix") == ".part", "literal string");
                     require(doc.get_string("state.label") == "a \"b\" # c", "basic string");
                     require(doc.get_int("state.missing", 9) == 9, "fallback");
                     require(doc.get_int("state.temp_suffix", 3) == 3, "non-number fallback");
                   }});

  tests.push_back({"common_toml_reports_line_of_error", [] {
                     auto parsed = c::parse_toml("[stream]\nthis is not toml\n");
                     require(!parsed.ok(), "parse should fail");
                     require(parsed.kind() == c::ErrorKind::InvalidArgument,
                             "kind should be InvalidArgument");
                     require(parsed.error().find("line 2") != std::string::npos,
                             "error should name the line");
                   }});

  tests.push_back({"common_toml_quote_escapes", [] {
                     require(c::quote_toml_string("a\"b\\c") == "\"a\\\"b\\\\c\"",
                             "quote mismatch");
                     auto parsed = c::parse_toml("k = " + c::quote_toml_string("x\"y") + "\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get_string("k") == "x\"y", "quoted roundtrip");
                   }});
}
