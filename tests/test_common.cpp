#include "test_framework.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/common/json_util.hpp"
#include "gembridge/common/result.hpp"
#include "gembridge/common/toml.hpp"

void register_common_tests(std::vector<gembridge::tests::TestCase> &tests) {
  using gembridge::tests::require;
  namespace common = gembridge::common;

  tests.push_back({"result_failure_carries_error_code", [] {
                     const auto failed =
                         common::Result<int>::failure("boom", common::ErrorCode::Timeout);
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.error() == "boom", "message mismatch");
                     require(failed.code() == common::ErrorCode::Timeout, "code mismatch");
                     require(std::string(common::error_code_name(failed.code())) == "timeout",
                             "code name mismatch");

                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on a failure should throw");

                     const auto status =
                         common::Status::error("bad", common::ErrorCode::InvalidRequest);
                     const auto from_status = common::Result<int>::failure(status);
                     require(from_status.code() == common::ErrorCode::InvalidRequest,
                             "status code should carry over");
                   }});

  tests.push_back({"fs_string_helpers", [] {
                     require(common::trim("  \t hi \r\n") == "hi", "trim mismatch");
                     require(common::trim("   ").empty(), "blank trims to empty");
                     require(common::starts_with("--config=x", "--config="), "prefix");
                     require(common::to_lower("GeMiNi") == "gemini", "lowercase");
                     require(common::join({"a", "b", "c"}, "\n") == "a\nb\nc", "join");
                     require(common::join({}, ",").empty(), "join empty");
                   }});

  tests.push_back({"json_validate_accepts_every_value_kind", [] {
                     require(common::json_validate("{}"), "empty object");
                     require(common::json_validate("  [1, 2.5, -3e2, true, null] "), "array");
                     require(common::json_validate("\"text\""), "string");
                     require(common::json_validate("42"), "number");
                     require(common::json_validate("false"), "literal");
                     require(common::json_validate(R"({"a":{"b":[{"c":"é"}]}})"), "nested");
                   }});

  tests.push_back({"json_validate_rejects_malformed_input", [] {
                     require(!common::json_validate(""), "empty");
                     require(!common::json_validate("{"), "unterminated object");
                     require(!common::json_validate("{\"a\":1,}"), "trailing comma");
                     require(!common::json_validate("[1 2]"), "missing comma");
                     require(!common::json_validate("{'a':1}"), "single quotes");
                     require(!common::json_validate("01"), "leading zero");
                     require(!common::json_validate("{} {}"), "two values");
                     require(!common::json_validate("tru"), "truncated literal");
                     require(!common::json_validate("\"bad \\x escape\""), "bad escape");
                     require(!common::json_validate("not json at all"), "plain text");
                   }});

  tests.push_back({"json_whitespace_is_limited_to_the_four_json_characters", [] {
                     require(common::json_validate(" \t\r\n{ \"a\" :\t[ 1 ,\n2 ] }\r\n"),
                             "space, tab, CR and LF are whitespace");
                     require(!common::json_validate("{\"a\":\v1}"), "vertical tab inside");
                     require(!common::json_validate("\f{}"), "form feed before value");
                     require(!common::json_validate("[1,\f2]"), "form feed in array");
                   }});

  tests.push_back({"json_value_kind_reports_top_level_kind", [] {
                     require(common::json_value_kind("[]") == common::JsonKind::Array, "array");
                     require(common::json_value_kind("1.5") == common::JsonKind::Number,
                             "number");
                     require(common::json_value_kind("null") == common::JsonKind::Null, "null");
                     require(!common::json_value_kind("{").has_value(), "invalid");
                   }});

  tests.push_back({"json_parse_object_keeps_top_level_members", [] {
                     const auto object = common::json_parse_object(
                         R"({"type":"message","n":3,"ok":true,"nested":{"session_id":"inner"},)"
                         R"("list":[1,2],"text":"line\nbreak","dup":"first","dup":"second"})");
                     require(object.has_value(), "object should parse");
                     require(common::json_string_field(*object, "type") == "message", "type");
                     require(object->at("n").kind == common::JsonKind::Number, "number kind");
                     require(object->at("n").text == "3", "number raw text");
                     require(common::json_bool_field(*object, "ok") == true, "bool");
                     require(object->at("nested").kind == common::JsonKind::Object, "nested");
                     require(object->at("nested").text == R"({"session_id":"inner"})",
                             "nested raw text");
                     require(object->at("list").text == "[1,2]", "array raw text");
                     require(common::json_string_field(*object, "text") == "line\nbreak",
                             "string unescaped");
                     require(common::json_string_field(*object, "dup") == "second",
                             "later duplicate wins");
                     require(!common::json_string_field(*object, "n").has_value(),
                             "number is not a string");
                     require(!common::json_string_field(*object, "missing").has_value(),
                             "missing key");
                   }});

  tests.push_back({"json_parse_object_rejects_non_objects", [] {
                     require(!common::json_parse_object("[1]").has_value(), "array");
                     require(!common::json_parse_object("\"s\"").has_value(), "string");
                     require(!common::json_parse_object("{\"a\":").has_value(), "broken");
                   }});

  tests.push_back({"json_escape_and_unescape", [] {
                     require(common::json_escape("a\"b\\c\n\t") == "a\\\"b\\\\c\\n\\t", "escape");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control char");
                     require(common::json_quote("x") == "\"x\"", "quote");
                     require(common::json_unescape("caf\\u00e9") == "caf\xc3\xa9", "utf8");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xf0\x9f\x98\x80",
                             "surrogate pair");
                     require(common::json_unescape("\\ud800") == "\xef\xbf\xbd",
                             "lone surrogate");
                   }});

  tests.push_back({"json_pretty_array_renders_one_value_per_line", [] {
                     require(common::json_pretty_array({}) == "[]", "empty");
                     require(common::json_pretty_array({"{\"a\":1}", "2"}) ==
                                 "[\n  {\"a\":1},\n  2\n]",
                             "two values");
                   }});

  tests.push_back({"toml_reads_sections_and_scalars", [] {
                     const auto doc = common::parse_toml(R"(
# comment
[gemini]
binary = "/opt/gemini"
default_timeout_secs = 120
force_model = 'gemini-2.5-pro'

[observability]
backend = "none"
)");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("gemini.binary") == "/opt/gemini", "binary");
                     require(doc.value().get_u64("gemini.default_timeout_secs", 0) == 120,
                             "timeout");
                     require(doc.value().get_string("gemini.force_model") == "gemini-2.5-pro",
                             "single-quoted string");
                     require(!doc.value().has("gemini.prompt_file"), "absent key");
                     require(doc.value().get_string("gemini.prompt_file", "GEMINI.md") ==
                                 "GEMINI.md",
                             "fallback");
                   }});

  tests.push_back({"toml_rejects_broken_lines", [] {
                     require(!common::parse_toml("[]\n").ok(), "empty section");
                     require(!common::parse_toml("just words\n").ok(), "missing equals");
                   }});
}
