#include "test_framework.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/ids.hpp"
#include "cowork/common/json_util.hpp"
#include "cowork/common/toml.hpp"

#include <filesystem>
#include <set>

void register_common_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;
  namespace c = cowork::common;

  tests.push_back({"common_json_parse_flat_keeps_nested_raw", [] {
                     const auto flat = c::json_parse_flat(
                         R"({"tool":"bash","args":{"command":"ls -la"},"n":3,"ok":true})");
                     require(flat.at("tool") == "bash", "string member");
                     require(flat.at("args") == R"({"command":"ls -la"})", "nested object raw");
                     require(flat.at("n") == "3", "number raw");
                     require(flat.at("ok") == "true", "bool raw");
                   }});

  tests.push_back({"common_json_parse_flat_unescapes_strings", [] {
                     const auto flat = c::json_parse_flat(R"({"content":"line1\nline2 \"q\""})");
                     require(flat.at("content") == "line1\nline2 \"q\"", "unescape mismatch");
                   }});

  tests.push_back({"common_json_parse_flat_rejects_non_object", [] {
                     require(c::json_parse_flat("[1,2]").empty(), "array should yield nothing");
                     require(c::json_parse_flat("plain text").empty(), "text should yield nothing");
                   }});

  tests.push_back({"common_extract_json_frame_strips_prose", [] {
                     const std::string framed =
                         c::extract_json_frame("Sure! ```json\n{\"tasks\":[]}\n``` done");
                     require(framed == "{\"tasks\":[]}", "frame mismatch: " + framed);
                     require(c::extract_json_frame(framed) == framed, "frame not idempotent");
                     require(c::extract_json_frame("  no braces ") == "no braces",
                             "frameless input should be trimmed");
                   }});

  tests.push_back({"common_find_json_objects_skips_malformed", [] {
                     const auto found = c::find_json_objects(
                         "first {broken and then {\"tool\":\"a\",\"args\":{}} tail {\"x\":1}");
                     require(found.size() == 2, "expected two objects");
                     require(found[0] == "{\"tool\":\"a\",\"args\":{}}", "first object mismatch");
                     require(found[1] == "{\"x\":1}", "second object mismatch");
                   }});

  tests.push_back({"common_json_get_string_skips_value_matches", [] {
                     const std::string block = R"({"type":"text","text":"Hello there"})";
                     require(c::json_get_string(block, "text") == "Hello there",
                             "key found after an equal string value");
                     require(c::json_get_string(R"({"kind":"id"})", "id").empty(),
                             "value-only match is not a key");
                   }});

  tests.push_back({"common_json_is_object", [] {
                     require(c::json_is_object(" {\"a\":[1,2,{\"b\":null}]} "), "valid object");
                     require(!c::json_is_object("{\"a\":}"), "missing value");
                     require(!c::json_is_object("{\"a\":1} trailing"), "trailing text");
                   }});

  tests.push_back({"common_json_quote_escapes_control_chars", [] {
                     require(c::json_quote("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"", "quote mismatch");
                     require(c::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control char escape");
                   }});

  tests.push_back({"common_toml_sections_and_arrays", [] {
                     auto doc = c::parse_toml(
                         "[agent]\nmodel = \"gpt-4o\"\nmax_turns = 7\n\n[providers]\n"
                         "fallbacks = [\"anthropic\", \"gemini\"]\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("agent.model") == "gpt-4o", "string value");
                     require(doc.value().get_int("agent.max_turns", 0) == 7, "int value");
                     const auto fallbacks = doc.value().get_string_array("providers.fallbacks");
                     require(fallbacks.size() == 2 && fallbacks[1] == "gemini", "array value");
                     require(!doc.value().has("agent.temperature"), "absent key");
                   }});

  tests.push_back({"common_new_uuid_format", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 32; ++i) {
                       const auto id = c::new_uuid();
                       require(id.size() == 36, "uuid length");
                       require(id[8] == '-' && id[13] == '-' && id[14] == '4', "uuid v4 layout");
                       seen.insert(id);
                     }
                     require(seen.size() == 32, "uuids should be unique");
                   }});

  tests.push_back({"common_scoped_temp_dir_removes_tree", [] {
                     std::filesystem::path kept;
                     {
                       auto made = c::make_temp_dir("cowork-test");
                       require(made.ok(), made.error());
                       c::ScopedTempDir dir(made.value());
                       kept = dir.path();
                       require(c::write_file(kept / "nested" / "file.txt", "x").ok(),
                               "write into temp dir");
                     }
                     require(!std::filesystem::exists(kept), "temp dir should be gone");
                   }});

  tests.push_back({"common_shell_quote_and_subpath", [] {
                     require(c::shell_quote("it's") == "'it'\\''s'", "shell quote mismatch");
                     require(c::is_subpath("/ws/a/b", "/ws"), "nested path");
                     require(!c::is_subpath("/other/a", "/ws"), "outside path");
                   }});
}
