#include <iostream>
#include <stdexcept>
#include <string>

#include "aurora/util/json.h"

#define AURORA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)aurora::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json_errors() {
  // Hand-edited sky configs get line/col and a caret in parse errors.

  // Stray comma in an array.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    AURORA_ASSERT(!msg.empty());
    AURORA_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    AURORA_ASSERT(msg.find("unexpected") != std::string::npos);
    AURORA_ASSERT(msg.find("^") != std::string::npos);
  }

  // Same, with CRLF line endings.
  {
    const std::string msg = parse_error_message("[\r\n  1,\r\n  ,\r\n  2\r\n]\r\n");
    AURORA_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }

  // Missing closing brace at end of file.
  {
    const std::string msg = parse_error_message("{\n  \"time_scale\": 1,\n  \"warmup_time\": 2");
    AURORA_ASSERT(!msg.empty());
    AURORA_ASSERT(msg.find("line 3, col 19") != std::string::npos);
    AURORA_ASSERT(msg.find("expected") != std::string::npos);
  }

  // Trailing garbage after a complete document.
  {
    const std::string msg = parse_error_message("{\"a\": 1} x");
    AURORA_ASSERT(msg.find("trailing") != std::string::npos);
  }

  // Valid documents: BOM, escapes and surrogate pairs.
  {
    const auto v = aurora::json::parse("\xEF\xBB\xBF{\"name\": \"a\\u00e9\\ud83c\\udf0c\", \"n\": -2.5e1, \"ok\": true}");
    AURORA_ASSERT(v.at("name").string_value() == "a\xC3\xA9\xF0\x9F\x8C\x8C");
    AURORA_ASSERT(v.at("n").number_value() == -25.0);
    AURORA_ASSERT(v.at("ok").bool_value());
    AURORA_ASSERT(v.find("missing") == nullptr);
  }

  // stringify output parses back to the same document.
  {
    const std::string text = "{\"a\": [1, 2.5, null, \"x\"], \"b\": {\"c\": false}}";
    const std::string once = aurora::json::stringify(aurora::json::parse(text), 2);
    const std::string twice = aurora::json::stringify(aurora::json::parse(once), 2);
    AURORA_ASSERT(once == twice);
    AURORA_ASSERT(aurora::json::stringify(aurora::json::parse(text), 0).find('\n') == std::string::npos);
  }

  return 0;
}
