#include "cowork/common/json_util.hpp"

#include "cowork/common/fs.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace cowork::common {

namespace {

void append_utf8(std::string &out, unsigned int cp) {
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

bool parse_hex4(const std::string &raw, std::size_t pos, unsigned int &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4U;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned int>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<unsigned int>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<unsigned int>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

std::size_t value_start_after_key(const std::string &json, const std::string &field) {
  // A quoted match not followed by ':' is a string value, e.g. "type":"text".
  for (auto key_pos = json_find_key(json, field); key_pos != std::string::npos;
       key_pos = json_find_key(json, field, key_pos + 1)) {
    std::size_t pos = json_skip_ws(json, key_pos + field.size() + 2);
    if (pos >= json.size() || json[pos] != ':') {
      continue;
    }
    pos = json_skip_ws(json, pos + 1);
    return pos < json.size() ? pos : std::string::npos;
  }
  return std::string::npos;
}

std::string nested_value(const std::string &json, const std::string &field, char open_ch,
                         char close_ch) {
  const auto pos = value_start_after_key(json, field);
  if (pos == std::string::npos || json[pos] != open_ch) {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

// Minimal recursive validator used to tell real JSON objects from brace-shaped prose.
class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  bool object_at(std::size_t pos, std::size_t &end) {
    pos_ = pos;
    if (!parse_object()) {
      return false;
    }
    end = pos_;
    return true;
  }

private:
  void skip_ws() { pos_ = json_skip_ws(text_, pos_); }

  bool parse_value() {
    skip_ws();
    if (pos_ >= text_.size()) {
      return false;
    }
    const char ch = text_[pos_];
    if (ch == '{') {
      return parse_object();
    }
    if (ch == '[') {
      return parse_array();
    }
    if (ch == '"') {
      return parse_string();
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      return parse_number();
    }
    return parse_literal("true") || parse_literal("false") || parse_literal("null");
  }

  bool parse_object() {
    if (text_[pos_] != '{') {
      return false;
    }
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"' || !parse_string()) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return false;
      }
      ++pos_;
      if (!parse_value()) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool parse_array() {
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      if (!parse_value()) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool parse_string() {
    const auto end = json_find_string_end(text_, pos_);
    if (end == std::string::npos) {
      return false;
    }
    pos_ = end + 1;
    return true;
  }

  bool parse_number() {
    const std::size_t start = pos_;
    if (text_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == 'e' ||
          ch == 'E' || ch == '+' || ch == '-') {
        ++pos_;
        continue;
      }
      break;
    }
    return pos_ > start + (text_[start] == '-' ? 1U : 0U);
  }

  bool parse_literal(const char *literal) {
    const std::string word(literal);
    if (text_.compare(pos_, word.size(), word) == 0) {
      pos_ += word.size();
      return true;
    }
    return false;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        unsigned int low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  return json.find("\"" + key + "\"", from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start_after_key(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  auto pos = value_start_after_key(json, field);
  if (pos == std::string::npos || json[pos] == '"' || json[pos] == '{' || json[pos] == '[') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return nested_value(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return nested_value(json, field, '[', ']');
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array = json_get_array(json, field);
  std::vector<std::string> out;
  for (std::size_t pos = 1; pos + 1 < array.size(); ++pos) {
    if (array[pos] != '"') {
      continue;
    }
    const auto end = json_find_string_end(array, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array.substr(pos + 1, end - pos - 1)));
    pos = end;
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  const std::string body = trim(json);
  if (body.size() < 2 || body.front() != '{') {
    return result;
  }

  std::size_t pos = 1;
  while (pos < body.size()) {
    pos = json_skip_ws(body, pos);
    if (pos >= body.size() || body[pos] == '}') {
      break;
    }
    if (body[pos] == ',') {
      ++pos;
      continue;
    }
    if (body[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(body, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(body.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(body, key_end + 1);
    if (pos >= body.size() || body[pos] != ':') {
      break;
    }
    pos = json_skip_ws(body, pos + 1);
    if (pos >= body.size()) {
      break;
    }

    const char lead = body[pos];
    if (lead == '"') {
      const auto end = json_find_string_end(body, pos);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(body.substr(pos + 1, end - pos - 1));
      pos = end + 1;
    } else if (lead == '{' || lead == '[') {
      const auto end = json_find_matching_token(body, pos, lead, lead == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      result[key] = body.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < body.size() && body[pos] != ',' && body[pos] != '}' &&
             std::isspace(static_cast<unsigned char>(body[pos])) == 0) {
        ++pos;
      }
      result[key] = body.substr(start, pos - start);
    }
  }
  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::string body = trim(array_json);
  if (body.size() < 2 || body.front() != '[' || body.back() != ']') {
    return out;
  }
  for (std::size_t pos = 1; pos + 1 < body.size(); ++pos) {
    if (body[pos] == '"') {
      const auto end = json_find_string_end(body, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end;
      continue;
    }
    if (body[pos] != '{') {
      continue;
    }
    const auto end = json_find_matching_token(body, pos, '{', '}');
    if (end == std::string::npos) {
      break;
    }
    out.push_back(body.substr(pos, end - pos + 1));
    pos = end;
  }
  return out;
}

bool json_is_object(const std::string &text) {
  const std::string body = trim(text);
  if (body.empty() || body.front() != '{') {
    return false;
  }
  Validator validator(body);
  std::size_t end = 0;
  return validator.object_at(0, end) && end == body.size();
}

std::string extract_json_frame(const std::string &text) {
  const auto start = text.find('{');
  const auto end = text.rfind('}');
  if (start == std::string::npos || end == std::string::npos || start > end) {
    return trim(text);
  }
  return text.substr(start, end - start + 1);
}

std::vector<std::string> find_json_objects(const std::string &text) {
  std::vector<std::string> out;
  Validator validator(text);
  std::size_t pos = 0;
  while ((pos = text.find('{', pos)) != std::string::npos) {
    std::size_t end = 0;
    if (validator.object_at(pos, end)) {
      out.push_back(text.substr(pos, end - pos));
      pos = end;
    } else {
      ++pos;
    }
  }
  return out;
}

std::string json_object_from_map(const std::map<std::string, std::string> &values) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << json_quote(key) << ":" << json_quote(value);
  }
  out << "}";
  return out.str();
}

} // namespace cowork::common
