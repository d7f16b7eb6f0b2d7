#include "berth/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace berth::common {

namespace {

constexpr std::size_t npos = std::string::npos;

std::size_t skip_ws(const std::string &json, std::size_t pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// `pos` is at an opening quote; returns the index just past the closing one.
std::size_t string_end(const std::string &json, std::size_t pos) {
  for (++pos; pos < json.size(); ++pos) {
    if (json[pos] == '\\') {
      ++pos;
    } else if (json[pos] == '"') {
      return pos + 1;
    }
  }
  return npos;
}

// Index just past the value starting at `pos`, or npos when it is cut off.
std::size_t value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return npos;
  }
  if (json[pos] == '"') {
    return string_end(json, pos);
  }
  if (json[pos] == '{' || json[pos] == '[') {
    int depth = 0;
    while (pos < json.size()) {
      const char ch = json[pos];
      if (ch == '"') {
        pos = string_end(json, pos);
        if (pos == npos) {
          return npos;
        }
        continue;
      }
      if (ch == '{' || ch == '[') {
        ++depth;
      } else if ((ch == '}' || ch == ']') && --depth == 0) {
        return pos + 1;
      }
      ++pos;
    }
    return npos;
  }
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

void append_utf8(std::string &out, unsigned code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

bool read_hex4(const std::string &text, std::size_t pos, unsigned &code) {
  if (pos + 4 > text.size()) {
    return false;
  }
  code = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = text[i];
    code <<= 4;
    if (ch >= '0' && ch <= '9') {
      code |= static_cast<unsigned>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      code |= static_cast<unsigned>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      code |= static_cast<unsigned>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// Decodes the string literal spanning [begin, end), quotes included.
std::string decode_string(const std::string &json, const std::size_t begin, const std::size_t end) {
  std::string out;
  for (std::size_t i = begin + 1; i + 1 < end; ++i) {
    if (json[i] != '\\') {
      out.push_back(json[i]);
      continue;
    }
    const char escape = json[++i];
    switch (escape) {
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
      unsigned code = 0;
      if (!read_hex4(json, i + 1, code)) {
        out.push_back('u');
        break;
      }
      i += 4;
      unsigned low = 0;
      if (code >= 0xD800 && code < 0xDC00 && i + 2 < end && json[i + 1] == '\\' &&
          json[i + 2] == 'u' && read_hex4(json, i + 3, low) && low >= 0xDC00 && low < 0xE000) {
        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(escape);
      break;
    }
  }
  return out;
}

// Calls `visit(key, value_begin, value_end)` for each member of the object at the
// start of `json`. Stops early when `visit` returns false or the text is malformed.
template <typename Visit> void for_each_member(const std::string &json, Visit visit) {
  std::size_t pos = skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return;
  }
  pos = skip_ws(json, pos + 1);
  while (pos < json.size() && json[pos] == '"') {
    const auto key_end = string_end(json, pos);
    if (key_end == npos) {
      return;
    }
    const std::string key = decode_string(json, pos, key_end);
    pos = skip_ws(json, key_end);
    if (pos >= json.size() || json[pos] != ':') {
      return;
    }
    const auto begin = skip_ws(json, pos + 1);
    const auto end = value_end(json, begin);
    if (end == npos || end == begin) {
      return;
    }
    if (!visit(key, begin, end)) {
      return;
    }
    pos = skip_ws(json, end);
    if (pos < json.size() && json[pos] == ',') {
      pos = skip_ws(json, pos + 1);
    }
  }
}

struct Span {
  std::size_t begin = npos;
  std::size_t end = npos;
};

Span find_member(const std::string &json, const std::string &field) {
  Span found;
  for_each_member(json, [&](const std::string &key, std::size_t begin, std::size_t end) {
    if (key != field) {
      return true;
    }
    found = {begin, end};
    return false;
  });
  return found;
}

} // namespace

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (member.begin == npos || json[member.begin] != '"') {
    return "";
  }
  return decode_string(json, member.begin, member.end);
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (member.begin == npos) {
    return "";
  }
  const char first = json[member.begin];
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  return json.substr(member.begin, member.end - member.begin);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto member = find_member(json, field);
  if (member.begin == npos || json[member.begin] != '[') {
    return "";
  }
  return json.substr(member.begin, member.end - member.begin);
}

std::vector<std::string> json_array_elements(const std::string &array_json) {
  std::vector<std::string> elements;
  std::size_t pos = skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return elements;
  }
  pos = skip_ws(array_json, pos + 1);
  while (pos < array_json.size() && array_json[pos] != ']') {
    const auto end = value_end(array_json, pos);
    if (end == npos || end == pos) {
      break;
    }
    elements.push_back(array_json.substr(pos, end - pos));
    pos = skip_ws(array_json, end);
    if (pos < array_json.size() && array_json[pos] == ',') {
      pos = skip_ws(array_json, pos + 1);
    }
  }
  return elements;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap values;
  for_each_member(json, [&](const std::string &key, std::size_t begin, std::size_t end) {
    values[key] = json[begin] == '"' ? decode_string(json, begin, end)
                                     : json.substr(begin, end - begin);
    return true;
  });
  return values;
}

namespace {

void append_quoted(std::string &out, const std::string &value) {
  out.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(ch));
        out += escaped;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  out.push_back('"');
}

} // namespace

std::string json_encode_flat(const JsonFlatMap &values) {
  std::string out = "{";
  for (const auto &[key, value] : values) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    append_quoted(out, key);
    out.push_back(':');
    append_quoted(out, value);
  }
  out.push_back('}');
  return out;
}

} // namespace berth::common
