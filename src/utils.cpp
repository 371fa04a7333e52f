#include "neurosync/utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace neurosync {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  if (s.size() >= 3 &&
      static_cast<unsigned char>(s[0]) == 0xEF &&
      static_cast<unsigned char>(s[1]) == 0xBB &&
      static_cast<unsigned char>(s[2]) == 0xBF) {
    return s.substr(3);
  }
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // Handle trailing empty field
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> out;
  std::string field;
  field.reserve(row.size());

  bool in_quotes = false;
  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < row.size() && row[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '\r') continue;  // getline() leaves CR from CRLF files
    if (c == '"') {
      in_quotes = true;
    } else if (c == delim) {
      out.push_back(field);
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(field);
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

double to_double(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) throw std::runtime_error("Failed to parse double from '" + s + "': empty");

  // Spelled out: stream extraction of these tokens differs between libstdc++ and libc++.
  const std::string low = to_lower(t);
  if (low == "nan") return std::numeric_limits<double>::quiet_NaN();
  if (low == "inf" || low == "+inf" || low == "infinity" || low == "+infinity") {
    return std::numeric_limits<double>::infinity();
  }
  if (low == "-inf" || low == "-infinity") return -std::numeric_limits<double>::infinity();

  std::istringstream iss(t);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) throw std::runtime_error("Failed to parse double from '" + s + "': invalid");
  iss >> std::ws;
  if (!iss.eof()) throw std::runtime_error("Failed to parse double from '" + s + "': trailing characters");
  return v;
}

namespace {

void json_skip_ws(const std::string& s, size_t* i) {
  while (*i < s.size() && is_space(s[*i])) ++(*i);
}

void append_utf8(unsigned cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Parse a JSON string starting at s[*i] == '"'. On success *i points past the
// closing quote.
bool json_parse_string(const std::string& s, size_t* i, std::string* out) {
  if (*i >= s.size() || s[*i] != '"') return false;
  ++(*i);
  out->clear();
  while (*i < s.size()) {
    const char c = s[(*i)++];
    if (c == '"') return true;
    if (c != '\\') {
      out->push_back(c);
      continue;
    }
    if (*i >= s.size()) return false;
    const char e = s[(*i)++];
    switch (e) {
      case 'n': out->push_back('\n'); break;
      case 't': out->push_back('\t'); break;
      case 'r': out->push_back('\r'); break;
      case 'b': out->push_back('\b'); break;
      case 'f': out->push_back('\f'); break;
      case 'u': {
        if (*i + 4 > s.size()) return false;
        unsigned cp = 0;
        for (size_t k = 0; k < 4; ++k) {
          const char h = s[*i + k];
          cp <<= 4;
          if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
          else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
          else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
          else return false;
        }
        *i += 4;
        append_utf8(cp, out);
        break;
      }
      default:
        out->push_back(e);  // \" \\ \/ and unknown escapes
        break;
    }
  }
  return false;
}

// Visit every member key of the top-level object. The callback receives the
// key and the position of its value; returning true stops the scan.
template <typename Fn>
void json_for_each_top_level_member(const std::string& s, Fn fn) {
  int depth = 0;
  size_t i = 0;
  std::string tok;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"') {
      const size_t token_start = i;
      if (!json_parse_string(s, &i, &tok)) {
        i = token_start + 1;
        continue;
      }
      if (depth == 1) {
        size_t j = i;
        json_skip_ws(s, &j);
        if (j < s.size() && s[j] == ':') {
          ++j;
          json_skip_ws(s, &j);
          if (fn(tok, j)) return;
        }
      }
      continue;
    }
    if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      if (depth > 0) --depth;
    }
    ++i;
  }
}

} // namespace

bool json_find_raw_value(const std::string& json, const std::string& key, std::string* out) {
  bool found = false;
  json_for_each_top_level_member(json, [&](const std::string& k, size_t pos) {
    if (k != key) return false;
    std::string v;
    if (pos < json.size() && json[pos] == '"') {
      size_t j = pos;
      if (!json_parse_string(json, &j, &v)) return false;
    } else {
      size_t j = pos;
      while (j < json.size() && json[j] != ',' && json[j] != '}' && json[j] != ']' && !is_space(json[j])) ++j;
      v = json.substr(pos, j - pos);
    }
    if (out) *out = v;
    found = true;
    return true;
  });
  return found;
}

std::vector<std::string> json_top_level_keys(const std::string& json) {
  std::vector<std::string> keys;
  json_for_each_top_level_member(json, [&](const std::string& k, size_t) {
    keys.push_back(k);
    return false;
  });
  return keys;
}

} // namespace neurosync
