#include <scribe/escaping.h>

#include <cstdio>

namespace scribe {

std::string EscapeField(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string UnescapeField(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  bool pending_escape = false;
  for (const auto character : value) {
    if (!pending_escape) {
      if (character == '\\') {
        pending_escape = true;
      } else {
        unescaped.push_back(character);
      }
      continue;
    }
    pending_escape = false;
    if (character == 't') {
      unescaped.push_back('\t');
    } else if (character == 'n') {
      unescaped.push_back('\n');
    } else {
      unescaped.push_back(character);
    }
  }
  if (pending_escape) {
    unescaped.push_back('\\');
  }
  return unescaped;
}

std::string JoinRecord(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(EscapeField(fields[i]));
  }
  return line;
}

std::vector<std::string> SplitRecord(const std::string &line) {
  std::vector<std::string> fields;
  std::string raw;
  bool pending_escape = false;
  for (const auto character : line) {
    if (pending_escape) {
      raw.push_back(character);
      pending_escape = false;
      continue;
    }
    if (character == '\\') {
      raw.push_back(character);
      pending_escape = true;
      continue;
    }
    if (character == '\t') {
      fields.push_back(UnescapeField(raw));
      raw.clear();
      continue;
    }
    raw.push_back(character);
  }
  fields.push_back(UnescapeField(raw));
  return fields;
}

std::string EscapeJsonString(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      break;
    case '\\':
      escaped.append("\\\\");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(character) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned int>(character));
        escaped.append(buffer);
      } else {
        escaped.push_back(character);
      }
    }
  }
  return escaped;
}

} // namespace scribe
