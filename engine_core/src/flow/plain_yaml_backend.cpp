#include "ConvoFlow/flow/serializer_backend.hpp"

#include <cstdio>
#include <vector>

namespace ConvoFlow::flow {

namespace {

bool hasControlCharacters(const std::string& text) {
  for (char c : text) {
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
      return true;
    }
  }
  return false;
}

bool needsSingleQuotes(const std::string& text) {
  if (text.empty() || looksLikeNonStringScalar(text)) {
    return true;
  }
  if (text.front() == ' ' || text.back() == ' ' || text.back() == ':') {
    return true;
  }

  const std::string alwaysIndicators = ",[]{}#&*!|>'\"%@`";
  if (alwaysIndicators.find(text.front()) != std::string::npos) {
    return true;
  }
  // "-", "?" and ":" only start a structure when followed by a space
  if ((text.front() == '-' || text.front() == '?' || text.front() == ':') &&
      (text.size() == 1 || text[1] == ' ')) {
    return true;
  }

  return text.find(": ") != std::string::npos || text.find(" #") != std::string::npos;
}

std::string doubleQuoted(const std::string& text) {
  std::string result = "\"";
  for (char c : text) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
        result += buf;
      } else {
        result += c;
      }
      break;
    }
  }
  result += '"';
  return result;
}

std::string singleQuoted(const std::string& text) {
  std::string result = "'";
  for (char c : text) {
    if (c == '\'') {
      result += "''";
    } else {
      result += c;
    }
  }
  result += '\'';
  return result;
}

std::string formatString(const std::string& text) {
  if (hasControlCharacters(text)) {
    return doubleQuoted(text);
  }
  if (needsSingleQuotes(text)) {
    return singleQuoted(text);
  }
  return text;
}

std::string formatScalar(const Value& value) {
  if (value.isString()) {
    return formatString(value.asString());
  }
  return value.toScalarString();
}

std::string indentation(usize level) {
  return std::string(level * 2, ' ');
}

void renderMap(const ValueMap& map, usize level, std::vector<std::string>& lines);

void renderList(const ValueList& list, usize level, std::vector<std::string>& lines) {
  for (const auto& item : list) {
    if (item.isMap() && !item.asMap().empty()) {
      lines.push_back(indentation(level) + "-");
      renderMap(item.asMap(), level + 1, lines);
    } else if (item.isList() && !item.asList().empty()) {
      lines.push_back(indentation(level) + "-");
      renderList(item.asList(), level + 1, lines);
    } else if (item.isMap()) {
      lines.push_back(indentation(level) + "- {}");
    } else if (item.isList()) {
      lines.push_back(indentation(level) + "- []");
    } else {
      lines.push_back(indentation(level) + "- " + formatScalar(item));
    }
  }
}

void renderMap(const ValueMap& map, usize level, std::vector<std::string>& lines) {
  for (const auto& [key, value] : map) {
    const std::string entry = indentation(level) + formatString(key) + ":";

    if (value.isMap()) {
      if (value.asMap().empty()) {
        lines.push_back(entry + " {}");
      } else {
        lines.push_back(entry);
        renderMap(value.asMap(), level + 1, lines);
      }
    } else if (value.isList()) {
      if (value.asList().empty()) {
        lines.push_back(entry + " []");
      } else {
        lines.push_back(entry);
        renderList(value.asList(), level + 1, lines);
      }
    } else {
      lines.push_back(entry + " " + formatScalar(value));
    }
  }
}

} // namespace

std::string PlainYamlBackend::render(const ValueMap& document) const {
  std::vector<std::string> lines;
  renderMap(document, 0, lines);

  std::string text;
  for (const auto& line : lines) {
    text += line;
    text += '\n';
  }
  return text;
}

} // namespace ConvoFlow::flow
