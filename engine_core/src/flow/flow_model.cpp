#include "ConvoFlow/flow/flow_model.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace ConvoFlow::flow {

namespace {

// Shortest round-trip digits; positional for exponents in [-4, 16),
// scientific with a signed two-digit exponent otherwise
std::string floatText(f64 number) {
  if (std::isnan(number)) {
    return "nan";
  }
  if (std::isinf(number)) {
    return number > 0 ? "inf" : "-inf";
  }

  std::array<char, 64> buffer{};
  auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number,
                                 std::chars_format::scientific);
  if (ec != std::errc()) {
    return std::to_string(number);
  }
  const std::string scientific(buffer.data(), end);

  const usize ePos = scientific.find('e');
  const int exponent = std::stoi(scientific.substr(ePos + 1));
  if (exponent < -4 || exponent >= 16) {
    return scientific;
  }

  std::string mantissa = scientific.substr(0, ePos);
  std::string sign;
  if (mantissa.front() == '-') {
    sign = "-";
    mantissa.erase(0, 1);
  }
  std::string digits;
  for (char c : mantissa) {
    if (c != '.') {
      digits += c;
    }
  }

  if (exponent < 0) {
    return sign + "0." + std::string(static_cast<usize>(-exponent - 1), '0') + digits;
  }
  const auto integralDigits = static_cast<usize>(exponent) + 1;
  if (digits.size() <= integralDigits) {
    return sign + digits + std::string(integralDigits - digits.size(), '0') + ".0";
  }
  return sign + digits.substr(0, integralDigits) + "." + digits.substr(integralDigits);
}

std::string quotedText(const std::string& text) {
  const bool hasSingle = text.find('\'') != std::string::npos;
  const bool hasDouble = text.find('"') != std::string::npos;
  const char quote = hasSingle && !hasDouble ? '"' : '\'';

  std::string result(1, quote);
  for (char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (c == quote || c == '\\') {
      result += '\\';
      result += c;
    } else if (c == '\n') {
      result += "\\n";
    } else if (c == '\r') {
      result += "\\r";
    } else if (c == '\t') {
      result += "\\t";
    } else if (byte < 0x20 || byte == 0x7f) {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02x", byte);
      result += escaped;
    } else {
      result += c;
    }
  }
  result += quote;
  return result;
}

std::string answerText(const Value& value, bool nested);

std::string containerText(const Value& value) {
  std::string text;
  if (value.isList()) {
    text = "[";
    for (const auto& item : value.asList()) {
      if (text.size() > 1) {
        text += ", ";
      }
      text += answerText(item, true);
    }
    return text + "]";
  }

  text = "{";
  for (const auto& [key, item] : value.asMap()) {
    if (text.size() > 1) {
      text += ", ";
    }
    text += quotedText(key) + ": " + answerText(item, true);
  }
  return text + "}";
}

// Text form of an answer as flow authors' tooling prints it:
// True/False/None, positional floats, quoted strings inside containers
std::string answerText(const Value& value, bool nested) {
  switch (value.type()) {
  case ValueType::Null:
    return "None";
  case ValueType::Bool:
    return value.asBool() ? "True" : "False";
  case ValueType::Int:
    return std::to_string(value.asInt());
  case ValueType::Double:
    return floatText(value.asDouble());
  case ValueType::String:
    return nested ? quotedText(value.asString()) : value.asString();
  case ValueType::List:
  case ValueType::Map:
    return containerText(value);
  }
  return {};
}

} // namespace

NodeKind nodeKindFromString(const std::string& type) {
  if (type == "question") {
    return NodeKind::Question;
  }
  if (type == "action") {
    return NodeKind::Action;
  }
  if (type == "message") {
    return NodeKind::Message;
  }
  return NodeKind::Other;
}

const char* nodeKindToString(NodeKind kind) {
  switch (kind) {
  case NodeKind::Question:
    return "question";
  case NodeKind::Action:
    return "action";
  case NodeKind::Message:
    return "message";
  case NodeKind::Other:
    return "other";
  }
  return "other";
}

int nodeKindRank(NodeKind kind) {
  switch (kind) {
  case NodeKind::Question:
    return 0;
  case NodeKind::Action:
    return 1;
  case NodeKind::Message:
    return 2;
  case NodeKind::Other:
    return 3;
  }
  return 3;
}

std::vector<std::string> Node::expectedAnswers() const {
  std::vector<std::string> answers;
  const Value* expected = data.find("expectedAnswers");
  if (expected == nullptr || !expected->isList()) {
    return answers;
  }
  for (const auto& answer : expected->asList()) {
    answers.push_back(answerText(answer, false));
  }
  return answers;
}

Node Node::question(std::string id, ValueMap data) {
  return ofType(std::move(id), "question", std::move(data));
}

Node Node::action(std::string id, ValueMap data) {
  return ofType(std::move(id), "action", std::move(data));
}

Node Node::message(std::string id, ValueMap data) {
  return ofType(std::move(id), "message", std::move(data));
}

Node Node::ofType(std::string id, const std::string& type, ValueMap data) {
  Node node;
  node.id = std::move(id);
  node.kind = nodeKindFromString(type);
  node.type = type;
  node.data = std::move(data);
  return node;
}

} // namespace ConvoFlow::flow
