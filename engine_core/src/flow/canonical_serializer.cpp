#include "ConvoFlow/flow/canonical_serializer.hpp"
#include "ConvoFlow/core/logger.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <tuple>

namespace ConvoFlow::flow {

namespace {

std::string declaredType(const Node& node) {
  return node.type.empty() ? std::string(nodeKindToString(node.kind)) : node.type;
}

void copyIfSet(const Node& node, const std::string& key, ValueMap& entry) {
  const Value* value = node.data.find(key);
  if (value != nullptr && value->isTruthy()) {
    entry.set(key, *value);
  }
}

void copySortedMapIfSet(const Node& node, const std::string& key, ValueMap& entry) {
  const Value* value = node.data.find(key);
  if (value != nullptr && value->isMap() && !value->asMap().empty()) {
    entry.set(key, value->asMap().sortedByKey());
  }
}

std::optional<Value> buildNext(const std::vector<const Edge*>& edges) {
  if (edges.empty()) {
    return std::nullopt;
  }

  if (edges.size() == 1 && !edges.front()->hasLabel()) {
    return Value(edges.front()->target);
  }

  ValueMap next;
  for (const Edge* edge : CanonicalSerializer::orderedEdges(edges)) {
    next.set(edge->hasLabel() ? *edge->viaLabel : std::string("default"), edge->target);
  }
  return Value(std::move(next));
}

void setNext(const std::vector<const Edge*>& edges, ValueMap& entry) {
  if (auto next = buildNext(edges)) {
    entry.set("next", std::move(*next));
  }
}

ValueMap questionEntry(const Node& node, const std::vector<const Edge*>& edges) {
  ValueMap entry;
  entry.set("type", declaredType(node));
  copyIfSet(node, "question", entry);
  copyIfSet(node, "check", entry);

  const Value* expected = node.data.find("expectedAnswers");
  if (expected != nullptr && expected->isList() && !expected->asList().empty()) {
    ValueList answers;
    for (const auto& answer : node.expectedAnswers()) {
      answers.emplace_back(answer);
    }
    entry.set("expected_answers", std::move(answers));
  }

  setNext(edges, entry);
  copySortedMapIfSet(node, "metadata", entry);
  return entry;
}

ValueMap actionEntry(const Node& node, const std::vector<const Edge*>& edges) {
  ValueMap entry;
  entry.set("type", declaredType(node));
  copyIfSet(node, "action", entry);
  copySortedMapIfSet(node, "parameters", entry);
  setNext(edges, entry);
  copySortedMapIfSet(node, "metadata", entry);
  return entry;
}

ValueMap messageEntry(const Node& node, const std::vector<const Edge*>& edges) {
  ValueMap entry;
  entry.set("type", declaredType(node));
  copyIfSet(node, "message", entry);
  copyIfSet(node, "severity", entry);
  copySortedMapIfSet(node, "metadata", entry);
  setNext(edges, entry);
  return entry;
}

ValueMap nodeEntry(const Node& node, const std::vector<const Edge*>& edges) {
  switch (node.kind) {
  case NodeKind::Question:
    return questionEntry(node, edges);
  case NodeKind::Action:
    return actionEntry(node, edges);
  case NodeKind::Message:
  case NodeKind::Other:
    return messageEntry(node, edges);
  }
  return messageEntry(node, edges);
}

} // namespace

CanonicalSerializer::CanonicalSerializer(SerializerKind kind)
    : m_backend(createSerializerBackend(kind)) {}

CanonicalSerializer::CanonicalSerializer(std::unique_ptr<SerializerBackend> backend)
    : m_backend(std::move(backend)) {
  if (!m_backend) {
    throw std::invalid_argument("CanonicalSerializer requires a backend");
  }
}

std::string CanonicalSerializer::serialize(const Flow& flow) const {
  GraphIndex index(flow);
  ValueMap document = buildDocument(flow, index);
  CONVOFLOW_LOG_DEBUG(std::string("Rendering flow '") + flow.id + "' with " +
                      serializerKindToString(m_backend->kind()) + " backend");
  return m_backend->render(document);
}

ValueMap CanonicalSerializer::buildDocument(const Flow& flow, const GraphIndex& index) {
  ValueMap nodes;
  for (const Node* node : orderedNodes(flow)) {
    nodes.set(node->id, nodeEntry(*node, index.outbound(node->id)));
  }

  ValueMap document;
  document.set("id", flow.id);
  document.set("name", flow.name);
  if (!flow.metadata.empty()) {
    document.set("metadata", flow.metadata.sortedByKey());
  }
  document.set("flow", std::move(nodes));
  return document;
}

std::vector<const Node*> CanonicalSerializer::orderedNodes(const Flow& flow) {
  std::vector<const Node*> ordered;
  ordered.reserve(flow.nodes.size());
  for (const auto& node : flow.nodes) {
    ordered.push_back(&node);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Node* a, const Node* b) {
    return std::make_tuple(nodeKindRank(a->kind), std::cref(a->id)) <
           std::make_tuple(nodeKindRank(b->kind), std::cref(b->id));
  });
  return ordered;
}

std::vector<const Edge*> CanonicalSerializer::orderedEdges(std::vector<const Edge*> edges) {
  std::stable_sort(edges.begin(), edges.end(), [](const Edge* a, const Edge* b) {
    return std::make_tuple(std::cref(a->source), std::cref(a->target), a->labelOrEmpty()) <
           std::make_tuple(std::cref(b->source), std::cref(b->target), b->labelOrEmpty());
  });
  return edges;
}

std::string serialize(const Flow& flow) {
  CanonicalSerializer serializer;
  return serializer.serialize(flow);
}

std::string serialize(const Flow& flow, SerializerKind kind) {
  CanonicalSerializer serializer(kind);
  return serializer.serialize(flow);
}

} // namespace ConvoFlow::flow
