#pragma once

/**
 * @file canonical_serializer.hpp
 * @brief Deterministic YAML-shaped rendering of a flow
 *
 * Two flows that differ only in node/edge declaration order or in the key
 * order of their open maps serialize to identical text:
 * - nodes are ordered by (kind rank, id): question, action, message, other
 * - edges leaving a node are ordered by (source, target, label or "")
 * - metadata and parameters maps are emitted with sorted keys
 *
 * Per-node entries project only the fields relevant to the node kind.
 * A node's transitions become "next": a bare target id when there is a
 * single unlabelled edge, otherwise a map from label ("default" for an
 * unlabelled edge) to target id. Nodes without edges have no "next".
 */

#include "ConvoFlow/flow/flow_model.hpp"
#include "ConvoFlow/flow/graph_index.hpp"
#include "ConvoFlow/flow/serializer_backend.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ConvoFlow::flow {

class CanonicalSerializer {
public:
  explicit CanonicalSerializer(SerializerKind kind = SerializerKind::Plain);
  explicit CanonicalSerializer(std::unique_ptr<SerializerBackend> backend);

  [[nodiscard]] std::string serialize(const Flow& flow) const;

  [[nodiscard]] SerializerKind backendKind() const { return m_backend->kind(); }

  /**
   * @brief Ordered document tree (id, name, metadata, flow) for a flow
   */
  [[nodiscard]] static ValueMap buildDocument(const Flow& flow, const GraphIndex& index);

  [[nodiscard]] static std::vector<const Node*> orderedNodes(const Flow& flow);
  [[nodiscard]] static std::vector<const Edge*> orderedEdges(std::vector<const Edge*> edges);

private:
  std::unique_ptr<SerializerBackend> m_backend;
};

[[nodiscard]] std::string serialize(const Flow& flow);
[[nodiscard]] std::string serialize(const Flow& flow, SerializerKind kind);

} // namespace ConvoFlow::flow
