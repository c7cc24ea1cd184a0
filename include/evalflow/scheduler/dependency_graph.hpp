#pragma once

#include "evalflow/core/error.hpp"
#include "evalflow/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <vector>

namespace evalflow {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

/// Task dependency graph. Edges run from a dependency to its dependent.
class DependencyGraph {
public:
  [[nodiscard]] auto add_node(TaskId task_id) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(const TaskId &from, const TaskId &to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId &task_id) const -> bool;

  /// Fails with Error::CycleDetected when the graph has a cycle; `cycle` (if
  /// given) receives the offending path, first node repeated at the end.
  [[nodiscard]] auto is_valid(std::vector<TaskId> *cycle = nullptr) const
      -> Result<void>;

  [[nodiscard]] auto get_topological_order() const -> std::vector<TaskId>;

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto get_index(const TaskId &task_id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const TaskId &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  [[nodiscard]] auto has_edge(NodeIndex from, NodeIndex to) const noexcept
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
};

} // namespace evalflow
