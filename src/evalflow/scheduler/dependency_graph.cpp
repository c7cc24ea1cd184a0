#include "evalflow/scheduler/dependency_graph.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

namespace evalflow {

auto DependencyGraph::add_node(TaskId task_id) -> Result<NodeIndex> {
  if (key_to_idx_.contains(task_id)) {
    return fail(Error::AlreadyExists);
  }
  if (nodes_.size() >= kInvalidNode) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  const auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return ok(idx);
}

auto DependencyGraph::add_edge(const TaskId &from, const TaskId &to)
    -> Result<void> {
  const NodeIndex from_idx = get_index(from);
  const NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto DependencyGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to) {
    return fail(Error::CycleDetected);
  }
  if (has_edge(from, to)) {
    return ok();
  }
  nodes_[to].deps.emplace_back(from);
  nodes_[from].dependents.emplace_back(to);
  return ok();
}

auto DependencyGraph::has_edge(NodeIndex from, NodeIndex to) const noexcept
    -> bool {
  const auto &dependents = nodes_[from].dependents;
  return std::ranges::find(dependents, to) != dependents.end();
}

auto DependencyGraph::has_node(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

// Iterative DFS, 0 = unvisited, 1 = on stack, 2 = done. Hitting a node that
// is on the stack closes a cycle; the stack holds its path.
auto DependencyGraph::is_valid(std::vector<TaskId> *cycle) const
    -> Result<void> {
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &dependents = nodes_[node].dependents;

      if (child_idx < dependents.size()) {
        const NodeIndex child = dependents[child_idx++];
        if (state[child] == 1) {
          if (cycle) {
            cycle->clear();
            auto it = std::ranges::find_if(
                stack, [child](const auto &frame) {
                  return frame.first == child;
                });
            for (; it != stack.end(); ++it) {
              cycle->push_back(keys_[it->first]);
            }
            cycle->push_back(keys_[child]);
          }
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

// Kahn's algorithm; nodes on a cycle are left out.
auto DependencyGraph::get_topological_order() const -> std::vector<TaskId> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<NodeIndex> ready;
  ready.reserve(nodes_.size());
  for (NodeIndex i = 0; i < in_degree.size(); ++i) {
    if (in_degree[i] == 0) {
      ready.emplace_back(i);
    }
  }

  std::vector<TaskId> result;
  result.reserve(nodes_.size());
  for (std::size_t head = 0; head < ready.size(); ++head) {
    const NodeIndex current = ready[head];
    result.emplace_back(keys_[current]);
    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.emplace_back(dep);
      }
    }
  }
  return result;
}

auto DependencyGraph::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DependencyGraph::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DependencyGraph::get_index(const TaskId &task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::get_key(NodeIndex idx) const -> const TaskId & {
  static const TaskId kEmpty;
  if (idx >= keys_.size()) {
    return kEmpty;
  }
  return keys_[idx];
}

} // namespace evalflow
