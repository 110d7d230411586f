// filament/mono/instantiation_graph.hpp - Concrete instantiation graph
//
// Nodes are specialization keys reachable from an entry key; edges are the
// `new` statements of each definition with their arguments evaluated.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/mono/mono_component.hpp"

namespace filament
{

class InstantiationGraph
{
public:
  static constexpr size_t kDefaultMaxDepth = 256;

  struct Edge
  {
    std::string_view instance;
    size_t target = 0;
  };

  struct Node
  {
    SpecKey key;
    std::vector<Edge> children;
  };

  explicit InstantiationGraph(
    ExprPool & pool, DiagnosticBag * diags = nullptr, size_t max_depth = kDefaultMaxDepth)
  : pool_(pool), diags_(diags), max_depth_(max_depth)
  {
  }

  /// Explore everything reachable from `entry`. A key that reappears on the
  /// current path, or a path deeper than the limit, is an InstantiationCycle.
  bool build(const SpecKey & entry);

  [[nodiscard]] const std::vector<Node> & nodes() const noexcept { return nodes_; }
  /// Node indices, callees before callers.
  [[nodiscard]] const std::vector<size_t> & post_order() const noexcept { return post_order_; }
  [[nodiscard]] size_t entry() const noexcept { return entry_; }
  [[nodiscard]] const Node * find(const SpecKey & key) const;

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  bool visit(const SpecKey & key, SourceRange use, size_t & index);
  /// Evaluate the `where` clause of `key.def` on its arguments.
  bool guards_hold(const SpecKey & key, SourceRange use);

  void report_error(
    ErrorKind kind, SourceRange range, std::string message, std::string label = "",
    std::vector<std::string> notes = {});

  ExprPool & pool_;
  DiagnosticBag * diags_;
  size_t max_depth_;

  std::vector<Node> nodes_;
  std::unordered_map<SpecKey, size_t, SpecKeyHash> index_;
  std::vector<size_t> post_order_;
  size_t entry_ = 0;

  std::vector<SpecKey> stack_;
  std::unordered_set<SpecKey, SpecKeyHash> on_stack_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
