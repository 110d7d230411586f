// filament/ast/ast_context.hpp - Arena owning the AST of one source file
//
// Every .fil module gets its own AstContext; nodes, interned identifiers and
// child arrays all come from a std::pmr::monotonic_buffer_resource and are
// released together when the module graph is destroyed.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace filament
{

class AstNode;

/**
 * Arena allocator and identifier pool for AST nodes.
 *
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<IntLiteralExpr>(32, range);
 *   std::string_view name = ctx.intern("Mul");
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{32} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), identifiers_(&arena_)
  {
  }

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Construct a node inside the arena.
   *
   * Nodes are never destroyed individually, so they must be trivially
   * destructible.
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes live in an arena: use std::string_view and gsl::span for members");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Intern an identifier; equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = identifiers_.find(s); it != identifiers_.end()) {
      return *it;
    }
    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    identifiers_.insert(stored);
    return stored;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return identifiers_.find(s) != identifiers_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return identifiers_.size(); }

  /// Copy a parser-side vector of children into arena storage.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_copyable_v<T>, "arena arrays hold pointers or PODs");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> identifiers_;
};

}  // namespace filament
