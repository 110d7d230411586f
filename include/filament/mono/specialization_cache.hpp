// filament/mono/specialization_cache.hpp - Shared specialization results
#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "filament/mono/mono_component.hpp"

namespace filament
{

/**
 * Map from specialization key to its concrete component.
 *
 * The only mutating operation is insert_if_absent. The first caller for a
 * key becomes its owner and runs the producer outside the lock; later
 * callers for the same key wait on the owner's result. A failed
 * specialization is cached as nullptr.
 *
 * The cache does not detect cycles: producers must only wait on keys that
 * are strictly below their own in the instantiation graph.
 */
class SpecializationCache
{
public:
  using Producer = std::function<std::shared_ptr<const MonoComponent>()>;

  SpecializationCache() = default;

  SpecializationCache(const SpecializationCache &) = delete;
  SpecializationCache & operator=(const SpecializationCache &) = delete;

  std::shared_ptr<const MonoComponent> insert_if_absent(
    const SpecKey & key, const Producer & produce);

  [[nodiscard]] size_t size() const;

  /// Number of times a producer was run.
  [[nodiscard]] size_t produced() const;

private:
  using Slot = std::shared_future<std::shared_ptr<const MonoComponent>>;

  mutable std::mutex mutex_;
  std::unordered_map<SpecKey, Slot, SpecKeyHash> slots_;
  size_t produced_ = 0;
};

}  // namespace filament
