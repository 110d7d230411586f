// filament/mono/specialization_cache.cpp - Shared specialization results
#include "filament/mono/specialization_cache.hpp"

#include <exception>
#include <optional>

namespace filament
{

std::shared_ptr<const MonoComponent> SpecializationCache::insert_if_absent(
  const SpecKey & key, const Producer & produce)
{
  std::promise<std::shared_ptr<const MonoComponent>> promise;
  std::optional<Slot> existing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
      existing = it->second;
    } else {
      slots_.emplace(key, promise.get_future().share());
      produced_++;
    }
  }

  if (existing) {
    return existing->get();
  }

  try {
    std::shared_ptr<const MonoComponent> result = produce();
    promise.set_value(result);
    return result;
  } catch (...) {
    promise.set_exception(std::current_exception());
    throw;
  }
}

size_t SpecializationCache::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

size_t SpecializationCache::produced() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return produced_;
}

}  // namespace filament
