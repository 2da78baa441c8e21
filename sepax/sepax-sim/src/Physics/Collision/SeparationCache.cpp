// Ticket: 0005_separation_cache

#include "sepax-sim/src/Physics/Collision/SeparationCache.hpp"

#include <stdexcept>
#include <string>

namespace sepax_sim
{

void SeparationCache::insert(uint32_t first,
                             uint32_t second,
                             const SeparatingAxis& axis)
{
  cache_.insert_or_assign(ObjectPairKey{first, second},
                          Separation{SeparationType::Separated, axis});
}

std::optional<Separation> SeparationCache::find(uint32_t first,
                                                uint32_t second) const
{
  auto it = cache_.find(ObjectPairKey{first, second});
  if (it == cache_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

bool SeparationCache::hasEntry(uint32_t first, uint32_t second) const
{
  return cache_.contains(ObjectPairKey{first, second});
}

const Separation& SeparationCache::refresh(uint32_t first,
                                           uint32_t second,
                                           const SeparatingAxisSolver& solver)
{
  auto it = cache_.find(ObjectPairKey{first, second});
  if (it == cache_.end())
  {
    throw std::out_of_range("No separation entry for object pair (" +
                            std::to_string(first) + ", " +
                            std::to_string(second) + ")");
  }

  Separation& entry = it->second;

  // Fast path: last known axis still separates
  if (entry.type == SeparationType::Separated && solver.separates(entry.axis))
  {
    return entry;
  }

  ++fullSearchCount_;
  if (auto axis = solver.findSeparatingAxis())
  {
    entry = Separation{SeparationType::Separated, *axis};
  }
  else
  {
    entry.type = SeparationType::Contact;
  }
  return entry;
}

void SeparationCache::clear()
{
  cache_.clear();
  fullSearchCount_ = 0;
}

size_t SeparationCache::size() const
{
  return cache_.size();
}

}  // namespace sepax_sim
