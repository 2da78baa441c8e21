// Ticket: 0005_separation_cache

#ifndef SEPAX_SIM_PHYSICS_SEPARATION_CACHE_HPP
#define SEPAX_SIM_PHYSICS_SEPARATION_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>

#include "sepax-sim/src/Physics/Collision/SeparatingAxis.hpp"

namespace sepax_sim
{

/**
 * @brief Outcome recorded for an object pair
 *
 * - Separated: the stored axis separated the pair at the last check
 * - Contact: no axis separates the pair; the stored axis is the last one that
 *   did and is used to resolve the penetration
 */
enum class SeparationType
{
  Contact,
  Separated
};

/**
 * @brief Cached separation state for a single ordered object pair
 */
struct Separation
{
  SeparationType type;
  SeparatingAxis axis;
};

/**
 * @brief Per-pair memo of the last known separating axis
 *
 * Entries are keyed by the ORDERED pair (first, second): the stored axis
 * refers to collision faces and edges of the first and second object in that
 * order, so (a, b) and (b, a) are distinct keys.
 *
 * refresh() re-tests a Separated entry's axis first and only falls back to a
 * full SAT search when that axis no longer separates (or the entry is already
 * in Contact). Between ticks objects move a small distance, so the fast path
 * is the common case.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0005_separation_cache
 */
class SeparationCache
{
public:
  using ObjectPairKey = std::pair<uint32_t, uint32_t>;

  SeparationCache() = default;

  /**
   * @brief Record a Separated entry, overwriting any existing one
   */
  void insert(uint32_t first, uint32_t second, const SeparatingAxis& axis);

  /**
   * @brief Look up the entry for an ordered pair
   * @return The entry, or std::nullopt if the pair was never inserted
   */
  [[nodiscard]] std::optional<Separation> find(uint32_t first,
                                               uint32_t second) const;

  [[nodiscard]] bool hasEntry(uint32_t first, uint32_t second) const;

  /**
   * @brief Re-validate an existing entry against the current placement
   *
   * Separated entries whose axis still separates are kept unchanged.
   * Otherwise a full search runs: a new axis is stored as Separated, and if
   * none exists the entry becomes Contact with its previous axis.
   *
   * @param first First object id (meshA of @p solver)
   * @param second Second object id (meshB of @p solver)
   * @param solver Both objects placed at their current transforms
   * @return The updated entry
   * @throws std::out_of_range if the pair has no entry
   */
  const Separation& refresh(uint32_t first,
                            uint32_t second,
                            const SeparatingAxisSolver& solver);

  /**
   * @brief Clear all entries and reset the search counter
   */
  void clear();

  [[nodiscard]] size_t size() const;

  /**
   * @brief Number of full searches refresh() has fallen back to
   */
  [[nodiscard]] size_t getFullSearchCount() const
  {
    return fullSearchCount_;
  }

  // Rule of Five
  SeparationCache(const SeparationCache&) = default;
  SeparationCache& operator=(const SeparationCache&) = default;
  SeparationCache(SeparationCache&&) noexcept = default;
  SeparationCache& operator=(SeparationCache&&) noexcept = default;
  ~SeparationCache() = default;

private:
  struct PairHash
  {
    size_t operator()(const ObjectPairKey& p) const
    {
      size_t seed = std::hash<uint32_t>{}(p.first);
      seed ^= std::hash<uint32_t>{}(p.second) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
      return seed;
    }
  };

  std::unordered_map<ObjectPairKey, Separation, PairHash> cache_;
  size_t fullSearchCount_{0};
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_SEPARATION_CACHE_HPP
