// Ticket: 0008_physics_engine

#ifndef SEPAX_SIM_PHYSICS_PHYSICS_ENGINE_HPP
#define SEPAX_SIM_PHYSICS_PHYSICS_ENGINE_HPP

#include <Eigen/Dense>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Physics/Collision/SeparationCache.hpp"
#include "sepax-sim/src/Physics/Integration/Integrator.hpp"
#include "sepax-sim/src/Physics/PhysicsConfig.hpp"
#include "sepax-sim/src/Physics/RigidBody/PhysicsObject.hpp"

namespace sepax_sim
{

/**
 * @brief Fixed-timestep rigid-body simulation over convex meshes
 *
 * Owns the static and dynamic objects and the separation cache covering
 * every (static, dynamic) and (dynamic, dynamic) pair. Static objects never
 * move; dynamic objects are integrated in 1 ms sub-steps and pushed out of
 * any static object they penetrate.
 *
 * Each sub-step processes the dynamic objects in registration order:
 * 1. Collect the normals of static partners whose cached separating face is
 *    within contactTolerance (touching), oriented into the obstacle
 * 2. Integrate a tentative state for 1 ms with those normals, adding the
 *    object's body-force acceleration to its stored acceleration for this
 *    step only
 * 3. Re-validate every static pair against the tentative placement; on
 *    contact, translate the object out along the pair's axis by the
 *    penetration depth. Repeat until a pass corrects nothing, at most
 *    maxResolutionIterations times. Running out of passes marks the object
 *    stuck and logs a warning; the tick always completes.
 * 4. Commit the tentative state
 *
 * After every dynamic object has moved, dynamic-dynamic pairs are
 * re-validated without any collision response.
 *
 * Object names are unique across both collections. Pair keys are
 * (static id, dynamic id) and (earlier dynamic id, later dynamic id).
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0008_physics_engine
 */
class PhysicsEngine
{
public:
  /**
   * @brief Create an empty engine
   * @throws std::invalid_argument if @p config fails validation
   */
  explicit PhysicsEngine(PhysicsConfig config = PhysicsConfig{});

  /**
   * @brief Create an engine with a custom integrator
   * @throws std::invalid_argument if @p config fails validation or
   *         @p integrator is null
   */
  PhysicsEngine(PhysicsConfig config, std::unique_ptr<Integrator> integrator);

  /**
   * @brief Register an immovable object
   *
   * Computes a separating axis against every dynamic object. Nothing is
   * inserted unless every pair separates.
   *
   * @throws std::invalid_argument if @p name is already registered
   * @throws SeparationError if the object overlaps a dynamic object
   */
  void addStaticObject(const std::string& name, PhysicsObject object);

  /**
   * @brief Register a moving object
   *
   * The object's acceleration is replaced with the configured gravity. A
   * separating axis is computed against every static and every dynamic
   * object before anything is inserted.
   *
   * @throws std::invalid_argument if @p name is already registered
   * @throws SeparationError if the object overlaps a registered object
   */
  void addDynamicObject(const std::string& name, PhysicsObject object);

  /**
   * @brief Advance the simulation by @p duration in 1 ms sub-steps
   * @throws std::invalid_argument if @p duration is negative
   */
  void run(std::chrono::milliseconds duration);

  /**
   * @brief Advance the simulation by exactly one 1 ms sub-step
   */
  void runOneMs();

  /**
   * @brief Mutable access to a dynamic object
   *
   * The pointer refers into the engine's object storage and is invalidated
   * by the next addDynamicObject() call.
   *
   * @return nullptr if no dynamic object has this name
   */
  [[nodiscard]] PhysicsObject* getDynamicObject(const std::string& name);

  /**
   * @brief Read-only access to a static object
   *
   * Invalidated by the next addStaticObject() call.
   *
   * @return nullptr if no static object has this name
   */
  [[nodiscard]] const PhysicsObject* getStaticObject(
    const std::string& name) const;

  [[nodiscard]] std::optional<Eigen::Matrix4d> getDynamicObjectTransform(
    const std::string& name) const;

  [[nodiscard]] std::optional<Eigen::Matrix4d> getStaticObjectTransform(
    const std::string& name) const;

  /**
   * @brief Cached separation state between two registered objects
   *
   * The pair may be given in either order; the returned axis is expressed in
   * the engine's key order (static first, then earlier dynamic first).
   *
   * @return std::nullopt if either name is unknown or the pair is not
   *         tracked (two static objects)
   */
  [[nodiscard]] std::optional<Separation> getSeparation(
    const std::string& first,
    const std::string& second) const;

  /**
   * @brief Replace the gravity seeded into subsequently added objects
   */
  void setGravity(const Direction& gravity);

  [[nodiscard]] const PhysicsConfig& getConfig() const
  {
    return config_;
  }

  /**
   * @brief Total simulated time since construction
   */
  [[nodiscard]] std::chrono::milliseconds getSimulationTime() const
  {
    return simulationTime_;
  }

  [[nodiscard]] size_t getStaticObjectCount() const
  {
    return staticObjects_.size();
  }

  [[nodiscard]] size_t getDynamicObjectCount() const
  {
    return dynamicObjects_.size();
  }

  [[nodiscard]] const SeparationCache& getSeparationCache() const
  {
    return cache_;
  }

  PhysicsEngine(const PhysicsEngine&) = delete;
  PhysicsEngine& operator=(const PhysicsEngine&) = delete;
  PhysicsEngine(PhysicsEngine&&) noexcept = default;
  PhysicsEngine& operator=(PhysicsEngine&&) noexcept = default;
  ~PhysicsEngine() = default;

private:
  struct ObjectEntry
  {
    uint32_t id;
    std::string name;
    PhysicsObject object;
  };

  // Cache relation computed during registration but not yet committed
  struct PendingRelation
  {
    uint32_t first;
    uint32_t second;
    SeparatingAxis axis;
  };

  void requireUniqueName(const std::string& name) const;

  /**
   * @brief Find the axis for a prospective pair or throw SeparationError
   */
  [[nodiscard]] SeparatingAxis requireSeparation(
    const std::string& firstName,
    const PhysicsObject& first,
    const std::string& secondName,
    const PhysicsObject& second) const;

  void stepDynamicObject(ObjectEntry& entry);

  [[nodiscard]] std::vector<Direction> gatherContactNormals(
    const ObjectEntry& entry) const;

  /**
   * @brief Push a tentative state out of every static object it penetrates
   * @return true if a pass completed without any correction
   */
  bool resolvePenetrations(const ObjectEntry& entry, KineticState& tentative);

  void refreshDynamicPairs();

  [[nodiscard]] const ObjectEntry* findStatic(const std::string& name) const;
  [[nodiscard]] const ObjectEntry* findDynamic(const std::string& name) const;

  static constexpr std::chrono::milliseconds kStep{1};

  PhysicsConfig config_;
  std::unique_ptr<Integrator> integrator_;

  std::vector<ObjectEntry> staticObjects_;
  std::vector<ObjectEntry> dynamicObjects_;
  std::unordered_map<std::string, size_t> staticIndex_;
  std::unordered_map<std::string, size_t> dynamicIndex_;

  SeparationCache cache_;
  uint32_t nextObjectId_{0};
  std::chrono::milliseconds simulationTime_{0};
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_PHYSICS_ENGINE_HPP
