// Ticket: 0008_physics_engine

#include "sepax-sim/src/Physics/PhysicsEngine.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "sepax-sim/src/Physics/Collision/SeparatingAxis.hpp"
#include "sepax-sim/src/Physics/Integration/ContactEulerIntegrator.hpp"
#include "sepax-sim/src/Physics/SeparationError.hpp"

namespace sepax_sim
{

namespace
{

constexpr double kStepSeconds{0.001};

}  // namespace

PhysicsEngine::PhysicsEngine(PhysicsConfig config)
  : PhysicsEngine{std::move(config), std::make_unique<ContactEulerIntegrator>()}
{
}

PhysicsEngine::PhysicsEngine(PhysicsConfig config,
                             std::unique_ptr<Integrator> integrator)
  : config_{std::move(config)}, integrator_{std::move(integrator)}
{
  config_.validate();
  if (!integrator_)
  {
    throw std::invalid_argument("PhysicsEngine requires an integrator");
  }
}

// ============================================================================
// Registration
// ============================================================================

void PhysicsEngine::addStaticObject(const std::string& name,
                                    PhysicsObject object)
{
  requireUniqueName(name);

  uint32_t const id = nextObjectId_;
  std::vector<PendingRelation> relations;
  relations.reserve(dynamicObjects_.size());
  for (const auto& dynamic : dynamicObjects_)
  {
    relations.push_back(PendingRelation{
      id,
      dynamic.id,
      requireSeparation(name, object, dynamic.name, dynamic.object)});
  }

  for (const auto& relation : relations)
  {
    cache_.insert(relation.first, relation.second, relation.axis);
  }
  staticIndex_.emplace(name, staticObjects_.size());
  staticObjects_.push_back(ObjectEntry{id, name, std::move(object)});
  ++nextObjectId_;

  spdlog::debug("Registered static object '{}' (id {}, {} relations)",
                name,
                id,
                relations.size());
}

void PhysicsEngine::addDynamicObject(const std::string& name,
                                     PhysicsObject object)
{
  requireUniqueName(name);

  object.getKineticState().acceleration = config_.gravity;

  uint32_t const id = nextObjectId_;
  std::vector<PendingRelation> relations;
  relations.reserve(staticObjects_.size() + dynamicObjects_.size());
  for (const auto& fixed : staticObjects_)
  {
    relations.push_back(PendingRelation{
      fixed.id, id, requireSeparation(fixed.name, fixed.object, name, object)});
  }
  for (const auto& dynamic : dynamicObjects_)
  {
    relations.push_back(PendingRelation{
      dynamic.id,
      id,
      requireSeparation(dynamic.name, dynamic.object, name, object)});
  }

  for (const auto& relation : relations)
  {
    cache_.insert(relation.first, relation.second, relation.axis);
  }
  dynamicIndex_.emplace(name, dynamicObjects_.size());
  dynamicObjects_.push_back(ObjectEntry{id, name, std::move(object)});
  ++nextObjectId_;

  spdlog::debug("Registered dynamic object '{}' (id {}, {} relations)",
                name,
                id,
                relations.size());
}

void PhysicsEngine::requireUniqueName(const std::string& name) const
{
  if (staticIndex_.contains(name) || dynamicIndex_.contains(name))
  {
    throw std::invalid_argument("Object name already registered: '" + name +
                                "'");
  }
}

SeparatingAxis PhysicsEngine::requireSeparation(
  const std::string& firstName,
  const PhysicsObject& first,
  const std::string& secondName,
  const PhysicsObject& second) const
{
  SeparatingAxisSolver const solver{first.getMesh(),
                                    first.getWorldTransform(),
                                    second.getMesh(),
                                    second.getWorldTransform(),
                                    config_.planeTolerance};
  auto axis = solver.findSeparatingAxis();
  if (!axis)
  {
    spdlog::error(
      "Cannot register: '{}' and '{}' overlap", firstName, secondName);
    throw SeparationError{firstName, secondName};
  }
  return *axis;
}

// ============================================================================
// Simulation
// ============================================================================

void PhysicsEngine::run(std::chrono::milliseconds duration)
{
  if (duration.count() < 0)
  {
    throw std::invalid_argument(
      "Simulation duration must be non-negative, got: " +
      std::to_string(duration.count()) + " ms");
  }

  for (std::chrono::milliseconds::rep i = 0; i < duration.count(); ++i)
  {
    runOneMs();
  }
}

void PhysicsEngine::runOneMs()
{
  for (auto& entry : dynamicObjects_)
  {
    stepDynamicObject(entry);
  }
  refreshDynamicPairs();
  simulationTime_ += kStep;
}

void PhysicsEngine::stepDynamicObject(ObjectEntry& entry)
{
  std::vector<Direction> const contactNormals = gatherContactNormals(entry);

  KineticState tentative = entry.object.getKineticState();
  Direction const storedAcceleration = tentative.acceleration;
  tentative.acceleration += entry.object.computeBodyForceAcceleration();
  integrator_->step(tentative, contactNormals, kStepSeconds);
  tentative.acceleration = storedAcceleration;

  if (!resolvePenetrations(entry, tentative))
  {
    if (!entry.object.isStuck())
    {
      spdlog::warn(
        "Object '{}' still penetrating after {} resolution passes at t = {} ms",
        entry.name,
        config_.maxResolutionIterations,
        simulationTime_.count());
    }
    entry.object.markStuck();
  }

  entry.object.getKineticState() = tentative;
}

std::vector<Direction> PhysicsEngine::gatherContactNormals(
  const ObjectEntry& entry) const
{
  std::vector<Direction> normals;
  Eigen::Matrix4d const transform = entry.object.getWorldTransform();

  for (const auto& fixed : staticObjects_)
  {
    auto separation = cache_.find(fixed.id, entry.id);
    if (!separation || separation->type != SeparationType::Separated)
    {
      continue;
    }

    SeparatingAxisSolver const solver{fixed.object.getMesh(),
                                      fixed.object.getWorldTransform(),
                                      entry.object.getMesh(),
                                      transform,
                                      config_.planeTolerance};
    auto contact = solver.evaluate(separation->axis);
    if (contact && contact->overlap >= -config_.contactTolerance)
    {
      // The axis normal points from the obstacle toward the object
      normals.push_back(contact->normal.opposite());
    }
  }
  return normals;
}

bool PhysicsEngine::resolvePenetrations(const ObjectEntry& entry,
                                        KineticState& tentative)
{
  for (size_t iteration = 0; iteration < config_.maxResolutionIterations;
       ++iteration)
  {
    bool corrected = false;

    for (const auto& fixed : staticObjects_)
    {
      SeparatingAxisSolver const solver{fixed.object.getMesh(),
                                        fixed.object.getWorldTransform(),
                                        entry.object.getMesh(),
                                        tentative.getWorldTransform(),
                                        config_.planeTolerance};
      const Separation& separation = cache_.refresh(fixed.id, entry.id, solver);
      if (separation.type != SeparationType::Contact)
      {
        continue;
      }

      auto contact = solver.evaluate(separation.axis);
      if (contact && contact->overlap > config_.planeTolerance)
      {
        tentative.position = tentative.position.displace(
          Direction{contact->normal * contact->overlap});
        corrected = true;
      }
    }

    if (!corrected)
    {
      return true;
    }
  }
  return false;
}

void PhysicsEngine::refreshDynamicPairs()
{
  for (size_t i = 0; i < dynamicObjects_.size(); ++i)
  {
    const ObjectEntry& first = dynamicObjects_[i];
    for (size_t j = i + 1; j < dynamicObjects_.size(); ++j)
    {
      const ObjectEntry& second = dynamicObjects_[j];
      SeparatingAxisSolver const solver{first.object.getMesh(),
                                        first.object.getWorldTransform(),
                                        second.object.getMesh(),
                                        second.object.getWorldTransform(),
                                        config_.planeTolerance};

      auto previous = cache_.find(first.id, second.id);
      bool const wasSeparated =
        previous && previous->type == SeparationType::Separated;
      const Separation& separation = cache_.refresh(first.id, second.id, solver);
      if (wasSeparated && separation.type == SeparationType::Contact)
      {
        spdlog::debug("Dynamic objects '{}' and '{}' interpenetrate",
                      first.name,
                      second.name);
      }
    }
  }
}

// ============================================================================
// Lookups
// ============================================================================

PhysicsObject* PhysicsEngine::getDynamicObject(const std::string& name)
{
  auto it = dynamicIndex_.find(name);
  if (it == dynamicIndex_.end())
  {
    return nullptr;
  }
  return &dynamicObjects_[it->second].object;
}

const PhysicsObject* PhysicsEngine::getStaticObject(
  const std::string& name) const
{
  const ObjectEntry* entry = findStatic(name);
  return entry ? &entry->object : nullptr;
}

std::optional<Eigen::Matrix4d> PhysicsEngine::getDynamicObjectTransform(
  const std::string& name) const
{
  const ObjectEntry* entry = findDynamic(name);
  if (!entry)
  {
    return std::nullopt;
  }
  return entry->object.getWorldTransform();
}

std::optional<Eigen::Matrix4d> PhysicsEngine::getStaticObjectTransform(
  const std::string& name) const
{
  const ObjectEntry* entry = findStatic(name);
  if (!entry)
  {
    return std::nullopt;
  }
  return entry->object.getWorldTransform();
}

std::optional<Separation> PhysicsEngine::getSeparation(
  const std::string& first,
  const std::string& second) const
{
  const ObjectEntry* firstStatic = findStatic(first);
  const ObjectEntry* secondStatic = findStatic(second);
  const ObjectEntry* firstDynamic = findDynamic(first);
  const ObjectEntry* secondDynamic = findDynamic(second);

  if (firstStatic && secondDynamic)
  {
    return cache_.find(firstStatic->id, secondDynamic->id);
  }
  if (firstDynamic && secondStatic)
  {
    return cache_.find(secondStatic->id, firstDynamic->id);
  }
  if (firstDynamic && secondDynamic)
  {
    return cache_.find(std::min(firstDynamic->id, secondDynamic->id),
                       std::max(firstDynamic->id, secondDynamic->id));
  }
  return std::nullopt;
}

void PhysicsEngine::setGravity(const Direction& gravity)
{
  if (!gravity.allFinite())
  {
    throw std::invalid_argument("Gravity must be finite");
  }
  config_.gravity = gravity;
}

const PhysicsEngine::ObjectEntry* PhysicsEngine::findStatic(
  const std::string& name) const
{
  auto it = staticIndex_.find(name);
  return it == staticIndex_.end() ? nullptr : &staticObjects_[it->second];
}

const PhysicsEngine::ObjectEntry* PhysicsEngine::findDynamic(
  const std::string& name) const
{
  auto it = dynamicIndex_.find(name);
  return it == dynamicIndex_.end() ? nullptr : &dynamicObjects_[it->second];
}

}  // namespace sepax_sim
