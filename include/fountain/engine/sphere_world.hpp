/**
 * @file sphere_world.hpp
 * @brief Small rigid-body world of dynamic spheres above a static ground slab
 *
 * Pipeline per step: integrate -> broad phase (uniform grid) ->
 * contact solver (sphere/sphere and sphere/ground, iterated) -> cull bodies
 * that fell far below the ground.
 */

#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fountain/engine/rigid_body_world.hpp"

namespace Engine {

/**
 * @struct SphereWorldConfig
 * @brief Configuration parameters specific to the sphere world
 */
struct SphereWorldConfig {
    double gravity = 9.81;            // m/s², along -Y
    double groundHeight = 0.0;        // top face of the slab
    double groundHalfExtent = 128.0;  // slab spans [-h, h] on X and Z
    double groundThickness = 10.0;
    double restitution = 0.4;         // normal restitution, ground and pairs
    double horizontalDamping = 0.9;   // X/Z velocity multiplier on ground impact
    double friction = 0.2;            // tangential impulse fraction between spheres
    int solverIterations = 4;
    double restingSpeed = 0.1;        // slower ground bounces are stopped
    double fallLimit = 100.0;         // bodies this far below the ground are removed
};

/**
 * @class SphereWorld
 * @brief IRigidBodyWorld implementation for equal-ish spheres.
 *
 * Bodies live in a dense array; ids map to array slots and removal swaps the
 * last body into the hole. Mass is proportional to radius cubed.
 */
class SphereWorld : public IRigidBodyWorld {
public:
    explicit SphereWorld(const SphereWorldConfig& config = SphereWorldConfig{});
    ~SphereWorld() override = default;

    BodyId createDynamicSphere(const BodyDesc& desc) override;
    bool removeBody(BodyId id) override;
    void step(double dt) override;
    std::optional<BodyState> bodyState(BodyId id) const override;
    std::size_t bodyCount() const override { return bodies.size(); }

    const SphereWorldConfig& getConfig() const { return config; }

    /**
     * @brief Number of sphere pairs that overlapped in the last step
     */
    std::size_t lastContactCount() const { return contacts.size(); }

private:
    struct Body {
        BodyId id;
        Vector3 position;
        Vector3 velocity;
        double radius;
        double invMass;
    };

    void integrate(double dt);
    void findContacts();
    void solvePair(Body& a, Body& b);
    void solveGround(Body& body);
    bool onSlab(const Body& body) const;
    void cullFallen();
    void removeAt(std::size_t index);

    SphereWorldConfig config;
    std::vector<Body> bodies;
    std::unordered_map<BodyId, std::size_t> slotOf;
    BodyId nextId = 1;

    // Scratch buffers reused between steps
    std::unordered_map<uint64_t, std::vector<std::size_t>> grid;
    std::vector<std::pair<std::size_t, std::size_t>> contacts;
};

} // namespace Engine
