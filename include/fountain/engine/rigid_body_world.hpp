/**
 * @file rigid_body_world.hpp
 * @brief Port through which the delegated backend drives a rigid-body engine
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "fountain/math/vector_math.hpp"

namespace Engine {

using BodyId = uint32_t;

/**
 * @brief Initial state of a dynamic sphere.
 */
struct BodyDesc {
    Vector3 position;
    Vector3 linearVelocity;
    double radius;
};

/**
 * @brief State reported back by the engine after a step.
 */
struct BodyState {
    Vector3 position;
    Vector3 linearVelocity;
};

/**
 * @class IRigidBodyWorld
 * @brief Minimal rigid-body engine surface.
 *
 * The engine owns gravity, collision detection and response against its
 * static geometry and between bodies. Static geometry is set up by whoever
 * builds the world.
 */
class IRigidBodyWorld {
public:
    virtual ~IRigidBodyWorld() = default;

    virtual BodyId createDynamicSphere(const BodyDesc& desc) = 0;

    /**
     * @return false if the engine does not know the body
     */
    virtual bool removeBody(BodyId id) = 0;

    virtual void step(double dt) = 0;

    /**
     * @return std::nullopt if the engine no longer tracks the body
     */
    virtual std::optional<BodyState> bodyState(BodyId id) const = 0;

    virtual std::size_t bodyCount() const = 0;
};

} // namespace Engine
