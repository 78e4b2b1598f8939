#ifndef FOUNTAIN_COMPONENTS_BASIC_HPP
#define FOUNTAIN_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "fountain/math/vector_math.hpp"

namespace Components {

    // Distinct types so that EnTT keeps them in separate pools.
    struct Position : ::Vector3 {
        using ::Vector3::Vector3;
        Position() = default;
        Position(const ::Vector3& v) : ::Vector3(v) {}
    };

    struct Velocity : ::Vector3 {
        using ::Vector3::Vector3;
        Velocity() = default;
        Velocity(const ::Vector3& v) : ::Vector3(v) {}
    };

    // Fixed at creation. expireTime == spawnTime + particleLifetime.
    struct Lifetime {
        double spawnTime;
        double expireTime;
    };

    // Shared by every particle of a store; never stored per entity.
    struct SphereShape {
        double radius;
    };

    // Handle of the body mirroring a particle in the rigid-body world.
    // Only present under the delegated backend.
    struct RigidBody {
        uint32_t bodyId;
    };

} // namespace Components

#endif
