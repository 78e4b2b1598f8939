/**
 * @file sphere_world.cpp
 * @brief Implementation of the sphere rigid-body world
 */

#include "fountain/engine/sphere_world.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"

namespace Engine {

namespace {

/**
 * @brief Packs integer cell coordinates into one key (21 bits per axis)
 */
uint64_t cellKey(int64_t ix, int64_t iy, int64_t iz) {
    constexpr uint64_t mask = (1ULL << 21) - 1;
    return ((static_cast<uint64_t>(ix) & mask) << 42) |
           ((static_cast<uint64_t>(iy) & mask) << 21) |
           (static_cast<uint64_t>(iz) & mask);
}

int64_t cellCoord(double v, double cellSize) {
    return static_cast<int64_t>(std::floor(v / cellSize));
}

} // namespace

SphereWorld::SphereWorld(const SphereWorldConfig& config)
    : config(config)
{
}

BodyId SphereWorld::createDynamicSphere(const BodyDesc& desc) {
    Body body;
    body.id = nextId++;
    body.position = desc.position;
    body.velocity = desc.linearVelocity;
    body.radius = desc.radius;
    body.invMass = 1.0 / (desc.radius * desc.radius * desc.radius);

    slotOf[body.id] = bodies.size();
    bodies.push_back(body);
    return body.id;
}

bool SphereWorld::removeBody(BodyId id) {
    auto it = slotOf.find(id);
    if (it == slotOf.end()) {
        return false;
    }
    removeAt(it->second);
    return true;
}

void SphereWorld::removeAt(std::size_t index) {
    slotOf.erase(bodies[index].id);
    if (index != bodies.size() - 1) {
        bodies[index] = bodies.back();
        slotOf[bodies[index].id] = index;
    }
    bodies.pop_back();
}

std::optional<BodyState> SphereWorld::bodyState(BodyId id) const {
    auto it = slotOf.find(id);
    if (it == slotOf.end()) {
        return std::nullopt;
    }
    const Body& body = bodies[it->second];
    return BodyState{body.position, body.velocity};
}

void SphereWorld::step(double dt) {
    PROFILE_SCOPE("SphereWorld");

    integrate(dt);
    findContacts();

    for (int iter = 0; iter < config.solverIterations; ++iter) {
        for (const auto& [i, j] : contacts) {
            solvePair(bodies[i], bodies[j]);
        }
        for (auto& body : bodies) {
            solveGround(body);
        }
    }

    cullFallen();
}

void SphereWorld::integrate(double dt) {
    for (auto& body : bodies) {
        body.velocity.y -= config.gravity * dt;
        body.position += body.velocity * dt;
    }
}

void SphereWorld::findContacts() {
    contacts.clear();
    for (auto& cell : grid) {
        cell.second.clear();
    }
    if (bodies.empty()) {
        return;
    }

    double maxRadius = 0.0;
    for (const auto& body : bodies) {
        maxRadius = std::max(maxRadius, body.radius);
    }
    double const cellSize = 2.0 * maxRadius;

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        const Vector3& p = bodies[i].position;
        grid[cellKey(cellCoord(p.x, cellSize), cellCoord(p.y, cellSize), cellCoord(p.z, cellSize))]
            .push_back(i);
    }

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        const Body& a = bodies[i];
        int64_t const cx = cellCoord(a.position.x, cellSize);
        int64_t const cy = cellCoord(a.position.y, cellSize);
        int64_t const cz = cellCoord(a.position.z, cellSize);

        for (int64_t dx = -1; dx <= 1; ++dx) {
            for (int64_t dy = -1; dy <= 1; ++dy) {
                for (int64_t dz = -1; dz <= 1; ++dz) {
                    auto it = grid.find(cellKey(cx + dx, cy + dy, cz + dz));
                    if (it == grid.end()) {
                        continue;
                    }
                    for (std::size_t const j : it->second) {
                        if (j <= i) {
                            continue;
                        }
                        const Body& b = bodies[j];
                        double const reach = a.radius + b.radius;
                        if ((b.position - a.position).lengthSquared() < reach * reach) {
                            contacts.emplace_back(i, j);
                        }
                    }
                }
            }
        }
    }

    // Drop empty cells so the map does not grow with every cell ever visited.
    for (auto it = grid.begin(); it != grid.end();) {
        it = it->second.empty() ? grid.erase(it) : std::next(it);
    }
}

void SphereWorld::solvePair(Body& a, Body& b) {
    Vector3 const delta = b.position - a.position;
    double const dist = delta.length();
    double const penetration = a.radius + b.radius - dist;
    if (penetration <= 0.0) {
        return;
    }

    // Coincident centres: push apart vertically
    Vector3 const normal = dist > EPSILON ? delta / dist : Vector3(0.0, 1.0, 0.0);
    double const invSum = a.invMass + b.invMass;

    // Positional correction, split by inverse mass
    a.position -= normal * (penetration * a.invMass / invSum);
    b.position += normal * (penetration * b.invMass / invSum);

    Vector3 const relVel = b.velocity - a.velocity;
    double const approach = relVel.dotProduct(normal);
    if (approach >= 0.0) {
        return;
    }

    double const jn = -(1.0 + config.restitution) * approach / invSum;
    a.velocity -= normal * (jn * a.invMass);
    b.velocity += normal * (jn * b.invMass);

    // Tangential friction on the pre-impulse sliding velocity
    Vector3 const tangent = relVel - normal * approach;
    Vector3 const jt = tangent * (config.friction / invSum);
    a.velocity += jt * a.invMass;
    b.velocity -= jt * b.invMass;
}

bool SphereWorld::onSlab(const Body& body) const {
    double const h = config.groundHalfExtent;
    double const bottom = body.position.y - body.radius;
    return std::fabs(body.position.x) <= h && std::fabs(body.position.z) <= h &&
           bottom < config.groundHeight &&
           bottom > config.groundHeight - config.groundThickness;
}

void SphereWorld::solveGround(Body& body) {
    if (!onSlab(body)) {
        return;
    }

    body.position.y = config.groundHeight + body.radius;

    if (body.velocity.y < 0.0) {
        body.velocity.y = -body.velocity.y * config.restitution;
        if (body.velocity.y < config.restingSpeed) {
            body.velocity.y = 0.0;
        }
        body.velocity.x *= config.horizontalDamping;
        body.velocity.z *= config.horizontalDamping;
    }
}

void SphereWorld::cullFallen() {
    double const limit = config.groundHeight - config.fallLimit;
    std::size_t removed = 0;
    for (std::size_t i = bodies.size(); i-- > 0;) {
        if (bodies[i].position.y < limit) {
            removeAt(i);
            ++removed;
        }
    }
    if (removed > 0) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "SphereWorld: culled " << removed << " fallen bodies\n");
    }
}

} // namespace Engine
