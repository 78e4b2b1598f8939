#include "fountain/systems/expiration_reaper.hpp"

#include <vector>

#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"

namespace Systems {

void ExpirationReaper::reap(double now, ParticleStore& store) {
    PROFILE_SCOPE("ExpirationReaper");

    auto& registry = store.getRegistry();
    auto view = registry.view<const Components::Lifetime>();

    // Collect first; destroying while walking the pool would reorder it.
    std::vector<entt::entity> expired;
    for (auto &&[entity, life] : view.each()) {
        if (life.expireTime <= now) {
            expired.push_back(entity);
        }
    }

    registry.destroy(expired.begin(), expired.end());

    if (!expired.empty()) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "ExpirationReaper: removed " << expired.size() << " at t=" << now << "\n");
    }
}

} // namespace Systems
