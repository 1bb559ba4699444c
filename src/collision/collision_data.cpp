#include "arena/collision/collision_data.hpp"
#include "arena/components/basic.hpp"

namespace Collision {

bool participates(const entt::registry &registry, entt::entity entity) {
    if (!registry.valid(entity)) {
        return false;
    }
    const auto *lifecycle = registry.try_get<Components::Lifecycle>(entity);
    return lifecycle == nullptr || (lifecycle->isActive && !lifecycle->isDead);
}

} // namespace Collision
