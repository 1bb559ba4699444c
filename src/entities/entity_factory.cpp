#include "arena/entities/entity_factory.hpp"

namespace Entities {

entt::entity EntityFactory::createCircle(entt::registry& registry,
                                         const Components::Position& position,
                                         double radius) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Collider>(entity, Components::Collider::fromRadius(radius));
    registry.emplace<Components::Lifecycle>(entity);
    return entity;
}

entt::entity EntityFactory::createSized(entt::registry& registry,
                                        const Components::Position& position,
                                        double size) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Collider>(entity, Components::Collider::fromSize(size));
    registry.emplace<Components::Lifecycle>(entity);
    return entity;
}

entt::entity EntityFactory::createCollidable(entt::registry& registry,
                                             const Components::Position& position,
                                             double radius,
                                             double size) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Collider>(entity, Components::Collider::resolve(radius, size));
    registry.emplace<Components::Lifecycle>(entity);
    return entity;
}

void EntityFactory::setActive(entt::registry& registry, entt::entity entity, bool active) {
    registry.get_or_emplace<Components::Lifecycle>(entity).isActive = active;
}

void EntityFactory::markDead(entt::registry& registry, entt::entity entity) {
    registry.get_or_emplace<Components::Lifecycle>(entity).isDead = true;
}

} // namespace Entities
