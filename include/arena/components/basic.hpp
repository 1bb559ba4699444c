#ifndef ARENA_COMPONENTS_BASIC_HPP
#define ARENA_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "arena/math/vector_math.hpp"

namespace Components {

    // World position of the entity's center, in pixels
    using Position = ::Position;

    /**
     * @brief Which extent fields an entity carried when it was created.
     *
     * Resolved once by Collider::resolve so collision checks never probe
     * for fields at call time.
     */
    enum class ColliderKind : std::uint8_t {
        Default,        // neither radius nor size; uses the configured fallback
        Radius,
        Size,           // size doubles as a radius
        RadiusAndSize
    };

    struct Collider {
        ColliderKind kind = ColliderKind::Default;
        double radius = 0.0;
        double size = 0.0;

        bool hasRadius() const {
            return kind == ColliderKind::Radius || kind == ColliderKind::RadiusAndSize;
        }

        bool hasSize() const {
            return kind == ColliderKind::Size || kind == ColliderKind::RadiusAndSize;
        }

        static Collider fromRadius(double radius);
        static Collider fromSize(double size);
        static Collider fromRadiusAndSize(double radius, double size);

        /**
         * @brief Builds a collider from raw entity fields.
         *
         * A zero or NaN value counts as "not present", so an entity with
         * radius 0 falls back to its size, then to the default radius.
         */
        static Collider resolve(double radius, double size);
    };

    // Participation flags. Entities without this component are active and alive.
    struct Lifecycle {
        bool isActive = true;
        bool isDead = false;
    };

} // namespace Components

#endif // ARENA_COMPONENTS_BASIC_HPP
