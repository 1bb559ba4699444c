#include "arena/components/basic.hpp"

#include <cmath>

namespace Components {

namespace {

bool isPresent(double value) {
    return value != 0.0 && !std::isnan(value);
}

} // namespace

Collider Collider::fromRadius(double radius) {
    Collider c;
    c.kind = ColliderKind::Radius;
    c.radius = radius;
    return c;
}

Collider Collider::fromSize(double size) {
    Collider c;
    c.kind = ColliderKind::Size;
    c.size = size;
    return c;
}

Collider Collider::fromRadiusAndSize(double radius, double size) {
    Collider c;
    c.kind = ColliderKind::RadiusAndSize;
    c.radius = radius;
    c.size = size;
    return c;
}

Collider Collider::resolve(double radius, double size) {
    bool const r = isPresent(radius);
    bool const s = isPresent(size);
    if (r && s) {
        return fromRadiusAndSize(radius, size);
    }
    if (r) {
        return fromRadius(radius);
    }
    if (s) {
        return fromSize(size);
    }
    return Collider{};
}

} // namespace Components
