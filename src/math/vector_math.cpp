#include "arena/math/vector_math.hpp"

#include <cmath>

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

double Vector::length() const {
    return std::sqrt(x * x + y * y);
}

Vector Vector::normalized() const {
    double const len = length();
    if (len > 0.0) {
        return {x / len, y / len};
    }
    return {};
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Vector Position::operator-(const Position& from) const {
    return {this->x - from.x, this->y - from.y};
}

// Point helpers

double pointDistance(double x1, double y1, double x2, double y2) {
    double const dx = x2 - x1;
    double const dy = y2 - y1;
    return std::sqrt(dx * dx + dy * dy);
}

double pointAngle(double x1, double y1, double x2, double y2) {
    return std::atan2(y2 - y1, x2 - x1);
}
