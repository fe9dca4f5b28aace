#pragma once
#include <ostream>

namespace squarify
{

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double w = 1.0;
    double h = 1.0;

    /// @brief Unit square at the origin
    Rect() = default;
    Rect(double x_, double y_, double w_, double h_)
        : x(x_), y(y_), w(w_), h(h_)
    {
    }

    /// @brief max(w/h, h/w), or 0 for a rectangle with a zero dimension
    double aspect_ratio() const;

    bool operator==(const Rect &) const = default;
};

struct Point {
    double x, y;
};

double shorter_side(const Rect &r);
double area(const Rect &r);
bool is_degenerate(const Rect &r);
Point rect_min(const Rect &r);
Point rect_max(const Rect &r);

// Touching edges don't count as overlap
bool overlaps(const Rect &a, const Rect &b, double tolerance = 0.0);

bool within_bounds(const Rect &rect, const Rect &bounds,
                   double tolerance = 0.0);

std::ostream &operator<<(std::ostream &os, const Rect &r);

} // namespace squarify
