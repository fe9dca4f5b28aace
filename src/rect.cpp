#include "rect.h"

#include <algorithm>

namespace squarify
{

double Rect::aspect_ratio() const
{
    if (w == 0.0 || h == 0.0) {
        return 0.0;
    }
    return std::max(w / h, h / w);
}

double shorter_side(const Rect &r) { return std::min(r.w, r.h); }
double area(const Rect &r) { return r.w * r.h; }
bool is_degenerate(const Rect &r) { return !(r.w > 0.0 && r.h > 0.0); }
Point rect_min(const Rect &r) { return {r.x, r.y}; }
Point rect_max(const Rect &r) { return {r.x + r.w, r.y + r.h}; }

static bool less_than_or_equal(const Point &a, const Point &b,
                               double tolerance)
{
    return a.x <= b.x + tolerance || a.y <= b.y + tolerance;
}

bool overlaps(const Rect &a, const Rect &b, double tolerance)
{
    return !(less_than_or_equal(rect_max(a), rect_min(b), tolerance) ||
             less_than_or_equal(rect_max(b), rect_min(a), tolerance));
}

bool within_bounds(const Rect &rect, const Rect &bounds, double tolerance)
{
    return rect.x >= bounds.x - tolerance && rect.y >= bounds.y - tolerance &&
           rect.x + rect.w <= bounds.x + bounds.w + tolerance &&
           rect.y + rect.h <= bounds.y + bounds.h + tolerance;
}

std::ostream &operator<<(std::ostream &os, const Rect &r)
{
    return os << "(" << r.x << ", " << r.y << ", " << r.w << ", " << r.h
              << ")";
}

} // namespace squarify
