#include "squarify.h"

#include <cmath>
#include <sstream>

namespace squarify
{

std::expected<void, LayoutError> validate_bounds(const Rect &bounds)
{
    const bool finite = std::isfinite(bounds.x) && std::isfinite(bounds.y) &&
                        std::isfinite(bounds.w) && std::isfinite(bounds.h);
    if (!finite || bounds.w < 0.0 || bounds.h < 0.0) {
        std::ostringstream message;
        message << "Invalid layout bounds: " << bounds;
        return std::unexpected(LayoutError{
            .kind = LayoutErrorKind::InvalidBounds, .what = message.str()});
    }
    return {};
}

std::expected<void, LayoutError> validate_size(size_t index, double size)
{
    if (!std::isfinite(size)) {
        return std::unexpected(
            LayoutError{.kind = LayoutErrorKind::NonFiniteSize,
                        .what = "Item " + std::to_string(index) +
                                " has a non-finite size"});
    }
    if (size < 0.0) {
        return std::unexpected(
            LayoutError{.kind = LayoutErrorKind::NegativeSize,
                        .what = "Item " + std::to_string(index) +
                                " has negative size " + std::to_string(size)});
    }
    return {};
}

std::expected<void, LayoutError> validate_total(double total)
{
    if (!std::isfinite(total)) {
        return std::unexpected(
            LayoutError{.kind = LayoutErrorKind::TotalOverflow,
                        .what = "Total item size is not representable"});
    }
    return {};
}

double aspect(double big, double small, double a, double b)
{
    return (big * b) / (small * a / b);
}

double norm_aspect(double big, double small, double a, double b)
{
    const double x = aspect(big, small, a, b);
    if (x < 1.0) {
        return 1.0 / x;
    }
    return x;
}

double worst_aspect_ratio(double row_area, double max_area, double min_area,
                          double side)
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    return std::max((side * side * max_area) / (row_area * row_area),
                    (row_area * row_area) / (side * side * min_area));
}

} // namespace squarify
