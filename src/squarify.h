#pragma once
#include <algorithm>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <ranges>
#include <string>

#include "mappable.h"
#include "rect.h"
#if TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace squarify
{

enum class RowStrategy {
    // Forward greedy scan on the normalized aspect metric. Matches the
    // reference layouts exactly; areas are close to but not exactly
    // proportional to sizes.
    NormalizedAspect,
    // Bruls/Huizing/van Wijk worst aspect ratio test; areas are exactly
    // proportional to sizes.
    WorstAspect,
};

struct LayoutOptions {
    RowStrategy strategy = RowStrategy::NormalizedAspect;
};

enum class LayoutErrorKind {
    NegativeSize,
    NonFiniteSize,
    // Sizes are finite individually but their sum is not
    TotalOverflow,
    InvalidBounds,
};

struct LayoutError {
    LayoutErrorKind kind;
    std::string what;
};

std::expected<void, LayoutError> validate_bounds(const Rect &bounds);
std::expected<void, LayoutError> validate_size(size_t index, double size);
std::expected<void, LayoutError> validate_total(double total);

double aspect(double big, double small, double a, double b);

// Always >= 1, 1 being a perfect square
double norm_aspect(double big, double small, double a, double b);

double worst_aspect_ratio(double row_area, double max_area, double min_area,
                          double side);

// Last index (inclusive) of the next row and the row's share of the
// current bounds along the split axis
struct RowSplit {
    size_t last;
    double share;
};

template <MappableRange R>
double total_size(const R &items, size_t start, size_t end)
{
    double sum = 0.0;
    for (size_t i = start; i < end; i++) {
        sum += size_of(items[i]);
    }
    return sum;
}

template <MappableRange R> double total_size(const R &items)
{
    return total_size(items, 0, std::ranges::size(items));
}

/// @brief Stable sort by descending size. Items of equal size keep their
/// relative order, which makes repeated layouts of the same input identical.
template <MappableRange R> void sort_descending(R &items)
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    std::ranges::stable_sort(
        items, std::ranges::greater{},
        [](const auto &element) { return size_of(element); });
}

template <MappableRange R>
std::expected<void, LayoutError> validate_items(const R &items,
                                                const Rect &bounds)
{
    if (auto valid = validate_bounds(bounds); !valid) {
        return valid;
    }
    for (size_t i = 0; i < std::ranges::size(items); i++) {
        if (auto valid = validate_size(i, size_of(items[i])); !valid) {
            return valid;
        }
    }
    return validate_total(total_size(items));
}

/// @brief Lay out items [start, end] side by side in a single row filling
/// bounds. Items are distributed along the longer side of bounds.
template <MappableRange R>
void layout_row(R &items, size_t start, size_t end, const Rect &bounds)
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    const bool is_horizontal = bounds.w > bounds.h;
    const double total = total_size(items, start, end + 1);
    double offset = 0.0;

    for (size_t i = start; i <= end; i++) {
        // A row without any size collapses into zero-extent slices
        const double ratio = total > 0.0 ? size_of(items[i]) / total : 0.0;
        Rect r;
        if (is_horizontal) {
            r.x = bounds.x + bounds.w * offset;
            r.w = bounds.w * ratio;
            r.y = bounds.y;
            r.h = bounds.h;
        } else {
            r.x = bounds.x;
            r.w = bounds.w;
            r.y = bounds.y + bounds.h * offset;
            r.h = bounds.h * ratio;
        }
        item_of(items[i]).set_bounds(r);
        offset += ratio;
    }
}

template <MappableRange R>
std::optional<RowSplit> select_row_normalized_aspect(const R &items,
                                                     size_t start, size_t end,
                                                     const Rect &bounds)
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    // Shares are taken relative to the range without its last item
    const double total = total_size(items, start, end);
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    const bool split_height = bounds.w < bounds.h;
    const double big = split_height ? bounds.h : bounds.w;
    const double small = split_height ? bounds.w : bounds.h;

    const double a = size_of(items[start]) / total;
    double b = a;
    size_t mid = start;
    while (mid <= end) {
        const double current = norm_aspect(big, small, a, b);
        const double q = size_of(items[mid]) / total;
        if (norm_aspect(big, small, a, b + q) > current) {
            break;
        }
        mid++;
        b += q;
    }

    // Every accepted step keeps b <= 1 (a <= 1 and small <= big), so the
    // row never claims more than bounds and never takes the last item.
    // The clamps only protect against rounding.
    return RowSplit{.last = std::min(mid, end),
                    .share = std::clamp(b, 0.0, 1.0)};
}

template <MappableRange R>
std::optional<RowSplit> select_row_worst_aspect(const R &items, size_t start,
                                                size_t end, const Rect &bounds)
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    const double total = total_size(items, start, end + 1);
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    // Sizes scaled so the whole range fills exactly the area of bounds
    const double scale = area(bounds) / total;
    const double side = shorter_side(bounds);

    double row_size = size_of(items[start]);
    const double max_area = row_size * scale;
    double current_worst =
        worst_aspect_ratio(max_area, max_area, max_area, side);
    size_t last = start;

    while (last < end) {
        const double next_size = size_of(items[last + 1]);
        // Zero-size items add no area and can't worsen the row
        if (next_size > 0.0) {
            const double candidate =
                worst_aspect_ratio((row_size + next_size) * scale, max_area,
                                   next_size * scale, side);
            if (candidate > current_worst) {
                break;
            }
            current_worst = candidate;
        }
        row_size += next_size;
        last++;
    }

    return RowSplit{.last = last,
                    .share = std::clamp(row_size / total, 0.0, 1.0)};
}

/// @brief Recursively partition bounds among the sorted items [start, end]:
/// pick a row of leading items, give it a slice of bounds along the longer
/// side, and continue with the remaining items in the rest of bounds.
template <MappableRange R>
void layout_range(R &items, size_t start, size_t end, const Rect &bounds,
                  const LayoutOptions &options = {})
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    if (start > end) {
        return;
    }
    if (end - start < 2 || is_degenerate(bounds)) {
        layout_row(items, start, end, bounds);
        return;
    }

    const std::optional<RowSplit> split =
        options.strategy == RowStrategy::WorstAspect
            ? select_row_worst_aspect(items, start, end, bounds)
            : select_row_normalized_aspect(items, start, end, bounds);
    if (!split) {
        layout_row(items, start, end, bounds);
        return;
    }

    const double x = bounds.x;
    const double y = bounds.y;
    const double w = bounds.w;
    const double h = bounds.h;
    const double b = split->share;

    if (w < h) {
        layout_row(items, start, split->last, Rect(x, y, w, h * b));
        layout_range(items, split->last + 1, end,
                     Rect(x, y + h * b, w, h * (1.0 - b)), options);
    } else {
        layout_row(items, start, split->last, Rect(x, y, w * b, h));
        layout_range(items, split->last + 1, end,
                     Rect(x + w * b, y, w * (1.0 - b), h), options);
    }
}

/// @brief Main entry point: arrange items to fill bounds.
/// @tparam R random access range of Mappable items or pointers to them
/// @param items reordered by descending size, every item gets new bounds
/// @param bounds rectangle to fill
/// @param options row selection strategy
/// @return LayoutError for negative or non-finite sizes and invalid bounds,
/// in which case items are left untouched
template <MappableRange R>
std::expected<void, LayoutError> layout_items(R &items, const Rect &bounds,
                                              const LayoutOptions &options = {})
{
#if TRACY_ENABLE
    ZoneScoped;
#endif
    if (auto valid = validate_items(items, bounds); !valid) {
        return valid;
    }

    const size_t count = std::ranges::size(items);
    if (count == 0) {
        return {};
    }

    sort_descending(items);
    layout_range(items, 0, count - 1, bounds, options);
    return {};
}

template <MapModel M>
std::expected<void, LayoutError> layout(M &model, const Rect &bounds,
                                        const LayoutOptions &options = {})
{
    auto items = model.items();
    return layout_items(items, bounds, options);
}

} // namespace squarify
