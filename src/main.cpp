#include "map_item.h"
#include "squarify.h"

#include <charconv>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>
#if TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

using namespace squarify;

static void print_usage(const char *program)
{
    std::cerr << "Usage: " << program
              << " [--strategy normalized|worst] [--bounds W H] [size...]\n";
}

static std::optional<double> parse_double(std::string_view text)
{
    double value = 0.0;
    const auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

int main(int argc, char **argv)
{
    LayoutOptions options;
    Rect bounds(0, 0, 6, 4);
    std::vector<double> sizes;

    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--strategy" && i + 1 < argc) {
            const std::string_view name = argv[++i];
            if (name == "normalized") {
                options.strategy = RowStrategy::NormalizedAspect;
            } else if (name == "worst") {
                options.strategy = RowStrategy::WorstAspect;
            } else {
                std::cerr << "Unknown strategy: " << name << std::endl;
                return 1;
            }
        } else if (arg == "--bounds" && i + 2 < argc) {
            const auto w = parse_double(argv[++i]);
            const auto h = parse_double(argv[++i]);
            if (!w || !h) {
                std::cerr << "Invalid bounds" << std::endl;
                return 1;
            }
            bounds = Rect(0, 0, *w, *h);
        } else if (const auto size = parse_double(arg)) {
            sizes.push_back(*size);
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    MapItemModel model = sizes.empty() ? MapItemModel::create_sample_model()
                                       : MapItemModel(sizes);

    auto items = model.items();
    if (auto result = layout_items(items, bounds, options); !result) {
        std::cerr << "Layout failed: " << result.error().what << std::endl;
        return 1;
    }

    std::cout << "Bounds: " << bounds << "\n";
    for (const MapItem *item : items) {
        std::cout << item->size() << ": " << item->bounds()
                  << " aspect " << item->bounds().aspect_ratio() << "\n";
    }

#if TRACY_ENABLE
    FrameMark;
#endif
    return 0;
}
