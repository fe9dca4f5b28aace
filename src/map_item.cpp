#include "map_item.h"

namespace squarify
{

void MapItem::set_bounds(double x, double y, double w, double h)
{
    bounds_.x = x;
    bounds_.y = y;
    bounds_.w = w;
    bounds_.h = h;
}

MapItemModel::MapItemModel(std::initializer_list<double> sizes)
{
    items_.reserve(sizes.size());
    for (double size : sizes) {
        items_.emplace_back(size);
    }
}

MapItemModel::MapItemModel(const std::vector<double> &sizes)
{
    items_.reserve(sizes.size());
    for (double size : sizes) {
        items_.emplace_back(size);
    }
}

void MapItemModel::add_item(double size) { items_.emplace_back(size); }

std::vector<MapItem *> MapItemModel::items()
{
    std::vector<MapItem *> result;
    result.reserve(items_.size());
    for (auto &item : items_) {
        result.push_back(&item);
    }
    return result;
}

MapItemModel MapItemModel::create_sample_model()
{
    return MapItemModel{6, 6, 4, 3, 2, 2, 1};
}

} // namespace squarify
