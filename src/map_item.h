#pragma once
#include <cstddef>
#include <initializer_list>
#include <vector>

#include "mappable.h"
#include "rect.h"

namespace squarify
{

class MapItem
{
  public:
    MapItem() = default;
    explicit MapItem(double size) : size_(size) {}

    // Mappable concept interface
    double size() const { return size_; }
    const Rect &bounds() const { return bounds_; }
    void set_bounds(const Rect &bounds) { bounds_ = bounds; }

    void set_size(double size) { size_ = size; }
    void set_bounds(double x, double y, double w, double h);

  private:
    double size_ = 1.0;
    Rect bounds_;
};

/// @brief Model owning a flat list of MapItems. items() hands out pointers
/// into the owned storage, so a layout writes straight into the model.
/// Those pointers are invalidated by add_item(); call items() again after
/// adding.
class MapItemModel
{
  public:
    MapItemModel() = default;
    MapItemModel(std::initializer_list<double> sizes);
    explicit MapItemModel(const std::vector<double> &sizes);

    void add_item(double size);

    // MapModel concept interface
    std::vector<MapItem *> items();

    const std::vector<MapItem> &stored_items() const { return items_; }
    size_t item_count() const { return items_.size(); }

    // The seven item example from the squarified treemap paper
    static MapItemModel create_sample_model();

  private:
    std::vector<MapItem> items_;
};

static_assert(Mappable<MapItem>);
static_assert(MapModel<MapItemModel>);

} // namespace squarify
