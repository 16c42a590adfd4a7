#include "stack/scene.h"

#include <fmt/format.h>

namespace stack {
std::string UtmZone::epsg() const
{
    return fmt::format("EPSG:{}{:02d}", north() ? 326 : 327, zone);
}

Scene Scene::with_path(fs::path new_path) const
{
    Scene scene = *this;
    scene.path = std::move(new_path);
    return scene;
}

std::string describe(ClipSpec const& clip)
{
    return std::visit(
        Visitor {
            [](NoClip const&) { return std::string("no clipping"); },
            [](Overlap const&) { return std::string("common overlap"); },
            [](BoundingBox const& box) {
                return fmt::format("bounding box {} {} {} {}", box.area.west, box.area.north, box.area.east, box.area.south);
            },
            [](ShapeFile const& shape) { return fmt::format("shape file {}", shape.path.string()); } },
        clip);
}

std::vector<fs::path> paths(StackState const& state)
{
    return state
        | ranges::views::transform([](Scene const& scene) { return scene.path; })
        | ranges::to<std::vector>();
}
}
