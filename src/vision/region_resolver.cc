#include "region_resolver.h"

#include <utility>

#include "common/errors.h"

namespace Roundwatch {

RegionMap ApplyOffset(const RegionMap& base_regions, const PositionOffset& offset) {
    RegionMap absolute;
    for (const auto& [role, region] : base_regions) {
        absolute[role] = Region{region.left + offset.left, region.top + offset.top,
                                region.width, region.height};
    }
    return absolute;
}

RegionResolver::RegionResolver(std::map<std::string, RegionMap> layouts,
                               std::map<std::string, PositionOffset> positions)
    : layouts_(std::move(layouts)), positions_(std::move(positions)) {}

RegionMap RegionResolver::Resolve(const std::string& layout, const std::string& position) const {
    auto layout_it = layouts_.find(layout);
    if (layout_it == layouts_.end()) {
        throw ConfigError("Unknown layout '" + layout + "'");
    }
    auto position_it = positions_.find(position);
    if (position_it == positions_.end()) {
        throw ConfigError("Unknown position '" + position + "' for layout '" + layout + "'");
    }
    return ApplyOffset(layout_it->second, position_it->second);
}

RegionMap RegionResolver::ResolveForSource(const std::string& source_id, const std::string& layout,
                                           const std::string& position) const {
    RegionMap regions = Resolve(layout, position);
    for (const auto& role : RequiredRoles()) {
        auto it = regions.find(role);
        if (it == regions.end()) {
            throw ConfigError("Source " + source_id + ": layout '" + layout + "' has no '" + role + "' region");
        }
        if (it->second.width <= 0 || it->second.height <= 0) {
            throw ConfigError("Source " + source_id + ": region '" + role + "' has an empty area");
        }
    }
    return regions;
}

} // namespace Roundwatch
