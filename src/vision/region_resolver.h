#ifndef ROUNDWATCH_VISION_REGION_RESOLVER_H_
#define ROUNDWATCH_VISION_REGION_RESOLVER_H_

#include <map>
#include <string>

#include "common/types.h"

namespace Roundwatch {

/// Shifts every base region by the offset. Width and height are kept.
RegionMap ApplyOffset(const RegionMap& base_regions, const PositionOffset& offset);

/**
 * Turns (layout, position) pairs into absolute screen regions.
 * Immutable after construction, so safe to share across threads.
 */
class RegionResolver {
public:
    RegionResolver(std::map<std::string, RegionMap> layouts,
                   std::map<std::string, PositionOffset> positions);

    /// Throws ConfigError if the layout or position is unknown.
    RegionMap Resolve(const std::string& layout, const std::string& position) const;

    /// Resolve and check that every role a source worker needs is present.
    RegionMap ResolveForSource(const std::string& source_id, const std::string& layout,
                               const std::string& position) const;

private:
    std::map<std::string, RegionMap> layouts_;
    std::map<std::string, PositionOffset> positions_;
};

} // namespace Roundwatch

#endif // ROUNDWATCH_VISION_REGION_RESOLVER_H_
