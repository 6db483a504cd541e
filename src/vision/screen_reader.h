#ifndef ROUNDWATCH_VISION_SCREEN_READER_H_
#define ROUNDWATCH_VISION_SCREEN_READER_H_

#include <functional>
#include <memory>
#include <string>

#include "common/types.h"

namespace Roundwatch {

/**
 * Source of pixel and text readings for screen regions.
 * One instance is owned by each source worker, so implementations need not be
 * thread safe. Both calls throw ReadError on failure.
 */
class ScreenReader {
public:
    virtual ~ScreenReader() = default;

    /// Mean color of the region.
    virtual Rgb SampleColor(const Region& region) = 0;

    /// Raw text shown in the region.
    virtual std::string ReadText(const Region& region) = 0;
};

/// Builds the reader for one source given its resolved regions.
using ScreenReaderFactory =
    std::function<std::unique_ptr<ScreenReader>(const std::string& source_id, const RegionMap& regions)>;

/**
 * Parses an on-screen number such as "1,234.50" or "2.35x".
 * Spaces, the multiplier suffix and thousands separators are dropped, then
 * anything that is not a digit or a decimal point. Throws ReadError when no
 * number remains.
 */
double ParseNumber(const std::string& text);

/// ParseNumber, truncated to an integer count.
int64_t ParseCount(const std::string& text);

struct PlayerCounts {
    int64_t current = 0;
    int64_t total = 0;
};

/**
 * Parses the player widget, shown as "current/total" (e.g. "12/154" or
 * "131/1,204 players"). A bare count is taken as both values. Throws
 * ReadError on a negative count or more than one separator.
 */
PlayerCounts ParsePlayerCounts(const std::string& text);

} // namespace Roundwatch

#endif // ROUNDWATCH_VISION_SCREEN_READER_H_
