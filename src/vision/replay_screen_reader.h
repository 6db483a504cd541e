#ifndef ROUNDWATCH_VISION_REPLAY_SCREEN_READER_H_
#define ROUNDWATCH_VISION_REPLAY_SCREEN_READER_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "vision/screen_reader.h"

namespace Roundwatch {

struct ReplayFrame {
    Rgb phase;
    // role -> text shown in that region
    std::map<std::string, std::string> text;
};

struct ReplayTrace {
    bool loop = false;
    std::vector<ReplayFrame> frames;
};

/**
 * Trace file layout:
 *   sources:
 *     <source id or "default">:
 *       loop: false
 *       frames:
 *         - phase: [r, g, b]
 *           score: "1.52x"
 *           my_money: "35,000"
 * Throws ConfigError if the file cannot be parsed.
 */
std::map<std::string, ReplayTrace> LoadReplayTraces(const std::string& path);
std::map<std::string, ReplayTrace> LoadReplayTracesFromString(const std::string& yaml_content);

/**
 * Plays back a recorded trace instead of looking at the screen.
 * Every SampleColor() moves to the next frame; ReadText() answers from the
 * current frame (the first one before any sample was taken).
 */
class ReplayScreenReader : public ScreenReader {
public:
    ReplayScreenReader(std::string source_id, RegionMap regions, ReplayTrace trace);

    Rgb SampleColor(const Region& region) override;
    std::string ReadText(const Region& region) override;

    size_t frames_played() const { return frames_played_; }
    bool exhausted() const { return !trace_.loop && next_frame_ >= trace_.frames.size(); }

private:
    std::string RoleOf(const Region& region) const;

    std::string source_id_;
    RegionMap regions_;
    ReplayTrace trace_;
    size_t next_frame_ = 0;
    std::optional<size_t> current_frame_;
    size_t frames_played_ = 0;
};

/// Per-source trace, falling back to the "default" entry. Throws ConfigError
/// from the returned factory when neither exists.
ScreenReaderFactory MakeReplayReaderFactory(std::map<std::string, ReplayTrace> traces);

} // namespace Roundwatch

#endif // ROUNDWATCH_VISION_REPLAY_SCREEN_READER_H_
