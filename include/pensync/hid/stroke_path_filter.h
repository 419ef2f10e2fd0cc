#ifndef PENSYNC_HID_STROKE_PATH_FILTER_H
#define PENSYNC_HID_STROKE_PATH_FILTER_H

#include <memory>
#include <vector>

#include "pensync/core/compat.h"
#include "pensync/hid/report_decoder.h"
#include "pensync/hid/sync_path.h"

namespace pensync {
namespace hid {

/**
 * Turns a stream of capture reports into completed paths.
 */
class PathFilter {
 public:
  virtual ~PathFilter() = default;

  /**
   * Feed one report. Returns the paths completed by it, usually none.
   */
  virtual std::vector<SyncPath> filter(const CaptureReport& report) = 0;

  /**
   * Forget any stroke in progress.
   */
  virtual void reset() = 0;
};

using PathFilterPtr = std::unique_ptr<PathFilter>;

/**
 * Tip down starts a path, motion with the tip down extends it and tip up
 * completes it. The stroke width scales linearly with the peak pressure
 * seen during the stroke, from kMinStrokeWidth to kMaxStrokeWidth.
 */
class StrokePathFilter : public PathFilter {
 public:
  static constexpr float kMinStrokeWidth = 1.0f;
  static constexpr float kMaxStrokeWidth = 5.0f;
  static constexpr uint16_t kMaxPressure = 1023;

  std::vector<SyncPath> filter(const CaptureReport& report) override;
  void reset() override;

  static float strokeWidthForPressure(uint16_t pressure);

 private:
  optional<SyncPath> current_;
  PathPoint last_point_;
  uint16_t peak_pressure_{0};
};

}  // namespace hid
}  // namespace pensync

#endif  // PENSYNC_HID_STROKE_PATH_FILTER_H
