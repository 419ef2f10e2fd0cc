#include "pensync/hid/stroke_path_filter.h"

#include <algorithm>

namespace pensync {
namespace hid {

float StrokePathFilter::strokeWidthForPressure(uint16_t pressure) {
  float ratio = static_cast<float>(std::min(pressure, kMaxPressure)) /
                static_cast<float>(kMaxPressure);
  return kMinStrokeWidth + ratio * (kMaxStrokeWidth - kMinStrokeWidth);
}

std::vector<SyncPath> StrokePathFilter::filter(const CaptureReport& report) {
  std::vector<SyncPath> completed;
  PathPoint point{static_cast<float>(report.x), static_cast<float>(report.y)};

  if (report.tipDown()) {
    if (!current_) {
      current_ = SyncPath();
      current_->moveTo(point.x, point.y);
      peak_pressure_ = report.pressure;
    } else {
      if (!(point == last_point_)) {
        current_->lineTo(point.x, point.y);
      }
      peak_pressure_ = std::max(peak_pressure_, report.pressure);
    }
    last_point_ = point;
    return completed;
  }

  if (current_) {
    current_->setStrokeWidth(strokeWidthForPressure(peak_pressure_));
    completed.push_back(std::move(*current_));
    reset();
  }
  return completed;
}

void StrokePathFilter::reset() {
  current_.reset();
  peak_pressure_ = 0;
  last_point_ = PathPoint();
}

}  // namespace hid
}  // namespace pensync
