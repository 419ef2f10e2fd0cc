#ifndef PENSYNC_HID_SYNC_PATH_H
#define PENSYNC_HID_SYNC_PATH_H

#include <vector>

namespace pensync {
namespace hid {

struct PathPoint {
  float x{0};
  float y{0};

  bool operator==(const PathPoint& other) const {
    return x == other.x && y == other.y;
  }
};

/**
 * A drawn stroke: the points in drawing order and a stroke width.
 */
class SyncPath {
 public:
  SyncPath() = default;

  void moveTo(float x, float y) { points_.push_back(PathPoint{x, y}); }
  void lineTo(float x, float y) { points_.push_back(PathPoint{x, y}); }

  void setStrokeWidth(float width) { stroke_width_ = width; }
  float strokeWidth() const { return stroke_width_; }

  const std::vector<PathPoint>& points() const { return points_; }
  bool empty() const { return points_.empty(); }

 private:
  std::vector<PathPoint> points_;
  float stroke_width_{0};
};

}  // namespace hid
}  // namespace pensync

#endif  // PENSYNC_HID_SYNC_PATH_H
