#ifndef PENSYNC_HID_REPORT_DECODER_H
#define PENSYNC_HID_REPORT_DECODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "pensync/core/compat.h"

namespace pensync {
namespace hid {

// Capture report flag bits
constexpr uint8_t kFlagTip = 0x01;
constexpr uint8_t kFlagBarrel = 0x02;
constexpr uint8_t kFlagErase = 0x04;
constexpr uint8_t kFlagSave = 0x08;

// Bytes after the report id: x, y, pressure (u16 LE each) and flags
constexpr size_t kCapturePayloadSize = 7;

/**
 * Live stylus sample with button state.
 */
struct CaptureReport {
  uint16_t x{0};
  uint16_t y{0};
  uint16_t pressure{0};
  uint8_t flags{0};

  bool tipDown() const { return (flags & kFlagTip) != 0; }
  bool barrelPressed() const { return (flags & kFlagBarrel) != 0; }
  bool hasEraseFlag() const { return (flags & kFlagErase) != 0; }
  bool hasSaveFlag() const { return (flags & kFlagSave) != 0; }

  bool operator==(const CaptureReport& other) const {
    return x == other.x && y == other.y && pressure == other.pressure &&
           flags == other.flags;
  }
};

/**
 * Input report with an id the decoder does not interpret.
 */
struct UnrecognizedReport {
  uint8_t report_id{0};
  std::vector<uint8_t> payload;
};

using DecodedReport = variant<CaptureReport, UnrecognizedReport>;

/**
 * Turns raw bytes read from the streaming channel into reports. An entry
 * without a value is a record that could not be decoded.
 */
class ReportDecoder {
 public:
  virtual ~ReportDecoder() = default;

  virtual std::vector<optional<DecodedReport>> decode(const uint8_t* data,
                                                      size_t length) = 0;
};

using ReportDecoderPtr = std::unique_ptr<ReportDecoder>;

/**
 * Decoder for DATA|Input records (0xA1, report id, payload).
 *
 * Capture records have a fixed size, so several of them in one buffer are
 * split apart. A record with any other id takes the rest of the buffer.
 * Bytes before a record header, and a capture record cut short, each produce
 * one failed entry.
 */
class HidReportDecoder : public ReportDecoder {
 public:
  std::vector<optional<DecodedReport>> decode(const uint8_t* data,
                                              size_t length) override;
};

}  // namespace hid
}  // namespace pensync

#endif  // PENSYNC_HID_REPORT_DECODER_H
