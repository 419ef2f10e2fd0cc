#include "pensync/hid/report_decoder.h"

#include "pensync/hid/hid_report.h"

namespace pensync {
namespace hid {

namespace {

uint16_t readU16Le(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

}  // namespace

std::vector<optional<DecodedReport>> HidReportDecoder::decode(
    const uint8_t* data,
    size_t length) {
  std::vector<optional<DecodedReport>> reports;
  size_t pos = 0;

  while (pos < length) {
    if (data[pos] != kDataInput) {
      // Skip to the next record header
      while (pos < length && data[pos] != kDataInput) {
        ++pos;
      }
      reports.emplace_back(nullopt);
      continue;
    }

    if (pos + 1 >= length) {
      reports.emplace_back(nullopt);
      break;
    }

    uint8_t report_id = data[pos + 1];
    const uint8_t* payload = data + pos + 2;
    size_t available = length - pos - 2;

    if (report_id == kReportCapture) {
      if (available < kCapturePayloadSize) {
        reports.emplace_back(nullopt);
        break;
      }
      CaptureReport capture;
      capture.x = readU16Le(payload);
      capture.y = readU16Le(payload + 2);
      capture.pressure = readU16Le(payload + 4);
      capture.flags = payload[6];
      reports.emplace_back(DecodedReport(capture));
      pos += 2 + kCapturePayloadSize;
      continue;
    }

    UnrecognizedReport other;
    other.report_id = report_id;
    other.payload.assign(payload, payload + available);
    reports.emplace_back(DecodedReport(std::move(other)));
    break;
  }

  return reports;
}

}  // namespace hid
}  // namespace pensync
