#include "pensync/hid/hid_report.h"

namespace pensync {
namespace hid {

bool isRecognizedMode(SyncMode mode) {
  switch (mode) {
    case SyncMode::None:
    case SyncMode::Capture:
    case SyncMode::File:
      return true;
  }
  return false;
}

const char* syncModeToString(SyncMode mode) {
  switch (mode) {
    case SyncMode::None: return "none";
    case SyncMode::Capture: return "capture";
    case SyncMode::File: return "file";
  }
  return "unknown";
}

std::vector<uint8_t> featureReport(uint8_t report_id,
                                   const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> frame;
  frame.reserve(payload.size() + 2);
  frame.push_back(kSetReportFeature);
  frame.push_back(report_id);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::vector<uint8_t> encodeModeCommand(SyncMode mode) {
  return featureReport(kReportMode, {static_cast<uint8_t>(mode)});
}

std::vector<uint8_t> encodeEraseCommand() {
  return featureReport(kReportOperationRequest, {kEraseOperation});
}

std::vector<uint8_t> encodeIdentifyCommand(uint8_t client_platform) {
  return featureReport(kReportDevice, {client_platform, 0x00, 0x00, 0x00});
}

ClockFields clockFieldsFromLocalTime(std::time_t time) {
  std::tm tm{};
  localtime_r(&time, &tm);

  ClockFields fields;
  fields.year = tm.tm_year + 1900;
  fields.month = tm.tm_mon + 1;
  fields.day = tm.tm_mday;
  fields.hour = tm.tm_hour;
  fields.minute = tm.tm_min;
  fields.second = tm.tm_sec;
  return fields;
}

std::array<uint8_t, 4> packClock(const ClockFields& fields) {
  const unsigned second = static_cast<unsigned>(fields.second / 2);
  const unsigned minute = static_cast<unsigned>(fields.minute);
  const unsigned hour = static_cast<unsigned>(fields.hour);
  const unsigned day = static_cast<unsigned>(fields.day);
  const unsigned month = static_cast<unsigned>(fields.month);
  const unsigned year = static_cast<unsigned>(fields.year - kClockYearOffset);

  return {static_cast<uint8_t>((minute << 5) | second),
          static_cast<uint8_t>((hour << 3) | (minute >> 3)),
          static_cast<uint8_t>((month << 5) | day),
          static_cast<uint8_t>((year << 1) | (month >> 3))};
}

std::vector<uint8_t> encodeClockSyncCommand(const ClockFields& fields) {
  auto packed = packClock(fields);
  return featureReport(kReportDate,
                       std::vector<uint8_t>(packed.begin(), packed.end()));
}

}  // namespace hid
}  // namespace pensync
