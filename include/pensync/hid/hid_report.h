#ifndef PENSYNC_HID_HID_REPORT_H
#define PENSYNC_HID_HID_REPORT_H

#include <array>
#include <cstdint>
#include <ctime>
#include <vector>

namespace pensync {
namespace hid {

// Transaction headers (HID over a stream channel)
constexpr uint8_t kSetReportFeature = 0x53;  // SET_REPORT | Feature
constexpr uint8_t kDataInput = 0xA1;         // DATA | Input

// Report identifiers
constexpr uint8_t kReportCapture = 0x01;
constexpr uint8_t kReportMode = 0x02;
constexpr uint8_t kReportDate = 0x03;
constexpr uint8_t kReportDevice = 0x04;
constexpr uint8_t kReportOperationRequest = 0x05;

constexpr uint8_t kEraseOperation = 0x01;

// Year field of the clock command counts from here
constexpr int kClockYearOffset = 1980;

/**
 * Device modes selectable through the mode report.
 */
enum class SyncMode : uint8_t {
  None = 1,     // Silent
  Capture = 4,  // Live paths and buttons
  File = 5      // Save events only
};

bool isRecognizedMode(SyncMode mode);
const char* syncModeToString(SyncMode mode);

/**
 * Header, report id, payload.
 */
std::vector<uint8_t> featureReport(uint8_t report_id,
                                   const std::vector<uint8_t>& payload);

std::vector<uint8_t> encodeModeCommand(SyncMode mode);
std::vector<uint8_t> encodeEraseCommand();
std::vector<uint8_t> encodeIdentifyCommand(uint8_t client_platform);

/**
 * Calendar fields for the clock command. `month` is 1-12, `year` is the
 * full year.
 */
struct ClockFields {
  int year{kClockYearOffset};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
};

ClockFields clockFieldsFromLocalTime(std::time_t time);

/**
 * Four byte layout, least significant bit first:
 *   byte 0: seconds/2 (5 bits), minute low 3 bits
 *   byte 1: minute high 3 bits, hour (5 bits)
 *   byte 2: day (5 bits), month low 3 bits
 *   byte 3: month high bit, year - 1980 (7 bits)
 */
std::array<uint8_t, 4> packClock(const ClockFields& fields);

std::vector<uint8_t> encodeClockSyncCommand(const ClockFields& fields);

}  // namespace hid
}  // namespace pensync

#endif  // PENSYNC_HID_HID_REPORT_H
