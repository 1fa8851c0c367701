#ifndef PRESSHOLD_CONSTANTS_H
#define PRESSHOLD_CONSTANTS_H

namespace PressHold {

// ============================================================================
// TIMING (milliseconds)
// ============================================================================
namespace Timer {
constexpr int kAutoDelay = 50;          // Between injected key events
constexpr int kPause = 2000;            // Popup settle and teardown grace delay
constexpr int kIdleFlush = 50;          // Event processing slice in waitForIdle
}  // namespace Timer

// ============================================================================
// SAMPLE INPUT
// ============================================================================
namespace Sample {
constexpr const char* kPhrase = "échantillon";
constexpr const char* kBackspace = "chantillon";
constexpr const char* kNoAccent = "echantillon";
constexpr const char* kMisprint = "e0chantillon";

// Ten repeats of the held key: the accent popup never appeared
constexpr const char* kPressAndHoldDisabled = "eeeeeeeeee";

constexpr int kHoldRepeatCount = 10;
}  // namespace Sample

// ============================================================================
// ENVIRONMENT
// ============================================================================
namespace Environment {
// Press and Hold first shipped with Mac OS X 10.7 Lion
constexpr int kMinimumMacOsSignature = 107;
}  // namespace Environment

// ============================================================================
// PROBE WINDOW (pixels)
// ============================================================================
namespace UI {
namespace ProbeWindow {
constexpr int kX = 100;
constexpr int kY = 100;
constexpr int kWidth = 400;
constexpr int kHeight = 200;
}  // namespace ProbeWindow
}  // namespace UI

}  // namespace PressHold

#endif // PRESSHOLD_CONSTANTS_H
