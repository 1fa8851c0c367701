#ifndef PROBEOPTIONS_H
#define PROBEOPTIONS_H

#include "Constants.h"
#include "input/KeyInjector.h"

namespace PressHold {

struct ProbeOptions {
    int pauseMs = Timer::kPause;
    int autoDelayMs = Timer::kAutoDelay;
    int holdRepeatCount = Sample::kHoldRepeatCount;
    int minimumOsVersion = Environment::kMinimumMacOsSignature;
    KeyInjectorBackend backend = KeyInjectorBackend::Native;
};

} // namespace PressHold

#endif // PROBEOPTIONS_H
