#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AudioDevice.h"
#include "IAudioOutput.h"

// Device catalog plus a factory for exclusive output streams.
class IAudioBackend {
public:
    virtual ~IAudioBackend() = default;

    virtual std::string name() const = 0;
    virtual std::vector<DeviceDescriptor> enumerateDevices() const = 0;
    virtual std::unique_ptr<IAudioOutput> createOutput() = 0;
};

// Returns the native backend for this platform, or nullptr if there is none.
std::shared_ptr<IAudioBackend> createPlatformAudioBackend(int periodMs = 50);
