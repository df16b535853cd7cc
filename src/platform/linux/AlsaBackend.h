#pragma once

#include "../IAudioBackend.h"

#include <map>
#include <mutex>

class AlsaBackend : public IAudioBackend {
public:
    explicit AlsaBackend(int periodMs = 50);

    std::string name() const override { return "ALSA"; }
    std::vector<DeviceDescriptor> enumerateDevices() const override;
    std::unique_ptr<IAudioOutput> createOutput() override;

private:
    int m_periodMs;

    // Last successful probe per device id, for devices that later enumerate busy
    mutable std::mutex m_probeCacheMutex;
    mutable std::map<std::string, DeviceDescriptor> m_probeCache;
};
