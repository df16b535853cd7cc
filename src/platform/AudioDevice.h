#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <algorithm>

// One (sample rate, bit depth, sample type) the device accepts without conversion.
struct DeviceCapability {
    int  sampleRate = 0;
    int  bitDepth   = 0;
    bool isFloat    = false;

    bool operator==(const DeviceCapability& o) const
    {
        return sampleRate == o.sampleRate && bitDepth == o.bitDepth && isFloat == o.isFloat;
    }
    bool operator<(const DeviceCapability& o) const
    {
        if (sampleRate != o.sampleRate)
            return sampleRate < o.sampleRate;
        if (bitDepth != o.bitDepth)
            return bitDepth < o.bitDepth;
        return isFloat < o.isFloat;
    }
};

struct DeviceDescriptor {
    std::string id;
    std::string name;
    bool        isDefault   = false;
    bool        busy        = false;   // held by another client when enumerated
    int         maxChannels = 2;
    std::vector<DeviceCapability> capabilities;

    bool isValid() const { return !id.empty(); }

    // A busy device that was never probed has an unknown capability set
    bool capabilitiesKnown() const { return !busy || !capabilities.empty(); }

    // Exact match, sample type included
    bool supports(int sampleRate, int bitDepth, bool isFloat) const
    {
        return std::find(capabilities.begin(), capabilities.end(),
                         DeviceCapability{sampleRate, bitDepth, isFloat}) != capabilities.end();
    }

    // Rate and depth only, for metadata that does not carry the sample type
    bool supports(int sampleRate, int bitDepth) const
    {
        return supports(sampleRate, bitDepth, false) || supports(sampleRate, bitDepth, true);
    }
};
