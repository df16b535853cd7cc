#include "AlsaBackend.h"
#include "AlsaOutput.h"

#include <alsa/asoundlib.h>
#include <QDebug>
#include <cerrno>

namespace {

const unsigned kProbeRates[] = { 44100, 48000, 88200, 96000, 176400, 192000, 352800, 384000 };

struct DepthFormat {
    int bitDepth;
    snd_pcm_format_t format;
    bool isFloat;
};

// 24-bit is carried in a 32-bit container, see AlsaOutput
const DepthFormat kProbeDepths[] = {
    { 16, SND_PCM_FORMAT_S16_LE,   false },
    { 24, SND_PCM_FORMAT_S32_LE,   false },
    { 32, SND_PCM_FORMAT_S32_LE,   false },
    { 32, SND_PCM_FORMAT_FLOAT_LE, true  },
};

// Returns false when the device could not be opened; busy is set for EBUSY
bool probeCapabilities(DeviceDescriptor& device)
{
    snd_pcm_t* pcm = nullptr;
    int err = snd_pcm_open(&pcm, device.id.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
    if (err < 0) {
        device.busy = (err == -EBUSY);
        qDebug() << "[ALSA] Cannot probe" << device.id.c_str() << ":" << snd_strerror(err);
        return false;
    }

    snd_pcm_hw_params_t* any;
    snd_pcm_hw_params_t* trial;
    snd_pcm_hw_params_alloca(&any);
    snd_pcm_hw_params_alloca(&trial);

    if (snd_pcm_hw_params_any(pcm, any) < 0) {
        snd_pcm_close(pcm);
        return false;
    }

    unsigned maxChannels = 0;
    if (snd_pcm_hw_params_get_channels_max(any, &maxChannels) == 0)
        device.maxChannels = (int)maxChannels;

    for (const DepthFormat& depth : kProbeDepths) {
        snd_pcm_hw_params_copy(trial, any);
        if (snd_pcm_hw_params_set_format(pcm, trial, depth.format) < 0)
            continue;
        for (unsigned rate : kProbeRates) {
            if (snd_pcm_hw_params_test_rate(pcm, trial, rate, 0) == 0)
                device.capabilities.push_back({ (int)rate, depth.bitDepth, depth.isFloat });
        }
    }

    snd_pcm_close(pcm);
    return true;
}

} // namespace

AlsaBackend::AlsaBackend(int periodMs)
    : m_periodMs(periodMs)
{
}

std::vector<DeviceDescriptor> AlsaBackend::enumerateDevices() const
{
    std::vector<DeviceDescriptor> devices;

    snd_ctl_card_info_t* cardInfo;
    snd_pcm_info_t* pcmInfo;
    snd_ctl_card_info_alloca(&cardInfo);
    snd_pcm_info_alloca(&pcmInfo);

    int card = -1;
    while (snd_card_next(&card) == 0 && card >= 0) {
        const std::string ctlName = "hw:" + std::to_string(card);
        snd_ctl_t* ctl = nullptr;
        if (snd_ctl_open(&ctl, ctlName.c_str(), 0) < 0)
            continue;
        if (snd_ctl_card_info(ctl, cardInfo) < 0) {
            snd_ctl_close(ctl);
            continue;
        }

        int dev = -1;
        while (snd_ctl_pcm_next_device(ctl, &dev) == 0 && dev >= 0) {
            snd_pcm_info_set_device(pcmInfo, (unsigned)dev);
            snd_pcm_info_set_subdevice(pcmInfo, 0);
            snd_pcm_info_set_stream(pcmInfo, SND_PCM_STREAM_PLAYBACK);
            if (snd_ctl_pcm_info(ctl, pcmInfo) < 0)
                continue;  // capture-only

            DeviceDescriptor device;
            device.id = ctlName + "," + std::to_string(dev);
            device.name = std::string(snd_ctl_card_info_get_name(cardInfo))
                          + " - " + snd_pcm_info_get_name(pcmInfo);
            if (probeCapabilities(device)) {
                std::lock_guard<std::mutex> lock(m_probeCacheMutex);
                m_probeCache[device.id] = device;
            } else if (device.busy) {
                // Held elsewhere, possibly by this process: reuse the last probe
                std::lock_guard<std::mutex> lock(m_probeCacheMutex);
                auto it = m_probeCache.find(device.id);
                if (it != m_probeCache.end()) {
                    device.maxChannels = it->second.maxChannels;
                    device.capabilities = it->second.capabilities;
                }
            }
            devices.push_back(std::move(device));
        }
        snd_ctl_close(ctl);
    }

    if (!devices.empty())
        devices.front().isDefault = true;

    qDebug() << "[ALSA] Found" << devices.size() << "playback devices";
    return devices;
}

std::unique_ptr<IAudioOutput> AlsaBackend::createOutput()
{
    return std::make_unique<AlsaOutput>(m_periodMs);
}
