#include "IAudioBackend.h"

#include <QtGlobal>

#ifdef Q_OS_LINUX
#include "linux/AlsaBackend.h"
#endif

std::shared_ptr<IAudioBackend> createPlatformAudioBackend(int periodMs)
{
#ifdef Q_OS_LINUX
    return std::make_shared<AlsaBackend>(periodMs);
#else
    Q_UNUSED(periodMs);
    return nullptr;
#endif
}
