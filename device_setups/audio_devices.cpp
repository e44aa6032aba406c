#include "audio_devices.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <iostream>
#include <portaudio.h>

std::vector<InputDevice> getInputDevices() {
    std::vector<InputDevice> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    const int defaultInput = Pa_GetDefaultInputDevice();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo || deviceInfo->maxInputChannels < 1) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        InputDevice dev;
        dev.index             = i;
        dev.name              = deviceInfo->name;
        dev.hostApi           = hostApiInfo ? hostApiInfo->name : "?";
        dev.maxInputChannels  = deviceInfo->maxInputChannels;
        dev.defaultSampleRate = deviceInfo->defaultSampleRate;
        dev.isDefault         = (i == defaultInput);
        devices.push_back(dev);
    }

    Pa_Terminate();
    return devices;
}

int printInputDevices() {
    auto devices = getInputDevices();
    if (devices.empty()) {
        std::cout << "[Audio] No input devices found\n";
        return 1;
    }

    std::cout << "=== PortAudio Input Devices ===\n\n";
    for (const auto& d : devices) {
        std::cout << "Device #" << d.index << ": " << d.name
                  << "  (Host API: " << d.hostApi << ")\n";
        std::cout << "  Max input channels : " << d.maxInputChannels << "\n";
        std::cout << "  Default sample rate: " << d.defaultSampleRate << "\n";
        if (d.isDefault)
            std::cout << "  *** Default INPUT device ***\n";
        std::cout << "-------------------------------------------\n";
    }
    std::cout << "\nSet kws.input_device_index in " << ASSISTANT_CONFIG_FILE << " to choose one.\n";
    return 0;
}
