#pragma once
#include <string>
#include <vector>

struct InputDevice {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

// PortAudio devices with at least one input channel. Empty on error.
std::vector<InputDevice> getInputDevices();

// Print the input device table to stdout (for choosing kws.input_device_index)
int printInputDevices();
