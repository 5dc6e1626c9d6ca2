#pragma once

#include <string>

namespace roto {

enum class DeviceKind { CPU, CUDA };

struct InferenceDevice {
    DeviceKind kind = DeviceKind::CPU;
    int index = 0;
    std::string name = "CPU";

    bool is_gpu() const { return kind == DeviceKind::CUDA; }
};

// Picks the accelerator once at startup. Falls back to CPU when GPU use is
// disabled or no CUDA device is visible to libtorch.
InferenceDevice select_inference_device(bool use_gpu);

} // namespace roto
