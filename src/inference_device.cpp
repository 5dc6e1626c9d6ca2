#include "inference_device.hpp"
#include <torch/torch.h>
#include <iostream>

namespace roto {

InferenceDevice select_inference_device(bool use_gpu) {
    InferenceDevice device;

    if (!use_gpu) {
        std::cout << "Using CPU for edge inference (GPU disabled)" << std::endl;
        return device;
    }

    if (torch::cuda::is_available()) {
        device.kind = DeviceKind::CUDA;
        device.index = 0;
        device.name = "CUDA:0 (" + std::to_string(torch::cuda::device_count()) + " visible)";
        std::cout << "Using CUDA for edge inference: " << device.name << std::endl;
    } else {
        std::cout << "CUDA not available, using CPU for edge inference" << std::endl;
    }

    return device;
}

} // namespace roto
