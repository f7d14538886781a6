#include "ml_processor.hpp"
#include "errors.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

int64_t SeparationModel::training_length() const {
    return static_cast<int64_t>(std::floor(segment() * samplerate()));
}

int64_t SeparationModel::valid_length(int64_t length) const {
    const int64_t training = training_length();
    if (length > training) {
        throw RangeError("given length " + std::to_string(length) +
                         " is longer than training length " + std::to_string(training));
    }
    return training;
}

MLProcessor::MLProcessor(const ModelConfig& config) : config_(config) {
    try {
        module_ = torch::jit::load(config_.model_path);
        module_.to(torch::kCPU);
        module_.eval();
        model_loaded_ = true;
        std::cout << "Separation model loaded from: " << config_.model_path << std::endl;
    } catch (const c10::Error& e) {
        std::cerr << "Error loading the separation model: " << e.what() << std::endl;
        model_loaded_ = false;
    }
}

bool MLProcessor::is_loaded() const { return model_loaded_; }

ModelOutput MLProcessor::forward(const Tensor& mix, const Tensor& magspec) {
    if (!model_loaded_) {
        throw std::runtime_error("separation model is not loaded");
    }
    torch::NoGradGuard no_grad;
    std::vector<torch::jit::IValue> inputs{to_torch(mix), to_torch(magspec)};
    auto result = module_.forward(inputs);
    if (!result.isTuple()) {
        throw ShapeError("separation model must return a (mask, time) tuple");
    }
    auto tuple = result.toTuple();
    const auto& elements = tuple->elements();
    if (elements.size() != 2 || !elements[0].isTensor() || !elements[1].isTensor()) {
        throw ShapeError("separation model must return exactly two tensors");
    }
    return {from_torch(elements[0].toTensor()), from_torch(elements[1].toTensor())};
}
