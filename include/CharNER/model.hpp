#pragma once

#include <onnxruntime_cxx_api.h>

#include <vector>
#include <string>

#include "charner_config.hpp"
#include "charner_structs.hpp"

namespace charner {
    class Model {
    public:
        virtual ~Model() {};
        virtual std::vector<ProbabilityMatrix> predict(Batch& batch) = 0;
    };

    class OnnxModel : public Model {
    protected:
        const std::string modelPath;
        Config config;
        Ort::Env *env = nullptr;
        Ort::SessionOptions *sessionOptions = nullptr;
        Ort::Session *session = nullptr;
        std::vector<const char*> inputNames;
        std::vector<const char*> outputNames;

        void initialize();
        void release();
        void useDevice(Ort::SessionOptions* session_options, const int device_id);
        static void softmaxRow(float* row, int64_t n);
    public:
        OnnxModel(const std::string& path, const Config& config);
        OnnxModel(const std::string& path, const Config& config, const int device_id);
        OnnxModel(
            const std::string& path, const Config& config, const Ort::Env& env, const Ort::SessionOptions& session_options
        );
        virtual ~OnnxModel();
        OnnxModel(const OnnxModel&) = delete;
        OnnxModel& operator=(const OnnxModel&) = delete;

        static int64_t count_total_elements(const std::vector<int64_t>& output_shape);
        // Splits a [batch, positions, classes] output into one matrix of numChars rows per item.
        static std::vector<ProbabilityMatrix> sliceOutput(
            const std::vector<float>& output, const std::vector<int64_t>& shape, const Batch& batch, bool logits
        );
        void run(const std::vector<Ort::Value>& input_tensors, std::vector<float>& output, std::vector<int64_t>& output_shape);
        virtual std::vector<ProbabilityMatrix> predict(Batch& batch);
    };
}
