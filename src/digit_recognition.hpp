#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime/onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>

#include "grid_extraction.hpp"
#include "reading_cleanup.hpp"

struct RecognizerConfig {
    int inputWidth = 32;
    int inputHeight = 32;
    int inputChannels = 3;
    int batchSize = 8;
    // Readings below this probability are reported as empty cells
    float minConfidence = 0.5f;
};

struct DigitReading {
    int digit = 0;           // 0 = empty or unreadable
    float confidence = 0.0f; // softmax probability of `digit`
};

struct GridReading {
    Grid grid{};
    Confidences confidence{};
};

// Floats one cell occupies in the input tensor (channels x height x width).
size_t cellTensorSize(const RecognizerConfig& config);

// Letterboxes a cell crop into `config`'s input shape, scaled to [0, 1], and
// writes exactly cellTensorSize(config) floats to `dst`. Only 1 (gray) and 3
// (RGB) channel models are supported; returns false otherwise.
bool cellToTensor(const cv::Mat& image, const RecognizerConfig& config, float* dst);

// Softmax over all classes, best of classes 1..9. Class 0 means blank and
// classes past 9 are ignored. Below `minConfidence` the digit is 0.
DigitReading pickDigit(const float* scores, size_t classes, float minConfidence);

// Classifies cell crops with an ONNX model whose output is 10 scores per image
// (class 0 = blank). Throws Ort::Exception if the model cannot be loaded.
class DigitClassifier {
public:
    explicit DigitClassifier(const std::string& modelPath, const RecognizerConfig& settings = {});

    std::array<DigitReading, SudokuTopology::CELL_COUNT> readCells(const CellImages& cells);
    GridReading readGrid(const CellImages& cells);

private:
    std::vector<DigitReading> classifyBatch(const std::vector<cv::Mat>& batch);

    RecognizerConfig config;
    std::vector<int64_t> inputShape;
    size_t singleImageTensorSize;
    size_t inputTensorSize;

    Ort::Env env;
    std::unique_ptr<Ort::Session> session;
    std::string inputNameStr;
    std::string outputNameStr;
    std::vector<const char*> inputNames;
    std::vector<const char*> outputNames;
    Ort::MemoryInfo memoryInfo;
};
