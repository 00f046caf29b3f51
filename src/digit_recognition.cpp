#include "digit_recognition.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

DigitClassifier::DigitClassifier(const std::string& modelPath, const RecognizerConfig& settings)
    : config(settings),
      env(ORT_LOGGING_LEVEL_WARNING, "DigitClassifier"),
      memoryInfo(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
    Ort::SessionOptions sessionOptions;
    sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    session = std::make_unique<Ort::Session>(env, modelPath.c_str(), sessionOptions);

    Ort::AllocatorWithDefaultOptions allocator;
    inputNameStr = session->GetInputNameAllocated(0, allocator).get();
    outputNameStr = session->GetOutputNameAllocated(0, allocator).get();
    inputNames = { inputNameStr.c_str() };
    outputNames = { outputNameStr.c_str() };

    // The model is exported with a fixed batch dimension
    inputShape = { config.batchSize, config.inputChannels, config.inputHeight, config.inputWidth };
    singleImageTensorSize = cellTensorSize(config);
    inputTensorSize = singleImageTensorSize * config.batchSize;
}

std::array<DigitReading, SudokuTopology::CELL_COUNT> DigitClassifier::readCells(const CellImages& cells) {
    std::array<DigitReading, SudokuTopology::CELL_COUNT> readings{};

    std::vector<cv::Mat> batch;
    std::vector<int> batchCells;
    auto flush = [&]() {
        std::vector<DigitReading> results = classifyBatch(batch);
        for (size_t k = 0; k < results.size(); ++k) readings[batchCells[k]] = results[k];
        batch.clear();
        batchCells.clear();
    };

    // Blank cells never reach the model
    for (int idx = 0; idx < SudokuTopology::CELL_COUNT; ++idx) {
        if (cells[idx].empty()) continue;
        batch.push_back(cells[idx]);
        batchCells.push_back(idx);
        if (static_cast<int>(batch.size()) == config.batchSize) flush();
    }
    if (!batch.empty()) flush();

    return readings;
}

GridReading DigitClassifier::readGrid(const CellImages& cells) {
    GridReading reading;
    auto readings = readCells(cells);
    for (int idx = 0; idx < SudokuTopology::CELL_COUNT; ++idx) {
        reading.grid[idx] = readings[idx].digit;
        reading.confidence[idx] = readings[idx].confidence;
    }
    return reading;
}

std::vector<DigitReading> DigitClassifier::classifyBatch(const std::vector<cv::Mat>& batch) {
    // Unused slots stay zero-filled
    std::vector<float> inputTensorValues(inputTensorSize, 0.0f);
    for (size_t i = 0; i < batch.size(); ++i) {
        if (!cellToTensor(batch[i], config, inputTensorValues.data() + i * singleImageTensorSize)) {
            std::cerr << "WARNING: Could not convert a cell image to a tensor" << std::endl;
        }
    }

    Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
        memoryInfo, inputTensorValues.data(), inputTensorSize,
        inputShape.data(), inputShape.size()
    );

    std::vector<DigitReading> results(batch.size());
    try {
        auto outputTensors = session->Run(
            Ort::RunOptions{nullptr}, inputNames.data(), &inputTensor, 1, outputNames.data(), 1
        );

        const float* scores = outputTensors.front().GetTensorMutableData<float>();
        size_t totalElements = outputTensors.front().GetTensorTypeAndShapeInfo().GetElementCount();
        size_t classes = totalElements / config.batchSize;

        for (size_t i = 0; i < batch.size(); ++i) {
            results[i] = pickDigit(scores + i * classes, classes, config.minConfidence);
        }
    } catch (const Ort::Exception& e) {
        std::cerr << "ERROR: ONNX Runtime inference failed: " << e.what() << std::endl;
    }
    return results;
}

size_t cellTensorSize(const RecognizerConfig& config) {
    return static_cast<size_t>(config.inputChannels) * config.inputHeight * config.inputWidth;
}

bool cellToTensor(const cv::Mat& image, const RecognizerConfig& config, float* dst) {
    if (image.empty()) return false;

    // Match the channel count the model was exported with
    cv::Mat converted;
    if (config.inputChannels == 1) {
        if (image.channels() == 3) cv::cvtColor(image, converted, cv::COLOR_BGR2GRAY);
        else if (image.channels() == 4) cv::cvtColor(image, converted, cv::COLOR_BGRA2GRAY);
        else converted = image;
    } else if (config.inputChannels == 3) {
        if (image.channels() == 1) cv::cvtColor(image, converted, cv::COLOR_GRAY2BGR);
        else if (image.channels() == 4) cv::cvtColor(image, converted, cv::COLOR_BGRA2BGR);
        else converted = image;
    } else {
        return false;
    }
    if (converted.channels() != config.inputChannels) return false;

    // Letterbox into the model's input size
    float scale = std::min(static_cast<float>(config.inputWidth) / converted.cols,
                           static_cast<float>(config.inputHeight) / converted.rows);
    int w = std::max(1, static_cast<int>(converted.cols * scale));
    int h = std::max(1, static_cast<int>(converted.rows * scale));

    cv::Mat resized;
    cv::resize(converted, resized, cv::Size(w, h), 0, 0, cv::INTER_AREA);

    cv::Mat canvas = cv::Mat::zeros(config.inputHeight, config.inputWidth, CV_8UC(config.inputChannels));
    resized.copyTo(canvas(cv::Rect((config.inputWidth - w) / 2, (config.inputHeight - h) / 2, w, h)));

    bool swapRB = config.inputChannels == 3;
    cv::Mat blob = cv::dnn::blobFromImage(canvas, 1.0 / 255.0, cv::Size(config.inputWidth, config.inputHeight),
                                          cv::Scalar(), swapRB, false);
    size_t size = cellTensorSize(config);
    if (!blob.isContinuous() || blob.total() != size) return false;

    std::memcpy(dst, blob.ptr<float>(), size * sizeof(float));
    return true;
}

DigitReading pickDigit(const float* scores, size_t classes, float minConfidence) {
    if (classes < 2) return {};

    // Softmax over all classes, argmax over digits 1..9 only
    float top = *std::max_element(scores, scores + classes);
    double sum = 0.0;
    for (size_t k = 0; k < classes; ++k) sum += std::exp(scores[k] - top);

    // Extra classes past 9 are never digits
    size_t digit_end = std::min<size_t>(classes, 10);
    size_t best = std::max_element(scores + 1, scores + digit_end) - scores;
    float probability = static_cast<float>(std::exp(scores[best] - top) / sum);

    if (probability < minConfidence) return {0, probability};
    return {static_cast<int>(best), probability};
}
