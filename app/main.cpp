#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include <chrono>

#include "digit_recognition.hpp"
#include "grid_extraction.hpp"
#include "grid_io.hpp"
#include "reading_cleanup.hpp"
#include "step_event.hpp"
#include "sudoku_detection.hpp"
#include "sudoku_solver.hpp"

struct AppOptions {
    bool printSteps = false;
    bool quiet = false;
    std::string puzzlePath;  // text mode
    std::string modelPath;   // image mode
    std::string imagePath;   // image mode

    bool imageMode() const { return !imagePath.empty(); }
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--steps] [--quiet] <puzzle.txt>\n"
              << "       " << program << " [--steps] [--quiet] --image <path_to_model.onnx> <path_to_image>"
              << std::endl;
}

std::optional<AppOptions> parseArgs(int argc, char* argv[]) {
    AppOptions options;
    std::vector<std::string> positional;
    bool image = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--steps") options.printSteps = true;
        else if (arg == "--quiet") options.quiet = true;
        else if (arg == "--image") image = true;
        else if (arg.rfind("--", 0) == 0) return std::nullopt;
        else positional.push_back(arg);
    }

    if (image) {
        if (positional.size() != 2) return std::nullopt;
        options.modelPath = positional[0];
        options.imagePath = positional[1];
    } else {
        if (positional.size() != 1) return std::nullopt;
        options.puzzlePath = positional[0];
    }
    return options;
}

long long elapsedMs(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

// Photo -> board -> cells -> digits, with duplicate readings dropped
std::optional<Grid> readPuzzleImage(const AppOptions& options) {
    cv::Mat photo = cv::imread(options.imagePath);
    if (photo.empty()) {
        std::cerr << "ERROR: Could not read image at " << options.imagePath << std::endl;
        return std::nullopt;
    }

    auto t1_start = std::chrono::high_resolution_clock::now();
    std::optional<cv::Mat> board = locateBoard(photo);
    std::cout << "Step 1 (Board Detection) took: " << elapsedMs(t1_start) << " ms" << std::endl;
    if (!board.has_value()) {
        std::cerr << "ERROR: No sudoku board found in " << options.imagePath << std::endl;
        return std::nullopt;
    }

    auto t2_start = std::chrono::high_resolution_clock::now();
    CellImages cells = extractCells(*board);
    std::cout << "Step 2 (Cell Extraction) took: " << elapsedMs(t2_start) << " ms" << std::endl;

    auto t3_start = std::chrono::high_resolution_clock::now();
    DigitClassifier classifier(options.modelPath);
    GridReading reading = classifier.readGrid(cells);
    Grid grid = dropConflictingReadings(reading.grid, reading.confidence);
    std::cout << "Step 3 (Digit Recognition) took: " << elapsedMs(t3_start) << " ms" << std::endl;

    for (int idx = 0; idx < SudokuTopology::CELL_COUNT; ++idx) {
        if (grid[idx] != reading.grid[idx]) {
            std::cerr << "WARNING: Dropped conflicting reading " << reading.grid[idx] << " at r"
                      << SudokuTopology::rowOf(idx) + 1 << "c" << SudokuTopology::colOf(idx) + 1 << std::endl;
        }
    }
    return grid;
}

int run(const AppOptions& options) {
    std::optional<Grid> puzzle;
    if (options.imageMode()) {
        puzzle = readPuzzleImage(options);
    } else {
        puzzle = loadGridFile(options.puzzlePath);
    }
    if (!puzzle.has_value()) return 1;

    if (!options.quiet) {
        std::cout << "Puzzle:" << std::endl;
        printGrid(*puzzle);
    }

    SudokuSolver solver;
    StepCounter counter;
    auto t4_start = std::chrono::high_resolution_clock::now();
    SolveResult result = solver.solveWithSteps(*puzzle, [&](const StepEvent& event) {
        counter.onStep(event);
        if (options.printSteps) std::cout << event.toString() << "\n";
    });
    std::cout << "Step 4 (Sudoku Solving) took: " << elapsedMs(t4_start) << " ms" << std::endl;

    std::cout << "Steps: " << counter.total()
              << " (assign " << counter.count(StepType::Assign)
              << ", guess " << counter.count(StepType::Guess)
              << ", backtrack " << counter.count(StepType::Backtrack) << ")" << std::endl;

    if (!result.ok) {
        std::cout << "\nStatus: " << describe(result.error) << std::endl;
        for (int idx : result.conflicts) {
            std::cout << "  conflict at r" << SudokuTopology::rowOf(idx) + 1
                      << "c" << SudokuTopology::colOf(idx) + 1 << std::endl;
        }
        return 1;
    }

    std::cout << "\nStatus: Solved" << std::endl;
    if (options.quiet) {
        std::cout << toString81(result.grid) << std::endl;
    } else {
        printGrid(result.grid);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::optional<AppOptions> options = parseArgs(argc, argv);
    if (!options.has_value()) {
        printUsage(argv[0]);
        return -1;
    }

    try {
        return run(*options);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return -1;
    }
}
