#include "DocumentPipeline.hpp"
#include "OutputWriter.hpp"
#include "PageRasterizer.hpp"
#include "TesseractEngine.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

hanzi::DocumentPipeline *g_pipeline = nullptr;
volatile std::sig_atomic_t g_interrupted = 0;

void handleInterrupt(int) {
  g_interrupted = 1;
  if (g_pipeline != nullptr) {
    g_pipeline->requestAbort();
  }
}

struct CliOptions {
  std::string inputPath;
  std::string outputPath;
  bool directory = false;
  bool clean = false;
};

enum class FileStatus { Written, Failed, Fatal, Aborted };

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <path> [options]\n"
      << "\nExtracts Chinese text from scanned PDFs and images.\n"
      << "\nOptions:\n"
      << "  -d, --directory         Process every PDF and image in a directory\n"
      << "  -o, --output <file>     Output file (single input only)\n"
      << "  -c, --clean             Write cleaned paragraphs with a metadata header\n"
      << "  -q, --quiet             Only print warnings and errors\n"
      << "  -l, --language <lang>   OCR language (default: chi_sim+eng)\n"
      << "      --fallback-language <lang>\n"
      << "                          Language used if the first one is missing\n"
      << "  -j, --jobs <n>          Concurrent OCR calls (default: CPU count)\n"
      << "      --slice-height <px> Slice height in page units (default: 1500)\n"
      << "      --overlap <px>      Overlap between slices (default: 100)\n"
      << "      --merge-window <n>  Smallest overlap search window (default: 16)\n"
      << "      --scale <f>         Render zoom factor (default: 3.0)\n"
      << "      --threshold <f>     Garbled text ratio threshold (default: 0.4)\n"
      << "      --symbol-run <n>    Symbol run length always removed (default: 10)\n"
      << "      --max-paragraph <n> Paragraph length bound (default: 500)\n"
      << "      --tessdata <dir>    Tesseract tessdata directory\n"
      << "      --timeout <ms>      Per-slice OCR deadline (default: none)\n"
      << "      --preprocess        Threshold images before OCR\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " scan.pdf\n"
      << "  " << programName << " scan.pdf -c -o scan_cleaned.txt\n"
      << "  " << programName << " scans/ -d -j 4\n";
}

std::vector<std::string> collectInputs(const std::string &directory) {
  std::vector<std::string> inputs;
  for (const auto &entry : fs::directory_iterator(fs::u8path(directory))) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::string path = entry.path().u8string();
    if (hanzi::isPdfFile(path) || hanzi::isSupportedImage(path)) {
      inputs.push_back(path);
    }
  }
  std::sort(inputs.begin(), inputs.end());
  return inputs;
}

FileStatus processOne(hanzi::DocumentPipeline &pipeline,
                      const std::string &inputPath,
                      const std::string &outputPath, const CliOptions &options,
                      bool verbose) {
  if (verbose) {
    std::cout << "Processing: " << inputPath << "\n";
    std::cout << "-------------------------------------------\n";
  }

  hanzi::DocumentResult result = pipeline.processFile(inputPath);

  if (result.aborted) {
    std::cerr << "Error: aborted while processing " << inputPath
              << "; no output written\n";
    return FileStatus::Aborted;
  }

  if (!result.success) {
    std::cerr << "Error: " << hanzi::errorKindName(result.error) << ": "
              << result.errorMessage << "\n";
    return result.error == hanzi::ErrorKind::Configuration ? FileStatus::Fatal
                                                           : FileStatus::Failed;
  }

  std::string content = options.clean
                            ? hanzi::formatCleanedDocument(result.cleaning)
                            : result.cleaning.filteredText;

  std::string target =
      outputPath.empty() ? hanzi::defaultOutputPath(inputPath) : outputPath;
  hanzi::WriteResult written = hanzi::writeTextFileAtomic(target, content);
  if (!written.success) {
    std::cerr << "Error: " << written.errorMessage << "\n";
    return FileStatus::Failed;
  }

  if (verbose) {
    const auto &stats = result.cleaning.stats;
    std::cout << "Pages processed:   " << result.processedPages << "/"
              << result.pageCount << "\n"
              << "Slices recognized: " << result.sliceCount << "\n"
              << "Raw characters:    " << stats.rawChars << "\n"
              << "After filtering:   " << stats.filteredChars << "\n"
              << "Cleaned:           " << stats.cleanedChars << " ("
              << std::fixed << std::setprecision(2)
              << stats.compressionRatio * 100.0 << "%)\n"
              << "Paragraphs:        " << stats.paragraphCount << "\n"
              << "Unit errors:       " << result.unitErrors.size() << "\n"
              << "Processing time:   " << std::fixed << std::setprecision(2)
              << result.processingTimeMs << " ms\n"
              << "Output:            " << written.path << "\n\n";
  }

  return FileStatus::Written;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  CliOptions options;
  hanzi::PipelineConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](const std::string &name) -> const char * {
      if (i + 1 < argc) {
        return argv[++i];
      }
      std::cerr << "Error: " << name << " requires an argument\n";
      return nullptr;
    };

    try {
      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-d" || arg == "--directory") {
        options.directory = true;
      } else if (arg == "-c" || arg == "--clean") {
        options.clean = true;
      } else if (arg == "-q" || arg == "--quiet") {
        config.verbose = false;
      } else if (arg == "--preprocess") {
        config.preprocessImage = true;
      } else if (arg == "-o" || arg == "--output" || arg == "-l" ||
                 arg == "--language" || arg == "--fallback-language" ||
                 arg == "-j" || arg == "--jobs" || arg == "--slice-height" ||
                 arg == "--overlap" || arg == "--merge-window" ||
                 arg == "--scale" ||
                 arg == "--threshold" || arg == "--symbol-run" ||
                 arg == "--max-paragraph" || arg == "--tessdata" ||
                 arg == "--timeout") {
        const char *value = requireValue(arg);
        if (value == nullptr) {
          return 1;
        }
        if (arg == "-o" || arg == "--output") {
          options.outputPath = value;
        } else if (arg == "-l" || arg == "--language") {
          config.languageHint = value;
        } else if (arg == "--fallback-language") {
          config.fallbackLanguage = value;
        } else if (arg == "-j" || arg == "--jobs") {
          config.workerCount = std::stoi(value);
        } else if (arg == "--slice-height") {
          config.sliceHeightPx = std::stoi(value);
        } else if (arg == "--overlap") {
          config.overlapPx = std::stoi(value);
        } else if (arg == "--merge-window") {
          config.mergeWindowChars = std::stoi(value);
        } else if (arg == "--scale") {
          config.scale = std::stod(value);
        } else if (arg == "--threshold") {
          config.garbledRatioThreshold = std::stod(value);
        } else if (arg == "--symbol-run") {
          config.symbolRunLength = std::stoi(value);
        } else if (arg == "--max-paragraph") {
          config.maxParagraphChars = std::stoi(value);
        } else if (arg == "--tessdata") {
          config.tessDataPath = value;
        } else {
          config.ocrTimeoutMs = std::stoi(value);
        }
      } else if (arg[0] != '-') {
        options.inputPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } catch (const std::exception &) {
      std::cerr << "Error: invalid value for " << arg << ": " << argv[i]
                << "\n";
      return 1;
    }
  }

  if (options.inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::error_code ec;
  if (!fs::exists(fs::u8path(options.inputPath), ec)) {
    std::cerr << "Error: Path does not exist: " << options.inputPath << "\n";
    return 1;
  }

  bool isDirectory = fs::is_directory(fs::u8path(options.inputPath), ec);
  if (isDirectory && !options.directory) {
    std::cerr << "Error: " << options.inputPath
              << " is a directory; use -d to process every file in it\n";
    return 1;
  }
  if (options.directory && !isDirectory) {
    std::cerr << "Error: " << options.inputPath << " is not a directory\n";
    return 1;
  }
  if (options.directory && !options.outputPath.empty()) {
    std::cerr << "Error: --output cannot be used with --directory\n";
    return 1;
  }

  std::string configProblem = config.validate();
  if (!configProblem.empty()) {
    std::cerr << "Error: Invalid configuration: " << configProblem << "\n";
    return 1;
  }

  if (config.verbose) {
    std::cout << "=== Hanzi OCR ===\n"
              << "Tesseract version: "
              << hanzi::TesseractEngine::getTesseractVersion() << "\n"
              << "OpenCV version: " << CV_VERSION << "\n"
              << "Language: " << config.languageHint << "\n"
              << "Workers: " << config.workerCount << "\n"
              << "=================\n\n";
  }

  hanzi::DocumentPipeline pipeline(config);
  g_pipeline = &pipeline;
  std::signal(SIGINT, handleInterrupt);

  std::string prepareError;
  if (pipeline.prepare(prepareError) != hanzi::ErrorKind::None) {
    std::cerr << "Error: " << prepareError << "\n";
    g_pipeline = nullptr;
    return 1;
  }

  int exitCode = 0;

  if (!options.directory) {
    if (!hanzi::isPdfFile(options.inputPath) &&
        !hanzi::isSupportedImage(options.inputPath)) {
      std::cerr << "Error: Unsupported file format: " << options.inputPath
                << "\nSupported formats: .pdf";
      for (const auto &ext : hanzi::supportedImageExtensions()) {
        std::cerr << " " << ext;
      }
      std::cerr << "\n";
      exitCode = 1;
    } else {
      FileStatus status = processOne(pipeline, options.inputPath,
                                     options.outputPath, options,
                                     config.verbose);
      if (status == FileStatus::Aborted) {
        exitCode = 130;
      } else if (status != FileStatus::Written) {
        exitCode = 1;
      }
    }
  } else {
    std::vector<std::string> inputs;
    try {
      inputs = collectInputs(options.inputPath);
    } catch (const fs::filesystem_error &e) {
      std::cerr << "Error: " << e.what() << "\n";
      g_pipeline = nullptr;
      return 1;
    }

    if (inputs.empty()) {
      std::cerr << "Warning: no PDF or image files found in "
                << options.inputPath << "\n";
    }

    size_t succeeded = 0;
    size_t attempted = 0;
    for (size_t i = 0; i < inputs.size(); ++i) {
      if (config.verbose) {
        std::cout << "[" << (i + 1) << "/" << inputs.size() << "] ";
      }
      attempted++;
      FileStatus status =
          processOne(pipeline, inputs[i], "", options, config.verbose);

      if (status == FileStatus::Written) {
        succeeded++;
      } else if (status == FileStatus::Aborted) {
        exitCode = 130;
        break;
      } else if (status == FileStatus::Fatal) {
        std::cerr << "Error: configuration problem, stopping the batch\n";
        exitCode = 1;
        break;
      }
    }

    std::cout << "===========================================\n"
              << "Batch complete: " << succeeded << "/" << inputs.size()
              << " files succeeded";
    if (attempted < inputs.size()) {
      std::cout << " (" << (inputs.size() - attempted) << " not attempted)";
    }
    std::cout << "\n";

    if (exitCode == 0 && succeeded != inputs.size()) {
      exitCode = 1;
    }
  }

  if (g_interrupted && exitCode == 0) {
    exitCode = 130;
  }

  g_pipeline = nullptr;
  return exitCode;
}
