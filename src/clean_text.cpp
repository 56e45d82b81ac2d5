#include "OutputWriter.hpp"
#include "PipelineConfig.hpp"
#include "TextCleaning.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input> [options]\n"
      << "\nCleans OCR text files: removes spurious spacing, unifies\n"
      << "punctuation and regroups sentences into paragraphs.\n"
      << "\nOptions:\n"
      << "  -o, --output <path>     Output file, or output directory with -d\n"
      << "  -d, --directory         Clean every matching file in a directory\n"
      << "  -p, --pattern <glob>    File name pattern with -d (default: *.txt)\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report_20251126102506_11_342.txt\n"
      << "  " << programName << " ocr_output/ -d\n"
      << "  " << programName << " ocr_output/ -d -p \"report_*.txt\"\n";
}

bool cleanFile(const std::string &inputPath, const std::string &outputPath,
               const hanzi::PipelineConfig &config) {
  std::string raw;
  std::string errorMessage;
  if (!hanzi::readTextFile(inputPath, raw, errorMessage)) {
    std::cerr << "  Error: " << errorMessage << "\n";
    return false;
  }

  hanzi::CleaningResult cleaning =
      hanzi::cleanRecognizedText(raw, inputPath, config, false);
  if (!cleaning.success) {
    std::cerr << "  Error: " << cleaning.errorMessage << "\n";
    return false;
  }

  hanzi::WriteResult written = hanzi::writeTextFileAtomic(
      outputPath, hanzi::formatCleanedDocument(cleaning));
  if (!written.success) {
    std::cerr << "  Error: " << written.errorMessage << "\n";
    return false;
  }

  const auto &stats = cleaning.stats;
  std::cout << "  Original:   " << stats.rawChars << " characters\n"
            << "  Cleaned:    " << stats.cleanedChars << " characters\n"
            << "  Ratio:      " << std::fixed << std::setprecision(2)
            << stats.compressionRatio * 100.0 << "%\n"
            << "  Sentences:  " << stats.sentenceCount << "\n"
            << "  Paragraphs: " << stats.paragraphCount << "\n"
            << "  Output:     " << written.path << "\n";
  return true;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string outputPath;
  std::string pattern = "*.txt";
  bool directory = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-d" || arg == "--directory") {
      directory = true;
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        outputPath = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg == "-p" || arg == "--pattern") {
      if (i + 1 < argc) {
        pattern = argv[++i];
      } else {
        std::cerr << "Error: --pattern requires an argument\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  hanzi::PipelineConfig config;
  std::error_code ec;

  if (!directory) {
    if (!fs::is_regular_file(fs::u8path(inputPath), ec)) {
      std::cerr << "Error: File does not exist: " << inputPath << "\n";
      return 1;
    }
    std::string target =
        outputPath.empty() ? hanzi::defaultCleanedPath(inputPath) : outputPath;
    std::cout << "Cleaning: " << inputPath << "\n";
    return cleanFile(inputPath, target, config) ? 0 : 1;
  }

  if (!fs::is_directory(fs::u8path(inputPath), ec)) {
    std::cerr << "Error: Not a directory: " << inputPath << "\n";
    return 1;
  }

  std::string outputDir = outputPath.empty()
                              ? (fs::u8path(inputPath) / "cleaned").u8string()
                              : outputPath;
  fs::create_directories(fs::u8path(outputDir), ec);
  if (ec) {
    std::cerr << "Error: Cannot create output directory " << outputDir << ": "
              << ec.message() << "\n";
    return 1;
  }

  std::vector<std::string> files;
  try {
    for (const auto &entry : fs::directory_iterator(fs::u8path(inputPath))) {
      if (entry.is_regular_file() &&
          hanzi::matchesFilePattern(entry.path().filename().u8string(),
                                    pattern)) {
        files.push_back(entry.path().u8string());
      }
    }
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  std::sort(files.begin(), files.end());

  if (files.empty()) {
    std::cerr << "Warning: no files matching " << pattern << " found in "
              << inputPath << "\n";
    return 0;
  }

  std::cout << "Found " << files.size() << " files\n"
            << std::string(60, '=') << "\n";

  size_t succeeded = 0;
  for (size_t i = 0; i < files.size(); ++i) {
    std::cout << "\n[" << (i + 1) << "/" << files.size()
              << "] Cleaning: " << fs::u8path(files[i]).filename().u8string()
              << "\n";
    if (cleanFile(files[i], hanzi::defaultCleanedPath(files[i], outputDir),
                  config)) {
      succeeded++;
    }
  }

  std::cout << "\n" << std::string(60, '=') << "\n"
            << "Batch complete: " << succeeded << "/" << files.size()
            << " files cleaned\n";

  return succeeded == files.size() ? 0 : 1;
}
