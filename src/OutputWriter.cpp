#include "OutputWriter.hpp"
#include "Utf8Text.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace hanzi {

namespace {

std::string temporarySibling(const fs::path &target) {
  static std::atomic<unsigned long> counter{0};
  auto ticks =
      std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream name;
  name << "." << target.filename().u8string() << ".tmp-" << ticks << "-"
       << counter++;
  return (target.parent_path() / fs::u8path(name.str())).u8string();
}

} // anonymous namespace

std::string defaultOutputPath(const std::string &inputPath) {
  fs::path input = fs::u8path(inputPath);
  return (input.parent_path() / fs::u8path(input.stem().u8string() + ".txt"))
      .u8string();
}

std::string defaultCleanedPath(const std::string &inputPath,
                               const std::string &outputDir) {
  fs::path input = fs::u8path(inputPath);
  fs::path dir =
      outputDir.empty() ? input.parent_path() : fs::u8path(outputDir);
  return (dir / fs::u8path(input.stem().u8string() + "_cleaned.txt"))
      .u8string();
}

bool matchesFilePattern(const std::string &fileName,
                        const std::string &pattern) {
  std::u32string name = text::decodeUtf8(fileName);
  std::u32string glob = text::decodeUtf8(pattern);

  size_t n = 0;
  size_t g = 0;
  // Position of the last '*' and the name position it was tried at
  size_t star = std::u32string::npos;
  size_t resume = 0;

  while (n < name.size()) {
    if (g < glob.size() && (glob[g] == U'?' || glob[g] == name[n])) {
      ++n;
      ++g;
    } else if (g < glob.size() && glob[g] == U'*') {
      star = g++;
      resume = n;
    } else if (star != std::u32string::npos) {
      g = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }
  while (g < glob.size() && glob[g] == U'*') {
    ++g;
  }
  return g == glob.size();
}

std::string formatCleanedDocument(const CleaningResult &cleaning) {
  std::ostringstream out;
  out << "# 标题: " << cleaning.metadata.title << "\n";
  out << "# 日期: " << cleaning.metadata.date << "\n";
  out << "# 页面信息: " << cleaning.metadata.pageInfo << "\n";
  out << "# 原始长度: " << cleaning.stats.rawChars << " 字符\n";
  out << "# 清洗后长度: " << cleaning.stats.cleanedChars << " 字符\n";
  out << "# 压缩率: " << std::fixed << std::setprecision(2)
      << cleaning.stats.compressionRatio * 100.0 << "%\n";
  out << "\n" << std::string(60, '=') << "\n\n";

  for (const auto &paragraph : cleaning.cleaned.paragraphs) {
    out << paragraph << "\n\n";
  }

  return out.str();
}

WriteResult writeTextFileAtomic(const std::string &path,
                                const std::string &content) {
  WriteResult result;
  result.path = path;

  fs::path target = fs::u8path(path);
  std::string tempPath = temporarySibling(target);

  {
    std::ofstream out(fs::u8path(tempPath), std::ios::binary | std::ios::trunc);
    if (!out) {
      result.errorMessage = "Failed to create output file: " + tempPath;
      return result;
    }
    out << content;
    out.flush();
    if (!out) {
      result.errorMessage = "Failed to write output file: " + tempPath;
      std::error_code ignored;
      fs::remove(fs::u8path(tempPath), ignored);
      return result;
    }
  }

  std::error_code ec;
  fs::rename(fs::u8path(tempPath), target, ec);
  if (ec) {
    result.errorMessage =
        "Failed to move output into place: " + path + " (" + ec.message() + ")";
    std::error_code ignored;
    fs::remove(fs::u8path(tempPath), ignored);
    return result;
  }

  result.success = true;
  return result;
}

bool readTextFile(const std::string &path, std::string &content,
                  std::string &errorMessage) {
  std::ifstream in(fs::u8path(path), std::ios::binary);
  if (!in) {
    errorMessage = "Failed to open file: " + path;
    return false;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    errorMessage = "Failed to read file: " + path;
    return false;
  }

  content = buffer.str();

  // Drop a UTF-8 byte order mark
  if (content.size() >= 3 && content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    content.erase(0, 3);
  }
  return true;
}

} // namespace hanzi
