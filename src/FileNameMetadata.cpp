#include "FileNameMetadata.hpp"

#include <cctype>
#include <filesystem>
#include <regex>
#include <vector>

namespace fs = std::filesystem;

namespace hanzi {

namespace {

std::vector<std::string> splitFields(const std::string &stem) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t pos = stem.find('_', start);
    if (pos == std::string::npos) {
      fields.push_back(stem.substr(start));
      break;
    }
    fields.push_back(stem.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

bool allDigits(const std::string &s, size_t count) {
  if (s.size() < count) {
    return false;
  }
  for (size_t i = 0; i < count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

std::string trimSeparators(const std::string &s) {
  const char *separators = " _-.";
  size_t begin = s.find_first_not_of(separators);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(separators);
  return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::string formatCompactDate(const std::string &digits) {
  if (!allDigits(digits, 8)) {
    return "";
  }
  int month = std::stoi(digits.substr(4, 2));
  int day = std::stoi(digits.substr(6, 2));
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return "";
  }
  return digits.substr(0, 4) + "-" + digits.substr(4, 2) + "-" +
         digits.substr(6, 2);
}

DocumentMetadata extractFileNameMetadata(const std::string &fileName) {
  DocumentMetadata metadata;
  std::string stem = fs::u8path(fileName).stem().u8string();
  if (stem.empty()) {
    return metadata;
  }

  std::vector<std::string> fields = splitFields(stem);
  if (fields.size() >= 2) {
    std::string date = formatCompactDate(fields[1]);
    if (!date.empty()) {
      metadata.title = fields[0];
      metadata.date = date;
      for (size_t i = 2; i < fields.size(); ++i) {
        if (i > 2) {
          metadata.pageInfo += '_';
        }
        metadata.pageInfo += fields[i];
      }
      return metadata;
    }
  }

  // Date stamp somewhere else in the name
  static const std::regex isoDate(R"((\d{4})-(\d{2})-(\d{2}))");
  static const std::regex compactDate(R"(\d{8,14})");
  std::smatch match;

  if (std::regex_search(stem, match, isoDate)) {
    std::string candidate = match[1].str() + match[2].str() + match[3].str();
    metadata.date = formatCompactDate(candidate);
  } else if (std::regex_search(stem, match, compactDate)) {
    metadata.date = formatCompactDate(match.str());
  }

  if (!metadata.date.empty()) {
    metadata.title = trimSeparators(match.prefix().str());
    if (metadata.title.empty()) {
      metadata.title = trimSeparators(match.suffix().str());
    }
  } else {
    metadata.title = fields[0];
    for (size_t i = 2; i < fields.size(); ++i) {
      if (i > 2) {
        metadata.pageInfo += '_';
      }
      metadata.pageInfo += fields[i];
    }
  }

  return metadata;
}

} // namespace hanzi
