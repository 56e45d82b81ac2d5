#ifndef HANZI_OUTPUT_WRITER_HPP
#define HANZI_OUTPUT_WRITER_HPP

#include "TextCleaning.hpp"

#include <string>

namespace hanzi {

/**
 * @brief Result of writing an output file
 */
struct WriteResult {
  bool success = false;     ///< Whether the file is in place
  std::string path;         ///< Final path of the file
  std::string errorMessage; ///< Error message if failed
};

/**
 * @brief Default OCR output path: <stem>.txt beside the input
 */
std::string defaultOutputPath(const std::string &inputPath);

/**
 * @brief Default cleaned output path: <stem>_cleaned.txt
 * @param inputPath Source text file
 * @param outputDir Directory to place it in, empty for beside the input
 */
std::string defaultCleanedPath(const std::string &inputPath,
                               const std::string &outputDir = "");

/**
 * @brief Match a file name against a shell wildcard pattern
 *
 * '*' matches any run of characters and '?' exactly one character. The
 * whole name must match.
 */
bool matchesFilePattern(const std::string &fileName,
                        const std::string &pattern);

/**
 * @brief Render cleaned text with its metadata and statistics header
 *
 * The header lists title, date, page information, raw and cleaned length
 * and the compression ratio, followed by a rule of 60 '=' and the
 * paragraphs separated by blank lines.
 */
std::string formatCleanedDocument(const CleaningResult &cleaning);

/**
 * @brief Write a file through a temporary sibling renamed into place
 *
 * The target either keeps its previous content or receives the whole new
 * content; a partially written file is never visible under @p path.
 */
WriteResult writeTextFileAtomic(const std::string &path,
                                const std::string &content);

/**
 * @brief Read a whole file
 * @return false with @p errorMessage set if the file cannot be read
 */
bool readTextFile(const std::string &path, std::string &content,
                  std::string &errorMessage);

} // namespace hanzi

#endif // HANZI_OUTPUT_WRITER_HPP
