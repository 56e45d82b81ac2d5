#ifndef HANZI_FILE_NAME_METADATA_HPP
#define HANZI_FILE_NAME_METADATA_HPP

#include "PipelineTypes.hpp"

#include <string>

namespace hanzi {

/**
 * @brief Derive title, date and page information from a file name
 *
 * Understands the export convention @c title_YYYYMMDDhhmmss_page_info.ext,
 * for example "A股4000拉锯要不要买黄金_20251126102506_11_342.txt". When the
 * second field is not a date, a YYYY-MM-DD or 8 to 14 digit date stamp is
 * searched anywhere in the stem and the rest of the stem becomes the title.
 * Fields that cannot be recognized are left empty.
 *
 * @param fileName File name or path; directories and extension are ignored
 */
DocumentMetadata extractFileNameMetadata(const std::string &fileName);

/**
 * @brief Format eight digits YYYYMMDD as YYYY-MM-DD
 * @return Empty string unless the month and day are plausible
 */
std::string formatCompactDate(const std::string &digits);

} // namespace hanzi

#endif // HANZI_FILE_NAME_METADATA_HPP
