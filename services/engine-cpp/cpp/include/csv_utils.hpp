/**
 * @file csv_utils.hpp
 * @brief Small CSV parsing helpers shared by the table loaders.
 */

#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace csv_utils {

/**
 * @brief Strip whitespace, CR and quotes from both ends.
 */
std::string trim(const std::string& s);

/**
 * @brief Split one CSV line; commas inside double quotes are kept.
 */
std::vector<std::string> split_line(const std::string& line);

/**
 * @brief Read a header line into trimmed column names.
 */
std::vector<std::string> parse_header(const std::string& header_line);

/**
 * @brief Index of the first of @p names present in @p cols, -1 if none.
 */
int find_column(const std::vector<std::string>& cols, std::initializer_list<const char*> names);

}  // namespace csv_utils
