/**
 * @file place_names.hpp
 * @brief Display rendering of place names.
 */

#pragma once

#include <map>
#include <string>

/**
 * @brief Capitalize the first letter of each word and lowercase the rest.
 *
 * A word starts after any non-letter character ("porto-novo" ->
 * "Porto-Novo"). Only ASCII letters change case; UTF-8 bytes count as
 * letters so accented words are not split.
 */
std::string title_case(const std::string& text);

std::string to_lower_ascii(const std::string& text);

/**
 * @brief Renders French place names with their local-language name.
 *
 * "Cotonou" -> "Kutɔnu (Cotonou)". Matching uses the part of the name
 * before the first comma and ignores ASCII case. Unknown names are
 * returned unchanged.
 */
class PlaceNameLocalizer {
public:
    PlaceNameLocalizer() = default;
    explicit PlaceNameLocalizer(const std::map<std::string, std::string>& local_names);

    std::string render(const std::string& name) const;

    size_t size() const { return by_key_.size(); }

private:
    struct Entry {
        std::string key;    ///< Name as configured
        std::string local;
    };
    std::map<std::string, Entry> by_key_;  ///< Lowercased key -> entry
};
