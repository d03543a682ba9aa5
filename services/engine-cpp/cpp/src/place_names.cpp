/**
 * @file place_names.cpp
 * @brief Title casing and local-name rendering.
 */

#include "place_names.hpp"
#include "csv_utils.hpp"

namespace {

bool is_ascii_alpha(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_word_char(unsigned char c) {
    return is_ascii_alpha(c) || c >= 0x80;
}

char ascii_upper(unsigned char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : static_cast<char>(c);
}

char ascii_lower(unsigned char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

}  // namespace

std::string title_case(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_word = false;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_word_char(c)) {
            out.push_back(in_word ? ascii_lower(c) : ascii_upper(c));
            in_word = true;
        } else {
            out.push_back(ch);
            in_word = false;
        }
    }
    return out;
}

std::string to_lower_ascii(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) out.push_back(ascii_lower(static_cast<unsigned char>(ch)));
    return out;
}

PlaceNameLocalizer::PlaceNameLocalizer(const std::map<std::string, std::string>& local_names) {
    for (const auto& [key, local] : local_names) {
        by_key_[to_lower_ascii(key)] = Entry{key, local};
    }
}

std::string PlaceNameLocalizer::render(const std::string& name) const {
    std::string base = csv_utils::trim(name.substr(0, name.find(',')));
    auto it = by_key_.find(to_lower_ascii(base));
    if (it == by_key_.end()) return name;
    return it->second.local + " (" + it->second.key + ")";
}
