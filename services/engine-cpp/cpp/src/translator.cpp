/**
 * @file translator.cpp
 * @brief Gemini translation client.
 */

#include "translator.hpp"

#include <iostream>

using json = nlohmann::json;

GeminiTranslator::GeminiTranslator(TranslatorConfig config, std::string api_key)
    : config_(std::move(config)),
      api_key_(std::move(api_key)),
      http_(config_.timeout_seconds) {}

std::string GeminiTranslator::build_prompt(const std::string& text) const {
    return "Translate the following text to " + config_.target_language + " (Benin language). "
           "Ensure to translate 'Total' to 'Bǐ' and 'Saison' to 'Hwenu'. "
           "Translate 'Bus', 'Taxi', 'Suggestion' appropriately. "
           "Keep numbers, prices, and special characters (like |) exactly as is. "
           "Output ONLY the translated text, no markdown, no explanations. "
           "Text: '" + text + "'";
}

std::optional<std::string> GeminiTranslator::translate(const std::string& text) const {
    if (api_key_.empty() || text.empty()) return std::nullopt;

    json part = {{"text", build_prompt(text)}};
    json content = {{"parts", json::array({part})}};
    json payload = {{"contents", json::array({content})}};
    std::string url = config_.base_url + "/models/" + config_.model +
                      ":generateContent?key=" + HttpClient::url_encode(api_key_);

    auto response = http_.post_json(url, payload);
    if (!response) return std::nullopt;
    if (response->status != 200) {
        std::cerr << "Warning: translation service returned HTTP " << response->status << "\n";
        return std::nullopt;
    }

    try {
        json body = json::parse(response->body);
        std::string out = body.at("candidates").at(0).at("content").at("parts").at(0).at("text").get<std::string>();

        // Trim surrounding whitespace the model tends to add
        size_t first = out.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        size_t last = out.find_last_not_of(" \t\r\n");
        return out.substr(first, last - first + 1);
    } catch (const std::exception& e) {
        std::cerr << "Warning: unreadable translation response: " << e.what() << "\n";
        return std::nullopt;
    }
}
