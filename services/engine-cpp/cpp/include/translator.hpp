/**
 * @file translator.hpp
 * @brief Translation of narrative strings into the local language.
 */

#pragma once

#include "engine_config.hpp"
#include "http_client.hpp"

#include <optional>
#include <string>

class Translator {
public:
    virtual ~Translator() = default;

    /// std::nullopt when no translation is available; callers keep the source.
    virtual std::optional<std::string> translate(const std::string& text) const = 0;
};

/**
 * @brief Translator calling the Gemini generateContent endpoint.
 *
 * With an empty API key every call returns std::nullopt without network I/O.
 */
class GeminiTranslator : public Translator {
public:
    GeminiTranslator(TranslatorConfig config, std::string api_key);

    std::optional<std::string> translate(const std::string& text) const override;

    /// Prompt sent for @p text; numbers, prices and '|' separators must survive.
    std::string build_prompt(const std::string& text) const;

private:
    TranslatorConfig config_;
    std::string api_key_;
    HttpClient http_;
};
