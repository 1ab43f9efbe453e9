#pragma once

#include "detector/ientity_detector.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace docanon {

/**
 * @brief User-supplied regex recognizer (from [[recognizers]] in the config)
 */
struct CustomRecognizer {
    std::string entity_type;
    std::vector<std::string> patterns;
    double score = 0.8;
};

/**
 * @brief Regex-based entity detector
 *
 * Runs a static table of precompiled recognizers, built once at construction:
 *   PII:   EMAIL_ADDRESS, PHONE_NUMBER, US_SSN (validated), CREDIT_CARD (Luhn)
 *   Infra: URL, IP_ADDRESS, HOSTNAME, HASH, UUID, CERT_SERIAL, CPE_STRING, CERT_BODY
 * plus any custom recognizers passed in.
 *
 * Patterns are language-independent; analyze() rejects language codes that
 * are not in supported_languages().
 */
class PatternDetector : public IEntityDetector {
public:
    /**
     * @brief Context check run on each regex hit
     * @param text Whole analyzed text
     * @param start,end Byte range of the hit
     */
    using Validator = std::function<bool(std::string_view text, size_t start, size_t end)>;

    struct Recognizer {
        std::string entity_type;
        std::string name;
        std::regex regex;
        double score = 0.0;
        Validator validator;
    };

    /**
     * @throws std::invalid_argument if a custom pattern fails to compile or has no entity type
     */
    explicit PatternDetector(const std::vector<CustomRecognizer>& custom = {});

    [[nodiscard]] std::vector<DetectedSpan> analyze(
        const std::string& text,
        const std::string& language,
        double score_threshold,
        const std::unordered_set<std::string>& entity_types) override;

    [[nodiscard]] std::vector<std::string> supported_entities(
        const std::string& language) const override;

    [[nodiscard]] size_t recognizer_count() const { return recognizers_.size(); }

private:
    void add(std::string entity_type, std::string name, const std::string& pattern,
             double score, Validator validator = nullptr);

    std::vector<Recognizer> recognizers_;
};

} // namespace docanon
