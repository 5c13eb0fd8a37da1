#pragma once

#include "../types.hpp"
#include "text.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace switchyard {
namespace engine {

/**
 * @brief Pattern lists and thresholds for complexity scoring
 *
 * Patterns are matched case-insensitively as whole words or phrases; a
 * trailing '*' marks a stem ("analy*" matches "analyze" and "analysis").
 */
struct ComplexityConfig {
    std::vector<std::string> simple_patterns = {
        "hi", "hello", "hey", "thanks", "thank you", "ok", "okay", "yes", "no",
        "ping", "status", "good morning", "what time"
    };

    std::vector<std::string> complex_patterns = {
        "analy*", "optimi*", "confluence", "strateg*", "architect*", "design",
        "refactor*", "compare", "comparison", "backtest*", "multi-timeframe",
        "correlat*", "root cause", "evaluate", "derive", "trade-off*", "tradeoff*",
        "tolerance stack*", "simulat*"
    };

    std::vector<std::string> booster_phrases = {
        "step by step", "in detail", "detailed", "comprehensive", "thorough*",
        "explain why", "pros and cons", "deep dive"
    };

    int length_threshold_words = 30;   ///< Messages longer than this earn one point

    std::vector<std::string> forced_complex_domains = {"audit", "inspector", "review"};

    Expected<void> validate() const {
        if (length_threshold_words <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "length_threshold_words must be positive"});
        }
        return {};
    }

    bool operator==(const ComplexityConfig& other) const {
        return simple_patterns == other.simple_patterns &&
               complex_patterns == other.complex_patterns &&
               booster_phrases == other.booster_phrases &&
               length_threshold_words == other.length_threshold_words &&
               forced_complex_domains == other.forced_complex_domains;
    }

    bool operator!=(const ComplexityConfig& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Breakdown of one complexity classification
 */
struct ComplexityAssessment {
    Tier tier = Tier::Moderate;
    int score = 0;                         ///< complex_matches + booster_matches + length bonus
    int complex_matches = 0;
    int booster_matches = 0;
    int simple_matches = 0;
    bool length_bonus = false;
    bool forced = false;                   ///< Tier forced by domain policy
    std::vector<std::string> matched;      ///< Complex patterns and boosters that fired
};

/**
 * @brief Maps request text (and optionally a domain) to a complexity tier
 *
 * Score >= 2 is complex; score 0 with a simple-pattern match is simple;
 * everything else is moderate. Pure and deterministic.
 *
 * @threadsafety Immutable after construction; safe to share across threads
 */
class ComplexityClassifier {
public:
    explicit ComplexityClassifier(ComplexityConfig config = {})
        : config_(std::move(config))
    {
        lower_all(config_.simple_patterns);
        lower_all(config_.complex_patterns);
        lower_all(config_.booster_phrases);
        lower_all(config_.forced_complex_domains);
    }

    Tier classify(const std::string& message) const {
        return assess(message).tier;
    }

    /**
     * @brief Score a message, applying the domain policy when a domain is given
     */
    ComplexityAssessment assess(const std::string& message, const std::string& domain = "") const {
        ComplexityAssessment result;
        const std::string lowered = text::to_lower(message);

        for (const auto& pattern : config_.complex_patterns) {
            if (text::matches_word(lowered, pattern)) {
                ++result.complex_matches;
                result.matched.push_back(pattern);
            }
        }
        for (const auto& phrase : config_.booster_phrases) {
            if (text::matches_word(lowered, phrase)) {
                ++result.booster_matches;
                result.matched.push_back(phrase);
            }
        }
        for (const auto& pattern : config_.simple_patterns) {
            if (text::matches_word(lowered, pattern)) {
                ++result.simple_matches;
            }
        }
        result.length_bonus =
            text::word_count(message) > static_cast<std::size_t>(config_.length_threshold_words);

        result.score = result.complex_matches + result.booster_matches + (result.length_bonus ? 1 : 0);

        if (is_forced_complex(domain)) {
            result.tier = Tier::Complex;
            result.forced = true;
        } else if (result.score >= 2) {
            result.tier = Tier::Complex;
        } else if (result.score == 0 && result.simple_matches > 0) {
            result.tier = Tier::Simple;
        } else {
            result.tier = Tier::Moderate;
        }
        return result;
    }

    bool is_forced_complex(const std::string& domain) const {
        if (domain.empty()) {
            return false;
        }
        const std::string lowered = text::to_lower(domain);
        return std::find(config_.forced_complex_domains.begin(),
                         config_.forced_complex_domains.end(),
                         lowered) != config_.forced_complex_domains.end();
    }

    const ComplexityConfig& config() const { return config_; }

private:
    static void lower_all(std::vector<std::string>& items) {
        for (auto& item : items) {
            item = text::to_lower(item);
        }
    }

    ComplexityConfig config_;
};

} // namespace engine
} // namespace switchyard
