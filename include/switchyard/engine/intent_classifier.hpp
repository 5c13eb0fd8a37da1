#pragma once

#include "../types.hpp"
#include "text.hpp"
#include <map>
#include <string>
#include <vector>

namespace switchyard {
namespace engine {

/// Category name -> keywords that vote for it.
using KeywordTable = std::map<std::string, std::vector<std::string>>;

inline constexpr const char* kGeneralCategory = "general";

/**
 * @brief Built-in category keyword table
 *
 * Keywords are matched as lower-case substrings, so "part" also votes for
 * cad in "department". Kept deliberately loose; callers with stricter
 * needs pass their own table.
 */
inline KeywordTable default_intent_keywords() {
    return KeywordTable{
        {"trading", {
            "trade", "trading", "forex", "gbp", "usd", "eur", "jpy", "setup", "bias",
            "ict", "btmm", "quarterly", "stacey", "order block", "fvg", "liquidity",
            "manipulation", "tradingview", "chart", "analysis", "journal"
        }},
        {"cad", {
            "cad", "solidworks", "inventor", "autocad", "bentley", "part", "sketch",
            "extrude", "flange", "model", "3d", "drawing", "assembly", "ecn",
            "revision", "pdf"
        }},
        {"sketch", {
            "photo", "sketch", "hand-drawn", "napkin", "ocr", "vision",
            "geometry extraction", "image to cad", "convert image"
        }},
        {"work", {
            "teams", "outlook", "email", "meeting", "calendar", "j2", "tracker",
            "work", "job", "microsoft", "task"
        }},
        {"inspector", {
            "audit", "review", "grade", "inspect", "judge", "report", "performance",
            "analyze results"
        }},
        {"system", {
            "backup", "health", "status", "metrics", "schedule", "system",
            "maintenance", "uptime"
        }},
    };
}

/**
 * @brief Outcome of keyword intent detection
 */
struct IntentMatch {
    std::string category;
    std::map<std::string, int> scores;   ///< Points per category in the table
    bool defaulted = false;              ///< True when a tie or no match chose "general"
};

/**
 * @brief Keyword-vote intent classifier
 *
 * Each keyword contained in the lower-cased message adds one point to its
 * category. The single highest-scoring category wins; ties at the top and
 * all-zero scores resolve to "general".
 *
 * @threadsafety Immutable after construction; safe to share across threads
 */
class IntentClassifier {
public:
    explicit IntentClassifier(KeywordTable table = default_intent_keywords())
        : table_(std::move(table))
    {
        for (auto& [category, keywords] : table_) {
            for (auto& keyword : keywords) {
                keyword = text::to_lower(keyword);
            }
        }
    }

    IntentMatch classify(const std::string& message) const {
        IntentMatch match;
        const std::string lowered = text::to_lower(message);

        int best = 0;
        int best_count = 0;
        std::string best_category;
        for (const auto& [category, keywords] : table_) {
            int score = 0;
            for (const auto& keyword : keywords) {
                if (!keyword.empty() && lowered.find(keyword) != std::string::npos) {
                    ++score;
                }
            }
            match.scores[category] = score;

            if (score > best) {
                best = score;
                best_count = 1;
                best_category = category;
            } else if (score == best && score > 0) {
                ++best_count;
            }
        }

        if (best == 0 || best_count > 1) {
            match.category = kGeneralCategory;
            match.defaulted = true;
        } else {
            match.category = best_category;
        }
        return match;
    }

    /// Categories present in the table, plus "general".
    std::vector<std::string> categories() const {
        std::vector<std::string> names;
        names.reserve(table_.size() + 1);
        for (const auto& [category, _] : table_) {
            names.push_back(category);
        }
        if (table_.find(kGeneralCategory) == table_.end()) {
            names.push_back(kGeneralCategory);
        }
        return names;
    }

    const KeywordTable& table() const { return table_; }

private:
    KeywordTable table_;
};

} // namespace engine
} // namespace switchyard
