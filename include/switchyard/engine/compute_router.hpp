#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "complexity_classifier.hpp"
#include <map>
#include <sstream>
#include <string>

namespace switchyard {
namespace engine {

/**
 * @brief Compute profile per tier plus per-domain temperature overrides
 */
struct TierProfiles {
    ComputeProfile simple{"gpt-4o-mini", 1024, 0.6f, "low"};
    ComputeProfile moderate{"gpt-4o", 2048, 0.7f, "medium"};
    ComputeProfile complex{"claude-3-5-sonnet-20240620", 8192, 0.7f, "high"};

    /// Domains that need a fixed sampling temperature (e.g. precise engineering output).
    std::map<std::string, float> domain_temperature = {{"cad", 0.2f}};

    const ComputeProfile& for_tier(Tier tier) const {
        switch (tier) {
            case Tier::Simple: return simple;
            case Tier::Complex: return complex;
            case Tier::Moderate: break;
        }
        return moderate;
    }

    Expected<void> validate() const {
        for (const ComputeProfile* profile : {&simple, &moderate, &complex}) {
            if (profile->model.empty()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Compute profile model cannot be empty"});
            }
            if (profile->max_tokens <= 0) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Compute profile max_tokens must be positive",
                                            profile->model});
            }
            if (profile->temperature < 0.0f) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Compute profile temperature must be >= 0",
                                            profile->model});
            }
        }
        return {};
    }

    bool operator==(const TierProfiles& other) const {
        return simple == other.simple &&
               moderate == other.moderate &&
               complex == other.complex &&
               domain_temperature == other.domain_temperature;
    }

    bool operator!=(const TierProfiles& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Picks a model/compute profile for a generative request
 *
 * Not on the Orchestrator's routing path: handlers consult it when they
 * need to choose how to generate. Deterministic and cannot fail.
 *
 * @threadsafety Immutable after construction; safe to share across threads
 */
class ComputeTierSelector {
public:
    explicit ComputeTierSelector(ComplexityConfig classifier_config = {}, TierProfiles profiles = {})
        : classifier_(std::move(classifier_config))
        , profiles_(std::move(profiles))
        , logger_(log::get(log::kRouter))
    {}

    Tier classify(const std::string& message) const {
        return classifier_.classify(message);
    }

    RoutingDecision route(const std::string& message, const std::string& domain = "general") const {
        const ComplexityAssessment assessment = classifier_.assess(message, domain);

        RoutingDecision decision;
        decision.domain = domain;
        decision.tier = assessment.tier;
        decision.score = assessment.score;
        decision.profile = profiles_.for_tier(assessment.tier);

        auto temperature = profiles_.domain_temperature.find(text::to_lower(domain));
        if (temperature != profiles_.domain_temperature.end()) {
            decision.profile.temperature = temperature->second;
        }

        decision.reason = explain(assessment, decision);
        logger_->debug("Compute route [{}]: {}", domain, decision.reason);
        return decision;
    }

    const ComplexityClassifier& classifier() const { return classifier_; }
    const TierProfiles& profiles() const { return profiles_; }

private:
    static std::string explain(const ComplexityAssessment& assessment, const RoutingDecision& decision) {
        std::ostringstream out;
        if (assessment.forced) {
            out << "Domain '" << decision.domain << "' always uses the complex tier";
        } else {
            out << "Complexity score " << assessment.score;
            if (!assessment.matched.empty() || assessment.length_bonus) {
                out << " (";
                bool first = true;
                for (const auto& match : assessment.matched) {
                    out << (first ? "" : ", ") << match;
                    first = false;
                }
                if (assessment.length_bonus) {
                    out << (first ? "" : ", ") << "long message";
                }
                out << ")";
            } else if (assessment.simple_matches > 0) {
                out << " (simple phrasing)";
            }
            out << " -> " << tier_to_string(decision.tier) << " tier";
        }
        out << " -> " << decision.profile.model
            << " (max_tokens=" << decision.profile.max_tokens
            << ", temperature=" << decision.profile.temperature
            << ", cost=" << decision.profile.cost_tier << ")";
        return out.str();
    }

    ComplexityClassifier classifier_;
    TierProfiles profiles_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace engine
} // namespace switchyard
