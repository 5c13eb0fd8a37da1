#include <gtest/gtest.h>
#include "switchyard/engine/complexity_classifier.hpp"
#include "fixtures/sample_messages.hpp"

using namespace switchyard;
using namespace switchyard::engine;
using namespace switchyard::testing::messages;

class ComplexityClassifierTest : public ::testing::Test {
protected:
    ComplexityClassifier classifier;
};

// ============================================================================
// Tier Thresholds
// ============================================================================

TEST_F(ComplexityClassifierTest, GreetingIsSimple) {
    EXPECT_EQ(classifier.classify(kGreeting), Tier::Simple);
    EXPECT_EQ(classifier.classify("Hello"), Tier::Simple);
    EXPECT_EQ(classifier.classify(kThanks), Tier::Simple);
}

TEST_F(ComplexityClassifierTest, NoSignalsIsModerate) {
    EXPECT_EQ(classifier.classify(kModerate), Tier::Moderate);
    EXPECT_EQ(classifier.classify(""), Tier::Moderate);
}

TEST_F(ComplexityClassifierTest, SingleComplexPatternIsModerate) {
    auto assessment = classifier.assess("Can you refactor this function");
    EXPECT_EQ(assessment.score, 1);
    EXPECT_EQ(assessment.tier, Tier::Moderate);
}

TEST_F(ComplexityClassifierTest, TwoPatternsAreComplex) {
    auto assessment = classifier.assess("Analyze and compare these two options");
    EXPECT_EQ(assessment.complex_matches, 2);
    EXPECT_EQ(assessment.tier, Tier::Complex);
}

TEST_F(ComplexityClassifierTest, LongMessageEarnsLengthPoint) {
    auto assessment = classifier.assess(kLongComplex);
    EXPECT_TRUE(assessment.length_bonus);
    EXPECT_EQ(assessment.complex_matches, 2);
    EXPECT_EQ(assessment.score, 3);
    EXPECT_EQ(assessment.tier, Tier::Complex);
}

TEST_F(ComplexityClassifierTest, BoosterCountsTowardScore) {
    auto assessment = classifier.assess("Walk me through the design step by step");
    EXPECT_EQ(assessment.complex_matches, 1);
    EXPECT_EQ(assessment.booster_matches, 1);
    EXPECT_EQ(assessment.tier, Tier::Complex);
}

TEST_F(ComplexityClassifierTest, SimpleWordLosesToComplexSignal) {
    // "hi" is present, but any score keeps it off the simple tier
    EXPECT_EQ(classifier.classify("hi, please optimize this"), Tier::Moderate);
}

// ============================================================================
// Pattern Matching
// ============================================================================

TEST_F(ComplexityClassifierTest, StemsMatchWordVariants) {
    EXPECT_EQ(classifier.assess("optimization").complex_matches, 1);
    EXPECT_EQ(classifier.assess("Analysis").complex_matches, 1);
    EXPECT_EQ(classifier.assess("we simulated it").complex_matches, 1);
}

TEST_F(ComplexityClassifierTest, WholeWordsOnly) {
    // "hi" inside "this" and "no" inside "notes" are not matches
    auto assessment = classifier.assess("this notes thing");
    EXPECT_EQ(assessment.simple_matches, 0);
    EXPECT_EQ(assessment.tier, Tier::Moderate);
}

TEST_F(ComplexityClassifierTest, CaseInsensitive) {
    EXPECT_EQ(classifier.classify("ROOT CAUSE of the COMPARISON"), Tier::Complex);
}

// ============================================================================
// Domain Policy
// ============================================================================

TEST_F(ComplexityClassifierTest, ForcedDomainsAlwaysComplex) {
    for (const char* domain : {"audit", "inspector", "review", "Review"}) {
        auto assessment = classifier.assess(kGreeting, domain);
        EXPECT_EQ(assessment.tier, Tier::Complex) << domain;
        EXPECT_TRUE(assessment.forced) << domain;
    }
}

TEST_F(ComplexityClassifierTest, OtherDomainsUseScore) {
    EXPECT_EQ(classifier.assess(kGreeting, "cad").tier, Tier::Simple);
    EXPECT_FALSE(classifier.is_forced_complex(""));
    EXPECT_FALSE(classifier.is_forced_complex("trading"));
}

TEST(ComplexityConfigTest, CustomPatterns) {
    ComplexityConfig config;
    config.complex_patterns = {"FEA", "mesh*"};
    config.simple_patterns = {"yo"};
    ComplexityClassifier classifier(config);

    EXPECT_EQ(classifier.classify("run fea on the meshed part"), Tier::Complex);
    EXPECT_EQ(classifier.classify("yo"), Tier::Simple);
    EXPECT_EQ(classifier.classify("hi"), Tier::Moderate);
}

TEST(ComplexityConfigTest, Validation) {
    ComplexityConfig config;
    EXPECT_TRUE(config.validate().has_value());

    config.length_threshold_words = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
}
