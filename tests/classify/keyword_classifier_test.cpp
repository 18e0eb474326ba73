#include "docsort/classify/classifier.hpp"

#include <gtest/gtest.h>

using docsort::classify::ClassificationResult;
using docsort::classify::KeywordClassifier;

TEST(KeywordClassifierTest, ContentKeywordSelectsCategory) {
    KeywordClassifier classifier;
    auto result = classifier.classify("Rechnung Nr. 42\nBetrag: 100 EUR", "scan_001.pdf");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().category, "finanzen");
    EXPECT_DOUBLE_EQ(result.value().confidence, KeywordClassifier::kMatchConfidence);
    EXPECT_EQ(result.value().source, "keywords");
    ASSERT_FALSE(result.value().tags.empty());
    EXPECT_EQ(result.value().tags.front(), "rechnung");
}

TEST(KeywordClassifierTest, FileNameIsConsidered) {
    KeywordClassifier classifier;
    auto result = classifier.classify_text("", "Drehplan_Tag1.pdf");
    EXPECT_EQ(result.category, "footage");
}

TEST(KeywordClassifierTest, NoMatchIsUnsortedWithLowConfidence) {
    KeywordClassifier classifier;
    auto result = classifier.classify_text("lorem ipsum", "notes.txt");
    EXPECT_EQ(result.category, "unsorted");
    EXPECT_DOUBLE_EQ(result.confidence, KeywordClassifier::kNoMatchConfidence);
    EXPECT_TRUE(result.tags.empty());
}

TEST(KeywordClassifierTest, ClassificationJson) {
    ClassificationResult result;
    result.category = "projekte";
    result.confidence = 0.9;
    result.project = "Alpha";
    result.tags = {"milestone"};
    result.source = "model";

    auto value = docsort::classify::to_json(result);
    EXPECT_TRUE(value["customer"].is_null());
    EXPECT_EQ(value["project"], "Alpha");

    auto parsed = docsort::classify::classification_from_json(value);
    EXPECT_EQ(parsed.category, "projekte");
    EXPECT_FALSE(parsed.customer.has_value());
    EXPECT_EQ(parsed.project, std::optional<std::string>("Alpha"));
    EXPECT_EQ(parsed.tags, std::vector<std::string>{"milestone"});
}
