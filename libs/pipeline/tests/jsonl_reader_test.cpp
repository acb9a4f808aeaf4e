// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "jsonl_reader.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace prefcol::pipeline::test {

TEST(JsonlReaderTest, ParsesFullRecord) {
    const std::string line = R"({"prompt": "Which clause applies?", "response_a": "FAR 52.212",
        "response_b": "DFARS 252.204", "chosen": "b", "producer_id": "user7",
        "category": "far_dfars", "session_id": "s1", "latency_a": 1.5, "latency_b": 0.5,
        "confidence": 0.8, "context": {"page": "compare", "attempt": 2},
        "response_a_model": "m1", "response_b_model": "m2",
        "dimension_scores": {"accuracy": 4}})";

    std::string error;
    auto s = parse_comparison_json(line, &error);

    ASSERT_TRUE(s.has_value()) << error;
    EXPECT_EQ(s->prompt, "Which clause applies?");
    EXPECT_TRUE(s->chosen == ChosenSide::B);
    EXPECT_EQ(s->producer_id, "user7");
    EXPECT_EQ(s->category, "far_dfars");
    EXPECT_EQ(s->session_id, "s1");
    EXPECT_DOUBLE_EQ(s->latency_a, 1.5);
    EXPECT_DOUBLE_EQ(s->latency_b, 0.5);
    EXPECT_DOUBLE_EQ(s->confidence, 0.8);
    EXPECT_EQ(s->context.at("page"), "compare");
    EXPECT_EQ(s->context.at("attempt"), "2");
    EXPECT_EQ(s->response_a_model, "m1");
    EXPECT_EQ(s->response_b_model, "m2");
    EXPECT_EQ(s->dimension_scores.at("accuracy"), 4);
}

TEST(JsonlReaderTest, AppliesDefaultsForOptionalFields) {
    auto s = parse_comparison_json(
        R"({"prompt": "p", "response_a": "a", "response_b": "b", "chosen": "TIE"})");

    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->chosen == ChosenSide::TIE);
    EXPECT_EQ(s->category, "general");
    EXPECT_TRUE(s->producer_id.empty());
    EXPECT_DOUBLE_EQ(s->confidence, 1.0);
    EXPECT_TRUE(s->context.empty());
}

TEST(JsonlReaderTest, RejectsMalformedInput) {
    std::string error;

    EXPECT_FALSE(parse_comparison_json("not json", &error).has_value());
    EXPECT_EQ(error, "not a JSON object");

    EXPECT_FALSE(parse_comparison_json("[1, 2]", &error).has_value());

    EXPECT_FALSE(parse_comparison_json(
        R"({"prompt": "p", "response_a": "a", "chosen": "A"})", &error).has_value());
    EXPECT_EQ(error, "missing string field 'response_b'");

    EXPECT_FALSE(parse_comparison_json(
        R"({"prompt": "p", "response_a": "a", "response_b": "b", "chosen": "C"})", &error)
                     .has_value());
    EXPECT_EQ(error, "invalid chosen side 'C'");

    EXPECT_FALSE(parse_comparison_json(
        R"({"prompt": "p", "response_a": "a", "response_b": "b", "chosen": "A",
            "latency_a": "slow"})", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(JsonlReaderTest, ReadsStreamSkippingBlankAndMalformedLines) {
    std::istringstream input(
        R"({"prompt": "p1", "response_a": "a", "response_b": "b", "chosen": "A"})" "\n"
        "\n"
        "{broken\n"
        "   \n"
        R"({"prompt": "p2", "response_a": "a", "response_b": "b", "chosen": "B"})" "\n");

    std::vector<std::string> prompts;
    auto stats = read_comparisons(input, [&](const ComparisonSubmission& s) {
        prompts.push_back(s.prompt);
    });

    EXPECT_EQ(stats.lines, 3u);
    EXPECT_EQ(stats.decoded, 2u);
    EXPECT_EQ(stats.malformed, 1u);
    EXPECT_EQ(prompts, (std::vector<std::string>{"p1", "p2"}));
}

TEST(JsonlReaderTest, StopsWhenToldTo) {
    std::istringstream input(
        R"({"prompt": "p1", "response_a": "a", "response_b": "b", "chosen": "A"})" "\n"
        R"({"prompt": "p2", "response_a": "a", "response_b": "b", "chosen": "A"})" "\n");

    size_t seen = 0;
    auto stats = read_comparisons(
        input,
        [&](const ComparisonSubmission&) { ++seen; },
        [&] { return seen < 1; });

    EXPECT_EQ(seen, 1u);
    EXPECT_EQ(stats.decoded, 1u);
}

}  // namespace prefcol::pipeline::test
