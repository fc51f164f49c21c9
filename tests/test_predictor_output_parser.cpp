#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/DataStructs.hpp"
#include "core/Errors.hpp"
#include "core/PredictorOutputParser.hpp"

using namespace MotifColoc;
namespace fs = std::filesystem;

class PredictorOutputParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("motif_coloc_parser_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string write_file(const std::string& content) {
        const std::string path = (dir_ / "chr1.fa.probability").string();
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(PredictorOutputParserTest, KeepsLinesInsideQualityBand) {
    const std::string path = write_file(
        "10 0.5 1.2 350.0 CGCGCGCGCGCG\n"
        "20 0.4 1.1 300 CACGTGCACGTG\n"
        "30 0.3 1.0 400 TGTGTGTGTGTG\n"
        "40 0.2 0.9 299.99 CGCGCGCGCGCG\n"
        "50 0.1 0.8 400.01 CGCGCGCGCGCG\n");

    PredictorOutputParser parser;
    ParseSummary summary;
    auto candidates = parser.parse(path, "chr1", 300.0, 400.0, nullptr, &summary);

    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(summary.records_parsed, 5u);
    EXPECT_EQ(summary.records_kept, 3u);
    EXPECT_EQ(summary.out_of_range, 2u);
    EXPECT_EQ(summary.malformed, 0u);

    const auto& c = candidates[0];
    EXPECT_EQ(c.sequence_id, "chr1");
    EXPECT_EQ(c.motif_class, MotifClass::ALTERNATIVE_STRUCTURE);
    EXPECT_EQ(c.start, 9);  // 1-based position 10
    EXPECT_EQ(c.end, 21);
    EXPECT_EQ(c.matched_text, "CGCGCGCGCGCG");
    EXPECT_DOUBLE_EQ(c.score, 350.0);
    EXPECT_DOUBLE_EQ(c.alternative.quality_score, 350.0);
    ASSERT_EQ(c.alternative.aux_scores.size(), 2u);
    EXPECT_DOUBLE_EQ(c.alternative.aux_scores[0], 0.5);
    EXPECT_DOUBLE_EQ(c.alternative.aux_scores[1], 1.2);

    // Band bounds are inclusive
    EXPECT_EQ(candidates[1].start, 19);
    EXPECT_EQ(candidates[2].start, 29);
}

TEST_F(PredictorOutputParserTest, SkipsMalformedLinesAndContinues) {
    const std::string path = write_file(
        "# header comment\n"
        "\n"
        "10 0.5 1.2 350.0 CGCG\n"
        "abc 0.5 1.2 350.0 CGCG\n"
        "11 0.5 1.2\n"
        "12 0.5 x 350 CGCG\n"
        "13 0.5 1.2 nan CGCG\n"
        "14 0.5 1.2 350 CGCG extra\n"
        "0 0.5 1.2 350 CGCG\n"
        "15 0.5 1.2 360\n");

    PredictorOutputParser parser;
    ParseSummary summary;
    auto candidates = parser.parse(path, "chr1", 300.0, 400.0, nullptr, &summary);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].start, 9);
    EXPECT_EQ(candidates[1].start, 14);
    EXPECT_EQ(summary.malformed, 6u);
    ASSERT_EQ(summary.first_errors.size(), 6u);
    EXPECT_EQ(summary.first_errors[0].line_number, 4u);
}

TEST_F(PredictorOutputParserTest, WarningsAreBounded) {
    std::string content;
    for (int i = 0; i < 25; ++i) {
        content += "garbage line\n";
    }
    content += "5 0 0 310 GCGC\n";
    const std::string path = write_file(content);

    PredictorOutputParser parser(PredictorOutputSchema(), 10);
    ParseSummary summary;
    auto candidates = parser.parse(path, "chr1", 300.0, 400.0, nullptr, &summary);

    EXPECT_EQ(candidates.size(), 1u);
    EXPECT_EQ(summary.malformed, 25u);
    EXPECT_EQ(summary.first_errors.size(), 10u);
}

TEST_F(PredictorOutputParserTest, MissingFileReturnsEmpty) {
    PredictorOutputParser parser;
    ParseSummary summary;
    auto candidates = parser.parse((dir_ / "absent.probability").string(), "chr1", 300.0, 400.0, nullptr, &summary);
    EXPECT_TRUE(candidates.empty());
    EXPECT_EQ(summary.lines_read, 0u);
}

TEST_F(PredictorOutputParserTest, EmptyBandThrows) {
    PredictorOutputParser parser;
    EXPECT_THROW(parser.parse(write_file(""), "chr1", 400.0, 300.0), ConfigError);
}

TEST_F(PredictorOutputParserTest, ReferenceSuppliesTextAndBounds) {
    Sequence ref;
    ref.id = "chr1";
    ref.residues = "AAAACGCGCGCGCGCGTTTT";  // 20 bp

    const std::string path = write_file(
        "5 0 0 320\n"
        "15 0 0 330\n"
        "25 0 0 340\n");

    PredictorOutputParser parser;
    ParseSummary summary;
    auto candidates = parser.parse(path, "chr1", 300.0, 400.0, &ref, &summary);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].start, 4);
    EXPECT_EQ(candidates[0].end, 16);
    EXPECT_EQ(candidates[0].matched_text, "CGCGCGCGCGCG");
    // Clipped at the end of the reference
    EXPECT_EQ(candidates[1].start, 14);
    EXPECT_EQ(candidates[1].end, 20);
    EXPECT_EQ(candidates[1].matched_text, "CGTTTT");
    // Position 25 lies beyond the reference
    EXPECT_EQ(summary.malformed, 1u);
}

TEST_F(PredictorOutputParserTest, WithoutTextOrReferenceUsesWindowLength) {
    PredictorOutputSchema schema;
    schema.window_length = 8;
    PredictorOutputParser parser(schema);

    auto candidates = parser.parse(write_file("100 0 0 350\n"), "chr1", 300.0, 400.0);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].start, 99);
    EXPECT_EQ(candidates[0].end, 107);
    EXPECT_EQ(candidates[0].length(), static_cast<int64_t>(candidates[0].matched_text.size()));
}

TEST_F(PredictorOutputParserTest, CustomSchema) {
    PredictorOutputSchema schema;
    schema.numeric_columns = 2;
    schema.quality_column = 1;
    schema.sequence_column = false;
    schema.one_based = false;
    PredictorOutputParser parser(schema);

    PredictorRecord rec;
    ParseError err;
    EXPECT_TRUE(parser.parse_line("0 12.5", 1, rec, err));
    EXPECT_EQ(rec.position, 0);
    EXPECT_DOUBLE_EQ(rec.quality, 12.5);
    EXPECT_TRUE(rec.aux_scores.empty());

    // A sequence column is not accepted by this schema
    EXPECT_FALSE(parser.parse_line("0 12.5 ACGT", 2, rec, err));
    EXPECT_EQ(err.line_number, 2u);
}

TEST(PredictorOutputSchemaTest, InvalidSchemaThrows) {
    PredictorOutputSchema schema;
    schema.quality_column = 0;  // Same as the position column
    EXPECT_THROW(PredictorOutputParser{schema}, ConfigError);

    schema = PredictorOutputSchema();
    schema.quality_column = 4;
    EXPECT_THROW(PredictorOutputParser{schema}, ConfigError);
}
