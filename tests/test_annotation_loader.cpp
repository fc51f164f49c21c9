#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/AnnotationLoader.hpp"
#include "core/ColocalizationEngine.hpp"
#include "core/Errors.hpp"

using namespace MotifColoc;
namespace fs = std::filesystem;

class AnnotationLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("motif_coloc_gtf_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string write_gtf(const std::string& content) {
        const std::string path = (dir_ / "genes.gtf").string();
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(AnnotationLoaderTest, LoadsTranscriptRecords) {
    const std::string path = write_gtf(
        "#!genome-build test\n"
        "chr1\tsrc\tgene\t1000\t5000\t.\t+\t.\tgene_id \"G1\"; gene_name \"ALPHA\";\n"
        "chr1\tsrc\ttranscript\t1000\t5000\t.\t+\t.\tgene_id \"G1\"; gene_name \"ALPHA\";\n"
        "chr1\tsrc\ttranscript\t8000\t9000\t.\t-\t.\tgene_id \"G2\"; transcript_id \"T2\";\n"
        "chr2\tsrc\texon\t10\t20\t.\t+\t.\tgene_id \"G3\";\n");

    AnnotationLoader loader;
    AnnotationSummary summary;
    auto genes = loader.load_gtf(path, "transcript", &summary);

    ASSERT_EQ(genes.size(), 2u);
    EXPECT_EQ(genes[0].sequence_id, "chr1");
    EXPECT_EQ(genes[0].start, 999);  // 1-based closed -> 0-based half-open
    EXPECT_EQ(genes[0].end, 5000);
    EXPECT_EQ(genes[0].strand, Strand::FORWARD);
    EXPECT_EQ(genes[0].gene_id, "G1");
    EXPECT_EQ(genes[0].gene_name, "ALPHA");

    EXPECT_EQ(genes[1].strand, Strand::REVERSE);
    EXPECT_EQ(genes[1].gene_name, "G2");  // falls back to gene_id

    EXPECT_EQ(summary.records_kept, 2u);
    EXPECT_EQ(summary.other_features, 2u);
    EXPECT_EQ(summary.malformed, 0u);
}

TEST_F(AnnotationLoaderTest, SkipsMalformedLines) {
    const std::string path = write_gtf(
        "chr1\tsrc\ttranscript\t100\t200\t.\t+\t.\tgene_id \"OK\";\n"
        "chr1\tsrc\ttranscript\t100\n"
        "chr1\tsrc\ttranscript\tabc\t200\t.\t+\t.\tgene_id \"X\";\n"
        "chr1\tsrc\ttranscript\t300\t200\t.\t+\t.\tgene_id \"X\";\n"
        "chr1\tsrc\ttranscript\t100\t200\t.\t?\t.\tgene_id \"X\";\n"
        "chr1\tsrc\ttranscript\t100\t200\t.\t+\t.\tgene_name \"X\";\n");

    AnnotationLoader loader;
    AnnotationSummary summary;
    auto genes = loader.load_gtf(path, "transcript", &summary);

    ASSERT_EQ(genes.size(), 1u);
    EXPECT_EQ(genes[0].gene_id, "OK");
    EXPECT_EQ(summary.malformed, 5u);
    EXPECT_EQ(summary.first_errors.size(), 5u);
}

TEST_F(AnnotationLoaderTest, MissingFileThrows) {
    AnnotationLoader loader;
    EXPECT_THROW(loader.load_gtf((dir_ / "absent.gtf").string()), InputError);
}

TEST(AnnotationAttributeTest, AttributeValue) {
    const std::string attrs = "gene_id \"ENSG1\"; gene_id_version \"3\"; gene_name \"TP53\"; level 2;";
    EXPECT_EQ(AnnotationLoader::attribute_value(attrs, "gene_id"), "ENSG1");
    EXPECT_EQ(AnnotationLoader::attribute_value(attrs, "gene_id_version"), "3");
    EXPECT_EQ(AnnotationLoader::attribute_value(attrs, "gene_name"), "TP53");
    EXPECT_EQ(AnnotationLoader::attribute_value(attrs, "level"), "2");
    EXPECT_EQ(AnnotationLoader::attribute_value(attrs, "gene_type"), "");
}

TEST(PromoterTest, FlanksFollowStrand) {
    GeneAnnotation plus;
    plus.sequence_id = "chr1";
    plus.start = 5000;
    plus.end = 9000;
    plus.strand = Strand::FORWARD;
    plus.gene_id = "P";

    GeneAnnotation minus = plus;
    minus.strand = Strand::REVERSE;
    minus.gene_id = "M";

    auto promoters = AnnotationLoader::build_promoters({plus, minus}, 1000, 200);
    ASSERT_EQ(promoters.size(), 2u);

    EXPECT_EQ(promoters[0].tss, 5000);
    EXPECT_EQ(promoters[0].interval.start, 4000);
    EXPECT_EQ(promoters[0].interval.end, 5201);

    // Last base of [5000, 9000)
    EXPECT_EQ(promoters[1].tss, 8999);
    EXPECT_EQ(promoters[1].interval.start, 8799);
    EXPECT_EQ(promoters[1].interval.end, 10000);
    EXPECT_EQ(promoters[1].gene_id, "M");
}

TEST(PromoterTest, ClampsAtSequenceStart) {
    GeneAnnotation g;
    g.sequence_id = "chr1";
    g.start = 300;
    g.end = 900;
    g.strand = Strand::FORWARD;
    g.gene_id = "EARLY";

    auto promoters = AnnotationLoader::build_promoters({g}, 1000, 1000);
    ASSERT_EQ(promoters.size(), 1u);
    EXPECT_EQ(promoters[0].interval.start, 0);
    EXPECT_EQ(promoters[0].interval.end, 1301);
}

TEST(PromoterTest, NegativeFlankThrows) {
    EXPECT_THROW(AnnotationLoader::build_promoters({}, -1, 10), ConfigError);
}

TEST(PromoterTest, IntervalViews) {
    GeneAnnotation g;
    g.sequence_id = "chr9";
    g.start = 10;
    g.end = 20;
    g.strand = Strand::FORWARD;
    g.gene_id = "A";

    auto spans = AnnotationLoader::gene_intervals({g});
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].sequence_id, "chr9");
    EXPECT_EQ(spans[0].length(), 10);

    auto promoters = AnnotationLoader::build_promoters({g}, 5, 5);
    auto pspans = AnnotationLoader::promoter_intervals(promoters);
    ASSERT_EQ(pspans.size(), 1u);
    EXPECT_EQ(pspans[0].start, 5);
    EXPECT_EQ(pspans[0].end, 16);
}

TEST_F(AnnotationLoaderTest, PromoterIncludesBothFlankEndpoints) {
    const std::string path = write_gtf(
        "chr1\tsrc\ttranscript\t1001\t5000\t.\t+\t.\tgene_id \"PLUS\";\n"
        "chr2\tsrc\ttranscript\t1001\t5000\t.\t-\t.\tgene_id \"MINUS\";\n");

    AnnotationLoader loader;
    auto genes = loader.load_gtf(path);
    ASSERT_EQ(genes.size(), 2u);

    auto promoters = AnnotationLoader::build_promoters(genes, 1000, 1000);
    ASSERT_EQ(promoters.size(), 2u);

    // + strand: TSS at GTF base 1001, promoter covers GTF bases 1..2001
    EXPECT_EQ(promoters[0].tss, 1000);
    EXPECT_EQ(promoters[0].interval.start, 0);
    EXPECT_EQ(promoters[0].interval.end, 2001);

    // - strand: TSS at GTF base 5000, promoter covers GTF bases 4000..6000
    EXPECT_EQ(promoters[1].tss, 4999);
    EXPECT_EQ(promoters[1].interval.start, 3999);
    EXPECT_EQ(promoters[1].interval.end, 6000);

    // Single-base features at each outermost promoter base, and one base past
    const std::vector<GenomicInterval> features = {
        GenomicInterval("chr1", 2000, 2001),  // GTF base 2001
        GenomicInterval("chr1", 2001, 2002),  // GTF base 2002
        GenomicInterval("chr2", 3999, 4000),  // GTF base 4000
        GenomicInterval("chr2", 3998, 3999),  // GTF base 3999
        GenomicInterval("chr2", 5999, 6000),  // GTF base 6000
    };
    auto pairs = ColocalizationEngine::find_overlapping(features, AnnotationLoader::promoter_intervals(promoters));
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].sequence_id, "chr1");
    EXPECT_EQ(pairs[0].ref_a, 0u);
    EXPECT_EQ(pairs[1].ref_a, 2u);
    EXPECT_EQ(pairs[2].ref_a, 4u);
    EXPECT_EQ(pairs[2].position_a, 5999);
}
