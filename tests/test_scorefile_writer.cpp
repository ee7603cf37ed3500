#include "ScorefileWriter.hpp"
#include "cli_utils.hpp"
#include "test_utils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace pgs_match {

namespace {

MatchRecord makeMatch(const std::string &chrom, const std::string &id,
                      const std::string &ea, double weight,
                      const std::string &accession) {
  MatchRecord m;
  m.score.chromosome = chrom;
  m.score.position = 1;
  m.score.effectAllele = ea;
  m.score.otherAllele = "A";
  m.score.effectWeight = weight;
  m.score.effectType = "additive";
  m.score.accession = accession;
  m.target.chromosome = chrom;
  m.target.id = id;
  return m;
}

} // namespace

TEST(TestFormatScorefile, PivotsAccessionsToColumnsWithZeroFill) {
  MatchRecords matches = {makeMatch("1", "rs2", "G", 0.5, "PGS2"),
                          makeMatch("1", "rs1", "C", 0.25, "PGS1"),
                          makeMatch("1", "rs2", "G", -1.0, "PGS1")};

  std::map<std::string, ScoreTable> tables = formatScorefile(matches, false);
  ASSERT_EQ(tables.size(), 1u);
  ASSERT_EQ(tables.count(kAllChromosomes), 1u);
  const ScoreTable &table = tables[kAllChromosomes];

  std::vector<std::string> accessions = {"PGS1", "PGS2"};
  EXPECT_EQ(table.accessions, accessions);
  ASSERT_EQ(table.rows.size(), 2u);

  // rows in order of first appearance
  EXPECT_EQ(table.rows[0].id, "rs2");
  EXPECT_EQ(table.rows[0].effectAllele, "G");
  std::vector<double> rs2 = {-1.0, 0.5};
  EXPECT_EQ(table.rows[0].weights, rs2);

  EXPECT_EQ(table.rows[1].id, "rs1");
  std::vector<double> rs1 = {0.25, 0.0};
  EXPECT_EQ(table.rows[1].weights, rs1);
}

TEST(TestFormatScorefile, SameIdWithTwoEffectAllelesGivesTwoRows) {
  MatchRecords matches = {makeMatch("1", "rs3", "A", 0.2, "Y"),
                          makeMatch("1", "rs3", "C", 0.7, "Z")};
  ScoreTable table = formatScorefile(matches, false)[kAllChromosomes];
  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0].effectAllele, "A");
  EXPECT_EQ(table.rows[0].weights, std::vector<double>({0.2, 0.0}));
  EXPECT_EQ(table.rows[1].effectAllele, "C");
  EXPECT_EQ(table.rows[1].weights, std::vector<double>({0.0, 0.7}));
}

TEST(TestFormatScorefile, RepeatedCellKeepsFirstWeight) {
  MatchRecords matches = {makeMatch("1", "rs1", "A", 0.2, "Y"),
                          makeMatch("1", "rs1", "A", 0.9, "Y")};
  ScoreTable table = formatScorefile(matches, false)[kAllChromosomes];
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0].weights, std::vector<double>({0.2}));
}

TEST(TestFormatScorefile, SplitByChromosome) {
  MatchRecords matches = {makeMatch("2", "rs2", "G", 0.5, "P"),
                          makeMatch("1", "rs1", "C", 0.25, "Q"),
                          makeMatch("2", "rs3", "T", 1.0, "Q")};

  std::map<std::string, ScoreTable> tables = formatScorefile(matches, true);
  ASSERT_EQ(tables.size(), 2u);

  const ScoreTable &chr1 = tables["1"];
  EXPECT_EQ(chr1.accessions, std::vector<std::string>({"Q"}));
  ASSERT_EQ(chr1.rows.size(), 1u);
  EXPECT_EQ(chr1.rows[0].id, "rs1");

  const ScoreTable &chr2 = tables["2"];
  EXPECT_EQ(chr2.accessions, std::vector<std::string>({"P", "Q"}));
  ASSERT_EQ(chr2.rows.size(), 2u);
  EXPECT_EQ(chr2.rows[0].weights, std::vector<double>({0.5, 0.0}));
  EXPECT_EQ(chr2.rows[1].weights, std::vector<double>({0.0, 1.0}));
}

TEST(TestFormatScorefile, EmptyInputGivesEmptyTable) {
  std::map<std::string, ScoreTable> tables =
      formatScorefile(MatchRecords(), false);
  ASSERT_EQ(tables.size(), 1u);
  EXPECT_TRUE(tables[kAllChromosomes].rows.empty());
  EXPECT_TRUE(formatScorefile(MatchRecords(), true).empty());
}

TEST(TestFormatWeight, ShortestRoundTrip) {
  EXPECT_EQ(formatWeight(0.0), "0");
  EXPECT_EQ(formatWeight(0.5), "0.5");
  EXPECT_EQ(formatWeight(0.1), "0.1");
  EXPECT_EQ(formatWeight(-0.3), "-0.3");
  EXPECT_EQ(formatWeight(1e-8), "1e-08");
  EXPECT_EQ(formatWeight(12), "12");

  double awkward = 0.1 + 0.2;
  EXPECT_EQ(std::stod(formatWeight(awkward)), awkward);
}

TEST(TestScorefilePath, FirstAndDupAreDistinct) {
  std::string first = scorefilePath("out", "cohort", "ALL", "additive", false);
  std::string dup = scorefilePath("out/", "cohort", "ALL", "additive", true);
  EXPECT_EQ(first, "out/cohort_ALL_additive_first.scorefile");
  EXPECT_EQ(dup, "out/cohort_ALL_additive_dup.scorefile");
  EXPECT_EQ(scorefilePath("", "cohort", "22", "dominant", false),
            "cohort_22_dominant_first.scorefile");
}

TEST(TestWriteScoreTable, TabSeparatedWithHeader) {
  ScoreTable table;
  table.accessions = {"PGS1", "PGS2"};
  ScoreTable::Row row;
  row.id = "rs1";
  row.effectAllele = "A";
  row.weights = {0.5, 0.0};
  table.rows.push_back(row);

  std::string path = pgs_match_test::tempPath("table.scorefile");
  writeScoreTable(table, path);
  EXPECT_EQ(pgs_match_test::readFile(path),
            "ID\teffect_allele\tPGS1\tPGS2\n"
            "rs1\tA\t0.5\t0\n");
}

TEST(TestWriteScoreTable, UnwritablePathThrows) {
  ScoreTable table;
  EXPECT_THROW(writeScoreTable(table, "/nonexistent-dir/x.scorefile"),
               std::runtime_error);
}

TEST(TestWriteMatchLog, OneLinePerRecord) {
  MatchRecord m = makeMatch("1", "rs2", "A", 0.8, "X");
  m.score.position = 200;
  m.score.otherAllele = "T";
  m.target.ref = "A";
  m.target.alt = "T";
  m.target.refFlip = "T";
  m.target.altFlip = "A";
  m.matchType = MatchType::AltRefFlip;
  m.ambiguous = true;

  std::string path = pgs_match_test::tempPath("matches.tsv");
  writeMatchLog(MatchRecords{m}, path);
  std::string content = pgs_match_test::readFile(path);
  std::vector<std::string> lines = splitFields(content, '\n');
  ASSERT_EQ(lines.size(), 3u); // header, record, trailing empty field
  EXPECT_EQ(lines[1], "1\t200\tA\tT\t0.8\tadditive\tX\trs2\tA\tT\tT\tA\t"
                      "altref_flip\ttrue");
}

TEST(TestSortChromosomes, NaturalOrder) {
  std::set<std::string> contigs = {"X", "10", "2", "1", "MT", "Y", "22",
                                   "ALL"};
  std::vector<std::string> expected = {"1", "2", "10", "22",
                                       "X", "Y", "MT", "ALL"};
  EXPECT_EQ(sortChromosomes(contigs), expected);
}

TEST(TestSortChromosomes, SexChromosomesBeforeMitochondrial) {
  std::set<std::string> contigs = {"MT", "X", "Y", "1"};
  std::vector<std::string> expected = {"1", "X", "Y", "MT"};
  EXPECT_EQ(sortChromosomes(contigs), expected);

  std::set<std::string> prefixed = {"chrM", "chrY", "chrX", "chr2", "chrUn"};
  std::vector<std::string> expectedPrefixed = {"chr2", "chrX", "chrY", "chrM",
                                               "chrUn"};
  EXPECT_EQ(sortChromosomes(prefixed), expectedPrefixed);
}

TEST(TestSortChromosomes, ChrPrefix) {
  std::set<std::string> contigs = {"chr10", "chr2", "chrX", "chr1"};
  std::vector<std::string> expected = {"chr1", "chr2", "chr10", "chrX"};
  EXPECT_EQ(sortChromosomes(contigs), expected);
}

} // namespace pgs_match
