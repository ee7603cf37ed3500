#ifndef SCOREFILE_WRITER_HPP
#define SCOREFILE_WRITER_HPP

#include "variants.hpp"
#include <map>
#include <string>
#include <vector>

namespace pgs_match {

/**
 * @brief A plink2 --score table: ID, effect allele, one weight per accession.
 */
struct ScoreTable {
  struct Row {
    std::string id;
    std::string effectAllele;
    std::vector<double> weights; // one per accession, 0 when absent
  };

  std::vector<std::string> accessions; // sorted
  std::vector<Row> rows;               // first-appearance order
};

// Key used by formatScorefile when the output is not split by chromosome.
extern const char *const kAllChromosomes;

/**
 * @brief Pivot matches to wide score tables.
 *
 * Each distinct (ID, effect allele) becomes a row and each accession a column
 * holding its effect weight; combinations without a weight are 0. If the
 * same cell is seen twice the first weight is kept.
 *
 * @param matches Matches of one effect type and duplicate group.
 * @param splitByChromosome If true, one table per chromosome.
 * @return std::map<std::string, ScoreTable> Tables keyed by chromosome, or a
 * single table under kAllChromosomes.
 */
std::map<std::string, ScoreTable> formatScorefile(const MatchRecords &matches,
                                                  bool splitByChromosome);

/**
 * @brief Shortest decimal text that reads back as the same double.
 */
std::string formatWeight(double weight);

/**
 * @brief Output path: <outdir>/<dataset>_<key>_<effectType>_<first|dup>.scorefile
 */
std::string scorefilePath(const std::string &outdir,
                          const std::string &dataset, const std::string &key,
                          const std::string &effectType, bool duplicate);

/**
 * @brief Write a score table as tab-separated text with a header line.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void writeScoreTable(const ScoreTable &table, const std::string &path);

/**
 * @brief Write every match record with its hypothesis and ambiguous flag.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void writeMatchLog(const MatchRecords &matches, const std::string &path);

} // namespace pgs_match

#endif // SCOREFILE_WRITER_HPP
