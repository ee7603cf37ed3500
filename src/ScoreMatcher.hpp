#ifndef SCORE_MATCHER_HPP
#define SCORE_MATCHER_HPP

#include "VariantMatcher.hpp"
#include "VariantReader.hpp"
#include "variants.hpp"
#include <map>
#include <string>
#include <vector>

namespace pgs_match {

/**
 * @brief Runs one matching job: load target and scoring variants, match them,
 * check the overlap and write plink2 score files.
 *
 * All state belongs to one run; nothing is shared between instances.
 */
class ScoreMatcher {
public:
  ScoreMatcher();

  // section: Configuration

  /**
   * @brief Drop strand-ambiguous matches (A/T, C/G). Default: true.
   */
  void setRemoveAmbiguous(bool remove);

  /**
   * @brief Minimum fraction of scoring variants that must match. Default: 0.
   */
  void setMinOverlap(double fraction);

  /**
   * @brief Write one score file per chromosome. Default: false.
   */
  void setSplitByChromosome(bool split);

  void setVerbose(bool v);

  /**
   * @brief Write every match, ambiguous flag set, to this path as soon as
   * match() has labelled them, before the overlap check can abort the run.
   */
  void setMatchLogPath(const std::string &path);

  // section: Data Loading

  /**
   * @brief Load the target variants.
   *
   * @throws InputFormatError, std::runtime_error
   */
  void loadTarget(const std::string &path, TargetFormat format);

  /**
   * @brief Load the combined scoring file.
   *
   * @throws InputFormatError, std::runtime_error
   */
  void loadScorefile(const std::string &path);

  // section: Processing

  /**
   * @brief Match, label ambiguous records, write the match log if one is
   * set, and enforce the minimum overlap.
   *
   * @throws NoMatchesError if nothing is left after ambiguity removal.
   * @throws InsufficientOverlapError if the overlap is below the threshold.
   */
  void match();

  // section: Output

  /**
   * @brief Matches kept for scoring (ambiguous ones removed if requested).
   */
  const MatchRecords &getMatches() const;

  /**
   * @brief Every match, ambiguous flag set, before removal.
   */
  const MatchRecords &getAllMatches() const;

  const OverlapSummary &getOverlap() const;

  /**
   * @brief Write one score file per (effect type, duplicate group[,
   * chromosome]).
   *
   * All tables are built before the first file is opened.
   *
   * @return std::vector<std::string> Paths written.
   * @throws std::runtime_error if a file cannot be written.
   */
  std::vector<std::string> writeScorefiles(const std::string &dataset,
                                           const std::string &outdir);

  /**
   * @brief Write all matches (including ambiguous ones) for inspection.
   */
  void writeMatchLog(const std::string &path) const;

  void printStats() const;

  struct RunStats {
    double timeLoading = 0.0;
    double timeMatching = 0.0;

    TargetReadStats target;
    long nScoreEntries = 0;

    long nMatches = 0;
    long nAmbiguous = 0;
    long nRemoved = 0;
    std::map<std::string, long> nByMatchType;

    // effect type -> (unique rows, duplicate rows)
    std::map<std::string, std::pair<long, long>> nByEffectType;
    long nFilesWritten = 0;
  } stats;

private:
  bool removeAmbiguous;
  double minOverlap;
  bool splitByChromosome;
  bool verbose;
  bool matched;
  std::string matchLogPath;

  std::vector<TargetVariant> targets;
  std::vector<ScoreEntry> scores;
  MatchRecords allMatches;
  MatchRecords matches;
  OverlapSummary overlap;
};

} // namespace pgs_match

#endif // SCORE_MATCHER_HPP
