#include "ScoreMatcher.hpp"
#include "ScorefileWriter.hpp"
#include "cli_utils.hpp"
#include "logging.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace pgs_match {

ScoreMatcher::ScoreMatcher()
    : removeAmbiguous(true), minOverlap(0.0), splitByChromosome(false),
      verbose(false), matched(false) {}

void ScoreMatcher::setRemoveAmbiguous(bool remove) { removeAmbiguous = remove; }

void ScoreMatcher::setMinOverlap(double fraction) {
  if (!(fraction >= 0.0) || fraction > 1.0) {
    throw std::invalid_argument("Minimum overlap must be between 0 and 1");
  }
  minOverlap = fraction;
}

void ScoreMatcher::setSplitByChromosome(bool split) {
  splitByChromosome = split;
}

void ScoreMatcher::setVerbose(bool v) { verbose = v; }

void ScoreMatcher::setMatchLogPath(const std::string &path) {
  matchLogPath = path;
}

void ScoreMatcher::loadTarget(const std::string &path, TargetFormat format) {
  clock_t start = clock();
  stats.target = TargetReadStats();
  targets = readTarget(path, format, stats.target);
  stats.timeLoading += (double)(clock() - start) / CLOCKS_PER_SEC;

  if (stats.target.nMissingAllele > 0) {
    warn(std::to_string(stats.target.nMissingAllele) +
         " target alleles with a missing REF or ALT ('0' or '.') skipped");
  }
  if (stats.target.nInvalidAllele > 0) {
    warn(std::to_string(stats.target.nInvalidAllele) +
         " target alleles with symbols other than A/C/G/T (e.g. I/D, N, '*', "
         "<DEL>) skipped");
  }
  log("Read " + std::to_string(targets.size()) + " target variants from " +
      path);
}

void ScoreMatcher::loadScorefile(const std::string &path) {
  clock_t start = clock();
  scores = readScorefile(path);
  stats.nScoreEntries = static_cast<long>(scores.size());
  stats.timeLoading += (double)(clock() - start) / CLOCKS_PER_SEC;
  log("Read " + std::to_string(scores.size()) + " scoring entries from " +
      path);
}

void ScoreMatcher::match() {
  clock_t start = clock();

  allMatches = labelAmbiguous(matchVariants(scores, targets), false);
  matches = labelAmbiguous(allMatches, removeAmbiguous);

  stats.nMatches = static_cast<long>(allMatches.size());
  stats.nAmbiguous = 0;
  stats.nByMatchType.clear();
  for (const auto &record : allMatches) {
    stats.nByMatchType[toString(record.matchType)]++;
    if (record.ambiguous)
      stats.nAmbiguous++;
  }
  stats.nRemoved = stats.nMatches - static_cast<long>(matches.size());
  stats.timeMatching = (double)(clock() - start) / CLOCKS_PER_SEC;

  if (!matchLogPath.empty()) {
    writeMatchLog(matchLogPath);
    if (verbose)
      log("Wrote match log " + matchLogPath);
  }

  overlap = computeOverlap(scores, matches);
  log("Matched " + std::to_string(overlap.nMatchedVariants) + " of " +
      std::to_string(overlap.nScoreVariants) + " scoring variants");
  checkOverlap(overlap, minOverlap);
  matched = true;
}

const MatchRecords &ScoreMatcher::getMatches() const { return matches; }

const MatchRecords &ScoreMatcher::getAllMatches() const { return allMatches; }

const OverlapSummary &ScoreMatcher::getOverlap() const { return overlap; }

std::vector<std::string>
ScoreMatcher::writeScorefiles(const std::string &dataset,
                              const std::string &outdir) {
  if (!matched) {
    throw std::runtime_error("No matches to write: match() has not run");
  }

  // path -> table; built completely before anything is written
  std::vector<std::pair<std::string, ScoreTable>> outputs;
  stats.nByEffectType.clear();

  std::map<std::string, MatchRecords> effectTypes = splitEffectTypes(matches);
  for (const auto &et : effectTypes) {
    DuplicateSplit split = splitDuplicates(et.second);
    stats.nByEffectType[et.first] = std::make_pair(
        static_cast<long>(split.unique.size()),
        static_cast<long>(split.duplicate.size()));

    const MatchRecords *groups[] = {&split.unique, &split.duplicate};
    for (int g = 0; g < 2; ++g) {
      if (groups[g]->empty())
        continue;
      bool duplicate = g == 1;
      std::map<std::string, ScoreTable> tables =
          formatScorefile(*groups[g], splitByChromosome);

      std::set<std::string> keys;
      for (const auto &pair : tables)
        keys.insert(pair.first);
      for (const auto &key : sortChromosomes(keys)) {
        outputs.push_back(std::make_pair(
            scorefilePath(outdir, dataset, key, et.first, duplicate),
            tables[key]));
      }
    }

    if (verbose && !split.duplicate.empty()) {
      log(std::to_string(split.duplicate.size()) + " " + et.first +
          " matches share an ID and go to a separate score file");
    }
  }

  std::vector<std::string> written;
  for (const auto &output : outputs) {
    writeScoreTable(output.second, output.first);
    written.push_back(output.first);
    if (verbose)
      log("Wrote " + output.first);
  }
  stats.nFilesWritten = static_cast<long>(written.size());
  return written;
}

void ScoreMatcher::writeMatchLog(const std::string &path) const {
  pgs_match::writeMatchLog(allMatches, path);
}

void ScoreMatcher::printStats() const {
  std::cerr << "  * Input parsing done (" << std::fixed << std::setprecision(2)
            << stats.timeLoading << "s)" << std::endl;
  std::cerr << "      + Target [#sites=" << stats.target.nLines
            << ", #variants=" << stats.target.nVariants << "]" << std::endl;
  if (stats.target.nMissingAllele + stats.target.nInvalidAllele > 0) {
    std::cerr << "         - " << stats.target.nMissingAllele
              << " missing and " << stats.target.nInvalidAllele
              << " non-ACGT alleles skipped" << std::endl;
  }
  if (stats.target.nMultiallelic > 0) {
    std::cerr << "         - " << stats.target.nMultiallelic
              << " multi-allelic sites split" << std::endl;
  }
  std::cerr << "      + Scorefile [#entries=" << stats.nScoreEntries
            << ", #variants=" << overlap.nScoreVariants << "]" << std::endl;

  std::cerr << "  * Matching done (" << std::fixed << std::setprecision(2)
            << stats.timeMatching << "s)" << std::endl;
  std::cerr << "      + Matches [n=" << stats.nMatches;
  for (const auto &pair : stats.nByMatchType)
    std::cerr << ", " << pair.first << "=" << pair.second;
  std::cerr << "]" << std::endl;
  std::cerr << "      + Ambiguous [n=" << stats.nAmbiguous
            << ", removed=" << stats.nRemoved << "]" << std::endl;

  std::cerr << "      + Overlap [" << overlap.nMatchedVariants << "/"
            << overlap.nScoreVariants << "=" << std::setprecision(3)
            << overlap.fraction() * 100.0 << "%]" << std::endl;
  for (const auto &pair : overlap.perAccession) {
    double pct = pair.second.second == 0
                     ? 0.0
                     : (double)pair.second.first / pair.second.second * 100.0;
    std::cerr << "         - " << pair.first << " : " << pair.second.first
              << "/" << pair.second.second << " (" << std::setprecision(3)
              << pct << "%)" << std::endl;
  }

  if (!stats.nByEffectType.empty()) {
    std::cerr << "  * Writing done [#files=" << stats.nFilesWritten << "]"
              << std::endl;
    for (const auto &pair : stats.nByEffectType) {
      std::cerr << "      + " << pair.first << " [first=" << pair.second.first
                << ", dup=" << pair.second.second << "]" << std::endl;
    }
  }
}

} // namespace pgs_match
