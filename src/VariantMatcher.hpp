#ifndef VARIANT_MATCHER_HPP
#define VARIANT_MATCHER_HPP

#include "variants.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pgs_match {

/**
 * @brief Join score entries against target variants under the four
 * allele-orientation hypotheses.
 *
 * Hypotheses are tried in the order refalt, altref, refalt_flip, altref_flip
 * and their results concatenated without deduplication, so a palindromic
 * site yields one record per satisfied hypothesis. Within a hypothesis,
 * records follow scorefile order, then target order.
 *
 * @param scores Score entries.
 * @param targets Target variants with flipped alleles.
 * @return MatchRecords All matches, ambiguous flag unset.
 */
MatchRecords matchVariants(const std::vector<ScoreEntry> &scores,
                           const std::vector<TargetVariant> &targets);

/**
 * @brief True if the record's allele pair satisfies both a non-flip and a
 * flip pairing of its target, i.e. strand cannot be told from the alleles.
 */
bool isAmbiguous(const MatchRecord &record);

/**
 * @brief Set the ambiguous flag on every record, optionally dropping the
 * ambiguous ones.
 *
 * @param matches Output of matchVariants.
 * @param removeAmbiguous If true, only unambiguous records are returned.
 * @return MatchRecords Records in input order with the flag set.
 */
MatchRecords labelAmbiguous(const MatchRecords &matches, bool removeAmbiguous);

/**
 * @brief Split matches by effect type; keys are sorted, input order is kept
 * inside each group.
 */
std::map<std::string, MatchRecords>
splitEffectTypes(const MatchRecords &matches);

/**
 * @brief Matches split by whether their target identifier is unique.
 */
struct DuplicateSplit {
  MatchRecords unique;    // identifier appears once
  MatchRecords duplicate; // identifier appears two or more times
};

/**
 * @brief Route every record whose identifier occurs more than once to the
 * duplicate group and the rest to the unique group.
 *
 * plink2 --score needs one row per variant ID, so a variant scored with
 * different effect alleles has to be scored in a separate file.
 */
DuplicateSplit splitDuplicates(const MatchRecords &matches);

/**
 * @brief How many distinct scoring variants found a match.
 *
 * A scoring variant is keyed by (chromosome, position, effect allele, other
 * allele), so the same variant in several accessions counts once overall.
 */
struct OverlapSummary {
  long nScoreVariants = 0;
  long nMatchedVariants = 0;
  long nMatches = 0;
  // accession -> (matched, total)
  std::map<std::string, std::pair<long, long>> perAccession;

  double fraction() const {
    return nScoreVariants == 0
               ? 0.0
               : static_cast<double>(nMatchedVariants) / nScoreVariants;
  }
};

OverlapSummary computeOverlap(const std::vector<ScoreEntry> &scores,
                              const MatchRecords &matches);

/**
 * @brief Abort the run when nothing matched or too little matched.
 *
 * @throws NoMatchesError if there are no matches at all.
 * @throws InsufficientOverlapError if the matched fraction is strictly below
 * minOverlap.
 */
void checkOverlap(const OverlapSummary &summary, double minOverlap);

} // namespace pgs_match

#endif // VARIANT_MATCHER_HPP
