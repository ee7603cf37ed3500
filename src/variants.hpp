#ifndef VARIANTS_HPP
#define VARIANTS_HPP

#include <string>
#include <vector>

namespace pgs_match {

/**
 * @brief One genotyped site of the target dataset.
 *
 * refFlip and altFlip are filled once by makeTargetVariant and never change.
 */
struct TargetVariant {
  std::string chromosome;
  std::string id;
  long position = 0;
  std::string ref;
  std::string alt;
  std::string refFlip;
  std::string altFlip;
};

/**
 * @brief Build a target variant and derive its strand-flipped alleles.
 *
 * @throws InvalidAlleleError if ref or alt cannot be complemented.
 */
TargetVariant makeTargetVariant(const std::string &chromosome,
                                const std::string &id, long position,
                                const std::string &ref,
                                const std::string &alt);

/**
 * @brief One row of the combined scoring file: a variant weighted by a single
 * scoring source (accession).
 */
struct ScoreEntry {
  std::string chromosome;
  long position = 0;
  std::string effectAllele;
  std::string otherAllele;
  double effectWeight = 0.0;
  std::string effectType; // "additive", "dominant" or "recessive"
  std::string accession;
};

/**
 * @brief Map scoring-file effect type labels to additive/dominant/recessive.
 *
 * Accepts "additive", "dominant", "recessive", "is_dominant" and
 * "is_recessive".
 *
 * @throws InputFormatError for any other label.
 */
std::string normalizeEffectType(const std::string &label);

// Allele-orientation hypothesis under which a score entry matched a target.
enum class MatchType { RefAlt, AltRef, RefAltFlip, AltRefFlip };

std::string toString(MatchType type);

/**
 * @brief A score entry joined to a target variant under one hypothesis.
 */
struct MatchRecord {
  ScoreEntry score;
  TargetVariant target;
  MatchType matchType = MatchType::RefAlt;
  bool ambiguous = false;
};

using MatchRecords = std::vector<MatchRecord>;

} // namespace pgs_match

#endif // VARIANTS_HPP
