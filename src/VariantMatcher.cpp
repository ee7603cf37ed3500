#include "VariantMatcher.hpp"
#include "errors.hpp"
#include <set>
#include <tuple>
#include <utility>

namespace pgs_match {

namespace {

using SiteKey = std::pair<std::string, long>;
using VariantKey = std::tuple<std::string, long, std::string, std::string>;

// Target alleles a score entry must equal under a hypothesis.
struct Hypothesis {
  MatchType type;
  const std::string TargetVariant::*effect;
  const std::string TargetVariant::*other;
};

const Hypothesis kHypotheses[] = {
    {MatchType::RefAlt, &TargetVariant::ref, &TargetVariant::alt},
    {MatchType::AltRef, &TargetVariant::alt, &TargetVariant::ref},
    {MatchType::RefAltFlip, &TargetVariant::refFlip, &TargetVariant::altFlip},
    {MatchType::AltRefFlip, &TargetVariant::altFlip, &TargetVariant::refFlip},
};

VariantKey variantKey(const ScoreEntry &score) {
  return std::make_tuple(score.chromosome, score.position, score.effectAllele,
                         score.otherAllele);
}

} // namespace

MatchRecords matchVariants(const std::vector<ScoreEntry> &scores,
                           const std::vector<TargetVariant> &targets) {
  // (chromosome, position) -> target rows in file order
  std::map<SiteKey, std::vector<size_t>> sites;
  for (size_t i = 0; i < targets.size(); ++i) {
    sites[SiteKey(targets[i].chromosome, targets[i].position)].push_back(i);
  }

  MatchRecords matches;
  for (const auto &hypothesis : kHypotheses) {
    for (const auto &score : scores) {
      auto it = sites.find(SiteKey(score.chromosome, score.position));
      if (it == sites.end())
        continue;

      for (size_t idx : it->second) {
        const TargetVariant &target = targets[idx];
        if (score.effectAllele == target.*(hypothesis.effect) &&
            score.otherAllele == target.*(hypothesis.other)) {
          MatchRecord record;
          record.score = score;
          record.target = target;
          record.matchType = hypothesis.type;
          matches.push_back(record);
        }
      }
    }
  }
  return matches;
}

bool isAmbiguous(const MatchRecord &record) {
  const std::string &ea = record.score.effectAllele;
  const std::string &oa = record.score.otherAllele;
  const TargetVariant &t = record.target;

  bool strandMatch =
      (ea == t.ref && oa == t.alt) || (ea == t.alt && oa == t.ref);
  bool flipMatch = (ea == t.refFlip && oa == t.altFlip) ||
                   (ea == t.altFlip && oa == t.refFlip);
  return strandMatch && flipMatch;
}

MatchRecords labelAmbiguous(const MatchRecords &matches, bool removeAmbiguous) {
  MatchRecords labelled;
  labelled.reserve(matches.size());
  for (const auto &match : matches) {
    MatchRecord record = match;
    record.ambiguous = isAmbiguous(record);
    if (removeAmbiguous && record.ambiguous)
      continue;
    labelled.push_back(record);
  }
  return labelled;
}

std::map<std::string, MatchRecords>
splitEffectTypes(const MatchRecords &matches) {
  std::map<std::string, MatchRecords> groups;
  for (const auto &match : matches) {
    groups[match.score.effectType].push_back(match);
  }
  return groups;
}

DuplicateSplit splitDuplicates(const MatchRecords &matches) {
  std::map<std::string, long> idCounts;
  for (const auto &match : matches) {
    idCounts[match.target.id]++;
  }

  DuplicateSplit split;
  for (const auto &match : matches) {
    if (idCounts[match.target.id] > 1)
      split.duplicate.push_back(match);
    else
      split.unique.push_back(match);
  }
  return split;
}

OverlapSummary computeOverlap(const std::vector<ScoreEntry> &scores,
                              const MatchRecords &matches) {
  std::set<VariantKey> matched;
  std::map<std::string, std::set<VariantKey>> matchedByAccession;
  for (const auto &match : matches) {
    VariantKey key = variantKey(match.score);
    matched.insert(key);
    matchedByAccession[match.score.accession].insert(key);
  }

  std::set<VariantKey> all;
  std::map<std::string, std::set<VariantKey>> allByAccession;
  for (const auto &score : scores) {
    VariantKey key = variantKey(score);
    all.insert(key);
    allByAccession[score.accession].insert(key);
  }

  OverlapSummary summary;
  summary.nScoreVariants = static_cast<long>(all.size());
  summary.nMatchedVariants = static_cast<long>(matched.size());
  summary.nMatches = static_cast<long>(matches.size());
  for (const auto &pair : allByAccession) {
    long nMatched = 0;
    auto it = matchedByAccession.find(pair.first);
    if (it != matchedByAccession.end())
      nMatched = static_cast<long>(it->second.size());
    summary.perAccession[pair.first] =
        std::make_pair(nMatched, static_cast<long>(pair.second.size()));
  }
  return summary;
}

void checkOverlap(const OverlapSummary &summary, double minOverlap) {
  if (summary.nMatches == 0) {
    throw NoMatchesError();
  }
  if (summary.fraction() < minOverlap) {
    throw InsufficientOverlapError(summary.fraction(), minOverlap);
  }
}

} // namespace pgs_match
