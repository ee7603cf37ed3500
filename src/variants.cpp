#include "variants.hpp"
#include "alleles.hpp"
#include "errors.hpp"

namespace pgs_match {

TargetVariant makeTargetVariant(const std::string &chromosome,
                                const std::string &id, long position,
                                const std::string &ref,
                                const std::string &alt) {
  TargetVariant v;
  v.chromosome = chromosome;
  v.id = id;
  v.position = position;
  v.ref = ref;
  v.alt = alt;
  v.refFlip = complement(ref);
  v.altFlip = complement(alt);
  return v;
}

std::string normalizeEffectType(const std::string &label) {
  if (label == "additive")
    return "additive";
  if (label == "dominant" || label == "is_dominant")
    return "dominant";
  if (label == "recessive" || label == "is_recessive")
    return "recessive";
  throw InputFormatError("Unknown effect_type '" + label +
                         "' (expected additive, is_dominant or is_recessive)");
}

std::string toString(MatchType type) {
  switch (type) {
  case MatchType::RefAlt:
    return "refalt";
  case MatchType::AltRef:
    return "altref";
  case MatchType::RefAltFlip:
    return "refalt_flip";
  case MatchType::AltRefFlip:
    return "altref_flip";
  }
  return "unknown";
}

} // namespace pgs_match
