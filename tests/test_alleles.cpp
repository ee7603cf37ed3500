#include "alleles.hpp"
#include "errors.hpp"
#include "variants.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace pgs_match {

namespace {

// Every string over {A,C,G,T} up to the given length.
std::vector<std::string> allAlleles(size_t maxLength) {
  std::vector<std::string> alleles;
  std::vector<std::string> current = {""};
  for (size_t len = 1; len <= maxLength; ++len) {
    std::vector<std::string> next;
    for (const auto &prefix : current) {
      for (char base : std::string("ACGT"))
        next.push_back(prefix + base);
    }
    alleles.insert(alleles.end(), next.begin(), next.end());
    current = next;
  }
  return alleles;
}

} // namespace

TEST(TestAlleles, ComplementSingleBases) {
  EXPECT_EQ(complement("A"), "T");
  EXPECT_EQ(complement("T"), "A");
  EXPECT_EQ(complement("C"), "G");
  EXPECT_EQ(complement("G"), "C");
}

TEST(TestAlleles, ComplementKeepsBaseOrder) {
  // not a reverse complement
  EXPECT_EQ(complement("AC"), "TG");
  EXPECT_EQ(complement("GATTACA"), "CTAATGT");
}

TEST(TestAlleles, ComplementIsAnInvolution) {
  for (const auto &allele : allAlleles(4)) {
    std::string flipped = complement(allele);
    EXPECT_EQ(flipped.size(), allele.size());
    EXPECT_NE(flipped, allele) << allele;
    EXPECT_EQ(complement(flipped), allele) << allele;
  }
}

TEST(TestAlleles, ComplementRejectsOtherSymbols) {
  EXPECT_THROW(complement("N"), InvalidAlleleError);
  EXPECT_THROW(complement("a"), InvalidAlleleError);
  EXPECT_THROW(complement("AC,G"), InvalidAlleleError);
  EXPECT_THROW(complement("ACGTN"), InvalidAlleleError);
  EXPECT_THROW(complement("*"), InvalidAlleleError);
  EXPECT_THROW(complement(""), InvalidAlleleError);
}

TEST(TestAlleles, ComplementErrorNamesTheAllele) {
  try {
    complement("ANT");
    FAIL() << "expected InvalidAlleleError";
  } catch (const InvalidAlleleError &e) {
    EXPECT_NE(std::string(e.what()).find("ANT"), std::string::npos);
  }
}

TEST(TestAlleles, IsValidAllele) {
  EXPECT_TRUE(isValidAllele("A"));
  EXPECT_TRUE(isValidAllele("ACGT"));
  EXPECT_FALSE(isValidAllele(""));
  EXPECT_FALSE(isValidAllele("0"));
  EXPECT_FALSE(isValidAllele("."));
  EXPECT_FALSE(isValidAllele("acgt"));
}

TEST(TestTargetVariant, FlippedAllelesAreDerivedOnce) {
  TargetVariant v = makeTargetVariant("1", "rs1", 100, "A", "G");
  EXPECT_EQ(v.chromosome, "1");
  EXPECT_EQ(v.id, "rs1");
  EXPECT_EQ(v.position, 100);
  EXPECT_EQ(v.refFlip, "T");
  EXPECT_EQ(v.altFlip, "C");
  EXPECT_EQ(complement(v.refFlip), v.ref);
  EXPECT_EQ(complement(v.altFlip), v.alt);
}

TEST(TestTargetVariant, IndelAllelesAreFlipped) {
  TargetVariant v = makeTargetVariant("2", "2:5:AT:A", 5, "AT", "A");
  EXPECT_EQ(v.refFlip, "TA");
  EXPECT_EQ(v.altFlip, "T");
}

TEST(TestTargetVariant, InvalidAlleleThrows) {
  EXPECT_THROW(makeTargetVariant("1", "rs1", 1, "A", "N"),
               InvalidAlleleError);
}

TEST(TestEffectType, NormalizesScorefileLabels) {
  EXPECT_EQ(normalizeEffectType("additive"), "additive");
  EXPECT_EQ(normalizeEffectType("is_dominant"), "dominant");
  EXPECT_EQ(normalizeEffectType("dominant"), "dominant");
  EXPECT_EQ(normalizeEffectType("is_recessive"), "recessive");
  EXPECT_EQ(normalizeEffectType("recessive"), "recessive");
  EXPECT_THROW(normalizeEffectType("multiplicative"), InputFormatError);
  EXPECT_THROW(normalizeEffectType(""), InputFormatError);
}

TEST(TestMatchType, Names) {
  EXPECT_EQ(toString(MatchType::RefAlt), "refalt");
  EXPECT_EQ(toString(MatchType::AltRef), "altref");
  EXPECT_EQ(toString(MatchType::RefAltFlip), "refalt_flip");
  EXPECT_EQ(toString(MatchType::AltRefFlip), "altref_flip");
}

} // namespace pgs_match
