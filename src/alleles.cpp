#include "alleles.hpp"
#include "errors.hpp"

namespace pgs_match {

namespace {

char complementBase(char base) {
  switch (base) {
  case 'A':
    return 'T';
  case 'T':
    return 'A';
  case 'C':
    return 'G';
  case 'G':
    return 'C';
  default:
    return '\0';
  }
}

} // namespace

std::string complement(const std::string &allele) {
  if (allele.empty()) {
    throw InvalidAlleleError("Cannot complement an empty allele");
  }
  std::string flipped(allele.size(), '\0');
  for (size_t i = 0; i < allele.size(); ++i) {
    char c = complementBase(allele[i]);
    if (c == '\0') {
      throw InvalidAlleleError("Invalid allele '" + allele +
                               "': unexpected symbol '" +
                               std::string(1, allele[i]) +
                               "' (expected A, C, G or T)");
    }
    flipped[i] = c;
  }
  return flipped;
}

bool isValidAllele(const std::string &allele) {
  if (allele.empty())
    return false;
  for (char c : allele) {
    if (complementBase(c) == '\0')
      return false;
  }
  return true;
}

} // namespace pgs_match
