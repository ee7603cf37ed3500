#ifndef ALLELES_HPP
#define ALLELES_HPP

#include <string>

namespace pgs_match {

/**
 * @brief Complement an allele base by base (A<->T, C<->G).
 *
 * This is a strand flip of the same single-strand representation, not a
 * reverse complement: the order of bases is preserved.
 *
 * @param allele Allele made only of A, C, G and T.
 * @return std::string The complemented allele, same length.
 * @throws InvalidAlleleError if the allele is empty or has any other symbol.
 */
std::string complement(const std::string &allele);

/**
 * @brief True if the allele is non-empty and made only of A, C, G and T.
 */
bool isValidAllele(const std::string &allele);

} // namespace pgs_match

#endif // ALLELES_HPP
