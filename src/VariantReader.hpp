#ifndef VARIANT_READER_HPP
#define VARIANT_READER_HPP

#include "variants.hpp"
#include <string>
#include <vector>

namespace pgs_match {

/**
 * @brief Layout of the target variant file.
 *
 * Bim:  plink1 .bim, headerless (chrom, id, cM, pos, A1, A2).
 * Pvar: plink2 .pvar, '##' meta lines then a '#CHROM' header.
 * Vcf:  VCF/BCF read through HTSlib.
 */
enum class TargetFormat { Bim, Pvar, Vcf };

/**
 * @brief Parse a --format value ("bim", "pvar" or "vcf").
 *
 * @throws std::invalid_argument for any other value.
 */
TargetFormat parseTargetFormat(const std::string &value);

std::string toString(TargetFormat format);

/**
 * @brief Counters filled while reading the target file.
 */
struct TargetReadStats {
  long nLines = 0;
  long nVariants = 0;
  long nMissingAllele = 0;  // rows skipped for a '0' or '.' allele
  long nInvalidAllele = 0;  // rows skipped for I/D, N, '*', <DEL>, ...
  long nMultiallelic = 0;   // rows with more than one ALT allele
};

/**
 * @brief Read all target variants, deriving flipped alleles for each.
 *
 * Comma-separated ALT lists produce one variant per alternate allele.
 * Alleles are uppercased; rows with a missing ('0', '.') or non-A/C/G/T
 * allele are skipped and counted in stats.
 *
 * @param path Target file (plain or gzipped for bim/pvar).
 * @param format Layout of the file.
 * @param stats Counters updated while reading.
 * @return std::vector<TargetVariant> Variants in file order.
 * @throws InputFormatError on malformed rows or a missing header column.
 * @throws std::runtime_error if the file cannot be read.
 */
std::vector<TargetVariant> readTarget(const std::string &path,
                                      TargetFormat format,
                                      TargetReadStats &stats);

/**
 * @brief Read the combined, headered scoring file.
 *
 * Required columns (any order): chr_name, chr_position, effect_allele,
 * other_allele, effect_weight, effect_type, accession.
 *
 * @throws InputFormatError on a missing column or malformed row.
 * @throws std::runtime_error if the file cannot be read.
 */
std::vector<ScoreEntry> readScorefile(const std::string &path);

} // namespace pgs_match

#endif // VARIANT_READER_HPP
