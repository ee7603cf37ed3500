#include "VariantReader.hpp"
#include "alleles.hpp"
#include "cli_utils.hpp"
#include "errors.hpp"
#include "io_raii.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <stdexcept>

namespace pgs_match {

namespace {

std::string location(const std::string &path, long lineNumber) {
  return path + ":" + std::to_string(lineNumber);
}

long parsePosition(const std::string &token, const std::string &where) {
  char *end = nullptr;
  errno = 0;
  long pos = std::strtol(token.c_str(), &end, 10);
  if (token.empty() || *end != '\0' || errno == ERANGE || pos < 0) {
    throw InputFormatError(where + ": invalid position '" + token + "'");
  }
  return pos;
}

double parseWeight(const std::string &token, const std::string &where) {
  char *end = nullptr;
  errno = 0;
  double w = std::strtod(token.c_str(), &end);
  if (token.empty() || *end != '\0' || errno == ERANGE) {
    throw InputFormatError(where + ": invalid effect_weight '" + token + "'");
  }
  return w;
}

bool isMissingAllele(const std::string &allele) {
  return allele == "0" || allele == ".";
}

std::string toUpper(const std::string &allele) {
  std::string upper(allele);
  for (auto &c : upper)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return upper;
}

// Append one target variant per ALT allele of a row. Soft-masked bases are
// uppercased; alleles that still are not A/C/G/T (I/D codes, N, '*',
// symbolic <DEL>) can never match and are skipped.
void addTargetRow(const std::string &chromosome, const std::string &id,
                  long position, const std::string &refField,
                  const std::string &altField, TargetReadStats &stats,
                  std::vector<TargetVariant> &out) {
  std::vector<std::string> alts = splitFields(altField, ',');
  if (alts.size() > 1)
    stats.nMultiallelic++;

  std::string ref = toUpper(refField);
  for (const auto &altAllele : alts) {
    std::string alt = toUpper(altAllele);
    if (isMissingAllele(ref) || isMissingAllele(alt)) {
      stats.nMissingAllele++;
      continue;
    }
    if (!isValidAllele(ref) || !isValidAllele(alt)) {
      stats.nInvalidAllele++;
      continue;
    }
    out.push_back(makeTargetVariant(chromosome, id, position, ref, alt));
    stats.nVariants++;
  }
}

void readBim(const std::string &path, std::vector<TargetVariant> &out,
             TargetReadStats &stats) {
  GzFileUPtr fp = openText(path);
  std::string line;
  long lineNumber = 0;
  while (readLine(fp.get(), line)) {
    lineNumber++;
    chompLine(line);
    if (line.empty())
      continue;
    stats.nLines++;

    std::vector<std::string> fields = splitWhitespace(line);
    if (fields.size() != 6) {
      throw InputFormatError(location(path, lineNumber) + ": expected 6 "
                             "columns in .bim file, found " +
                             std::to_string(fields.size()));
    }
    std::string where = location(path, lineNumber);
    addTargetRow(fields[0], fields[1], parsePosition(fields[3], where),
                 fields[4], fields[5], stats, out);
  }
}

void readPvar(const std::string &path, std::vector<TargetVariant> &out,
              TargetReadStats &stats) {
  GzFileUPtr fp = openText(path);
  std::string line;
  long lineNumber = 0;
  std::map<std::string, size_t> columns;
  size_t nColumns = 0;

  while (readLine(fp.get(), line)) {
    lineNumber++;
    chompLine(line);
    if (line.empty() || line.compare(0, 2, "##") == 0)
      continue;

    if (columns.empty()) {
      if (line.compare(0, 6, "#CHROM") != 0) {
        throw InputFormatError(location(path, lineNumber) +
                               ": expected a '#CHROM' header line");
      }
      std::vector<std::string> header = splitFields(line);
      for (size_t i = 0; i < header.size(); ++i)
        columns[header[i]] = i;
      for (const char *name : {"#CHROM", "POS", "ID", "REF", "ALT"}) {
        if (columns.find(name) == columns.end()) {
          throw InputFormatError(path + ": missing column '" + name +
                                 "' in header");
        }
      }
      nColumns = header.size();
      continue;
    }

    stats.nLines++;
    std::vector<std::string> fields = splitFields(line);
    std::string where = location(path, lineNumber);
    if (fields.size() < nColumns) {
      throw InputFormatError(where + ": expected " + std::to_string(nColumns) +
                             " columns, found " +
                             std::to_string(fields.size()));
    }
    addTargetRow(fields[columns["#CHROM"]], fields[columns["ID"]],
                 parsePosition(fields[columns["POS"]], where),
                 fields[columns["REF"]], fields[columns["ALT"]], stats, out);
  }

  if (columns.empty()) {
    throw InputFormatError(path + ": no '#CHROM' header line found");
  }
}

void readVcf(const std::string &path, std::vector<TargetVariant> &out,
             TargetReadStats &stats) {
  HtsFileUPtr fp = openVcf(path);
  BcfHdrUPtr hdr = readVcfHeader(fp.get(), path);
  Bcf1UPtr rec = createBcfRecord();

  int ret;
  while ((ret = bcf_read(fp.get(), hdr.get(), rec.get())) == 0) {
    bcf_unpack(rec.get(), BCF_UN_STR);
    stats.nLines++;

    std::string chrom = bcf_hdr_id2name(hdr.get(), rec->rid);
    long pos = rec->pos + 1;
    std::string ref = rec->d.allele[0];
    std::string alts;
    for (int i = 1; i < rec->n_allele; ++i) {
      if (i > 1)
        alts += ",";
      alts += rec->d.allele[i];
    }
    if (alts.empty())
      alts = ".";

    std::string id = rec->d.id;
    if (id == ".")
      id = chrom + ":" + std::to_string(pos) + ":" + ref + ":" + alts;

    addTargetRow(chrom, id, pos, ref, alts, stats, out);
  }
  if (ret < -1) {
    throw std::runtime_error("Error reading VCF/BCF record from: " + path);
  }
}

const char *kScorefileColumns[] = {"chr_name",      "chr_position",
                                   "effect_allele", "other_allele",
                                   "effect_weight", "effect_type",
                                   "accession"};

} // namespace

TargetFormat parseTargetFormat(const std::string &value) {
  if (value == "bim")
    return TargetFormat::Bim;
  if (value == "pvar")
    return TargetFormat::Pvar;
  if (value == "vcf")
    return TargetFormat::Vcf;
  throw std::invalid_argument("--format must be 'bim', 'pvar' or 'vcf', got '" +
                              value + "'");
}

std::string toString(TargetFormat format) {
  switch (format) {
  case TargetFormat::Bim:
    return "bim";
  case TargetFormat::Pvar:
    return "pvar";
  case TargetFormat::Vcf:
    return "vcf";
  }
  return "unknown";
}

std::vector<TargetVariant> readTarget(const std::string &path,
                                      TargetFormat format,
                                      TargetReadStats &stats) {
  std::vector<TargetVariant> variants;
  switch (format) {
  case TargetFormat::Bim:
    readBim(path, variants, stats);
    break;
  case TargetFormat::Pvar:
    readPvar(path, variants, stats);
    break;
  case TargetFormat::Vcf:
    readVcf(path, variants, stats);
    break;
  }
  return variants;
}

std::vector<ScoreEntry> readScorefile(const std::string &path) {
  GzFileUPtr fp = openText(path);
  std::vector<ScoreEntry> entries;
  std::string line;
  long lineNumber = 0;

  std::vector<size_t> index; // position of each required column
  size_t nColumns = 0;

  while (readLine(fp.get(), line)) {
    lineNumber++;
    chompLine(line);
    if (line.empty())
      continue;

    std::vector<std::string> fields = splitFields(line);
    if (index.empty()) {
      std::map<std::string, size_t> header;
      for (size_t i = 0; i < fields.size(); ++i)
        header[fields[i]] = i;
      for (const char *name : kScorefileColumns) {
        auto it = header.find(name);
        if (it == header.end()) {
          throw InputFormatError(path + ": missing column '" +
                                 std::string(name) + "' in scorefile header");
        }
        index.push_back(it->second);
      }
      nColumns = fields.size();
      continue;
    }

    std::string where = location(path, lineNumber);
    if (fields.size() < nColumns) {
      throw InputFormatError(where + ": expected " + std::to_string(nColumns) +
                             " columns, found " +
                             std::to_string(fields.size()));
    }

    ScoreEntry entry;
    entry.chromosome = fields[index[0]];
    entry.position = parsePosition(fields[index[1]], where);
    entry.effectAllele = fields[index[2]];
    entry.otherAllele = fields[index[3]];
    entry.effectWeight = parseWeight(fields[index[4]], where);
    try {
      entry.effectType = normalizeEffectType(fields[index[5]]);
    } catch (const InputFormatError &e) {
      throw InputFormatError(where + ": " + e.what());
    }
    entry.accession = fields[index[6]];
    entries.push_back(entry);
  }

  if (index.empty()) {
    throw InputFormatError(path + ": scorefile is empty (no header line)");
  }
  return entries;
}

} // namespace pgs_match
