#include "ScorefileWriter.hpp"
#include "logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace pgs_match {

const char *const kAllChromosomes = "ALL";

namespace {

ScoreTable pivot(const MatchRecords &matches) {
  ScoreTable table;

  std::set<std::string> accessions;
  for (const auto &match : matches)
    accessions.insert(match.score.accession);
  table.accessions.assign(accessions.begin(), accessions.end());

  std::map<std::string, size_t> column;
  for (size_t i = 0; i < table.accessions.size(); ++i)
    column[table.accessions[i]] = i;

  std::map<std::pair<std::string, std::string>, size_t> rowIndex;
  std::vector<std::vector<bool>> filled;
  long nRepeated = 0;

  for (const auto &match : matches) {
    auto key = std::make_pair(match.target.id, match.score.effectAllele);
    auto it = rowIndex.find(key);
    if (it == rowIndex.end()) {
      ScoreTable::Row row;
      row.id = key.first;
      row.effectAllele = key.second;
      row.weights.assign(table.accessions.size(), 0.0);
      it = rowIndex.insert(std::make_pair(key, table.rows.size())).first;
      table.rows.push_back(row);
      filled.push_back(std::vector<bool>(table.accessions.size(), false));
    }

    size_t col = column[match.score.accession];
    if (filled[it->second][col]) {
      nRepeated++;
      continue;
    }
    table.rows[it->second].weights[col] = match.score.effectWeight;
    filled[it->second][col] = true;
  }

  if (nRepeated > 0) {
    warn(std::to_string(nRepeated) +
         " repeated (ID, effect_allele, accession) weights ignored; the first "
         "weight was kept");
  }
  return table;
}

} // namespace

std::map<std::string, ScoreTable> formatScorefile(const MatchRecords &matches,
                                                  bool splitByChromosome) {
  std::map<std::string, ScoreTable> tables;
  if (!splitByChromosome) {
    tables[kAllChromosomes] = pivot(matches);
    return tables;
  }

  std::map<std::string, MatchRecords> byChromosome;
  for (const auto &match : matches)
    byChromosome[match.score.chromosome].push_back(match);
  for (const auto &pair : byChromosome)
    tables[pair.first] = pivot(pair.second);
  return tables;
}

std::string formatWeight(double weight) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", weight);
  if (std::strtod(buf, nullptr) != weight)
    std::snprintf(buf, sizeof(buf), "%.17g", weight);
  return buf;
}

std::string scorefilePath(const std::string &outdir,
                          const std::string &dataset, const std::string &key,
                          const std::string &effectType, bool duplicate) {
  std::string prefix = outdir;
  if (!prefix.empty() && prefix.back() != '/')
    prefix += '/';
  return prefix + dataset + "_" + key + "_" + effectType + "_" +
         (duplicate ? "dup" : "first") + ".scorefile";
}

void writeScoreTable(const ScoreTable &table, const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Cannot open output file for writing: " + path);
  }

  out << "ID\teffect_allele";
  for (const auto &accession : table.accessions)
    out << "\t" << accession;
  out << "\n";

  for (const auto &row : table.rows) {
    out << row.id << "\t" << row.effectAllele;
    for (double w : row.weights)
      out << "\t" << formatWeight(w);
    out << "\n";
  }

  out.close();
  if (!out) {
    throw std::runtime_error("Error writing output file: " + path);
  }
}

void writeMatchLog(const MatchRecords &matches, const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Cannot open match log for writing: " + path);
  }

  out << "chr_name\tchr_position\teffect_allele\tother_allele\teffect_weight"
         "\teffect_type\taccession\tID\tREF\tALT\tREF_FLIP\tALT_FLIP"
         "\tmatch_type\tambiguous\n";
  for (const auto &m : matches) {
    out << m.score.chromosome << "\t" << m.score.position << "\t"
        << m.score.effectAllele << "\t" << m.score.otherAllele << "\t"
        << formatWeight(m.score.effectWeight) << "\t" << m.score.effectType
        << "\t" << m.score.accession << "\t" << m.target.id << "\t"
        << m.target.ref << "\t" << m.target.alt << "\t" << m.target.refFlip
        << "\t" << m.target.altFlip << "\t" << toString(m.matchType) << "\t"
        << (m.ambiguous ? "true" : "false") << "\n";
  }

  out.close();
  if (!out) {
    throw std::runtime_error("Error writing match log: " + path);
  }
}

} // namespace pgs_match
