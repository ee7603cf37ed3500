#ifndef CLI_UTILS_HPP
#define CLI_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace pgs_match {

/**
 * @brief Rank of a sex or mitochondrial chromosome name (prefix removed):
 * X, Y, then MT/M; every other non-numeric contig ranks after them.
 */
inline int nonNumericChromosomeRank(const std::string &name) {
  if (name == "X")
    return 0;
  if (name == "Y")
    return 1;
  if (name == "MT" || name == "M")
    return 2;
  return 3;
}

/**
 * @brief Sort chromosome names in natural order.
 *
 * Numeric chromosomes come first (1, 2, ..., 22), followed by X, Y and MT,
 * then any other contig in lexicographical order. Handles both "chr"
 * prefixed and non-prefixed chromosome names.
 *
 * @param contigs Set of chromosome/contig names to sort.
 * @return std::vector<std::string> Sorted vector of chromosome names.
 */
inline std::vector<std::string>
sortChromosomes(const std::set<std::string> &contigs) {
  std::vector<std::string> chromosomes(contigs.begin(), contigs.end());
  std::sort(chromosomes.begin(), chromosomes.end(),
            [](const std::string &a, const std::string &b) {
              std::string a_num = a.substr(0, 3) == "chr" ? a.substr(3) : a;
              std::string b_num = b.substr(0, 3) == "chr" ? b.substr(3) : b;
              bool aNumeric =
                  !a_num.empty() &&
                  std::isdigit(static_cast<unsigned char>(a_num[0]));
              bool bNumeric =
                  !b_num.empty() &&
                  std::isdigit(static_cast<unsigned char>(b_num[0]));

              if (aNumeric && bNumeric) {
                long na = std::strtol(a_num.c_str(), nullptr, 10);
                long nb = std::strtol(b_num.c_str(), nullptr, 10);
                if (na != nb)
                  return na < nb;
                return a < b; // e.g. "1" before "1_random"
              }
              if (aNumeric != bNumeric)
                return aNumeric;

              int ra = nonNumericChromosomeRank(a_num);
              int rb = nonNumericChromosomeRank(b_num);
              if (ra != rb)
                return ra < rb;
              return a < b;
            });
  return chromosomes;
}

/**
 * @brief Split a line on a single delimiter character, keeping empty fields.
 */
inline std::vector<std::string> splitFields(const std::string &line,
                                            char delimiter = '\t') {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t end = line.find(delimiter, start);
    if (end == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, end - start));
    start = end + 1;
  }
  return fields;
}

/**
 * @brief Split a line on runs of spaces or tabs (plink .bim files may use
 * either).
 */
inline std::vector<std::string> splitWhitespace(const std::string &line) {
  std::vector<std::string> fields;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
      ++i;
    size_t start = i;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t')
      ++i;
    if (i > start)
      fields.push_back(line.substr(start, i - start));
  }
  return fields;
}

/**
 * @brief Remove trailing newline and carriage return characters in place.
 */
inline void chompLine(std::string &line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.pop_back();
}

/**
 * @brief Parse a proportion given on the command line.
 *
 * @throws std::invalid_argument if the value is not a number in [0, 1].
 */
inline double parseFraction(const std::string &value,
                            const std::string &option) {
  char *end = nullptr;
  double x = std::strtod(value.c_str(), &end);
  if (value.empty() || end == nullptr || *end != '\0' || !(x >= 0.0) ||
      x > 1.0) {
    throw std::invalid_argument(option + " must be a number between 0 and 1, "
                                         "got '" +
                                value + "'");
  }
  return x;
}

} // namespace pgs_match

#endif // CLI_UTILS_HPP
