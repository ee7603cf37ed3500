#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pgs_match {

/**
 * @brief An allele contains a symbol outside {A, C, G, T}.
 */
class InvalidAlleleError : public std::runtime_error {
public:
  explicit InvalidAlleleError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief A target or scoring table is malformed (missing column, bad number,
 * short row, unknown effect type).
 */
class InputFormatError : public std::runtime_error {
public:
  explicit InputFormatError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief No scoring variant matched the target after ambiguity removal.
 */
class NoMatchesError : public std::runtime_error {
public:
  NoMatchesError()
      : std::runtime_error(
            "No target variants match any variants in all scoring files.\n"
            "  * Try checking the genome build of the target and scoring "
            "files.\n"
            "  * Try imputing your microarray data if it doesn't cover the "
            "scoring variants well.") {}
};

/**
 * @brief The fraction of matched scoring variants is below --min-overlap.
 */
class InsufficientOverlapError : public std::runtime_error {
public:
  InsufficientOverlapError(double observed, double required)
      : std::runtime_error(
            "Only " + std::to_string(observed * 100.0) +
            "% of scoring variants matched the target (minimum " +
            std::to_string(required * 100.0) +
            "%). Check the genome build and variant coverage, or lower "
            "--min-overlap."),
        observedFraction(observed), requiredFraction(required) {}

  double observed() const { return observedFraction; }
  double required() const { return requiredFraction; }

private:
  double observedFraction;
  double requiredFraction;
};

} // namespace pgs_match

#endif // ERRORS_HPP
