#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "ScoreMatcher.hpp"
#include "cli_utils.hpp"
#include "logging.hpp"
#include "version.hpp"

static void printUsage(const char *path) {
  std::cerr << "\nProgram: match_variants\n\n";
  std::cerr << "Usage: " << path
            << " --dataset <label> --scorefiles <scorefile> --target <target> "
               "--format <bim|pvar|vcf> --min-overlap <fraction> [--split]\n\n";

  std::cerr << "Description:\n";
  std::cerr << "  Matches the variants of a combined scoring file against the "
               "variants of a target\n";
  std::cerr << "  dataset, allowing for swapped and strand-flipped alleles, "
               "and writes plink2 --score\n";
  std::cerr << "  files per effect type.\n\n";

  std::cerr << "Arguments:\n";
  std::cerr << "  --dataset/-d <label>        : Required. Label of the target "
               "dataset, used as output prefix.\n";
  std::cerr << "  --scorefiles/-s <file>      : Required. Combined scorefile "
               "(tab-separated, may be gzipped) with\n";
  std::cerr << "                                columns chr_name, "
               "chr_position, effect_allele, other_allele,\n";
  std::cerr << "                                effect_weight, effect_type, "
               "accession.\n";
  std::cerr << "  --target/-t <file>          : Required. Target variants "
               "(.bim, .pvar or VCF/BCF).\n";
  std::cerr << "  --format <bim|pvar|vcf>     : Required. Format of the "
               "--target file.\n";
  std::cerr << "  --min-overlap/-m <fraction> : Required. Minimum proportion "
               "of scoring variants that\n";
  std::cerr << "                                must match, between 0 and 1.\n";
  std::cerr << "  --split                     : Optional. Write one score "
               "file per chromosome.\n";
  std::cerr << "  --keep-ambiguous            : Optional. Keep strand-ambiguous "
               "(A/T, C/G) matches.\n";
  std::cerr << "  --outdir/-o <dir>           : Optional. Output directory "
               "(default: current directory).\n";
  std::cerr << "  --match-log <file>          : Optional. Write every match "
               "with its match type and\n";
  std::cerr << "                                ambiguous flag.\n";
  std::cerr << "  --verbose/-v                : Optional. Print more "
               "information during the run.\n\n";

  std::cerr << "Output:\n";
  std::cerr << "  <outdir>/<dataset>_<chrom|ALL>_<effect_type>_<first|dup>"
               ".scorefile\n";
  std::cerr << "  Variants whose ID matched more than once (different effect "
               "alleles) go to the 'dup'\n";
  std::cerr << "  file and must be scored separately.\n";
}

int main(int argc, char *argv[]) {
  std::string dataset;
  std::string scorefilePath;
  std::string targetPath;
  std::string formatName;
  std::string minOverlapValue;
  std::string outdir;
  std::string matchLogPath;
  bool split = false;
  bool keepAmbiguous = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if ((arg == "--dataset" || arg == "-d") && i + 1 < argc) {
      dataset = argv[++i];
    } else if ((arg == "--scorefiles" || arg == "-s") && i + 1 < argc) {
      scorefilePath = argv[++i];
    } else if ((arg == "--target" || arg == "-t") && i + 1 < argc) {
      targetPath = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      formatName = argv[++i];
    } else if ((arg == "--min-overlap" || arg == "--min_overlap" ||
                arg == "-m") &&
               i + 1 < argc) {
      minOverlapValue = argv[++i];
    } else if ((arg == "--outdir" || arg == "-o") && i + 1 < argc) {
      outdir = argv[++i];
    } else if (arg == "--match-log" && i + 1 < argc) {
      matchLogPath = argv[++i];
    } else if (arg == "--split") {
      split = true;
    } else if (arg == "--keep-ambiguous") {
      keepAmbiguous = true;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else {
      std::cerr << "Error! Unknown or incomplete argument: " << arg
                << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  if (dataset.empty() || scorefilePath.empty() || targetPath.empty() ||
      formatName.empty() || minOverlapValue.empty()) {
    std::cerr << "Error: --dataset, --scorefiles, --target, --format and "
                 "--min-overlap are required"
              << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  pgs_match::TargetFormat format = pgs_match::TargetFormat::Bim;
  double minOverlap = 0.0;
  try {
    format = pgs_match::parseTargetFormat(formatName);
    minOverlap = pgs_match::parseFraction(minOverlapValue, "--min-overlap");
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  std::map<std::string, std::string> files;
  files["Scorefile"] = scorefilePath;
  files["Target"] = targetPath;
  files["Output dir"] = outdir.empty() ? "." : outdir;
  files["Match log"] = matchLogPath;

  std::map<std::string, std::string> params;
  params["Dataset"] = dataset;
  params["Format"] = formatName;
  params["Min overlap"] = minOverlapValue;
  params["Split"] = split ? "Yes" : "No";
  params["Ambiguous"] = keepAmbiguous ? "Keep" : "Remove";
  params["Verbose"] = verbose ? "Yes" : "No";

  pgs_match::printHeader("MATCH_VARIANTS",
                         "Match scoring file variants to a target dataset",
                         files, params);

  pgs_match::ScoreMatcher matcher;
  matcher.setRemoveAmbiguous(!keepAmbiguous);
  matcher.setMinOverlap(minOverlap);
  matcher.setSplitByChromosome(split);
  matcher.setVerbose(verbose);
  matcher.setMatchLogPath(matchLogPath);

  try {
    matcher.loadTarget(targetPath, format);
    matcher.loadScorefile(scorefilePath);
    matcher.match();
    matcher.writeScorefiles(dataset, outdir);
  } catch (const std::exception &e) {
    std::cerr << "\nError: " << e.what() << std::endl;
    matcher.printStats();
    return 2;
  }

  matcher.printStats();
  pgs_match::log("Done");
  return 0;
}
