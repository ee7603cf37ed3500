#ifndef IO_RAII_HPP
#define IO_RAII_HPP

#include <htslib/hts.h>
#include <htslib/vcf.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace pgs_match {

/**
 * @brief RAII handles for the zlib and HTSlib resources used by the readers.
 *
 * Text tables (.bim, .pvar, scorefiles) are read through zlib so plain and
 * gzip/bgzip input are handled alike; VCF/BCF targets go through HTSlib.
 */

struct GzFileDeleter {
  void operator()(gzFile_s *fp) const {
    if (fp)
      gzclose(fp);
  }
};

using GzFileUPtr = std::unique_ptr<gzFile_s, GzFileDeleter>;

struct HtsFileDeleter {
  void operator()(htsFile *fp) const {
    if (fp)
      bcf_close(fp);
  }
};

using HtsFileUPtr = std::unique_ptr<htsFile, HtsFileDeleter>;

struct BcfHdrDeleter {
  void operator()(bcf_hdr_t *hdr) const {
    if (hdr)
      bcf_hdr_destroy(hdr);
  }
};

using BcfHdrUPtr = std::unique_ptr<bcf_hdr_t, BcfHdrDeleter>;

struct Bcf1Deleter {
  void operator()(bcf1_t *rec) const {
    if (rec)
      bcf_destroy(rec);
  }
};

using Bcf1UPtr = std::unique_ptr<bcf1_t, Bcf1Deleter>;

/**
 * @brief Open a plain or gzipped text file for reading.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
inline GzFileUPtr openText(const std::string &path) {
  GzFileUPtr fp(gzopen(path.c_str(), "rb"));
  if (!fp) {
    throw std::runtime_error("Cannot open file for reading: " + path);
  }
  return fp;
}

/**
 * @brief Read one full line from a gz handle, however long it is.
 *
 * @return false at end of file.
 * @throws std::runtime_error on a zlib read error.
 */
inline bool readLine(gzFile_s *fp, std::string &line) {
  line.clear();
  char buf[4096];
  while (gzgets(fp, buf, sizeof(buf)) != Z_NULL) {
    line += buf;
    if (!line.empty() && line.back() == '\n')
      return true;
  }
  int errnum = 0;
  const char *msg = gzerror(fp, &errnum);
  if (errnum != Z_OK && errnum != Z_STREAM_END) {
    throw std::runtime_error(std::string("Read error: ") + msg);
  }
  return !line.empty();
}

inline HtsFileUPtr openVcf(const std::string &path) {
  HtsFileUPtr fp(bcf_open(path.c_str(), "r"));
  if (!fp) {
    throw std::runtime_error("Cannot open VCF/BCF file: " + path);
  }
  return fp;
}

inline BcfHdrUPtr readVcfHeader(htsFile *fp, const std::string &path) {
  BcfHdrUPtr hdr(bcf_hdr_read(fp));
  if (!hdr) {
    throw std::runtime_error("Cannot read header from VCF/BCF file: " + path);
  }
  return hdr;
}

inline Bcf1UPtr createBcfRecord() {
  Bcf1UPtr rec(bcf_init());
  if (!rec) {
    throw std::runtime_error("Cannot initialize BCF record.");
  }
  return rec;
}

} // namespace pgs_match

#endif // IO_RAII_HPP
