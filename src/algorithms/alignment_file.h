#pragma once
#include <cstdint>
#include <htslib/hts.h>
#include <htslib/sam.h>
#include <memory>
#include <string>

namespace gccorrect {

// Records with any of these flags are never counted
constexpr uint16_t EXCLUDED_FLAGS = BAM_FUNMAP | BAM_FSECONDARY |
                                    BAM_FSUPPLEMENTARY | BAM_FQCFAIL |
                                    BAM_FDUP;

struct BamRecordDeleter {
  void operator()(bam1_t *b) const { bam_destroy1(b); }
};
using BamRecordPtr = std::unique_ptr<bam1_t, BamRecordDeleter>;

inline BamRecordPtr make_record() { return BamRecordPtr(bam_init1()); }

// One open, indexed BAM/CRAM. Each worker thread opens its own instance so
// no htslib state is shared between threads.
class AlignmentFile {
public:
  // Throws std::runtime_error when the file, header or index can't be read
  explicit AlignmentFile(const std::string &path);
  ~AlignmentFile();

  // Target id of a contig, or -1 when the header does not name it
  int tid(const std::string &contig) const;

  // Sequential read over the whole file; false at EOF, throws on error
  bool read(bam1_t *b);

  samFile *fp() { return fp_; }
  sam_hdr_t *header() { return hdr_; }
  hts_idx_t *index() { return idx_; }
  const std::string &path() const { return path_; }

private:
  std::string path_;
  samFile *fp_ = nullptr;
  sam_hdr_t *hdr_ = nullptr;
  hts_idx_t *idx_ = nullptr;

  AlignmentFile(const AlignmentFile &) = delete;
  AlignmentFile &operator=(const AlignmentFile &) = delete;
};

// Records overlapping contig:[start, end), in file order
class RegionReader {
public:
  RegionReader(AlignmentFile &file, const std::string &contig, int64_t start,
               int64_t end);
  ~RegionReader();

  // Advance to the next record; false when the region is exhausted
  bool next();
  const bam1_t *record() const { return b_.get(); }

private:
  AlignmentFile &file_;
  hts_itr_t *iter_ = nullptr;
  BamRecordPtr b_;

  RegionReader(const RegionReader &) = delete;
  RegionReader &operator=(const RegionReader &) = delete;
};

// One reference position and the reads aligned over it
struct PileupColumn {
  int64_t pos = 0;
  int depth = 0;
  const bam_pileup1_t *reads = nullptr;

  double mean_mapq() const;
  // Reads whose first aligned base sits on this column on the forward strand
  int forward_heads() const;
};

// Walks the pileup columns of contig:[start, end) in order. Reads carrying
// EXCLUDED_FLAGS never enter the pileup.
class PileupWalker {
public:
  PileupWalker(AlignmentFile &file, const std::string &contig, int64_t start,
               int64_t end);
  ~PileupWalker();

  bool next(PileupColumn &column);

private:
  static int read_filtered(void *data, bam1_t *b);

  AlignmentFile &file_;
  hts_itr_t *iter_ = nullptr;
  bam_plp_t plp_ = nullptr;
  int64_t start_;
  int64_t end_;
  bool read_error_ = false;

  PileupWalker(const PileupWalker &) = delete;
  PileupWalker &operator=(const PileupWalker &) = delete;
};

} // namespace gccorrect
