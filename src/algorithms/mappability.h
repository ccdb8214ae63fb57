#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "reference_index.h"

namespace gccorrect {

// Half-open [start, end) interval on one contig
struct Segment {
  int64_t start = 0;
  int64_t end = 0;
  int64_t length() const { return end - start; }
};

// Per-contig boolean mask of usable positions. Every contig of the
// reference gets a mask of exactly its length; positions no interval
// covers stay false.
class MappabilityMask {
public:
  MappabilityMask() = default;

  // One all-false mask per reference contig
  explicit MappabilityMask(const ReferenceIndex &ref);

  // Read "chrom<TAB>start<TAB>end" lines. Intervals on contigs outside the
  // reference are ignored; intervals are clipped to the contig. Throws
  // std::runtime_error for an unreadable file or a malformed line.
  void load_bed(const std::string &path);

  // Mark [start, end) usable on a contig already in the mask
  void mark(const std::string &contig, int64_t start, int64_t end);

  // Collect, for every contig, the maximal mappable runs longer than
  // `min_span`. Call after all intervals are loaded.
  void find_long_segments(int64_t min_span);

  bool mappable(const std::string &contig, int64_t pos) const {
    return mask(contig)[pos];
  }
  const std::vector<bool> &mask(const std::string &contig) const;
  const std::vector<Segment> &long_segments(const std::string &contig) const;
  int64_t mappable_count(const std::string &contig) const;

private:
  std::unordered_map<std::string, std::vector<bool>> masks_;
  std::unordered_map<std::string, std::vector<Segment>> long_segments_;
};

} // namespace gccorrect
