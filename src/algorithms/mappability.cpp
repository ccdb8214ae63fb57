#include "mappability.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gccorrect {

MappabilityMask::MappabilityMask(const ReferenceIndex &ref) {
  for (const auto &c : ref.contigs()) {
    masks_[c.name].assign(c.length, false);
    long_segments_[c.name];
  }
}

void MappabilityMask::load_bed(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("MappabilityMask: cannot open " + path);
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#')
      continue;
    if (line.compare(0, 5, "track") == 0 || line.compare(0, 7, "browser") == 0)
      continue;

    std::istringstream iss(line);
    std::string chrom;
    int64_t start = 0, end = 0;
    if (!(iss >> chrom >> start >> end) || start < 0 || end < start) {
      throw std::runtime_error("MappabilityMask: malformed line " +
                               std::to_string(line_no) + " in " + path);
    }
    if (!masks_.count(chrom))
      continue;
    mark(chrom, start, end);
  }
}

void MappabilityMask::mark(const std::string &contig, int64_t start,
                           int64_t end) {
  auto it = masks_.find(contig);
  if (it == masks_.end()) {
    throw std::runtime_error("MappabilityMask: unknown contig " + contig);
  }
  auto &bits = it->second;
  end = std::min<int64_t>(end, static_cast<int64_t>(bits.size()));
  for (int64_t i = std::max<int64_t>(start, 0); i < end; ++i)
    bits[i] = true;
}

void MappabilityMask::find_long_segments(int64_t min_span) {
  for (auto &kv : masks_) {
    const auto &bits = kv.second;
    auto &segments = long_segments_[kv.first];
    segments.clear();

    const int64_t n = static_cast<int64_t>(bits.size());
    int64_t i = 0;
    while (i < n) {
      if (!bits[i]) {
        ++i;
        continue;
      }
      int64_t j = i;
      while (j < n && bits[j])
        ++j;
      if (j - i > min_span)
        segments.push_back({i, j});
      i = j;
    }
  }
}

const std::vector<bool> &
MappabilityMask::mask(const std::string &contig) const {
  auto it = masks_.find(contig);
  if (it == masks_.end()) {
    throw std::runtime_error("MappabilityMask: unknown contig " + contig);
  }
  return it->second;
}

const std::vector<Segment> &
MappabilityMask::long_segments(const std::string &contig) const {
  static const std::vector<Segment> none;
  auto it = long_segments_.find(contig);
  return it == long_segments_.end() ? none : it->second;
}

int64_t MappabilityMask::mappable_count(const std::string &contig) const {
  const auto &bits = mask(contig);
  return std::count(bits.begin(), bits.end(), true);
}

} // namespace gccorrect
