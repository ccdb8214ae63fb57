#include "alignment_file.h"
#include <stdexcept>

namespace gccorrect {

AlignmentFile::AlignmentFile(const std::string &path) : path_(path) {
  fp_ = sam_open(path.c_str(), "r");
  if (!fp_) {
    throw std::runtime_error("AlignmentFile: sam_open failed for " + path);
  }
  hdr_ = sam_hdr_read(fp_);
  if (!hdr_) {
    sam_close(fp_);
    throw std::runtime_error("AlignmentFile: sam_hdr_read failed for " + path);
  }
  idx_ = sam_index_load(fp_, path.c_str());
  if (!idx_) {
    sam_hdr_destroy(hdr_);
    sam_close(fp_);
    throw std::runtime_error("AlignmentFile: sam_index_load failed for " +
                             path + " (missing .bai/.csi?)");
  }
}

AlignmentFile::~AlignmentFile() {
  if (idx_)
    hts_idx_destroy(idx_);
  if (hdr_)
    sam_hdr_destroy(hdr_);
  if (fp_)
    sam_close(fp_);
}

int AlignmentFile::tid(const std::string &contig) const {
  return sam_hdr_name2tid(hdr_, contig.c_str());
}

bool AlignmentFile::read(bam1_t *b) {
  int ret = sam_read1(fp_, hdr_, b);
  if (ret < -1) {
    throw std::runtime_error("AlignmentFile: truncated or corrupt record in " +
                             path_);
  }
  return ret >= 0;
}

RegionReader::RegionReader(AlignmentFile &file, const std::string &contig,
                           int64_t start, int64_t end)
    : file_(file), b_(make_record()) {
  int tid = file.tid(contig);
  if (tid < 0)
    return;  // contig without alignments: empty region
  iter_ = sam_itr_queryi(file.index(), tid, start, end);
  if (!iter_) {
    throw std::runtime_error("RegionReader: query failed for " + contig +
                             " in " + file.path());
  }
}

RegionReader::~RegionReader() {
  if (iter_)
    hts_itr_destroy(iter_);
}

bool RegionReader::next() {
  if (!iter_)
    return false;
  int ret = sam_itr_next(file_.fp(), iter_, b_.get());
  if (ret < -1) {
    throw std::runtime_error("RegionReader: corrupt record in " +
                             file_.path());
  }
  return ret >= 0;
}

double PileupColumn::mean_mapq() const {
  if (depth == 0)
    return 0.0;
  double sum = 0.0;
  for (int i = 0; i < depth; ++i)
    sum += reads[i].b->core.qual;
  return sum / depth;
}

int PileupColumn::forward_heads() const {
  int heads = 0;
  for (int i = 0; i < depth; ++i) {
    const bam_pileup1_t &p = reads[i];
    if (p.is_head && !bam_is_rev(p.b))
      ++heads;
  }
  return heads;
}

PileupWalker::PileupWalker(AlignmentFile &file, const std::string &contig,
                           int64_t start, int64_t end)
    : file_(file), start_(start), end_(end) {
  int tid = file.tid(contig);
  if (tid < 0)
    return;
  iter_ = sam_itr_queryi(file.index(), tid, start, end);
  if (!iter_) {
    throw std::runtime_error("PileupWalker: query failed for " + contig +
                             " in " + file.path());
  }
  plp_ = bam_plp_init(&PileupWalker::read_filtered, this);
  bam_plp_set_maxcnt(plp_, 1000000);
}

PileupWalker::~PileupWalker() {
  if (plp_)
    bam_plp_destroy(plp_);
  if (iter_)
    hts_itr_destroy(iter_);
}

int PileupWalker::read_filtered(void *data, bam1_t *b) {
  auto *self = static_cast<PileupWalker *>(data);
  int ret;
  while ((ret = sam_itr_next(self->file_.fp(), self->iter_, b)) >= 0) {
    if (b->core.flag & EXCLUDED_FLAGS)
      continue;
    break;
  }
  if (ret < -1)
    self->read_error_ = true;
  return ret;
}

bool PileupWalker::next(PileupColumn &column) {
  if (!plp_)
    return false;
  int tid = 0, n = 0;
  hts_pos_t pos = 0;
  const bam_pileup1_t *reads;
  while ((reads = bam_plp64_auto(plp_, &tid, &pos, &n)) != nullptr) {
    if (pos < start_)
      continue;
    if (pos >= end_)
      return false;
    column.pos = pos;
    column.depth = n;
    column.reads = reads;
    return true;
  }
  if (n < 0 || read_error_) {
    throw std::runtime_error("PileupWalker: pileup failed in " + file_.path());
  }
  return false;
}

} // namespace gccorrect
