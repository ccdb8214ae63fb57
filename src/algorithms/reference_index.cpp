#include "reference_index.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <htslib/faidx.h>
#include <memory>
#include <stdexcept>

namespace gccorrect {

namespace {

struct FaidxDeleter {
  void operator()(faidx_t *fai) const { fai_destroy(fai); }
};

std::string fetch_contig(faidx_t *fai, const std::string &name) {
  hts_pos_t len = 0;
  char *res = faidx_fetch_seq64(fai, name.c_str(), 0, HTS_POS_MAX, &len);
  if (!res || len < 0) {
    if (res)
      free(res);
    throw std::runtime_error("ReferenceIndex: cannot fetch sequence for " +
                             name);
  }
  std::string out(res, len);
  free(res);
  return out;
}

} // namespace

void ReferenceIndex::load(const std::string &fasta_path,
                          const std::vector<std::string> &allow_list) {
  std::unique_ptr<faidx_t, FaidxDeleter> fai(fai_load(fasta_path.c_str()));
  if (!fai) {
    throw std::runtime_error("ReferenceIndex: fai_load failed for " +
                             fasta_path);
  }

  std::vector<std::string> names;
  if (allow_list.empty()) {
    int n = faidx_nseq(fai.get());
    for (int i = 0; i < n; ++i)
      names.emplace_back(faidx_iseq(fai.get(), i));
  } else {
    for (const auto &name : allow_list) {
      if (!faidx_has_seq(fai.get(), name.c_str())) {
        throw std::runtime_error("ReferenceIndex: contig '" + name +
                                 "' not found in " + fasta_path);
      }
      names.push_back(name);
    }
  }

  for (const auto &name : names) {
    add(name, fetch_contig(fai.get(), name));
  }
}

void ReferenceIndex::add(const std::string &name, const std::string &sequence) {
  if (by_name_.count(name)) {
    throw std::runtime_error("ReferenceIndex: duplicate contig " + name);
  }
  Contig c;
  c.name = name;
  c.sequence = sequence;
  std::transform(c.sequence.begin(), c.sequence.end(), c.sequence.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  c.length = static_cast<int64_t>(c.sequence.size());
  by_name_[name] = contigs_.size();
  contigs_.push_back(std::move(c));
}

bool ReferenceIndex::contains(const std::string &name) const {
  return by_name_.count(name) > 0;
}

int ReferenceIndex::find(const std::string &name) const {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? -1 : static_cast<int>(it->second);
}

int64_t ReferenceIndex::length(const std::string &name) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    throw std::runtime_error("ReferenceIndex: unknown contig " + name);
  }
  return contigs_[it->second].length;
}

const std::string &ReferenceIndex::sequence(const std::string &name) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    throw std::runtime_error("ReferenceIndex: unknown contig " + name);
  }
  return contigs_[it->second].sequence;
}

int64_t ReferenceIndex::total_length() const {
  int64_t total = 0;
  for (const auto &c : contigs_)
    total += c.length;
  return total;
}

} // namespace gccorrect
