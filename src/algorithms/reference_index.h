#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gccorrect {

struct Contig {
  std::string name;
  int64_t length = 0;
  std::string sequence;  // uppercase
};

// Reference contigs loaded through a faidx index (.fai is built when
// missing). Contigs are immutable once loaded; worker units hold const
// references into this object.
class ReferenceIndex {
public:
  ReferenceIndex() = default;

  // Load every contig of the FASTA, or only those named in `allow_list`
  // (in allow-list order). Throws std::runtime_error when the FASTA cannot
  // be indexed or an allow-listed contig is missing.
  void load(const std::string &fasta_path,
            const std::vector<std::string> &allow_list = {});

  // Add an in-memory contig (sequence is uppercased)
  void add(const std::string &name, const std::string &sequence);

  size_t size() const { return contigs_.size(); }
  bool empty() const { return contigs_.empty(); }
  const Contig &operator[](size_t i) const { return contigs_[i]; }
  const std::vector<Contig> &contigs() const { return contigs_; }

  bool contains(const std::string &name) const;
  // Index of the contig, or -1
  int find(const std::string &name) const;
  int64_t length(const std::string &name) const;
  const std::string &sequence(const std::string &name) const;
  int64_t total_length() const;

private:
  std::vector<Contig> contigs_;
  std::unordered_map<std::string, size_t> by_name_;

  ReferenceIndex(const ReferenceIndex &) = delete;
  ReferenceIndex &operator=(const ReferenceIndex &) = delete;
};

} // namespace gccorrect
