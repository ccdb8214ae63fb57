#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace gccorrect {

// Map an uppercase nucleotide to a tally slot (A=0, C=1, G=2, T=3, other=4)
inline int nucleotide_slot(char base) {
    switch (base) {
        case 'A': return 0;
        case 'C': return 1;
        case 'G': return 2;
        case 'T': return 3;
        default: return 4;
    }
}

inline bool is_gc(char base) {
    return base == 'G' || base == 'C';
}

// Naive G+C count over seq[begin, end)
inline int64_t count_gc(const std::string& seq, int64_t begin, int64_t end) {
    int64_t gc = 0;
    for (int64_t i = begin; i < end; ++i) {
        if (is_gc(seq[i])) ++gc;
    }
    return gc;
}

// Nucleotide counts of a window, updated one base at a time
class NucleotideTally {
public:
    void add(char base) { ++counts_[nucleotide_slot(base)]; ++size_; }
    void remove(char base) { --counts_[nucleotide_slot(base)]; --size_; }

    void clear() {
        counts_.fill(0);
        size_ = 0;
    }

    int64_t count(char base) const { return counts_[nucleotide_slot(base)]; }
    int64_t gc() const { return counts_[1] + counts_[2]; }
    int64_t size() const { return size_; }

private:
    std::array<int64_t, 5> counts_{};
    int64_t size_ = 0;
};

// Window [pos + lead, pos + lead + length) over a sequence, clipped to the
// sequence bounds. Both ends only move right as pos advances, so advance()
// removes at most one base and adds at most one base.
//   forward window: lead = shift              -> [pos + shift, pos + shift + length)
//   reverse window: lead = -(length + shift)  -> [pos - shift - length, pos - shift)
class SlidingWindow {
public:
    SlidingWindow(const std::string& seq, int64_t lead, int64_t length)
        : seq_(seq), lead_(lead), length_(length) {}

    void reset(int64_t pos) {
        pos_ = pos;
        primed_ = true;
        tally_.clear();
        begin_ = clip(pos + lead_);
        end_ = clip(pos + lead_ + length_);
        for (int64_t i = begin_; i < end_; ++i) tally_.add(seq_[i]);
    }

    void advance() {
        ++pos_;
        int64_t new_begin = clip(pos_ + lead_);
        int64_t new_end = clip(pos_ + lead_ + length_);
        if (new_end > end_) {
            tally_.add(seq_[end_]);
            end_ = new_end;
        }
        if (new_begin > begin_) {
            tally_.remove(seq_[begin_]);
            begin_ = new_begin;
        }
    }

    // Moves forward to pos, base by base while that is cheaper than a recount
    void seek(int64_t pos) {
        if (!primed_ || pos < pos_ || pos - pos_ > length_) {
            reset(pos);
            return;
        }
        while (pos_ < pos) advance();
    }

    int64_t position() const { return pos_; }
    int64_t begin() const { return begin_; }
    int64_t end() const { return end_; }
    bool full() const { return tally_.size() == length_; }
    const NucleotideTally& tally() const { return tally_; }

private:
    int64_t clip(int64_t x) const {
        return std::max<int64_t>(0, std::min<int64_t>(x, static_cast<int64_t>(seq_.size())));
    }

    const std::string& seq_;
    int64_t lead_;
    int64_t length_;
    int64_t pos_ = 0;
    int64_t begin_ = 0;
    int64_t end_ = 0;
    bool primed_ = false;
    NucleotideTally tally_;
};

}  // namespace gccorrect
