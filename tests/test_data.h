// gccorrect - test fixtures
// Small on-disk references, BED masks and indexed BAMs built with htslib

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace gccorrect {
namespace fixtures {

// Fresh directory under the system temp dir, removed with its contents
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

struct SimRead {
    std::string contig;
    int64_t pos = 0;            // 0-based leftmost aligned base
    int length = 100;
    bool reverse = false;
    int mapq = 60;
    uint16_t extra_flags = 0;
    int64_t isize = 0;          // > 0 makes the read a properly paired first mate
};

using NamedSequence = std::pair<std::string, std::string>;

struct BedInterval {
    std::string contig;
    int64_t start;
    int64_t end;
};

void write_fasta(const std::string& path, const std::vector<NamedSequence>& contigs);
void write_bed(const std::string& path, const std::vector<BedInterval>& intervals);
void write_text(const std::string& path, const std::string& text);
std::string read_text(const std::string& path);

// Coordinate-sort `reads`, write them as BAM and build a .bai next to it
void write_bam(const std::string& path, const std::vector<NamedSequence>& contigs,
               std::vector<SimRead> reads);

// Uniform random sequence with the given expected GC fraction
std::string random_sequence(size_t length, double gc_fraction, std::mt19937_64& rng);

// Argument vector for CLI handlers; argv[0] is the command name
class Args {
public:
    explicit Args(std::vector<std::string> args);

    int argc() const { return static_cast<int>(ptrs_.size()) - 1; }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

}  // namespace fixtures
}  // namespace gccorrect
