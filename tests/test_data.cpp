#include "test_data.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

#include <htslib/sam.h>

namespace gccorrect {
namespace fixtures {

namespace fs = std::filesystem;

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "gccorrect-test-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << text;
}

std::string read_text(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot read " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_fasta(const std::string& path, const std::vector<NamedSequence>& contigs) {
    std::ostringstream ss;
    for (const auto& c : contigs) {
        ss << ">" << c.first << "\n";
        for (size_t i = 0; i < c.second.size(); i += 60) {
            ss << c.second.substr(i, 60) << "\n";
        }
    }
    write_text(path, ss.str());
}

void write_bed(const std::string& path, const std::vector<BedInterval>& intervals) {
    std::ostringstream ss;
    for (const auto& iv : intervals) {
        ss << iv.contig << "\t" << iv.start << "\t" << iv.end << "\n";
    }
    write_text(path, ss.str());
}

void write_bam(const std::string& path, const std::vector<NamedSequence>& contigs,
               std::vector<SimRead> reads) {
    std::map<std::string, size_t> order;
    for (size_t i = 0; i < contigs.size(); ++i) order[contigs[i].first] = i;
    std::stable_sort(reads.begin(), reads.end(), [&order](const SimRead& a, const SimRead& b) {
        size_t ta = order.at(a.contig), tb = order.at(b.contig);
        return ta != tb ? ta < tb : a.pos < b.pos;
    });

    std::ostringstream sam;
    sam << "@HD\tVN:1.6\tSO:coordinate\n";
    for (const auto& c : contigs) {
        sam << "@SQ\tSN:" << c.first << "\tLN:" << c.second.size() << "\n";
    }
    for (size_t i = 0; i < reads.size(); ++i) {
        const SimRead& r = reads[i];
        uint16_t flag = r.extra_flags;
        if (r.reverse) flag |= BAM_FREVERSE;
        std::string rnext = "*";
        int64_t pnext = 0;
        if (r.isize > 0) {
            flag |= BAM_FPAIRED | BAM_FPROPER_PAIR | BAM_FREAD1;
            if (!r.reverse) flag |= BAM_FMREVERSE;
            rnext = "=";
            pnext = r.pos + r.isize - r.length + 1;
        }
        sam << "r" << i << "\t" << flag << "\t" << r.contig << "\t" << (r.pos + 1) << "\t"
            << r.mapq << "\t" << r.length << "M\t" << rnext << "\t" << pnext << "\t"
            << r.isize << "\t*\t*\n";
    }

    const std::string sam_path = path + ".sam";
    write_text(sam_path, sam.str());

    samFile* in = sam_open(sam_path.c_str(), "r");
    if (!in) throw std::runtime_error("sam_open failed for " + sam_path);
    sam_hdr_t* hdr = sam_hdr_read(in);
    samFile* out = sam_open(path.c_str(), "wb");
    if (!hdr || !out || sam_hdr_write(out, hdr) < 0) {
        throw std::runtime_error("cannot start BAM " + path);
    }
    bam1_t* b = bam_init1();
    int ret;
    while ((ret = sam_read1(in, hdr, b)) >= 0) {
        if (sam_write1(out, hdr, b) < 0) throw std::runtime_error("sam_write1 failed");
    }
    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    sam_close(in);
    if (sam_close(out) < 0 || ret < -1) throw std::runtime_error("BAM write failed: " + path);
    if (sam_index_build(path.c_str(), 0) < 0) {
        throw std::runtime_error("sam_index_build failed for " + path);
    }
}

std::string random_sequence(size_t length, double gc_fraction, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::string seq(length, 'A');
    for (auto& base : seq) {
        double x = u(rng);
        if (x < gc_fraction) {
            base = x < gc_fraction / 2 ? 'G' : 'C';
        } else {
            base = x < gc_fraction + (1.0 - gc_fraction) / 2 ? 'A' : 'T';
        }
    }
    return seq;
}

Args::Args(std::vector<std::string> args) : storage_(std::move(args)) {
    for (auto& s : storage_) ptrs_.push_back(&s[0]);
    ptrs_.push_back(nullptr);
}

}  // namespace fixtures
}  // namespace gccorrect
