// gccorrect - inputs.cpp

#include "inputs.h"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <stdexcept>

namespace gccorrect {

void load_inputs(const InputConfig& input, ReferenceIndex& ref, MappabilityMask& mask,
                 Logger& log) {
    log.info("Loading reference: " + input.reference_path);
    ref.load(input.reference_path, input.chromosomes);
    if (ref.empty()) {
        throw std::runtime_error("no contigs loaded from " + input.reference_path);
    }
    log.info("Loaded " + std::to_string(ref.size()) + " contigs, " +
             std::to_string(ref.total_length()) + " bp");

    log.info("Loading mappability: " + input.mappability_path);
    mask = MappabilityMask(ref);
    mask.load_bed(input.mappability_path);
    mask.find_long_segments(input.min_span);

    log.section("Mappability");
    for (const auto& contig : ref.contigs()) {
        int64_t usable = mask.mappable_count(contig.name);
        log.metric(contig.name + " mappable_bp", usable);
        log.metric(contig.name + " long_segments",
                   static_cast<int64_t>(mask.long_segments(contig.name).size()));
        if (usable == 0) log.warn("no mappable positions on " + contig.name);
    }
}

OutputFile::OutputFile(const std::string& path) : path_(path), out_(&std::cout) {
    if (path.empty() || path == "-") return;
    tmp_path_ = path + ".tmp";
    file_.open(tmp_path_);
    if (!file_) {
        throw std::runtime_error("cannot open output file: " + tmp_path_);
    }
    out_ = &file_;
}

OutputFile::~OutputFile() {
    if (!file_.is_open()) return;
    file_.close();
    std::error_code ec;
    std::filesystem::remove(tmp_path_, ec);
}

void OutputFile::close() {
    out_->flush();
    if (!*out_) {
        throw std::runtime_error("write failed: " +
                                 (tmp_path_.empty() ? std::string("stdout") : tmp_path_));
    }
    if (!file_.is_open()) return;
    file_.close();
    std::error_code ec;
    if (file_.fail()) {
        std::filesystem::remove(tmp_path_, ec);
        throw std::runtime_error("write failed: " + tmp_path_);
    }
    std::filesystem::rename(tmp_path_, path_, ec);
    if (ec) {
        std::filesystem::remove(tmp_path_, ec);
        throw std::runtime_error("cannot move " + tmp_path_ + " to " + path_);
    }
}

}  // namespace gccorrect
