// gccorrect - inputs.h
// Loading of the shared inputs and output destinations for every command

#pragma once

#include <fstream>
#include <iosfwd>
#include <string>

#include "algorithms/mappability.h"
#include "algorithms/reference_index.h"
#include "util/logger.h"
#include <gccorrect/config.hpp>

namespace gccorrect {

// Reference (allow-listed contigs only), its mask and the long mappable
// segments. Throws std::runtime_error on unreadable inputs.
void load_inputs(const InputConfig& input, ReferenceIndex& ref, MappabilityMask& mask,
                 Logger& log);

// A file, or stdout for "-". A file is written to `<path>.tmp` and only
// renamed to `path` by close(); destroying an unclosed OutputFile removes
// the temporary, so a failed run leaves no output behind.
class OutputFile {
public:
    explicit OutputFile(const std::string& path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    std::ostream& stream() { return *out_; }

    // Flush, move the file into place and report errors as std::runtime_error
    void close();

private:
    std::string path_;
    std::string tmp_path_;
    std::ofstream file_;
    std::ostream* out_;
};

}  // namespace gccorrect
