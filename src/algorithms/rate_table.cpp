#include "rate_table.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace gccorrect {

RateTable::RateTable(int insert_length)
    : counts_(insert_length + 1),
      rates_(insert_length + 1, 0.0),
      usable_(insert_length + 1, false) {
    if (insert_length < 0) {
        throw std::invalid_argument("RateTable: negative insert length");
    }
}

void RateTable::add(int gc, uint64_t positions, uint64_t fragments) {
    counts_.at(gc).positions += positions;
    counts_.at(gc).fragments += fragments;
}

void RateTable::add(const std::vector<GcCounts>& counts) {
    for (size_t gc = 0; gc < counts.size(); ++gc) {
        add(static_cast<int>(gc), counts[gc].positions, counts[gc].fragments);
    }
}

uint64_t RateTable::total_positions() const {
    uint64_t total = 0;
    for (const auto& c : counts_) total += c.positions;
    return total;
}

uint64_t RateTable::total_fragments() const {
    uint64_t total = 0;
    for (const auto& c : counts_) {
        if (c.positions >= 1) total += c.fragments;
    }
    return total;
}

void RateTable::finalize(int64_t min_positions) {
    uint64_t positions = total_positions();
    global_mean_ = positions > 0
                 ? static_cast<double>(total_fragments()) / positions : 0.0;

    for (size_t gc = 0; gc < counts_.size(); ++gc) {
        const GcCounts& c = counts_[gc];
        usable_[gc] = c.positions >= static_cast<uint64_t>(std::max<int64_t>(min_positions, 0))
                   && c.fragments > 0;
        rates_[gc] = usable_[gc]
                   ? global_mean_ * static_cast<double>(c.positions) / c.fragments : 0.0;
    }
}

std::vector<int> RateTable::under_sampled(int64_t min_positions) const {
    std::vector<int> left;
    for (size_t gc = 0; gc < counts_.size(); ++gc) {
        if (static_cast<int64_t>(counts_[gc].positions) < min_positions) {
            left.push_back(static_cast<int>(gc));
        }
    }
    return left;
}

void RateTable::write(std::ostream& out) const {
    for (size_t gc = 0; gc < counts_.size(); ++gc) {
        out << gc << "\t" << counts_[gc].positions << "\t" << counts_[gc].fragments << "\t";
        if (usable_[gc]) {
            out << std::setprecision(10) << rates_[gc];
        } else {
            out << "-";
        }
        out << "\n";
    }
}

RateTable RateTable::read(std::istream& in) {
    RateTable table;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        long long gc = -1;
        unsigned long long positions = 0, fragments = 0;
        std::string rate;
        if (!(iss >> gc >> positions >> fragments >> rate)
            || gc != static_cast<long long>(table.counts_.size())) {
            throw std::runtime_error("RateTable: malformed row at line " + std::to_string(line_no));
        }

        table.counts_.push_back({positions, fragments});
        if (rate == "-") {
            table.rates_.push_back(0.0);
            table.usable_.push_back(false);
        } else {
            try {
                table.rates_.push_back(std::stod(rate));
            } catch (const std::exception&) {
                throw std::runtime_error("RateTable: bad rate '" + rate + "' at line " +
                                         std::to_string(line_no));
            }
            table.usable_.push_back(true);
        }
    }
    if (table.counts_.empty()) {
        throw std::runtime_error("RateTable: no rows");
    }

    uint64_t positions = table.total_positions();
    table.global_mean_ = positions > 0
                       ? static_cast<double>(table.total_fragments()) / positions : 0.0;
    return table;
}

RateTable RateTable::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("RateTable: cannot open " + path);
    }
    return read(in);
}

}  // namespace gccorrect
