// gccorrect - rates.cpp
// Stage 1: fragment rate per GC value

#include "algorithms/coverage_estimator.h"
#include "algorithms/rate_estimator.h"
#include "inputs.h"
#include "util/logger.h"
#include "util/work_pool.h"
#include <gccorrect/config.hpp>

#include <cmath>
#include <sstream>

namespace gccorrect {

int run_rates(const RateConfig& config) {
    Logger log("rates");
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    if (!config.trace_path.empty() && !log.open_trace(config.trace_path)) {
        log.warn("cannot write trace file " + config.trace_path);
    }
    log.info("gccorrect rates v" + std::string(VERSION) + " starting");

    try {
        ReferenceIndex ref;
        MappabilityMask mask;
        load_inputs(config.input, ref, mask, log);

        CancellationToken token;
        InterruptScope interrupts(token);

        log.section("Alignment profile");
        AlignmentProfile profile = profile_alignments(config.input.bam_path, ref, mask,
                                                      config.sampling, token, log);

        RateParams params;
        params.insert_length = static_cast<int>(std::lround(profile.insert.mean));
        params.shift = config.shift;
        params.min_mapq = config.sampling.min_mapq;
        params.cutoffs = profile.cutoffs;

        std::ostringstream ss;
        ss << "Insert length " << params.insert_length << ", depth cutoffs ["
           << params.cutoffs.min_depth << ", " << params.cutoffs.max_depth << "]";
        log.info(ss.str());

        log.section("Rate estimation");
        RateEstimate estimate = estimate_rates(config.input.bam_path, ref, mask, params,
                                               config.sampling, config.min_positions,
                                               token, log);

        std::ostringstream left;
        for (size_t i = 0; i < estimate.left_over.size(); ++i) {
            if (i > 0) left << ",";
            left << estimate.left_over[i];
        }
        log.decision("pass2_gc_values", left.str().empty() ? "none" : left.str(),
                     "fewer than " + std::to_string(config.min_positions) +
                     " positions after pass 1");

        size_t usable = 0;
        for (size_t gc = 0; gc < estimate.table.size(); ++gc) {
            if (estimate.table.has_rate(static_cast<int>(gc))) ++usable;
        }
        log.info("Evaluated " + std::to_string(estimate.pass1_positions) + " + " +
                 std::to_string(estimate.pass2_positions) + " positions; " +
                 std::to_string(usable) + "/" + std::to_string(estimate.table.size()) +
                 " GC values have a rate");
        if (usable == 0) {
            log.warn("no GC value reached --min-positions; every rate is unusable");
        }

        token.check("rates");
        OutputFile out(config.output_path);
        estimate.table.write(out.stream());
        out.close();
    } catch (const InterruptedError& e) {
        log.error(e.what());
        return 130;
    } catch (const InsertEstimateError& e) {
        log.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace gccorrect
