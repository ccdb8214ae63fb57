// gccorrect - estimate.cpp
// Insert-length and coverage-cutoff estimation as a standalone command

#include "algorithms/coverage_estimator.h"
#include "inputs.h"
#include "util/logger.h"
#include "util/work_pool.h"
#include <gccorrect/config.hpp>

#include <iomanip>
#include <ostream>
#include <string>

namespace gccorrect {

int run_estimate(const EstimateConfig& config) {
    Logger log("estimate");
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    if (!config.trace_path.empty() && !log.open_trace(config.trace_path)) {
        log.warn("cannot write trace file " + config.trace_path);
    }
    log.info("gccorrect estimate v" + std::string(VERSION) + " starting");

    try {
        ReferenceIndex ref;
        MappabilityMask mask;
        load_inputs(config.input, ref, mask, log);

        CancellationToken token;
        InterruptScope interrupts(token);
        AlignmentProfile profile = profile_alignments(config.input.bam_path, ref, mask,
                                                      config.sampling, token, log);

        token.check("estimate");
        OutputFile out(config.output_path);
        std::ostream& os = out.stream();
        os << std::fixed << std::setprecision(4);
        os << "insert_mean\t" << profile.insert.mean << "\n";
        os << "insert_stdev\t" << profile.insert.stdev << "\n";
        os << "insert_samples\t" << profile.insert.samples << "\n";
        os << "coverage_mean\t" << profile.cutoffs.mean << "\n";
        os << "coverage_stdev\t" << profile.cutoffs.stdev << "\n";
        os << "min_depth\t" << profile.cutoffs.min_depth << "\n";
        os << "max_depth\t" << profile.cutoffs.max_depth << "\n";
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
