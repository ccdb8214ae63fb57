// gccorrect - correct.cpp
// Stage 2: per-base correction, binning and optional LOWESS rescaling

#include "algorithms/binning.h"
#include "algorithms/lowess.h"
#include "algorithms/rate_table.h"
#include "algorithms/region_corrector.h"
#include "inputs.h"
#include "util/logger.h"
#include "util/work_pool.h"
#include <gccorrect/config.hpp>

#include <sstream>
#include <stdexcept>
#include <vector>

namespace gccorrect {

int run_correct(const CorrectConfig& config) {
    Logger log("correct");
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    if (!config.trace_path.empty() && !log.open_trace(config.trace_path)) {
        log.warn("cannot write trace file " + config.trace_path);
    }
    log.info("gccorrect correct v" + std::string(VERSION) + " starting");

    try {
        log.info("Loading rates: " + config.rates_path);
        RateTable rates = RateTable::read_file(config.rates_path);

        CorrectParams params;
        params.window = rates.insert_length() - 2 * config.shift;
        params.shift = config.shift;
        params.min_mapq = config.sampling.min_mapq;
        if (params.window <= 0) {
            throw std::runtime_error("GC window is empty: rate table ends at " +
                                     std::to_string(rates.insert_length()) + ", shift " +
                                     std::to_string(config.shift));
        }
        log.metric("gc_window", static_cast<int64_t>(params.window));

        ReferenceIndex ref;
        MappabilityMask mask;
        load_inputs(config.input, ref, mask, log);

        CancellationToken token;
        InterruptScope interrupts(token);

        // Every contig is corrected before anything is written
        std::vector<Bin> kept;
        int bin_size = config.bin_size;
        int64_t included = 0, excluded = 0;

        log.section("Correction");
        for (size_t ci = 0; ci < ref.size(); ++ci) {
            const Contig& contig = ref[ci];
            if (contig.length == 0) continue;

            log.detail("Correcting " + contig.name);
            BaseCounts counts = correct_contig(config.input.bam_path, contig, ci,
                                               mask.mask(contig.name), rates, params,
                                               config.sampling.threads, token, log);

            int64_t contig_included = 0;
            for (size_t i = 0; i < counts.size(); ++i) {
                if (!counts.excluded(i)) ++contig_included;
            }
            included += contig_included;
            excluded += static_cast<int64_t>(counts.size()) - contig_included;

            if (bin_size <= 0) {
                BinSizeSearch search = search_bin_size(included_values(counts),
                                                       BIN_SIZE_STEP, BIN_SIZE_MIN_RATIO);
                bin_size = search.bin_size;
                std::ostringstream why;
                why << "mean/sd " << search.ratio << " on " << contig.name;
                log.decision("bin_size", std::to_string(bin_size), why.str());
                if (!search.converged) {
                    log.warn("bin-size search ran out of data on " + contig.name +
                             "; using " + std::to_string(bin_size));
                }
                log.info("Bin size " + std::to_string(bin_size));
            }

            std::vector<Bin> bins = bin_contig(contig, counts, bin_size);
            log.metric(contig.name + " bins", static_cast<int64_t>(bins.size()));
            kept.insert(kept.end(), bins.begin(), bins.end());
        }
        token.check("correct");

        log.metric("included_bases", included);
        log.metric("excluded_bases", excluded);
        log.info("Included " + std::to_string(included) + " bases, excluded " +
                 std::to_string(excluded));

        if (config.smooth) {
            log.section("Smoothing");
            LowessParams lp;
            lp.seed = config.sampling.seed;
            SmoothingResult smoothing = smooth_bins(kept, lp);
            log.metric("median_coverage", smoothing.median_coverage, 4);
            log.info("Rescaled " + std::to_string(smoothing.rescaled) + " bins to median " +
                     std::to_string(smoothing.median_coverage));
            if (smoothing.skipped > 0) {
                log.warn(std::to_string(smoothing.skipped) +
                         " bins left unscaled where the GC curve is not positive");
            }
        }

        OutputFile out(config.output_path);
        write_bins(out.stream(), kept);
        out.close();
    } catch (const InterruptedError& e) {
        log.error(e.what());
        return 130;
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace gccorrect
