// gccorrect - Parallel work-unit dispatch
// Fan-out over an OpenMP team, fan-in in the calling thread after the join

#pragma once

#include <atomic>
#include <cstdint>
#include <csignal>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <omp.h>

#include "logger.h"
#include <gccorrect/config.hpp>

namespace gccorrect {

// Raised in the parent when a stage stops because its token was cancelled
class InterruptedError : public std::runtime_error {
public:
    explicit InterruptedError(const std::string& stage)
        : std::runtime_error(stage + " interrupted; no partial results were kept") {}
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

    // Throws InterruptedError(stage) once cancelled
    void check(const std::string& stage) const {
        if (cancelled()) throw InterruptedError(stage);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// Polls a token from inside a long scan over columns or records. The first
// step and every `interval`-th step after it throw InterruptedError once the
// token is cancelled.
class CancellationCheck {
public:
    CancellationCheck(const CancellationToken& token, std::string stage,
                      uint32_t interval = CANCEL_CHECK_INTERVAL)
        : token_(token), stage_(std::move(stage)), interval_(interval > 0 ? interval : 1) {}

    void step() {
        if (steps_++ % interval_ == 0) token_.check(stage_);
    }

private:
    const CancellationToken& token_;
    std::string stage_;
    uint32_t interval_;
    uint64_t steps_ = 0;
};

// While alive, SIGINT cancels `token` instead of killing the process.
// The previous handler is restored on destruction. Scopes do not nest.
class InterruptScope {
public:
    explicit InterruptScope(CancellationToken& token);
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    struct sigaction previous_;
    bool installed_ = false;
};

// Run `process(state, unit)` for every unit on `threads` workers.
// `make_state()` runs once per worker and builds its private state (its own
// BAM handles); shared inputs must be captured by const reference. The
// token is checked before every unit. The first exception thrown by a
// worker cancels the remaining units and is rethrown here after the join;
// a cancelled run throws InterruptedError and returns nothing.
template <typename Result, typename Unit, typename MakeState, typename Process>
std::vector<Result> run_units(const std::vector<Unit>& units, int threads,
                              CancellationToken& token, MakeState make_state,
                              Process process, Logger* log = nullptr,
                              const std::string& stage = "units") {
    std::vector<Result> results(units.size());
    std::exception_ptr first_error;
    std::atomic<size_t> done{0};
    const long n_units = static_cast<long>(units.size());

    #pragma omp parallel num_threads(threads > 0 ? threads : 1)
    {
        decltype(make_state()) state{};
        bool ready = false;
        try {
            state = make_state();
            ready = true;
        } catch (...) {
            #pragma omp critical(gccorrect_run_units_error)
            {
                if (!first_error) first_error = std::current_exception();
            }
            token.cancel();
        }

        #pragma omp for schedule(dynamic, 1)
        for (long i = 0; i < n_units; ++i) {
            if (!ready || token.cancelled()) continue;
            try {
                results[i] = process(state, units[i]);
            } catch (...) {
                #pragma omp critical(gccorrect_run_units_error)
                {
                    if (!first_error) first_error = std::current_exception();
                }
                token.cancel();
                continue;
            }
            size_t finished = ++done;
            if (log) log->progress(stage, finished, units.size());
        }
    }

    if (first_error) std::rethrow_exception(first_error);
    if (token.cancelled()) throw InterruptedError(stage);
    return results;
}

}  // namespace gccorrect
