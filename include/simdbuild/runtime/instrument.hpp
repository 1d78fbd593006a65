//! # Instrumentation Hook
//!
//! Code compiled with instrumentation enabled calls
//! `ISPCInstrument(file, note, line, mask)` at interesting points. The
//! call is forwarded to the installed `Instrument` along with the number of
//! active program instances in `mask`.

#ifndef SIMDBUILD_RUNTIME_INSTRUMENT_HPP
#define SIMDBUILD_RUNTIME_INSTRUMENT_HPP

#include "simdbuild/common.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace simdbuild::runtime {

class Instrument {
public:
    virtual ~Instrument() = default;

    virtual void instrument(const char* file, const char* note, int line, uint64_t mask,
                            uint32_t active_count) = 0;

    /// Reports what was gathered. Does nothing by default.
    virtual void print_summary() {}
};

/// Logs every call and keeps per-site lane utilization for the summary.
class LoggingInstrument : public Instrument {
public:
    struct Site {
        uint64_t calls = 0;
        uint64_t active_lanes = 0;
    };

    void instrument(const char* file, const char* note, int line, uint64_t mask,
                    uint32_t active_count) override;
    void print_summary() override;

    /// Sites keyed "file:line (note)".
    [[nodiscard]] std::map<std::string, Site> sites() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Site> sites_;
};

/// Installs the instrument. Only the first call (or the first use of
/// `instrument()`) wins; returns false afterwards.
bool set_instrument(Box<Instrument> instrument);

/// The installed instrument, a `LoggingInstrument` if none was set.
[[nodiscard]] Instrument& instrument();

/// Calls `print_summary()` on the installed instrument.
void print_instrumenting_summary();

} // namespace simdbuild::runtime

extern "C" {
void ISPCInstrument(const char* file, const char* note, int line, uint64_t mask);
}

#endif // SIMDBUILD_RUNTIME_INSTRUMENT_HPP
