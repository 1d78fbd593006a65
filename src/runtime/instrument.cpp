#include "simdbuild/runtime/instrument.hpp"

#include "simdbuild/log/log.hpp"

#include <bitset>
#include <iomanip>

namespace simdbuild::runtime {

void LoggingInstrument::instrument(const char* file, const char* note, int line, uint64_t mask,
                                   uint32_t active_count) {
    SIMDBUILD_LOG_INFO("rt", "instrument " << file << ":" << line << " (" << note
                                           << ") active " << active_count << " mask 0x"
                                           << std::hex << mask);
    std::string key = std::string(file) + ":" + std::to_string(line) + " (" + note + ")";
    std::lock_guard<std::mutex> lock(mutex_);
    auto& site = sites_[key];
    ++site.calls;
    site.active_lanes += active_count;
}

void LoggingInstrument::print_summary() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, site] : sites_) {
        double average = site.calls ? static_cast<double>(site.active_lanes) / site.calls : 0.0;
        SIMDBUILD_LOG_INFO("rt", key << ": " << site.calls << " calls, " << std::fixed
                                     << std::setprecision(2) << average << " active lanes avg");
    }
}

std::map<std::string, LoggingInstrument::Site> LoggingInstrument::sites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sites_;
}

namespace {

std::once_flag g_instrument_once;
Instrument* g_instrument = nullptr;

} // namespace

bool set_instrument(Box<Instrument> instrument) {
    bool installed = false;
    std::call_once(g_instrument_once, [&] {
        g_instrument = instrument.release();
        installed = true;
    });
    return installed;
}

Instrument& instrument() {
    std::call_once(g_instrument_once, [] { g_instrument = new LoggingInstrument(); });
    return *g_instrument;
}

void print_instrumenting_summary() {
    instrument().print_summary();
}

} // namespace simdbuild::runtime

extern "C" void ISPCInstrument(const char* file, const char* note, int line, uint64_t mask) {
    auto active = static_cast<uint32_t>(std::bitset<64>(mask).count());
    simdbuild::runtime::instrument().instrument(file, note, line, mask, active);
}
