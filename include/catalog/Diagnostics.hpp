#pragma once
#include <ostream>
#include <string>

namespace catalog {

// Console sink for pipeline progress. Null streams silence a channel.
struct Diagnostics {
    std::ostream* out = nullptr;  // progress, summaries, KEY: value lines
    std::ostream* err = nullptr;  // warnings
    bool debug = false;           // per-section trace lines

    void info(const std::string& msg) const {
        if (out) (*out) << msg << "\n";
    }
    void warn(const std::string& msg) const {
        if (err) (*err) << "warning: " << msg << "\n";
    }
    void trace(const std::string& msg) const {
        if (debug && out) (*out) << "  " << msg << "\n";
    }
};

}  // namespace catalog
