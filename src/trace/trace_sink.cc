#include "trace_sink.h"

#include <glog/logging.h>

namespace Meshwork {

FileTraceSink::FileTraceSink(std::string path) : path_(std::move(path)) {}

bool FileTraceSink::EnsureOpen() {
    if (out_.is_open() && out_.good()) {
        return true;
    }
    out_.close();
    out_.clear();
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        LOG_EVERY_N(WARNING, 100) << "Trace sink " << path_ << " unavailable";
        return false;
    }
    return true;
}

bool FileTraceSink::Write(const MutationRecord& record) {
    if (!EnsureOpen()) {
        return false;
    }
    out_ << ToJsonLine(record) << '\n';
    return out_.good();
}

bool FileTraceSink::Flush() {
    if (!out_.is_open()) {
        return false;
    }
    out_.flush();
    return out_.good();
}

} // namespace Meshwork
