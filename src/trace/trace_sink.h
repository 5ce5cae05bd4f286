#ifndef MESHWORK_TRACE_TRACE_SINK_H_
#define MESHWORK_TRACE_TRACE_SINK_H_

#include <fstream>
#include <string>

#include "mutation_record.h"

namespace Meshwork {

/**
 * Destination for exported trace records. Write returns false while the sink
 * is unavailable; the recorder keeps the record and retries later.
 */
class ITraceSink {
public:
    virtual ~ITraceSink() = default;

    virtual bool Write(const MutationRecord& record) = 0;
    virtual bool Flush() { return true; }
};

// Appends one JSON record per line to a file.
class FileTraceSink : public ITraceSink {
public:
    explicit FileTraceSink(std::string path);

    bool Write(const MutationRecord& record) override;
    bool Flush() override;

    const std::string& path() const { return path_; }

private:
    bool EnsureOpen();

    std::string path_;
    std::ofstream out_;
};

} // namespace Meshwork

#endif // MESHWORK_TRACE_TRACE_SINK_H_
