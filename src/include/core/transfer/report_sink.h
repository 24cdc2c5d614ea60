#pragma once

#include <cstdint>
#include <string>

namespace handover::core {

// Lifecycle events of a migration run, persisted by the implementation
class ReportSink {
public:
    virtual ~ReportSink() = default;

    virtual void RecordStart() = 0;
    virtual void RecordTotalSize(std::int64_t bytes) = 0;
    virtual void RecordMigratedFile(const std::string& path) = 0;
    virtual void RecordError(const std::string& message) = 0;
    virtual void RecordEnd() = 0;
};

} // namespace handover::core
