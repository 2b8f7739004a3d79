#pragma once
#include <stdexcept>
#include <string>

enum class Stage {
    Acquire,
    ExtractText,
    ExtractRegions,
    Chunk,
    Embed,
    Write,
    Route,
    GenerateQuery,
    ExecuteQuery,
    Retrieve,
    Synthesize
};

enum class ErrorKind {
    AcquisitionFailure,
    ExtractionFailure,
    StructuredExtractionDegraded,
    EmbeddingFailure,
    SyncWriteFailure,
    GenerationInvalid,
    RetrievalEmpty,
    DuplicateDocument,
    Timeout
};

const char* to_string(Stage s);
const char* to_string(ErrorKind k);

// Error raised by every pipeline stage. The orchestrators catch it and turn it
// into a result; it never crosses ingest() or answer().
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, Stage stage, const std::string& msg, bool retryable = false)
        : std::runtime_error(msg), kind_(kind), stage_(stage), retryable_(retryable) {}

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }
    bool retryable() const { return retryable_; }

private:
    ErrorKind kind_;
    Stage stage_;
    bool retryable_;
};

// Failure modes reported by the acquisition boundary.
enum class AcquireFailureMode { NotFound, RateLimited, TransportTimeout, Transport };

class AcquisitionError : public PipelineError {
public:
    AcquisitionError(AcquireFailureMode mode, const std::string& msg)
        : PipelineError(ErrorKind::AcquisitionFailure, Stage::Acquire, msg,
                        mode != AcquireFailureMode::NotFound),
          mode_(mode) {}

    AcquireFailureMode mode() const { return mode_; }

private:
    AcquireFailureMode mode_;
};
