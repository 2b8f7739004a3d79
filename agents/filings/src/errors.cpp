#include "../include/errors.hpp"

const char* to_string(Stage s) {
    switch (s) {
        case Stage::Acquire: return "acquire";
        case Stage::ExtractText: return "extract_text";
        case Stage::ExtractRegions: return "extract_regions";
        case Stage::Chunk: return "chunk";
        case Stage::Embed: return "embed";
        case Stage::Write: return "write";
        case Stage::Route: return "route";
        case Stage::GenerateQuery: return "generate_query";
        case Stage::ExecuteQuery: return "execute_query";
        case Stage::Retrieve: return "retrieve";
        case Stage::Synthesize: return "synthesize";
    }
    return "unknown";
}

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::AcquisitionFailure: return "AcquisitionFailure";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::StructuredExtractionDegraded: return "StructuredExtractionDegraded";
        case ErrorKind::EmbeddingFailure: return "EmbeddingFailure";
        case ErrorKind::SyncWriteFailure: return "SyncWriteFailure";
        case ErrorKind::GenerationInvalid: return "GenerationInvalid";
        case ErrorKind::RetrievalEmpty: return "RetrievalEmpty";
        case ErrorKind::DuplicateDocument: return "DuplicateDocument";
        case ErrorKind::Timeout: return "Timeout";
    }
    return "Unknown";
}
