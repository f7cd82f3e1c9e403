#include "common/errors.hpp"

namespace reasongraph {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:          return "INVALID_INPUT";
        case ErrorCode::MissingParameter:      return "MISSING_PARAMETER";
        case ErrorCode::BranchNotFound:        return "BRANCH_NOT_FOUND";
        case ErrorCode::ThoughtNotFound:       return "THOUGHT_NOT_FOUND";
        case ErrorCode::ConfigurationError:    return "CONFIGURATION_ERROR";
        case ErrorCode::SemanticAnalysisError: return "SEMANTIC_ANALYSIS_ERROR";
        case ErrorCode::ProviderTimeout:       return "PROVIDER_TIMEOUT";
        case ErrorCode::ImportFailed:          return "IMPORT_FAILED";
        case ErrorCode::ExportFailed:          return "EXPORT_FAILED";
        case ErrorCode::InternalError:         return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR";
}

bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::SemanticAnalysisError:
        case ErrorCode::ProviderTimeout:
        case ErrorCode::InternalError:
            return true;
        default:
            return false;
    }
}

ErrorInfo describe(const std::exception& e) {
    if (const auto* err = dynamic_cast<const Error*>(&e)) {
        return {err->code(), err->what(), err->retryable()};
    }
    return {ErrorCode::InternalError, e.what(), true};
}

} // namespace reasongraph
