#include <dashgraph/core/result.hpp>

#include <sstream>

namespace dashgraph {

Error Error::Wrap(ErrorCategory category,
                  const std::string& operation,
                  const std::string& object,
                  const std::string& message,
                  const Error& cause) {
    return Error{operation, object, message, cause.ToString(), category};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::InvalidObject:       return "invalid_object";
        case ErrorCategory::NoQueryerConfigured: return "no_queryer_configured";
        case ErrorCategory::ChildLookup:         return "child_lookup";
        case ErrorCategory::Configuration:       return "configuration";
        case ErrorCategory::ContextCancelled:    return "context_cancelled";
        case ErrorCategory::PathResolution:      return "path_resolution";
        case ErrorCategory::NotFound:            return "not_found";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!object.empty()) {
        oss << " [" << object << "]";
    }
    oss << ": " << message;
    if (cause.has_value() && !cause->empty()) {
        oss << ": " << *cause;
    }
    return oss.str();
}

} // namespace dashgraph
