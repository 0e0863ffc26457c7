#include <ea_mcp/core/result.hpp>

#include <ostream>
#include <sstream>

namespace ea_mcp {

namespace {

std::string JoinAllowed(const std::vector<std::string>& allowed) {
    std::string joined;
    for (const auto& a : allowed) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += a;
    }
    return joined;
}

} // anonymous namespace

Error Error::MissingParameter(const std::string& operation,
                              const std::string& field) {
    Error e{operation, ErrorKind::MissingParameter,
            "Missing required parameter: " + field};
    e.field = field;
    return e;
}

Error Error::InvalidParameter(const std::string& operation,
                              const std::string& field,
                              const std::string& message) {
    Error e{operation, ErrorKind::InvalidParameter,
            "Invalid parameter " + field + ": " + message};
    e.field = field;
    return e;
}

Error Error::InvalidGuid(const std::string& operation,
                         const std::string& field,
                         const std::string& value) {
    Error e{operation, ErrorKind::InvalidGuid,
            "Invalid GUID in " + field + ": '" + value + "'"};
    e.field = field;
    e.value = value;
    return e;
}

Error Error::UnknownElementType(const std::string& operation,
                                const std::string& field,
                                const std::string& value,
                                std::vector<std::string> allowed) {
    Error e{operation, ErrorKind::UnknownElementType,
            "Unknown element type '" + value + "' in " + field +
                " (allowed: " + JoinAllowed(allowed) + ")"};
    e.field = field;
    e.value = value;
    e.allowed = std::move(allowed);
    return e;
}

Error Error::EaConnection(const std::string& operation,
                          const std::string& message) {
    return Error{operation, ErrorKind::EaConnection, message};
}

Error Error::NotFound(const std::string& operation,
                      const std::string& message) {
    return Error{operation, ErrorKind::NotFound, message};
}

Error Error::DiagramCreationFailed(const std::string& operation,
                                   const std::string& reason) {
    return Error{operation, ErrorKind::DiagramCreationFailed,
                 "Diagram creation failed: " + reason};
}

Error Error::ElementCreationFailed(const std::string& operation,
                                   const std::string& field,
                                   std::size_t index,
                                   const std::string& reason) {
    Error e{operation, ErrorKind::ElementCreationFailed,
            "Element creation failed at " + field + "[" +
                std::to_string(index) + "]: " + reason};
    e.field = field;
    e.index = index;
    return e;
}

Error Error::Config(const std::string& message) {
    return Error{"ConfigLoader", ErrorKind::Config, message};
}

Error Error::Internal(const std::string& operation,
                      const std::string& message) {
    return Error{operation, ErrorKind::Internal, message};
}

int Error::ExitCode() const noexcept {
    switch (kind) {
        case ErrorKind::MissingParameter:      return 2;
        case ErrorKind::InvalidParameter:      return 2;
        case ErrorKind::InvalidGuid:           return 2;
        case ErrorKind::UnknownElementType:    return 2;
        case ErrorKind::Config:                return 2;
        case ErrorKind::EaConnection:          return 3;
        case ErrorKind::NotFound:              return 4;
        case ErrorKind::DiagramCreationFailed: return 5;
        case ErrorKind::ElementCreationFailed: return 5;
        case ErrorKind::Internal:              return 99;
    }
    return 99;
}

std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::MissingParameter:      return "missing_parameter";
        case ErrorKind::InvalidParameter:      return "invalid_parameter";
        case ErrorKind::InvalidGuid:           return "invalid_guid";
        case ErrorKind::UnknownElementType:    return "unknown_element_type";
        case ErrorKind::EaConnection:          return "ea_connection";
        case ErrorKind::NotFound:              return "not_found";
        case ErrorKind::DiagramCreationFailed: return "diagram_creation_failed";
        case ErrorKind::ElementCreationFailed: return "element_creation_failed";
        case ErrorKind::Config:                return "config";
        case ErrorKind::Internal:              return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << KindName() << "]: " << message;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

} // namespace ea_mcp
