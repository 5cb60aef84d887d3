#include "error.hpp"

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::MissingDependency: return "MissingDependency";
        case ErrorKind::BuildFailed: return "BuildFailed";
        case ErrorKind::UnknownModel: return "UnknownModel";
        case ErrorKind::ModelNotFound: return "ModelNotFound";
        case ErrorKind::ModelDownloadFailed: return "ModelDownloadFailed";
        case ErrorKind::AudioConversionFailed: return "AudioConversionFailed";
        case ErrorKind::EngineInvocationFailed: return "EngineInvocationFailed";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Storage: return "Storage";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out(to_string(kind));
    out += ": ";
    out += message;
    if (!names.empty()) {
        out += " (";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
        }
        out += ")";
    }
    return out;
}
