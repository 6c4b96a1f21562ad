#include "util/result.hpp"

namespace fwbundle {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "ok";
        case ErrorKind::Configuration:   return "ConfigurationError";
        case ErrorKind::KeyMissing:      return "KeyError(missing)";
        case ErrorKind::KeyUnsupported:  return "KeyError(unsupported)";
        case ErrorKind::Manifest:        return "ManifestError";
        case ErrorKind::MissingArtifact: return "MissingArtifactError";
        case ErrorKind::BuildTool:       return "BuildToolError";
        case ErrorKind::Io:              return "IoError";
    }
    return "Error";
}

} // namespace fwbundle
