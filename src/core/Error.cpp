#include <gmshim/Error.hpp>

namespace gmshim {

std::string_view toString(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kCommandNotFound:
            return "command_not_found";
        case ErrorKind::kFileNotFound:
            return "file_not_found";
        case ErrorKind::kNoImageReturned:
            return "no_image_returned";
        case ErrorKind::kUnableToOpen:
            return "unable_to_open";
        case ErrorKind::kUnclassified:
            return "unclassified";
        case ErrorKind::kMalformedMetadata:
            return "malformed_metadata";
        case ErrorKind::kUnboundPlaceholder:
            return "unbound_placeholder";
        case ErrorKind::kSpawnFailed:
            return "spawn_failed";
    }
    return "unknown";
}

}  // namespace gmshim
