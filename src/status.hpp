#pragma once

namespace gridsync {

/**
 * Outcome of a coordinator or preference operation.
 *
 * None of the failure values are fatal: callers either fall back to a
 * default (NotFound) or treat the call as a no-op.
 */
enum class Status {
    Ok,
    NotFound,         // preference (section, option) never set
    NoSuchView,       // panel kind not registered for the current gateway
    UnknownGateway,   // gateway absent from the registry
    DisplayMismatch,  // notification no longer in the unread list
    InvalidName,      // section or option cannot be stored in the preference file
    IoError           // preference file could not be read or written
};

inline const char* status_name(Status status) {
    switch (status) {
        case Status::Ok:              return "ok";
        case Status::NotFound:        return "not found";
        case Status::NoSuchView:      return "no such view";
        case Status::UnknownGateway:  return "unknown gateway";
        case Status::DisplayMismatch: return "display mismatch";
        case Status::InvalidName:     return "invalid name";
        case Status::IoError:         return "i/o error";
    }
    return "unknown";
}

} // namespace gridsync
