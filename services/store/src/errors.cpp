#include "../include/errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::ConstraintViolation: return "constraint_violation";
        case ErrorKind::StorageUnavailable: return "storage_unavailable";
        case ErrorKind::MalformedInput: return "malformed_input";
    }
    return "unknown";
}
