#include "memory.hpp"

namespace memkeep {

std::string store_error_kind_to_string(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::IoFailure:           return "io_failure";
        case StoreErrorKind::ConstraintViolation: return "constraint_violation";
    }
    return "io_failure";
}

} // namespace memkeep
