#include "repro/types.hpp"

namespace repro {

ExitCode exit_code_for(ErrorKind kind, VerdictStatus status) {
    switch (kind) {
        case ErrorKind::InputError:
            return ExitCode::InvalidInput;
        case ErrorKind::InternalError:
            return ExitCode::ComparisonFailed;
        case ErrorKind::None:
        default:
            break;
    }
    return status == VerdictStatus::Reproducible ? ExitCode::Success
                                                 : ExitCode::ComparisonFailed;
}

} // namespace repro
