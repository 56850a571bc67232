#include "timepuff/status.h"

namespace timepuff {

std::string_view StatusName(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::Ok:
            return "Ok";
        case StatusCode::InvalidArgument:
            return "InvalidArgument";
        case StatusCode::InvalidFormat:
            return "InvalidFormat";
        case StatusCode::InvalidNumber:
            return "InvalidNumber";
        case StatusCode::NotFound:
            return "NotFound";
        case StatusCode::IoError:
            return "IoError";
        case StatusCode::InternalError:
            return "InternalError";
    }
    return "Unknown";
}

}
