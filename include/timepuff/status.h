#pragma once

#include <string_view>

namespace timepuff {

enum class StatusCode {
    Ok = 0,
    InvalidArgument,
    InvalidFormat,
    InvalidNumber,
    NotFound,
    IoError,
    InternalError
};

std::string_view StatusName(StatusCode status) noexcept;

}
