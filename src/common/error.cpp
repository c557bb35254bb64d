// =============================================================================
// parz - Error Handling Implementation
// =============================================================================

#include "parz/common/error.h"

#include <cerrno>
#include <system_error>

#include <fmt/format.h>

namespace parz {

std::string Error::describe() const {
    return fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

Error errorFromErrno(ErrorCode code, std::string_view what) {
    const std::error_code ec(errno, std::generic_category());
    return Error{code, fmt::format("{}: {}", what, ec.message())};
}

ParzException::ParzException(Error error)
    : error_(std::move(error)), what_(error_.describe()) {}

}  // namespace parz
