#include <tagflow/core/operation_error.h>

namespace tagflow {

Error toError(const std::exception_ptr& failure) {
    if (!failure) {
        return Error{ErrorCode::InternalError, "No failure recorded"};
    }
    try {
        std::rethrow_exception(failure);
    } catch (const OperationError& e) {
        return e.error();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        return Error{ErrorCode::Unknown, "Non-standard exception"};
    }
}

ErrorCode errorCodeOf(const std::exception_ptr& failure) {
    return toError(failure).code;
}

} // namespace tagflow
