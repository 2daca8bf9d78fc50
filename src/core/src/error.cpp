#include "folio/core/error.hpp"
#include "folio/core/logger.hpp"

namespace folio {

namespace {

Error<EditorError> report(ErrorKind kind, String message) {
    EditorError error{kind, std::move(message)};
    logging::get("error").warn(error.describe().view());
    return make_error(std::move(error));
}

} // namespace

String EditorError::describe() const {
    StringBuilder sb;
    sb.append(to_string(kind)).append(": ").append(message);
    return sb.build();
}

Error<EditorError> out_of_range(String message) {
    return report(ErrorKind::OutOfRange, std::move(message));
}

Error<EditorError> unregistered_type(String message) {
    return report(ErrorKind::UnregisteredType, std::move(message));
}

Error<EditorError> structural_violation(String message) {
    return report(ErrorKind::StructuralViolation, std::move(message));
}

Error<EditorError> invalid_argument(String message) {
    return report(ErrorKind::InvalidArgument, std::move(message));
}

} // namespace folio
