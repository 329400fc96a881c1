#include "wirepod/core/Error.hpp"

#include <sstream>

namespace wirepod {
namespace {

class CodecCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "wirepod"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::ok:                        return "ok";
            case Errc::end_of_stream:             return "end of stream";
            case Errc::unrecognized_discriminant: return "unrecognized discriminant";
            case Errc::malformed_length:          return "malformed length";
            case Errc::bad_magic:                 return "bad magic";
            case Errc::unencodable_variant:       return "variant cannot be encoded";
            case Errc::schema_error:              return "schema error";
            case Errc::value_mismatch:            return "value does not match schema";
            case Errc::length_overflow:           return "length does not fit size type";
            case Errc::missing_context:           return "missing context value";
        }
        return "unknown wirepod error";
    }
};

} // namespace

const std::error_category& codecCategory() noexcept {
    static const CodecCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), codecCategory()};
}

ErrorKind classify(const std::error_code& code) noexcept {
    if (code.category() != codecCategory()) {
        return ErrorKind::IoFailure;
    }
    switch (static_cast<Errc>(code.value())) {
        case Errc::unrecognized_discriminant: return ErrorKind::UnrecognizedDiscriminant;
        case Errc::malformed_length:          return ErrorKind::MalformedLength;
        case Errc::bad_magic:                 return ErrorKind::BadMagic;
        case Errc::unencodable_variant:       return ErrorKind::UnencodableVariant;
        case Errc::schema_error:              return ErrorKind::SchemaError;
        case Errc::value_mismatch:            return ErrorKind::ValueMismatch;
        case Errc::length_overflow:           return ErrorKind::LengthOverflow;
        case Errc::missing_context:           return ErrorKind::MissingContext;
        case Errc::ok:
        case Errc::end_of_stream:
            break;
    }
    return ErrorKind::IoFailure;
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::IoFailure:                return "IoFailure";
        case ErrorKind::UnrecognizedDiscriminant: return "UnrecognizedDiscriminant";
        case ErrorKind::MalformedLength:          return "MalformedLength";
        case ErrorKind::BadMagic:                 return "BadMagic";
        case ErrorKind::UnencodableVariant:       return "UnencodableVariant";
        case ErrorKind::SchemaError:              return "SchemaError";
        case ErrorKind::ValueMismatch:            return "ValueMismatch";
        case ErrorKind::LengthOverflow:           return "LengthOverflow";
        case ErrorKind::MissingContext:           return "MissingContext";
    }
    return "unknown";
}

std::string CodecError::describe() const {
    std::ostringstream os;
    os << toString(kind()) << " (" << code.message() << ")";
    if (!where.empty()) {
        os << " at " << where;
    }
    if (!detail.empty()) {
        os << ": " << detail;
    }
    return os.str();
}

unexpected_t<CodecError> makeError(std::error_code code, std::string where, std::string detail) {
    return unexpected(CodecError{code, std::move(where), std::move(detail)});
}

unexpected_t<CodecError> makeError(Errc code, std::string where, std::string detail) {
    return makeError(make_error_code(code), std::move(where), std::move(detail));
}

} // namespace wirepod
