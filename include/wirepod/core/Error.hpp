#pragma once

#include "wirepod/core/Expected.hpp"

#include <string>
#include <system_error>

namespace wirepod {

/**
 * @brief Error codes raised by the codec engine itself.
 *
 * Errors coming from a stream (asio, POSIX, ...) keep their own category and
 * are propagated verbatim; see classify().
 */
enum class Errc : int {
    ok = 0,
    end_of_stream = 1,           // in-memory stream ran out of bytes
    unrecognized_discriminant,   // no variant matched and no default
    malformed_length,            // byte-sized sequence budget did not land on zero
    bad_magic,                   // literal constant mismatch
    unencodable_variant,         // variant is excluded from encoding
    schema_error,                // invalid declaration, never from decode/encode
    value_mismatch,              // value shape does not fit the schema
    length_overflow,             // sequence length does not fit its size type
    missing_context              // context slot absent on decode
};

enum class ErrorKind {
    IoFailure,
    UnrecognizedDiscriminant,
    MalformedLength,
    BadMagic,
    UnencodableVariant,
    SchemaError,
    ValueMismatch,
    LengthOverflow,
    MissingContext
};

const std::error_category& codecCategory() noexcept;
std::error_code make_error_code(Errc e) noexcept;

// Maps any error code onto the codec's error kinds. Codes outside the codec
// category are I/O failures.
ErrorKind classify(const std::error_code& code) noexcept;
const char* toString(ErrorKind kind) noexcept;

struct CodecError {
    std::error_code code;
    std::string where;   // dotted path of the field being processed
    std::string detail;

    ErrorKind kind() const noexcept { return classify(code); }
    bool is(ErrorKind k) const noexcept { return kind() == k; }
    std::string describe() const;
};

template <typename T>
using Result = expected<T, CodecError>;

unexpected_t<CodecError> makeError(std::error_code code, std::string where, std::string detail = {});
unexpected_t<CodecError> makeError(Errc code, std::string where, std::string detail = {});

} // namespace wirepod

namespace std {
template <>
struct is_error_code_enum<wirepod::Errc> : true_type {};
} // namespace std
