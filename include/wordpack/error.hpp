/**
 * @file error.hpp
 * @brief wordpack error handling.
 *
 * Operations report through Error codes. Unless WORDPACK_NO_EXCEPTIONS is
 * set, a matching exception hierarchy is also available for callers that
 * prefer to throw.
 */

#ifndef WORDPACK_ERROR_HPP
#define WORDPACK_ERROR_HPP

#include "config.hpp"

#if !WORDPACK_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace wordpack {

/**
 * @brief Error codes returned by array and store operations.
 */
enum class Error {
    Ok = 0,                ///< Success
    InvalidWidth = -1,     ///< Element bit width outside [1, W]
    EmptyArray = -2,       ///< Pop from an array of length 0
    LengthMismatch = -3,   ///< Index and value lists differ in size
    IndexOutOfRange = -4,  ///< Checked access at index >= length
    AddressDerivation = -5 ///< Digest backend failed to derive an address
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidWidth:
        return "Invalid element bit width";
    case Error::EmptyArray:
        return "Pop from empty array";
    case Error::LengthMismatch:
        return "Index and value lists have different lengths";
    case Error::IndexOutOfRange:
        return "Index out of range";
    case Error::AddressDerivation:
        return "Address derivation failed";
    default:
        return "Unknown error";
    }
}

#if !WORDPACK_NO_EXCEPTIONS

/**
 * @brief Base exception for wordpack errors.
 */
class WordpackException : public std::runtime_error {
public:
    WordpackException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for an element width outside [1, W].
 */
class InvalidWidthException : public WordpackException {
public:
    explicit InvalidWidthException(const std::string& message)
        : WordpackException(message, Error::InvalidWidth) {}
};

/**
 * @brief Exception for popping an empty array.
 */
class EmptyArrayException : public WordpackException {
public:
    explicit EmptyArrayException(const std::string& message)
        : WordpackException(message, Error::EmptyArray) {}
};

/**
 * @brief Exception for batch lists of unequal size.
 */
class LengthMismatchException : public WordpackException {
public:
    explicit LengthMismatchException(const std::string& message)
        : WordpackException(message, Error::LengthMismatch) {}
};

/**
 * @brief Exception for checked access past the array length.
 */
class IndexOutOfRangeException : public WordpackException {
public:
    explicit IndexOutOfRangeException(const std::string& message)
        : WordpackException(message, Error::IndexOutOfRange) {}
};

/**
 * @brief Exception for a failed address digest.
 */
class AddressDerivationException : public WordpackException {
public:
    explicit AddressDerivationException(const std::string& message)
        : WordpackException(message, Error::AddressDerivation) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Prefix for the exception message (may be empty)
 */
inline void throw_on_error(Error error, const std::string& context = {}) {
    if (error == Error::Ok) {
        return;
    }
    std::string message = context.empty() ? error_string(error)
                                          : context + ": " + error_string(error);
    switch (error) {
    case Error::InvalidWidth:
        throw InvalidWidthException(message);
    case Error::EmptyArray:
        throw EmptyArrayException(message);
    case Error::LengthMismatch:
        throw LengthMismatchException(message);
    case Error::IndexOutOfRange:
        throw IndexOutOfRangeException(message);
    case Error::AddressDerivation:
        throw AddressDerivationException(message);
    default:
        throw WordpackException(message, error);
    }
}

#endif // !WORDPACK_NO_EXCEPTIONS

} // namespace wordpack

#endif // WORDPACK_ERROR_HPP
