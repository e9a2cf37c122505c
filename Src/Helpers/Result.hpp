#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

namespace huffpack
{
    enum class ErrorKind : size_t {
        NONE,
        EMPTY_INPUT,
        INVALID_FORMAT,
        CORRUPT_PAYLOAD,
        IO_ERROR,
        INTERNAL
    };

    inline std::string errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::NONE:            return "none";
            case ErrorKind::EMPTY_INPUT:     return "EmptyInputError";
            case ErrorKind::INVALID_FORMAT:  return "InvalidFormatError";
            case ErrorKind::CORRUPT_PAYLOAD: return "CorruptPayloadError";
            case ErrorKind::IO_ERROR:        return "IOError";
            case ErrorKind::INTERNAL:        return "InternalError";
        }
        return "unknown";
    }

    template<typename T>
    struct Result
    {
        std::optional<T> value;
        std::optional<std::string> error;
        ErrorKind errorKind = ErrorKind::NONE;
        std::vector<std::string> warnings;

        bool success() const
        {
            return value.has_value() && !error.has_value();
        }

        bool hasError() const
        {
            return error.has_value();
        }

        bool hasWarning() const
        {
            return !warnings.empty();
        }

        void setValue(const T& val)
        {
            value = val;
        }

        void setError(const std::string& errorMessage, ErrorKind kind = ErrorKind::INTERNAL)
        {
            error = errorMessage;
            errorKind = kind;
        }

        void addWarning(const std::string& warningMessage)
        {
            warnings.push_back(warningMessage);
        }

        std::string getError() const
        {
            return error.value_or("No error");
        }

        ErrorKind getErrorKind() const
        {
            return errorKind;
        }

        T getValue() const
        {
            if (value.has_value()) {
                return value.value();
            }
            else {
                throw std::runtime_error("No value set in Result: " + getError());
            }
        }

        std::vector<std::string> getWarnings() const
        {
            return warnings;
        }
    };

    template<typename T>
    static Result<T> makeError(
        const std::string& errorMessage,
        ErrorKind kind = ErrorKind::INTERNAL
    ) {
        Result<T> result;
        result.setError(errorMessage, kind);
        return result;
    };

    template<typename T>
    static Result<T> makeResult(const T& value, Result<T>* result = nullptr)
    {
        if (result != nullptr) {
            result->setValue(value);
            return *result;
        }
        Result<T> newResult;
        newResult.setValue(value);
        return newResult;
    };
} // huffpack
