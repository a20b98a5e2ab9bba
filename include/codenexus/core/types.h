#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace codenexus {

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    InvalidTagFormat,
    InvalidQuerySyntax,
    RelationAlreadyExists,
    RelationNotFound,
    TagNotFound,
    StorageError,
    SerializationError,
    FileSystemError,
    ConfigError,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidTagFormat: return "Invalid tag format";
        case ErrorCode::InvalidQuerySyntax: return "Invalid query syntax";
        case ErrorCode::RelationAlreadyExists: return "Relation already exists";
        case ErrorCode::RelationNotFound: return "Relation not found";
        case ErrorCode::TagNotFound: return "Tag not found";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::FileSystemError: return "File system error";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Internal error";
}

// Stable machine-readable code, part of the tool error payload
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "SUCCESS";
        case ErrorCode::FileNotFound: return "FILE_NOT_FOUND";
        case ErrorCode::InvalidTagFormat: return "INVALID_TAG_FORMAT";
        case ErrorCode::InvalidQuerySyntax: return "INVALID_QUERY_SYNTAX";
        case ErrorCode::RelationAlreadyExists: return "RELATION_ALREADY_EXISTS";
        case ErrorCode::RelationNotFound: return "RELATION_NOT_FOUND";
        case ErrorCode::TagNotFound: return "TAG_NOT_FOUND";
        case ErrorCode::StorageError: return "STORAGE_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::FileSystemError: return "FILESYSTEM_ERROR";
        case ErrorCode::ConfigError: return "CONFIG_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

constexpr const char* recoverySuggestion(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "";
        case ErrorCode::FileNotFound: return "Check that the file path is correct";
        case ErrorCode::InvalidTagFormat:
            return "Use type:value format, e.g. category:api";
        case ErrorCode::InvalidQuerySyntax:
            return "Check the query syntax; AND, OR, NOT, parentheses and * wildcards are supported";
        case ErrorCode::RelationAlreadyExists:
            return "The relation already exists; remove it before adding it again";
        case ErrorCode::RelationNotFound: return "Add the relation first";
        case ErrorCode::TagNotFound: return "Add the tag to the file first";
        case ErrorCode::StorageError: return "Check file permissions and free disk space";
        case ErrorCode::SerializationError:
            return "The data file is malformed; check or restore it from its .bak copy";
        case ErrorCode::FileSystemError: return "Check file system permissions";
        case ErrorCode::ConfigError: return "Check the configuration and arguments";
        case ErrorCode::InternalError: return "Retry the operation or report the issue";
    }
    return "";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Prefix an error message with the operation that produced it
inline Error withContext(const Error& error, const std::string& context) {
    return Error{error.code, context + ": " + error.message};
}

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

// Outgoing edge as stored under its source file
struct Relation {
    std::string target;
    std::string description;

    bool operator==(const Relation&) const = default;
};

// Edge seen from its target file
struct IncomingRelation {
    std::string source;
    std::string description;

    bool operator==(const IncomingRelation&) const = default;
};

} // namespace codenexus

// Format support for ErrorCode
#if CODENEXUS_HAS_STD_FORMAT
#include <format>
template <> struct std::formatter<codenexus::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(codenexus::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", codenexus::errorCodeName(error));
    }
};
#endif

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<codenexus::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(codenexus::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", codenexus::errorCodeName(error));
    }
};
#endif
