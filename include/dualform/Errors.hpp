/**
 * @file Errors.hpp
 * @brief Exception types for dualform decoding errors
 *
 * Error taxonomy:
 * - Error: Base class
 * - DecodeError: Field decode failure with field path
 *   - UnsupportedShapeError: Value is neither a string nor a map
 *   - StringParseError: Target's string parser rejected the string form
 *   - StructuredDecodeError: Target's structured decode rejected the map form
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 */

#ifndef DUALFORM_ERRORS_HPP
#define DUALFORM_ERRORS_HPP

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

namespace dualform {

/**
 * @brief Base class for all dualform exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A field of a document could not be decoded
 *
 * Holds the cause message verbatim in details() and the path of the
 * failing field, outermost segment first. The path starts empty where
 * the failure is raised and grows as the error propagates out through
 * enclosing fields (see rethrow_at()).
 */
class DecodeError : public Error {
public:
    /**
     * @brief Get the field path, outermost segment first
     */
    const std::vector<std::string>& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the field path joined with dots ("" at the root)
     */
    std::string path_string() const;

    /**
     * @brief Get the underlying cause message
     */
    const std::string& details() const noexcept {
        return details_;
    }

    /**
     * @brief Rethrow this error with @p segment prepended to its path
     *
     * Keeps the concrete error kind, so callers can still catch
     * UnsupportedShapeError etc. after the path has been attached.
     */
    [[noreturn]] void rethrow_at(const std::string& segment) const {
        rethrow_at(std::vector<std::string>{segment});
    }

    /**
     * @brief Rethrow this error with @p segments prepended to its path
     */
    [[noreturn]] void rethrow_at(const std::vector<std::string>& segments) const {
        std::rethrow_exception(at_path(prefixed(segments)));
    }

protected:
    DecodeError(std::vector<std::string> path, std::string details)
        : Error(format_message(path, details))
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    std::vector<std::string> prefixed(const std::vector<std::string>& segments) const {
        std::vector<std::string> out = segments;
        out.insert(out.end(), path_.begin(), path_.end());
        return out;
    }

    /// A copy of this error, same kind, located at @p path.
    virtual std::exception_ptr at_path(std::vector<std::string> path) const = 0;

private:
    std::vector<std::string> path_;
    std::string details_;

    static std::string format_message(const std::vector<std::string>& path,
                                      const std::string& details);
};

/**
 * @brief Value is neither a string nor a map
 *
 * Raised for numbers, booleans, null and arrays. The message names the
 * two accepted shapes.
 */
class UnsupportedShapeError : public DecodeError {
public:
    /**
     * @brief Construct with the observed type
     * @param actual Type name of the rejected value (e.g., "integer")
     * @param path Field path, outermost first
     */
    explicit UnsupportedShapeError(std::string actual, std::vector<std::string> path = {})
        : DecodeError(std::move(path), "invalid type: " + actual + ", expected string or map")
        , actual_(std::move(actual))
    {}

    /**
     * @brief Get the type name of the rejected value
     */
    const std::string& actual() const noexcept {
        return actual_;
    }

protected:
    std::exception_ptr at_path(std::vector<std::string> path) const override {
        return std::make_exception_ptr(UnsupportedShapeError(actual_, std::move(path)));
    }

private:
    std::string actual_;
};

/**
 * @brief String form could not be parsed into the target type
 *
 * details() is the target parser's own message.
 */
class StringParseError : public DecodeError {
public:
    explicit StringParseError(std::string details, std::vector<std::string> path = {})
        : DecodeError(std::move(path), std::move(details))
    {}

protected:
    std::exception_ptr at_path(std::vector<std::string> path) const override {
        return std::make_exception_ptr(StringParseError(details(), std::move(path)));
    }
};

/**
 * @brief Map form could not be decoded into the target type
 *
 * Missing required field, wrong field type, or any other rule of the
 * target's own structured decoder. details() is that decoder's message.
 */
class StructuredDecodeError : public DecodeError {
public:
    explicit StructuredDecodeError(std::string details, std::vector<std::string> path = {})
        : DecodeError(std::move(path), std::move(details))
    {}

protected:
    std::exception_ptr at_path(std::vector<std::string> path) const override {
        return std::make_exception_ptr(StructuredDecodeError(details(), std::move(path)));
    }
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Document file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document syntax error (JSON/TOML)
 */
class DocumentParseError : public Error {
public:
    /**
     * @brief Construct with origin, position and error details
     * @param origin File path or "<string>" / "<stdin>"
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string origin, int line, int column, std::string details)
        : Error(format_message(origin, line, column, details))
        , origin_(std::move(origin))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& origin() const noexcept { return origin_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string origin_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& origin, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << origin << "'";
        if (line > 0) oss << " at line " << line << ", column " << column;
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public Error {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "service.options")
     * @param segment The specific segment that doesn't exist (e.g., "options")
     */
    KeyError(std::string path, std::string segment)
        : Error("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., "name.first" where name is a string).
 */
class TypeError : public Error {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : Error("Cannot traverse into " + actual +
                " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace dualform

#endif // DUALFORM_ERRORS_HPP
