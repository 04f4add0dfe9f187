/**
 * @file Errors.hpp
 * @brief Exception types for patch, transform and composition errors
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - RequiredFieldMissing: A patch type's mandatory field is absent
 * - InvalidPatchType: Patch type is not one of the supported values
 * - FieldPathNotFound: A read found no value at a field path
 * - FieldPathError: Malformed path or traversal into the wrong kind of value
 * - ArrayExpansionFailure: A wildcarded path resolved to no concrete paths
 * - UndefinedPatchSet / NestedPatchSet: Patch set reference problems
 * - CombineConfigMissing / CombineRequiresVariables: Bad combine config
 * - TransformError / FormatError: A transform step failed
 * - SchemaError, FileNotFoundError, ParseError: Rule decoding and loading
 * - CompositionError: A patch failed while rendering a composition
 */

#ifndef PATCHWORK_ERRORS_HPP
#define PATCHWORK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace patchwork {

/**
 * @brief Base class for all patchwork exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A field required by the patch type was not supplied
 */
class RequiredFieldMissing : public PatchError {
public:
    /**
     * @param field Name of the missing field (e.g., "FromFieldPath")
     * @param patch_type Name of the patch type that requires it
     */
    RequiredFieldMissing(std::string field, std::string patch_type)
        : PatchError(field + " is required by type " + patch_type)
        , field_(std::move(field))
        , patch_type_(std::move(patch_type))
    {}

    const std::string& field() const noexcept { return field_; }
    const std::string& patch_type() const noexcept { return patch_type_; }

private:
    std::string field_;
    std::string patch_type_;
};

/**
 * @brief Patch type is not supported
 */
class InvalidPatchType : public PatchError {
public:
    explicit InvalidPatchType(std::string patch_type)
        : PatchError("patch type " + patch_type + " is unsupported")
        , patch_type_(std::move(patch_type))
    {}

    const std::string& patch_type() const noexcept { return patch_type_; }

private:
    std::string patch_type_;
};

/**
 * @brief No value exists at a field path
 *
 * This is the only error kind the optional field policy can turn into a
 * no-op.
 */
class FieldPathNotFound : public PatchError {
public:
    /**
     * @param path Full field path being read (e.g., "metadata.labels.app")
     * @param segment The segment that does not exist (e.g., "app")
     */
    FieldPathNotFound(std::string path, std::string segment)
        : PatchError(path + ": no such field")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Field path is malformed, or traversal hit the wrong kind of value
 *
 * Raised for syntax errors, field access on a non-object, index access on
 * a non-array, and writes blocked by an existing scalar.
 */
class FieldPathError : public PatchError {
public:
    FieldPathError(std::string path, const std::string& reason)
        : PatchError(path + ": " + reason)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A wildcarded field path could not be expanded
 */
class ArrayExpansionFailure : public PatchError {
public:
    explicit ArrayExpansionFailure(std::string path)
        : PatchError("cannot expand ToFieldPath " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A PatchSet patch names a set that was not supplied
 */
class UndefinedPatchSet : public PatchError {
public:
    explicit UndefinedPatchSet(std::string name)
        : PatchError("cannot find PatchSet by name " + name)
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief A patch set contains a reference to another patch set
 */
class NestedPatchSet : public PatchError {
public:
    NestedPatchSet(std::string set_name, std::string reference)
        : PatchError("PatchSet " + set_name + " cannot reference PatchSet " + reference)
        , set_name_(std::move(set_name))
        , reference_(std::move(reference))
    {}

    const std::string& set_name() const noexcept { return set_name_; }
    const std::string& reference() const noexcept { return reference_; }

private:
    std::string set_name_;
    std::string reference_;
};

/**
 * @brief Combine strategy has no configuration block, or is unknown
 */
class CombineConfigMissing : public PatchError {
public:
    explicit CombineConfigMissing(std::string strategy)
        : PatchError("given combine strategy " + strategy + " requires configuration")
        , strategy_(std::move(strategy))
    {}

    const std::string& strategy() const noexcept { return strategy_; }

private:
    std::string strategy_;
};

class CombineRequiresVariables : public PatchError {
public:
    CombineRequiresVariables()
        : PatchError("combine patch types require at least one variable")
    {}
};

/**
 * @brief A transform step could not be applied
 */
class TransformError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief printf-style format could not be applied to the given values
 */
class FormatError : public TransformError {
public:
    using TransformError::TransformError;
};

/**
 * @brief Rule document does not have the expected shape
 */
class SchemaError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Rule or document file not found
 */
class FileNotFoundError : public PatchError {
public:
    explicit FileNotFoundError(std::string path)
        : PatchError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Rule or document file has a JSON/TOML syntax error
 */
class ParseError : public PatchError {
public:
    /**
     * @param file Path to the file with the parse error
     * @param line Line number (1-based, 0 if unknown)
     * @param column Column number (1-based, 0 if unknown)
     * @param details Detailed error message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : PatchError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief A patch failed while rendering a composed resource
 */
class CompositionError : public PatchError {
public:
    CompositionError(std::string resource, std::size_t index, const std::string& cause)
        : PatchError("cannot apply the patch at index " + std::to_string(index) +
                     " of resource " + resource + ": " + cause)
        , resource_(std::move(resource))
        , index_(index)
    {}

    const std::string& resource() const noexcept { return resource_; }
    std::size_t index() const noexcept { return index_; }

private:
    std::string resource_;
    std::size_t index_;
};

} // namespace patchwork

#endif // PATCHWORK_ERRORS_HPP
