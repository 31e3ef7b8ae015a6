#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace sortedschema
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Raised while building a schema; an annotation error, not a data error.
struct SchemaError : public Error
{
    using Error::Error;
};

/// A container kind was given more or fewer type arguments than it takes.
struct UnsupportedParameterization : public SchemaError
{
    using SchemaError::SchemaError;
};

/// Raised by the sorted container constructors on a source of the wrong shape.
struct ContainerError : public Error
{
    using Error::Error;
};

enum class ErrorKind
{
    ShapeMismatch,         ///< Input matched none of the legal shapes
    ElementValidationError ///< A nested key, value, item or field failed its own check
};

std::string to_string(ErrorKind kind);

struct ErrorDetail
{
    ErrorKind kind{ErrorKind::ShapeMismatch};
    std::vector<std::string> loc; ///< Outermost segment first
    std::string message;
    std::string branch; ///< Union alternative that produced this error, if any
};

class ValidationError : public Error
{
  public:
    explicit ValidationError(std::vector<ErrorDetail> details);
    ValidationError(ErrorKind kind, const std::string& message);

    const std::vector<ErrorDetail>& errors() const
    {
        return details_;
    }

    /// ElementValidationError if any detail is one, otherwise ShapeMismatch.
    ErrorKind kind() const;
    bool has(ErrorKind kind) const;

    /// Copy of this error with `segment` prepended to every location.
    ValidationError at(const std::string& segment) const;

  private:
    std::vector<ErrorDetail> details_;
};

} // namespace sortedschema
