#include "sortedschema/exceptions.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace sortedschema
{
namespace
{

std::string render(const std::vector<ErrorDetail>& details)
{
    std::ostringstream out;
    out << details.size() << (details.size() == 1 ? " validation error" : " validation errors");
    for (const auto& d : details)
    {
        out << "\n  ";
        if (d.loc.empty())
        {
            out << "<root>";
        }
        else
        {
            for (size_t i = 0; i < d.loc.size(); ++i)
                out << (i ? "." : "") << d.loc[i];
        }
        out << ": " << d.message << " [" << to_string(d.kind);
        if (!d.branch.empty())
            out << ", " << d.branch;
        out << "]";
    }
    return out.str();
}

} // namespace

std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ShapeMismatch:
        return "shape_mismatch";
    case ErrorKind::ElementValidationError:
        return "element_validation_error";
    }
    return "shape_mismatch";
}

ValidationError::ValidationError(std::vector<ErrorDetail> details)
    : Error(render(details)), details_(std::move(details))
{
}

ValidationError::ValidationError(ErrorKind kind, const std::string& message)
    : ValidationError(std::vector<ErrorDetail>{ErrorDetail{kind, {}, message, {}}})
{
}

ErrorKind ValidationError::kind() const
{
    return has(ErrorKind::ElementValidationError) ? ErrorKind::ElementValidationError
                                                  : ErrorKind::ShapeMismatch;
}

bool ValidationError::has(ErrorKind kind) const
{
    return std::any_of(details_.begin(), details_.end(),
                       [kind](const ErrorDetail& d) { return d.kind == kind; });
}

ValidationError ValidationError::at(const std::string& segment) const
{
    auto details = details_;
    for (auto& d : details)
        d.loc.insert(d.loc.begin(), segment);
    return ValidationError(std::move(details));
}

} // namespace sortedschema
