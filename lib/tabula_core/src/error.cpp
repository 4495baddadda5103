#include "tabula/error.hpp"

namespace tabula
{

std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::InvalidBounds:
        return "invalid bounds";
    case ErrorKind::InvalidArgument:
        return "invalid argument";
    case ErrorKind::Collision:
        return "collision";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::EmptyMerge:
        return "empty merge";
    case ErrorKind::AmbiguousMerge:
        return "ambiguous merge";
    }
    return "unknown error";
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind)
{
}

} // namespace tabula
