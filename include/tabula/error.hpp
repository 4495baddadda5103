#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tabula
{

enum class ErrorKind
{
    InvalidBounds,   // degenerate or inverted box, non-positive span
    InvalidArgument, // malformed coordinate text, letters, view index
    Collision,       // a new cell overlaps an existing one
    NotFound,        // no cell covers the coordinate
    EmptyMerge,      // the merge target contains no cell
    AmbiguousMerge   // a cell straddles the merge target boundary
};

std::string_view to_string(ErrorKind kind) noexcept;

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string &message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace tabula
