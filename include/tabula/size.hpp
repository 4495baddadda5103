#pragma once

#include <string>

namespace tabula
{

// Span of a cell in columns (width) and rows (height). Zero and negative
// values are allowed as intermediate results; Box validates real spans.
struct Size
{
    int width = 1;
    int height = 1;

    constexpr Size() = default;
    constexpr Size(int w, int h) : width(w), height(h) {}

    std::string to_string() const;

    friend constexpr bool operator==(const Size &, const Size &) = default;
};

constexpr Size operator+(Size a, Size b) { return {a.width + b.width, a.height + b.height}; }
constexpr Size operator-(Size a, Size b) { return {a.width - b.width, a.height - b.height}; }
constexpr Size operator+(Size a, int n) { return {a.width + n, a.height + n}; }
constexpr Size operator-(Size a, int n) { return {a.width - n, a.height - n}; }
constexpr Size operator*(Size a, int factor) { return {a.width * factor, a.height * factor}; }
constexpr Size operator-(Size a) { return {-a.width, -a.height}; }
constexpr Size operator+(Size a) { return a; }

} // namespace tabula
