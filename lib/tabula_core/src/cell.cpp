#include "tabula/cell.hpp"

#include <sstream>

namespace tabula
{

Cell::Cell(CellContent content, StyleMap styles, std::string nature, Coord min, Size size)
    : Styled(std::move(styles), std::move(nature)), content_(std::move(content)),
      box_(Box::from_origin_and_size(min, size))
{
}

Cell::Cell(const Cell &source, const Box &box)
    : Styled(source), content_(source.content_), box_(box)
{
}

Cell Cell::transform(std::optional<Coord> coord, std::optional<Size> size) const
{
    return Cell(*this, box_.transform(coord, size));
}

std::string Cell::describe() const
{
    std::ostringstream out;
    out << "<Cell(";
    if (content_.is_empty())
        out << "None";
    else
        out << "'" << content_.to_text() << "'";
    out << ", styles={";
    bool first = true;
    for (const auto &[key, value] : styles())
    {
        if (!first)
            out << ", ";
        out << "'" << key << "': '" << value << "'";
        first = false;
    }
    out << "}, nature='" << nature() << "'"
        << ", x=" << min().x << ", y=" << min().y << ", width=" << width() << ", height=" << height() << ")>";
    return out.str();
}

} // namespace tabula
