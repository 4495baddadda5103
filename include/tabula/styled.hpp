#pragma once

#include <map>
#include <string>
#include <utility>

namespace tabula
{

using StyleMap = std::map<std::string, std::string>;

inline constexpr const char kBodyNature[] = "body";
inline constexpr const char kHeaderNature[] = "header";
inline constexpr const char kFooterNature[] = "footer";

// Base of every styled entity (table, row/column view, cell). Each entity
// owns its style map: assignment always stores a copy.
class Styled
{
public:
    const StyleMap &styles() const noexcept { return styles_; }
    StyleMap &styles() noexcept { return styles_; }
    void set_styles(const StyleMap &styles) { styles_ = styles; }
    void set_style(const std::string &key, std::string value) { styles_[key] = std::move(value); }

    // Row group of the entity: "body", "header", "footer" or a caller-defined name.
    const std::string &nature() const noexcept { return nature_; }
    void set_nature(std::string nature) { nature_ = std::move(nature); }

protected:
    explicit Styled(StyleMap styles = {}, std::string nature = kBodyNature)
        : styles_(std::move(styles)), nature_(std::move(nature))
    {
    }
    ~Styled() = default;

    Styled(const Styled &) = default;
    Styled(Styled &&) noexcept = default;
    Styled &operator=(const Styled &) = default;
    Styled &operator=(Styled &&) noexcept = default;

private:
    StyleMap styles_;
    std::string nature_;
};

} // namespace tabula
