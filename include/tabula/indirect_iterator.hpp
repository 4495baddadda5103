#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace tabula
{

// Forward iterator over a container of owning pointers, yielding references
// to the pointees.
template <typename Value, typename Underlying>
class IndirectIterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::remove_const_t<Value>;
    using difference_type = std::ptrdiff_t;
    using pointer = Value *;
    using reference = Value &;

    IndirectIterator() = default;
    explicit IndirectIterator(Underlying it) : it_(it) {}

    reference operator*() const { return **it_; }
    pointer operator->() const { return it_->get(); }

    IndirectIterator &operator++()
    {
        ++it_;
        return *this;
    }

    IndirectIterator operator++(int)
    {
        IndirectIterator copy = *this;
        ++it_;
        return copy;
    }

    friend bool operator==(const IndirectIterator &a, const IndirectIterator &b) { return a.it_ == b.it_; }

private:
    Underlying it_{};
};

} // namespace tabula
