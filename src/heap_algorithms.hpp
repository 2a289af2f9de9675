#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>
#include "heap.hpp"

// Free functions built on the public BinaryHeap interface.

// 0-based: nth == 0 is the minimum. Pops nth+1 times; the array slot nth
// after build-heap is not the nth smallest in general.
template <typename T>
std::optional<T> nth_smallest(std::vector<T> v, std::size_t nth)
{
    if (nth >= v.size())
        return std::nullopt;
    BinaryHeap<T> h(std::move(v), Priority::Min);
    std::optional<T> out;
    for (std::size_t i = 0; i <= nth; ++i)
        out = h.remove_root();
    return out;
}

template <typename T>
std::optional<T> nth_largest(std::vector<T> v, std::size_t nth)
{
    if (nth >= v.size())
        return std::nullopt;
    BinaryHeap<T> h(std::move(v), Priority::Max);
    std::optional<T> out;
    for (std::size_t i = 0; i <= nth; ++i)
        out = h.remove_root();
    return out;
}

// Union of two heaps; ordering taken from a. Neither input is modified.
template <typename T>
BinaryHeap<T> combine_heaps(const BinaryHeap<T> &a, const BinaryHeap<T> &b)
{
    std::vector<T> all;
    all.reserve(a.size() + b.size());
    all.insert(all.end(), a.elements().begin(), a.elements().end());
    all.insert(all.end(), b.elements().begin(), b.elements().end());
    return BinaryHeap<T>(std::move(all), a.priority());
}

// Only looks at the ordering tag, not the contents.
template <typename T>
bool is_min_heap(const BinaryHeap<T> &h)
{
    return h.priority() == Priority::Min;
}

// Checks every parent against its children, last parent first.
template <typename T>
bool is_heap_array(const std::vector<T> &v, Priority p)
{
    if (v.empty())
        return true;
    auto below = [p](const T &child, const T &parent)
    { return p == Priority::Min ? child < parent : parent < child; };
    for (std::size_t i = v.size() / 2; i > 0; --i)
    {
        std::size_t parent = i - 1;
        std::size_t l = 2 * parent + 1, r = 2 * parent + 2;
        if (below(v[l], v[parent]))
            return false;
        if (r < v.size() && below(v[r], v[parent]))
            return false;
    }
    return true;
}

template <typename T>
bool is_min_heap_array(const std::vector<T> &v)
{
    return is_heap_array(v, Priority::Min);
}

// Empties h, returning its elements in priority order.
template <typename T>
std::vector<T> drain(BinaryHeap<T> &h)
{
    std::vector<T> out;
    out.reserve(h.size());
    while (auto v = h.remove_root())
        out.push_back(std::move(*v));
    return out;
}

// Min gives ascending order, Max descending.
template <typename T>
std::vector<T> heap_sort(std::vector<T> v, Priority p)
{
    BinaryHeap<T> h(std::move(v), p);
    return drain(h);
}

// One line per removal showing everything extracted so far.
template <typename T>
void print_extraction_steps(std::ostream &os, std::vector<T> v, Priority p)
{
    BinaryHeap<T> h(std::move(v), p);
    std::vector<T> acc;
    acc.reserve(h.size());
    while (auto x = h.remove_root())
    {
        acc.push_back(std::move(*x));
        os << '[';
        for (std::size_t i = 0; i < acc.size(); ++i)
        {
            if (i)
                os << ", ";
            os << acc[i];
        }
        os << "]\n";
    }
}
