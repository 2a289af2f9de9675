#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

enum class Priority
{
    Max,
    Min
};

// Binary heap over a std::vector<T>, max or min ordered.
// T needs operator< (ordering) and operator== (index_of).
template <typename T>
class BinaryHeap
{
public:
    using value_type = T;
    using size_type = std::size_t;

    explicit BinaryHeap(Priority p = Priority::Max) : a_(), prio_(p) {}

    // Takes the sequence as-is and repairs it in place.
    explicit BinaryHeap(std::vector<T> elements, Priority p = Priority::Max)
        : a_(std::move(elements)), prio_(p)
    {
        build_heap_();
    }

    BinaryHeap(std::initializer_list<T> init, Priority p = Priority::Max)
        : a_(init), prio_(p)
    {
        build_heap_();
    }

    BinaryHeap(const BinaryHeap &) = default;
    BinaryHeap &operator=(const BinaryHeap &) = default;

    BinaryHeap(BinaryHeap &&o) noexcept : a_(std::move(o.a_)), prio_(o.prio_)
    {
        o.a_.clear();
    }
    BinaryHeap &operator=(BinaryHeap &&o) noexcept
    {
        if (this != &o)
        {
            a_ = std::move(o.a_);
            prio_ = o.prio_;
            o.a_.clear();
        }
        return *this;
    }

    bool empty() const { return a_.empty(); }
    size_type size() const { return a_.size(); }
    Priority priority() const { return prio_; }
    const std::vector<T> &elements() const { return a_; }

    void reserve(size_type n) { a_.reserve(n); }
    void clear() { a_.clear(); }

    std::optional<T> peek() const
    {
        if (a_.empty())
            return std::nullopt;
        return a_.front();
    }

    void insert(const T &v)
    {
        a_.push_back(v);
        sift_up_(a_.size() - 1);
    }
    void insert(T &&v)
    {
        a_.push_back(std::move(v));
        sift_up_(a_.size() - 1);
    }

    std::optional<T> remove_root()
    {
        if (a_.empty())
            return std::nullopt;
        std::swap(a_.front(), a_.back());
        T v = std::move(a_.back());
        a_.pop_back();
        if (!a_.empty())
            sift_down_(0);
        return v;
    }

    std::optional<T> remove_at(size_type i)
    {
        if (i >= a_.size())
            return std::nullopt;
        size_type last = a_.size() - 1;
        if (i == last)
        {
            T v = std::move(a_.back());
            a_.pop_back();
            return v;
        }
        std::swap(a_[i], a_[last]);
        T v = std::move(a_.back());
        a_.pop_back();
        // the replacement may belong above or below i
        sift_down_(i);
        sift_up_(i);
        return v;
    }

    // Appends and rebuilds the whole array: O(n) on the combined size.
    void merge(const std::vector<T> &other)
    {
        a_.insert(a_.end(), other.begin(), other.end());
        build_heap_();
    }
    void merge(std::vector<T> &&other)
    {
        a_.reserve(a_.size() + other.size());
        for (auto &v : other)
            a_.push_back(std::move(v));
        other.clear();
        build_heap_();
    }

    // Depth-first search that skips any subtree whose root already has
    // lower priority than value.
    std::optional<size_type> index_of(const T &value, size_type from = 0) const
    {
        if (from >= a_.size())
            return std::nullopt;
        if (higher_(value, a_[from]))
            return std::nullopt;
        if (value == a_[from])
            return from;
        if (auto l = index_of(value, left_(from)))
            return l;
        return index_of(value, right_(from));
    }

    std::string to_string() const
    {
        std::ostringstream os;
        os << *this;
        return os.str();
    }

    friend std::ostream &operator<<(std::ostream &os, const BinaryHeap &h)
    {
        os << '[';
        for (size_type i = 0; i < h.a_.size(); ++i)
        {
            if (i)
                os << ", ";
            os << h.a_[i];
        }
        return os << ']';
    }

private:
    static size_type left_(size_type i) { return 2 * i + 1; }
    static size_type right_(size_type i) { return 2 * i + 2; }
    static size_type parent_(size_type i) { return (i - 1) / 2; }

    // true if x should sit above y
    bool higher_(const T &x, const T &y) const
    {
        return prio_ == Priority::Max ? y < x : x < y;
    }

    // Index of the higher-priority slot; an out-of-range i never wins.
    size_type pick_(size_type i, size_type j) const
    {
        if (i >= a_.size())
            return j;
        return higher_(a_[i], a_[j]) ? i : j;
    }

    void build_heap_()
    {
        for (size_type i = a_.size() / 2; i > 0; --i)
            sift_down_(i - 1);
    }

    void sift_up_(size_type i)
    {
        while (i > 0)
        {
            size_type p = parent_(i);
            if (!higher_(a_[i], a_[p]))
                break;
            std::swap(a_[i], a_[p]);
            i = p;
        }
    }

    void sift_down_(size_type i)
    {
        for (;;)
        {
            size_type m = pick_(left_(i), i);
            m = pick_(right_(i), m);
            if (m == i)
                break;
            std::swap(a_[i], a_[m]);
            i = m;
        }
    }

    std::vector<T> a_;
    Priority prio_;
};

inline std::ostream &operator<<(std::ostream &os, Priority p)
{
    return os << (p == Priority::Max ? "max" : "min");
}
