#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/heap.hpp"
#include "../src/heap_algorithms.hpp"

struct Args
{
    std::vector<long long> values;
    Priority prio = Priority::Max;
    std::optional<std::size_t> nth;
    std::optional<long long> find;
};

static void split_values(const std::string &v, std::vector<long long> &out)
{
    std::size_t start = 0;
    while (true)
    {
        auto pos = v.find(',', start);
        std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
        if (!tok.empty())
            out.push_back(std::stoll(tok));
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
}

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + s);
            return argv[++i];
        };
        if (s == "--min")
            a.prio = Priority::Min;
        else if (s == "--max")
            a.prio = Priority::Max;
        else if (s == "--nth")
            a.nth = std::stoull(next());
        else if (s == "--find")
            a.find = std::stoll(next());
        else if (s == "--values")
            split_values(next(), a.values);
        else if (s.size() > 1 && s[0] == '-' && (s[1] < '0' || s[1] > '9'))
            throw std::invalid_argument("unknown flag " + s);
        else
            a.values.push_back(std::stoll(s));
    }
    if (a.values.empty())
        a.values = {3, 10, 18, 5, 21, 100};
    return a;
}

int main(int argc, char **argv)
{
    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "heap_demo: %s\n", e.what());
        std::fprintf(stderr, "usage: heap_demo [--min|--max] [--nth N] [--find V] [--values a,b,c] [v ...]\n");
        return 2;
    }

    BinaryHeap<long long> h(a.values, a.prio);
    std::cout << a.prio << " heap: " << h << "\n";
    std::cout << "extraction steps:\n";
    print_extraction_steps(std::cout, a.values, a.prio);

    if (a.find)
    {
        if (auto i = h.index_of(*a.find))
            std::cout << "index_of(" << *a.find << ") = " << *i << "\n";
        else
            std::cout << "index_of(" << *a.find << ") = not found\n";
    }
    if (a.nth)
    {
        if (auto v = nth_smallest(a.values, *a.nth))
            std::cout << "nth_smallest(" << *a.nth << ") = " << *v << "\n";
        else
            std::cout << "nth_smallest(" << *a.nth << ") = out of range\n";
    }
    return 0;
}
