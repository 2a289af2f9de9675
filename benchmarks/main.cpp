#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include "workloads.hpp"
#include "workloads_stl.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

struct Args
{
    std::vector<std::size_t> sizes{128, 1024, 8192, 65536, 524288, 4194304};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
};

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
        if (s == "--trials")
            a.trials = std::stoi(next());
        else if (s == "--dist")
        {
            std::string v = next();
            if (v == "zipf")
                a.dist = Dist::Zipf;
            else if (v == "uniform")
                a.dist = Dist::Uniform;
            else
                throw std::invalid_argument("unknown --dist " + v);
        }
        else if (s == "--seed")
            a.seed0 = std::stoull(next());
        else if (s == "--sizes")
        {
            std::string v = next();
            a.sizes.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.sizes.push_back(std::stoull(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
        else
            throw std::invalid_argument("unknown flag " + s);
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "heap_bench: %s\n", e.what());
        std::fprintf(stderr, "usage: heap_bench [--trials N] [--sizes a,b,c] [--dist uniform|zipf] [--seed S]\n");
        return 2;
    }
    print_metadata();
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            // ---- Custom ----
            print_row(run_heap_insert_drain(N, a.dist, trial, seed, Priority::Max));
            print_row(run_heap_insert_drain(N, a.dist, trial, seed, Priority::Min));
            print_row(run_heap_build_drain(N, a.dist, trial, seed + 1));
            print_row(run_heap_merge(N, a.dist, trial, seed + 2));
            print_row(run_heap_remove_at(N, a.dist, trial, seed + 3));
            print_row(run_heap_index_of(N, a.dist, trial, seed + 4));

            // ---- STL baselines ----
            print_row(run_heap_stl_insert_drain(N, a.dist, trial, seed, Priority::Max));
            print_row(run_heap_stl_insert_drain(N, a.dist, trial, seed, Priority::Min));
            print_row(run_heap_stl_build_drain(N, a.dist, trial, seed + 1));
            print_row(run_heap_stl_merge(N, a.dist, trial, seed + 2));

            ++trial;
        }
    }
    return 0;
}
