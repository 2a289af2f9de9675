#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "datasets.hpp"
#include "../src/heap.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string ds, impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "ds,impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.ds << "," << r.impl << "," << r.workload << "," << r.N << "," << r.dist << ","
              << r.params << "," << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

// ---- BinaryHeap workloads ----

// insert N one at a time, then remove_root until empty
inline Row run_heap_insert_drain(std::size_t N, Dist dist, int trial, std::uint64_t seed, Priority p)
{
    Sink s;
    BinaryHeap<std::uint64_t> h(p);
    auto keys = gen_keys(N, dist, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) h.insert(k);
        while (auto v = h.remove_root()) s.eat(*v); });

    std::ostringstream params;
    params << "priority=" << p;
    return Row{"heap", "custom", "insert_then_drain", dist_name(dist), params.str(), N, trial, seed, ns, s.acc};
}

// build-heap over the whole vector, then drain
inline Row run_heap_build_drain(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);

    std::uint64_t ns = time_ns([&]
                               {
        BinaryHeap<std::uint64_t> h(std::move(keys));
        while (auto v = h.remove_root()) s.eat(*v); });

    return Row{"heap", "custom", "build_then_drain", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// build from one half, merge the other half, read the root
inline Row run_heap_merge(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::vector<std::uint64_t> lo(keys.begin(), keys.begin() + N / 2);
    std::vector<std::uint64_t> hi(keys.begin() + N / 2, keys.end());

    std::uint64_t ns = time_ns([&]
                               {
        BinaryHeap<std::uint64_t> h(std::move(lo));
        h.merge(std::move(hi));
        s.eat(h.size());
        if (auto v = h.peek()) s.eat(*v); });

    return Row{"heap", "custom", "build_half+merge_half", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// remove N/2 random positions
inline Row run_heap_remove_at(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    BinaryHeap<std::uint64_t> h(gen_keys(N, dist, seed));
    auto pos = gen_positions(N, N / 2, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto i: pos)
            if (auto v = h.remove_at(i)) s.eat(*v); });

    return Row{"heap", "custom", "remove_at_random_half", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

// 50/50 hit and miss lookups; capped since index_of is linear
inline Row run_heap_index_of(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    BinaryHeap<std::uint64_t> h(keys);
    std::size_t Q = N < 1024 ? N : 1024;

    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i=0;i<Q;++i){
            auto q = (i%2==0) ? keys[i] : keys[i]^0xabcdefULL;
            auto r = h.index_of(q);
            s.eat(r ? *r : 0x1234ULL);
        } });

    return Row{"heap", "custom", "index_of_mixed", dist_name(dist), "queries=" + std::to_string(Q), N, trial, seed, ns, s.acc};
}
