#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <vector>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

// --- std::priority_queue ---
inline Row run_heap_stl_insert_drain(std::size_t N, Dist dist, int trial, std::uint64_t seed, Priority p)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = 0;
    if (p == Priority::Max)
    {
        std::priority_queue<std::uint64_t> pq;
        ns = time_ns([&]
                     {
            for (auto k: keys) pq.push(k);
            while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    }
    else
    {
        std::priority_queue<std::uint64_t, std::vector<std::uint64_t>, std::greater<std::uint64_t>> pq;
        ns = time_ns([&]
                     {
            for (auto k: keys) pq.push(k);
            while(!pq.empty()){ s.eat(pq.top()); pq.pop(); } });
    }
    return Row{"heap", "stl", "insert_then_drain", dist_name(dist),
               p == Priority::Max ? "priority=max" : "priority=min", N, trial, seed, ns, s.acc};
}

// --- std::make_heap / pop_heap ---
inline Row run_heap_stl_build_drain(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        std::make_heap(keys.begin(), keys.end());
        for (auto end = keys.end(); end != keys.begin(); --end){
            s.eat(keys.front());
            std::pop_heap(keys.begin(), end);
        } });
    return Row{"heap", "stl", "build_then_drain", dist_name(dist), "", N, trial, seed, ns, s.acc};
}

inline Row run_heap_stl_merge(std::size_t N, Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    auto keys = gen_keys(N, dist, seed);
    std::vector<std::uint64_t> lo(keys.begin(), keys.begin() + N / 2);
    std::vector<std::uint64_t> hi(keys.begin() + N / 2, keys.end());
    std::uint64_t ns = time_ns([&]
                               {
        std::make_heap(lo.begin(), lo.end());
        lo.insert(lo.end(), hi.begin(), hi.end());
        std::make_heap(lo.begin(), lo.end());
        s.eat(lo.size());
        if (!lo.empty()) s.eat(lo.front()); });
    return Row{"heap", "stl", "build_half+merge_half", dist_name(dist), "", N, trial, seed, ns, s.acc};
}
