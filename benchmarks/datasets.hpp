#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

enum class Dist
{
    Uniform,
    Zipf
};

inline const char *dist_name(Dist d)
{
    return d == Dist::Uniform ? "uniform" : "zipf";
}

inline std::vector<std::uint64_t>
gen_uniform(std::size_t n, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::uint64_t> d;
    std::vector<std::uint64_t> v(n);
    for (auto &x : v)
        x = d(rng);
    return v;
}

// Zipf(s) ranks over [1..n]; many repeats near the top, which stresses
// equal-key handling in sift_up/sift_down.
inline std::vector<std::uint64_t>
gen_zipf(std::size_t n, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::vector<std::uint64_t> out(n);
    for (auto &x : out)
    {
        double u = U(rng);
        x = (std::uint64_t)(std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin());
    }
    return out;
}

inline std::vector<std::uint64_t> gen_keys(std::size_t n, Dist dist, std::uint64_t seed)
{
    return dist == Dist::Uniform ? gen_uniform(n, seed) : gen_zipf(n, 1.2, seed);
}

// Positions for remove_at, each valid for the heap size at that step.
inline std::vector<std::size_t> gen_positions(std::size_t n, std::size_t count, std::uint64_t seed)
{
    std::mt19937_64 rng(seed ^ 0x5bd1e995ull);
    std::vector<std::size_t> pos;
    pos.reserve(count);
    for (std::size_t i = 0; i < count && i < n; ++i)
        pos.push_back(std::uniform_int_distribution<std::size_t>(0, n - i - 1)(rng));
    return pos;
}
