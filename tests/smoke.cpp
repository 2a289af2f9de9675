#include <cassert>
#include <vector>
#include <queue>
#include <random>
#include <algorithm>
#include <functional>
#include <iostream>
#include <cstdint>

#include "../src/heap.hpp"
#include "../src/heap_algorithms.hpp"

static std::mt19937_64 rng(12345);

// against std::priority_queue, max ordering
void check_pushpop_max() {
    BinaryHeap<std::uint64_t> h;
    std::priority_queue<std::uint64_t> pq;
    for (int i=0;i<50000;++i){ auto x=rng(); h.insert(x); pq.push(x); }
    assert(h.size()==pq.size());
    while(!pq.empty()){
        assert(!h.empty());
        assert(*h.peek()==pq.top());
        auto v = h.remove_root();
        assert(v && *v==pq.top());
        pq.pop();
    }
    assert(h.empty());
    assert(!h.remove_root());
}

// against a min priority_queue, with duplicates
void check_pushpop_min() {
    BinaryHeap<int> h(Priority::Min);
    std::priority_queue<int, std::vector<int>, std::greater<int>> pq;
    std::uniform_int_distribution<int> d(-50, 50);
    std::uniform_int_distribution<int> op(0, 2); // 0,1:insert 2:remove_root
    for (int i=0;i<20000;++i){
        if (op(rng)!=2){
            int x=d(rng);
            h.insert(x); pq.push(x);
        } else if (!pq.empty()){
            auto v=h.remove_root();
            assert(v && *v==pq.top());
            pq.pop();
        } else {
            assert(!h.remove_root());
        }
        assert(h.size()==pq.size());
    }
    assert(is_min_heap_array(h.elements()));
}

// remove_at / merge / index_of against a sorted multiset in a vector
void check_mixed() {
    for (Priority p : {Priority::Max, Priority::Min}) {
        BinaryHeap<int> h(p);
        std::vector<int> ref;
        std::uniform_int_distribution<int> d(0, 999);
        std::uniform_int_distribution<int> op(0, 4); // 0:insert 1:remove_at 2:merge 3:index_of 4:remove_root
        for (int i=0;i<5000;++i){
            int o = op(rng);
            if (o==0){
                int x=d(rng);
                h.insert(x); ref.push_back(x);
            } else if (o==1){
                std::size_t n=h.size();
                std::size_t at = std::uniform_int_distribution<std::size_t>(0, n+1)(rng);
                auto v=h.remove_at(at);
                if (at<n){
                    assert(v);
                    assert(h.size()==n-1);
                    auto it=std::find(ref.begin(), ref.end(), *v);
                    assert(it!=ref.end());
                    ref.erase(it);
                } else {
                    assert(!v);
                    assert(h.size()==n);
                }
            } else if (o==2){
                std::vector<int> more(std::uniform_int_distribution<int>(0, 8)(rng));
                for (auto &x: more) x=d(rng);
                std::size_t n=h.size();
                h.merge(more);
                assert(h.size()==n+more.size());
                ref.insert(ref.end(), more.begin(), more.end());
            } else if (o==3){
                int x=d(rng);
                auto idx=h.index_of(x);
                bool present = std::find(ref.begin(), ref.end(), x)!=ref.end();
                assert(idx.has_value()==present);
                if (idx) assert(h.elements()[*idx]==x);
            } else {
                auto v=h.remove_root();
                if (ref.empty()){ assert(!v); continue; }
                auto best = (p==Priority::Max) ? std::max_element(ref.begin(), ref.end())
                                               : std::min_element(ref.begin(), ref.end());
                assert(v && *v==*best);
                ref.erase(best);
            }
            assert(h.size()==ref.size());
            assert(is_heap_array(h.elements(), p));
        }
        // what is left drains in sorted order
        auto rest = drain(h);
        if (p==Priority::Max) std::sort(ref.begin(), ref.end(), std::greater<int>());
        else std::sort(ref.begin(), ref.end());
        assert(rest==ref);
    }
}

void check_nth() {
    for (int t=0;t<200;++t){
        std::vector<int> v(1 + t%40);
        for (auto &x: v) x = std::uniform_int_distribution<int>(-20, 20)(rng);
        auto sorted = v;
        std::sort(sorted.begin(), sorted.end());
        for (std::size_t k=0;k<v.size();++k){
            assert(*nth_smallest(v, k)==sorted[k]);
            assert(*nth_largest(v, k)==sorted[sorted.size()-1-k]);
        }
        assert(!nth_smallest(v, v.size()));
    }
}

int main(){
    check_pushpop_max();
    check_pushpop_min();
    check_mixed();
    check_nth();
    std::cout << "OK\n";
    return 0;
}
