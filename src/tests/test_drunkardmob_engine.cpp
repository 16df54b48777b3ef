
/**
 * @file
 * @author  Aapo Kyrola <akyrola@cs.cmu.edu>
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Aapo Kyrola, Guy Blelloch, Carlos Guestrin / Carnegie Mellon University]
 * 
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 * 
 * http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 
 *
 * @section DESCRIPTION
 *
 * Tests for the DrunkardMob engine: accounting of walk steps and visits,
 * dead ends, avoidance lists and reproducibility.
 */

#include <vector>
#include <map>
#include <set>
#include <algorithm>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "graph/inmemory_graph.hpp"
#include "walks/drunkardmob_engine.hpp"
#include "walks/local_companion.hpp"
#include "tests/tests.hpp"

using namespace drunkardmob;

static file_logger logger;

/**
 * Companion that records the calls it receives.
 */
class recording_companion : public walk_companion {
public:
    std::map<vid_t, std::vector<vid_t> > avoidance;
    std::vector<visit> visits;
    bool visit_before_avoidance;
    int nflush;
    mutex lock;
    
    recording_companion() : visit_before_avoidance(false), nflush(0) {}
    
    void set_avoidance(vid_t source, const std::vector<vid_t> &vertices) {
        scoped_lock<mutex> guard(lock);
        avoidance[source] = vertices;
    }
    void record_visits(const std::vector<visit> &v) {
        scoped_lock<mutex> guard(lock);
        for(size_t i=0; i < v.size(); i++) {
            if (avoidance.count(v[i].source) == 0) visit_before_avoidance = true;
            visits.push_back(v[i]);
        }
    }
    void flush() { nflush++; }
    std::vector<id_count> get_top(vid_t source, int topN) { return std::vector<id_count>(); }
    void discard(vid_t source) {}
};

/**
 * Graph whose partitions cannot be loaded.
 */
class broken_graph : public inmemory_graph {
public:
    broken_graph(const std::vector<std::vector<vid_t> > &adj) : inmemory_graph(adj, 2) {}
    virtual memory_partition * load_partition(int p) {
        if (p == 1) throw graph_access_error("partition 1 is corrupt");
        return inmemory_graph::load_partition(p);
    }
};

/* Random graph with a few dead ends */
static std::vector<std::vector<vid_t> > random_adjacency(int nvertices, int seed) {
    random_generator rnd(seed);
    std::vector<std::vector<vid_t> > adj(nvertices);
    for(int v=0; v < nvertices; v++) {
        if (v % 11 == 5) continue;
        int deg = 1 + (int) (rnd() % 6);
        for(int j=0; j < deg; j++) adj[v].push_back((vid_t) (rnd() % nvertices));
    }
    return adj;
}

static std::map<vid_t, std::vector<id_count> > run_walks(graph_access &graph, int nthreads, uint64_t seed,
                                                         walk_statistics &stats, uint64_t &avoided) {
    metrics m("test");
    local_companion companion(2, 0, logger);
    drunkardmob_engine engine(graph, logger, m);
    engine.set_exec_threads(nthreads);
    engine.set_seed(seed);
    engine.configure_source_range(0, 20, 100);
    personalized_walk_update update;
    engine.run(update, companion, 6);
    stats = engine.get_statistics();
    avoided = companion.total_avoided();
    
    std::map<vid_t, std::vector<id_count> > result;
    for(vid_t s=0; s < 20; s++) {
        result[s] = companion.get_top(s, 1000000);
    }
    return result;
}

static bool same_distributions(std::map<vid_t, std::vector<id_count> > &a, std::map<vid_t, std::vector<id_count> > &b) {
    if (a.size() != b.size()) return false;
    for(std::map<vid_t, std::vector<id_count> >::iterator it = a.begin(); it != a.end(); ++it) {
        std::vector<id_count> &x = it->second;
        std::vector<id_count> &y = b[it->first];
        if (x.size() != y.size()) return false;
        for(size_t i=0; i < x.size(); i++) {
            if (x[i].id != y[i].id || x[i].count != y[i].count) return false;
        }
    }
    return true;
}

int test_step_accounting() {
    inmemory_graph graph(random_adjacency(200, 1), 4);
    walk_statistics stats;
    uint64_t avoided;
    std::map<vid_t, std::vector<id_count> > dist = run_walks(graph, 2, 12345, stats, avoided);
    
    ASSERTEQ(stats.steps, (uint64_t) (20 * 100 * 6));
    ASSERTEQ(stats.forwarded + stats.resets + stats.deadend_resets, stats.steps);
    ASSERTEQ(stats.tracked + stats.untracked_hops, stats.forwarded);
    ASSERTTRUE(stats.tracked > 0);
    
    uint64_t total = 0;
    for(std::map<vid_t, std::vector<id_count> >::iterator it = dist.begin(); it != dist.end(); ++it) {
        for(size_t i=0; i < it->second.size(); i++) {
            ASSERTTRUE(it->second[i].count >= 1);
            ASSERTTRUE(it->second[i].id != it->first);
            total += it->second[i].count;
        }
    }
    ASSERTEQ(total + avoided, stats.tracked);
    return 0;
}

int test_same_result_any_threads_and_partitions() {
    std::vector<std::vector<vid_t> > adj = random_adjacency(300, 2);
    inmemory_graph graph1(adj, 1);
    inmemory_graph graph5(adj, 5);
    walk_statistics s1, s2, s3;
    uint64_t a1, a2, a3;
    std::map<vid_t, std::vector<id_count> > d1 = run_walks(graph1, 1, 99, s1, a1);
    std::map<vid_t, std::vector<id_count> > d2 = run_walks(graph1, 4, 99, s2, a2);
    std::map<vid_t, std::vector<id_count> > d3 = run_walks(graph5, 3, 99, s3, a3);
    ASSERTTRUE(same_distributions(d1, d2));
    ASSERTTRUE(same_distributions(d1, d3));
    ASSERTEQ(s1.tracked, s3.tracked);
    ASSERTEQ(a1, a3);
    
    walk_statistics s4;
    uint64_t a4;
    std::map<vid_t, std::vector<id_count> > d4 = run_walks(graph1, 4, 100, s4, a4);
    ASSERTTRUE(!same_distributions(d1, d4));
    return 0;
}

int test_dead_end_is_not_a_trap() {
    /* 0 -> 1 -> 2, 2 is a dead end */
    inmemory_graph graph(3);
    graph.add_edge(0, 1);
    graph.add_edge(1, 2);
    metrics m("test");
    recording_companion companion;
    drunkardmob_engine engine(graph, logger, m);
    engine.configure_source_range(0, 1, 50);
    personalized_walk_update update;
    engine.run(update, companion, 10);
    
    const walk_statistics &stats = engine.get_statistics();
    ASSERTTRUE(stats.deadend_resets > 0);
    ASSERTEQ(engine.num_walks(), (size_t) 50);
    ASSERTEQ(stats.steps, (uint64_t) 500);
    ASSERTEQ(companion.nflush, 1);
    
    /* Only the hop 1 -> 2 can be tracked */
    ASSERTTRUE(companion.visits.size() > 0);
    for(size_t i=0; i < companion.visits.size(); i++) {
        ASSERTEQ(companion.visits[i].source, (vid_t) 0);
        ASSERTEQ(companion.visits[i].vertex, (vid_t) 2);
    }
    return 0;
}

int test_avoidance_registered_first() {
    inmemory_graph graph(random_adjacency(100, 3), 3);
    metrics m("test");
    recording_companion companion;
    drunkardmob_engine engine(graph, logger, m);
    engine.set_exec_threads(2);
    engine.configure_source_range(10, 30, 20);
    personalized_walk_update update;
    engine.run(update, companion, 4);
    
    ASSERTTRUE(!companion.visit_before_avoidance);
    ASSERTEQ(companion.avoidance.size(), (size_t) 30);
    for(vid_t s=10; s < 40; s++) {
        std::vector<vid_t> expected = graph.out_neighbors(s);
        expected.push_back(s);
        std::sort(expected.begin(), expected.end());
        std::vector<vid_t> got = companion.avoidance[s];
        std::sort(got.begin(), got.end());
        ASSERTTRUE(got == expected);
    }
    for(size_t i=0; i < companion.visits.size(); i++) {
        ASSERTTRUE(companion.visits[i].source >= 10 && companion.visits[i].source < 40);
    }
    return 0;
}

int test_configuration_errors() {
    inmemory_graph graph(random_adjacency(10, 4), 1);
    metrics m("test");
    recording_companion companion;
    personalized_walk_update update;
    drunkardmob_engine engine(graph, logger, m);
    ASSERTTHROWS(engine.run(update, companion, 1), configuration_error);
    ASSERTTHROWS(engine.configure_source_range(5, 6, 10), configuration_error);
    ASSERTTHROWS(engine.configure_source_range(0, 0, 10), configuration_error);
    ASSERTTHROWS(engine.set_exec_threads(0), configuration_error);
    return 0;
}

int test_graph_failure_is_fatal() {
    broken_graph graph(random_adjacency(50, 5));
    metrics m("test");
    recording_companion companion;
    personalized_walk_update update;
    drunkardmob_engine engine(graph, logger, m);
    engine.configure_source_range(0, 50, 2);
    ASSERTTHROWS(engine.run(update, companion, 2), graph_access_error);
    return 0;
}

int main(int argc, const char ** argv) {
    logger.set_log_level(LOG_ERROR);
    int ret = 0;
    RUN_TEST(test_step_accounting);
    RUN_TEST(test_same_result_any_threads_and_partitions);
    RUN_TEST(test_dead_end_is_not_a_trap);
    RUN_TEST(test_avoidance_registered_first);
    RUN_TEST(test_configuration_errors);
    RUN_TEST(test_graph_failure_is_fatal);
    return ret;
}
