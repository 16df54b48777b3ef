
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
 * End-to-end tests of the recommendation pipeline on small graphs.
 */

#include <vector>
#include <string>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <unistd.h>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "graph/inmemory_graph.hpp"
#include "walks/local_companion.hpp"
#include "recommendations/recommendation_pipeline.hpp"
#include "output/output.hpp"
#include "tests/tests.hpp"

using namespace drunkardmob;

static file_logger logger;

class collecting_output : public irecommendation_output {
public:
    std::vector<vid_t> egos;
    std::vector<std::vector<scored_vertex> > lists;
    bool closed;
    
    collecting_output() : closed(false) {}
    
    void output_recommendations(vid_t ego, const std::vector<scored_vertex> &recommendations) {
        egos.push_back(ego);
        lists.push_back(recommendations);
    }
    void close() { closed = true; }
};

/**
 * Companion that fails for one source, otherwise forwards to a local companion.
 * Throws companion_unavailable, or a plain drunkardmob_error if other_error is set.
 */
class failing_companion : public walk_companion {
    walk_companion &inner;
    vid_t failing_source;
    bool other_error;
public:
    failing_companion(walk_companion &inner, vid_t failing_source, bool other_error = false) : inner(inner),
        failing_source(failing_source), other_error(other_error) {}
    void set_avoidance(vid_t source, const std::vector<vid_t> &vertices) { inner.set_avoidance(source, vertices); }
    void record_visits(const std::vector<visit> &visits) { inner.record_visits(visits); }
    void flush() { inner.flush(); }
    std::vector<id_count> get_top(vid_t source, int topN) {
        if (source == failing_source) {
            if (other_error) throw drunkardmob_error("histogram unreadable");
            throw companion_unavailable("connection refused");
        }
        return inner.get_top(source, topN);
    }
    void discard(vid_t source) { inner.discard(source); }
};

/**
 * Graph whose neighbor lookups fail for one vertex.
 */
class failing_graph : public inmemory_graph {
    vid_t failing_vertex;
public:
    failing_graph(const std::vector<std::vector<vid_t> > &adj, vid_t failing_vertex) : inmemory_graph(adj, 2),
        failing_vertex(failing_vertex) {}
    virtual std::vector<vid_t> out_neighbors(vid_t v) {
        if (v == failing_vertex) throw graph_access_error("cannot read neighbors");
        return inmemory_graph::out_neighbors(v);
    }
};

static std::vector<std::vector<vid_t> > cycle_adjacency(int n) {
    std::vector<std::vector<vid_t> > adj(n);
    for(int v=0; v < n; v++) adj[v].push_back((vid_t) ((v + 1) % n));
    return adj;
}

static pipeline_config cycle_config(vid_t nsources) {
    pipeline_config config;
    config.first_source = 0;
    config.num_sources = nsources;
    config.walks_per_source = 1000;
    config.niters = 3;
    config.circle_size = 5;
    config.seed = 2013;
    config.exec_threads = 2;
    return config;
}

int test_cycle() {
    inmemory_graph graph(cycle_adjacency(6), 2);
    local_companion companion(2, 0, logger);
    metrics m("test");
    recommendation_pipeline pipeline(graph, companion, cycle_config(1), logger, m);
    
    pipeline.run_walks();
    std::vector<id_count> circle = companion.get_top(0, 5);
    /* Vertex 1 is a direct neighbor and never tracked; 4 and 5 are out of reach in 3 passes */
    ASSERTEQ(circle.size(), (size_t) 2);
    ASSERTEQ(circle[0].id, (vid_t) 2);
    ASSERTEQ(circle[1].id, (vid_t) 3);
    ASSERTTRUE(circle[0].count > circle[1].count);
    ASSERTEQ(pipeline.walk_stats().steps, (uint64_t) 3000);
    
    collecting_output out;
    pipeline.compute_recommendations(out);
    ASSERTEQ(out.egos.size(), (size_t) 1);
    ASSERTEQ(out.egos[0], (vid_t) 0);
    std::vector<scored_vertex> &recs = out.lists[0];
    ASSERTEQ(recs.size(), (size_t) 2);
    ASSERTEQ(recs[0].id, (vid_t) 3);
    ASSERTEQ(recs[1].id, (vid_t) 4);
    ASSERTCLOSE(recs[0].value, 0.5, 1e-12);
    for(size_t i=0; i < recs.size(); i++) {
        ASSERTTRUE(recs[i].id != 0 && recs[i].id != 1);
    }
    
    /* Histogram was discarded after extracting the circle */
    ASSERTEQ(companion.get_top(0, 5).size(), (size_t) 0);
    return 0;
}

int test_all_egos_in_order() {
    inmemory_graph graph(cycle_adjacency(6), 3);
    local_companion companion(3, 0, logger);
    metrics m("test");
    pipeline_config config = cycle_config(6);
    config.exec_threads = 4;
    config.progress_interval = 2;
    recommendation_pipeline pipeline(graph, companion, config, logger, m);
    collecting_output out;
    pipeline.run(out);
    
    ASSERTTRUE(out.closed);
    ASSERTEQ(out.egos.size(), (size_t) 6);
    for(vid_t e=0; e < 6; e++) {
        ASSERTEQ(out.egos[e], e);
        ASSERTEQ(out.lists[e].size(), (size_t) 2);
        /* Circle {e+2, e+3} recommends {e+3, e+4} with equal scores, smaller id first */
        vid_t a = (e + 3) % 6, b = (e + 4) % 6;
        ASSERTEQ(out.lists[e][0].id, std::min(a, b));
        ASSERTEQ(out.lists[e][1].id, std::max(a, b));
        for(size_t i=0; i < out.lists[e].size(); i++) {
            ASSERTTRUE(out.lists[e][i].id != e && out.lists[e][i].id != (e + 1) % 6);
        }
    }
    ASSERTTRUE(pipeline.failed_egos().empty());
    ASSERTEQ(m.get("recommendations.egos").value, 6.0);
    return 0;
}

int test_star_has_no_recommendations() {
    /* Leaves 1..10 follow only the center 0, the center follows all leaves */
    inmemory_graph graph(11);
    for(vid_t v=1; v <= 10; v++) {
        graph.add_edge(0, v);
        graph.add_edge(v, 0);
    }
    local_companion companion(2, 0, logger);
    metrics m("test");
    pipeline_config config = cycle_config(1);
    config.niters = 5;
    config.circle_size = 300;
    recommendation_pipeline pipeline(graph, companion, config, logger, m);
    
    pipeline.run_walks();
    /* Every visit of the ego's walks is the ego or one of its neighbors */
    ASSERTEQ(companion.get_top(0, 300).size(), (size_t) 0);
    ASSERTTRUE(companion.total_avoided() > 0);
    
    collecting_output out;
    pipeline.compute_recommendations(out);
    ASSERTEQ(out.egos.size(), (size_t) 1);
    ASSERTEQ(out.lists[0].size(), (size_t) 0);
    ASSERTEQ(pipeline.num_empty(), (size_t) 1);
    return 0;
}

int test_companion_failure_is_per_ego() {
    inmemory_graph graph(cycle_adjacency(6), 1);
    local_companion local(2, 0, logger);
    failing_companion companion(local, 2);
    metrics m("test");
    recommendation_pipeline pipeline(graph, companion, cycle_config(6), logger, m);
    collecting_output out;
    pipeline.run(out);
    
    ASSERTEQ(pipeline.failed_egos().size(), (size_t) 1);
    ASSERTEQ(pipeline.failed_egos()[0], (vid_t) 2);
    ASSERTEQ(out.egos.size(), (size_t) 5);
    ASSERTEQ(out.egos[2], (vid_t) 3);
    return 0;
}

int test_other_companion_error_is_per_ego() {
    inmemory_graph graph(cycle_adjacency(6), 1);
    local_companion local(2, 0, logger);
    failing_companion companion(local, 4, true);
    metrics m("test");
    recommendation_pipeline pipeline(graph, companion, cycle_config(6), logger, m);
    collecting_output out;
    pipeline.run(out);
    
    ASSERTEQ(pipeline.failed_egos().size(), (size_t) 1);
    ASSERTEQ(pipeline.failed_egos()[0], (vid_t) 4);
    ASSERTEQ(out.egos.size(), (size_t) 5);
    ASSERTEQ(out.egos[4], (vid_t) 5);
    ASSERTTRUE(out.closed);
    return 0;
}

int test_graph_failure_aborts() {
    failing_graph graph(cycle_adjacency(6), 4);
    local_companion companion(2, 0, logger);
    metrics m("test");
    recommendation_pipeline pipeline(graph, companion, cycle_config(6), logger, m);
    pipeline.run_walks();
    collecting_output out;
    ASSERTTHROWS(pipeline.compute_recommendations(out), graph_access_error);
    /* Egos before the failure were written */
    ASSERTTRUE(out.egos.size() >= 1);
    ASSERTEQ(out.egos[0], (vid_t) 0);
    return 0;
}

int test_translated_text_output() {
    char fname[] = "/tmp/drunkardmob_recsXXXXXX";
    int fd = mkstemp(fname);
    ASSERTTRUE(fd >= 0);
    close(fd);
    
    inmemory_graph graph(cycle_adjacency(6), 2);
    local_companion companion(2, 0, logger);
    metrics m("test");
    recommendation_pipeline pipeline(graph, companion, cycle_config(1), logger, m);
    offset_translate translate(1000);
    pipeline.set_vertex_id_translate(&translate);
    {
        basic_text_output out(fname);
        pipeline.run(out);
    }
    
    std::ifstream in(fname);
    vid_t ego, rec;
    double score;
    ASSERTTRUE(in >> ego >> rec >> score);
    ASSERTEQ(ego, (vid_t) 1000);
    ASSERTEQ(rec, (vid_t) 1003);
    ASSERTCLOSE(score, 0.5, 1e-9);
    ASSERTTRUE(in >> ego >> rec >> score);
    ASSERTEQ(rec, (vid_t) 1004);
    ASSERTTRUE(!(in >> ego));
    remove(fname);
    return 0;
}

int test_invalid_config() {
    inmemory_graph graph(cycle_adjacency(6), 1);
    local_companion companion(1, 0, logger);
    metrics m("test");
    pipeline_config config = cycle_config(1);
    config.circle_size = 0;
    ASSERTTHROWS(recommendation_pipeline(graph, companion, config, logger, m), configuration_error);
    
    config = cycle_config(7);
    recommendation_pipeline pipeline(graph, companion, config, logger, m);
    ASSERTTHROWS(pipeline.run_walks(), configuration_error);
    return 0;
}

int main(int argc, const char ** argv) {
    logger.set_log_level(LOG_ERROR);
    int ret = 0;
    RUN_TEST(test_cycle);
    RUN_TEST(test_all_egos_in_order);
    RUN_TEST(test_star_has_no_recommendations);
    RUN_TEST(test_companion_failure_is_per_ego);
    RUN_TEST(test_other_companion_error_is_per_ego);
    RUN_TEST(test_graph_failure_aborts);
    RUN_TEST(test_translated_text_output);
    RUN_TEST(test_invalid_config);
    return ret;
}
