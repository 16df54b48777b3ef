
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
 * Tests for the walk token encoding and the personalized walk update function.
 */

#include <vector>
#include <algorithm>

#include "walks/walk_state.hpp"
#include "walks/walk_update.hpp"
#include "tests/tests.hpp"

using namespace drunkardmob;

int test_walk_token() {
    walk_source_range sources(100, 50);
    walk_t w = make_walk(sources.index_of(120), 120, false);
    ASSERTEQ(walk_vertex(w), (vid_t) 120);
    ASSERTEQ(sources.source_of(w), (vid_t) 120);
    ASSERTTRUE(!walk_has_hopped(w));
    
    walk_t moved = sources.forward(w, 4000000000u);
    ASSERTEQ(walk_vertex(moved), (vid_t) 4000000000u);
    ASSERTEQ(sources.source_of(moved), (vid_t) 120);
    ASSERTTRUE(walk_has_hopped(moved));
    
    walk_t back = sources.reset(moved);
    ASSERTEQ(walk_vertex(back), (vid_t) 120);
    ASSERTTRUE(!walk_has_hopped(back));
    ASSERTTRUE(sources.contains(149));
    ASSERTTRUE(!sources.contains(150));
    ASSERTTRUE(!sources.contains(99));
    
    /* Sorting tokens groups the walks by vertex */
    ASSERTTRUE(make_walk(0, 5, true) < make_walk(0, 6, false));
    return 0;
}

int test_deadend_resets() {
    walk_source_range sources(0, 10);
    personalized_walk_update update;
    random_generator rnd(1);
    
    std::vector<walk_t> walks;
    for(int i=0; i < 10; i++) walks.push_back(sources.forward(make_walk(i, i, false), 7));
    vertex_walks vw(7, NULL, 0, &walks[0], walks.size());
    walk_step_output out;
    update.process_walks_at_vertex(vw, sources, rnd, out);
    
    ASSERTEQ(out.walks.size(), walks.size());
    ASSERTEQ(out.visits.size(), (size_t) 0);
    ASSERTEQ(out.stats.deadend_resets, (uint64_t) 10);
    for(size_t i=0; i < out.walks.size(); i++) {
        ASSERTEQ(walk_vertex(out.walks[i]), sources.source_of(walks[i]));
        ASSERTTRUE(!walk_has_hopped(out.walks[i]));
    }
    return 0;
}

int test_first_hop_untracked() {
    walk_source_range sources(3, 1);
    personalized_walk_update update(0.0);
    random_generator rnd(2);
    
    vid_t nbrs[] = {10, 11, 12};
    std::vector<walk_t> walks(100, make_walk(0, 3, false));
    vertex_walks vw(3, nbrs, 3, &walks[0], walks.size());
    walk_step_output out;
    update.process_walks_at_vertex(vw, sources, rnd, out);
    
    /* No resets, every walk moved to a neighbor, nothing tracked */
    ASSERTEQ(out.walks.size(), (size_t) 100);
    ASSERTEQ(out.visits.size(), (size_t) 0);
    ASSERTEQ(out.stats.untracked_hops, (uint64_t) 100);
    for(size_t i=0; i < out.walks.size(); i++) {
        vid_t v = walk_vertex(out.walks[i]);
        ASSERTTRUE(v >= 10 && v <= 12);
        ASSERTTRUE(walk_has_hopped(out.walks[i]));
    }
    
    /* The second hop is tracked */
    std::vector<walk_t> second;
    second.push_back(out.walks[0]);
    vid_t nbrs2[] = {20};
    vertex_walks vw2(walk_vertex(out.walks[0]), nbrs2, 1, &second[0], 1);
    walk_step_output out2;
    update.process_walks_at_vertex(vw2, sources, rnd, out2);
    ASSERTEQ(out2.visits.size(), (size_t) 1);
    ASSERTEQ(out2.visits[0].source, (vid_t) 3);
    ASSERTEQ(out2.visits[0].vertex, (vid_t) 20);
    ASSERTEQ(walk_vertex(out2.walks[0]), (vid_t) 20);
    return 0;
}

int test_reset_probability() {
    walk_source_range sources(0, 1);
    random_generator rnd(3);
    
    vid_t nbrs[] = {1, 2};
    std::vector<walk_t> walks(20000, sources.forward(make_walk(0, 0, false), 5));
    vertex_walks vw(5, nbrs, 2, &walks[0], walks.size());
    
    personalized_walk_update always(1.0);
    walk_step_output out;
    always.process_walks_at_vertex(vw, sources, rnd, out);
    ASSERTEQ(out.stats.resets, (uint64_t) walks.size());
    ASSERTEQ(out.visits.size(), (size_t) 0);
    
    personalized_walk_update update;
    out.clear();
    update.process_walks_at_vertex(vw, sources, rnd, out);
    ASSERTEQ(out.stats.resets + out.stats.forwarded, (uint64_t) walks.size());
    ASSERTEQ(out.visits.size(), (size_t) out.stats.forwarded);
    double frac = (double) out.stats.resets / walks.size();
    ASSERTCLOSE(frac, 0.15, 0.02);
    
    ASSERTTHROWS(personalized_walk_update(1.5), configuration_error);
    return 0;
}

int test_same_seed_same_result() {
    walk_source_range sources(0, 4);
    personalized_walk_update update;
    vid_t nbrs[] = {1, 2, 3, 4, 5, 6};
    std::vector<walk_t> walks;
    for(int i=0; i < 1000; i++) walks.push_back(sources.forward(make_walk(i % 4, i % 4, false), 9));
    vertex_walks vw(9, nbrs, 6, &walks[0], walks.size());
    
    walk_step_output a, b;
    random_generator r1(77), r2(77);
    update.process_walks_at_vertex(vw, sources, r1, a);
    update.process_walks_at_vertex(vw, sources, r2, b);
    ASSERTTRUE(a.walks == b.walks);
    return 0;
}

int test_not_tracked_vertices() {
    personalized_walk_update update;
    vid_t nbrs[] = {8, 2, 5};
    std::vector<vid_t> nt = update.not_tracked_vertices(4, nbrs, 3);
    std::sort(nt.begin(), nt.end());
    ASSERTEQ(nt.size(), (size_t) 4);
    ASSERTEQ(nt[0], (vid_t) 2);
    ASSERTEQ(nt[1], (vid_t) 4);
    ASSERTEQ(nt[2], (vid_t) 5);
    ASSERTEQ(nt[3], (vid_t) 8);
    ASSERTEQ(update.not_tracked_vertices(4, NULL, 0).size(), (size_t) 1);
    return 0;
}

int main(int argc, const char ** argv) {
    int ret = 0;
    RUN_TEST(test_walk_token);
    RUN_TEST(test_deadend_resets);
    RUN_TEST(test_first_hop_untracked);
    RUN_TEST(test_reset_probability);
    RUN_TEST(test_same_seed_same_result);
    RUN_TEST(test_not_tracked_vertices);
    return ret;
}
