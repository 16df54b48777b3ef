
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
 * Walk update functions. The engine calls process_walks_at_vertex() for
 * every vertex hosting walks in the current pass; the function decides the
 * next position of each walk and which visits are reported to the companion.
 * It has no state of its own, so it can be called directly without a graph
 * or an engine.
 */

#ifndef DEF_DRUNKARDMOB_WALK_UPDATE
#define DEF_DRUNKARDMOB_WALK_UPDATE

#include <vector>
#include <stdint.h>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "drunkardmob_types.hpp"
#include "walks/walk_state.hpp"

namespace drunkardmob {
    
    typedef boost::random::mt19937 random_generator;
    
    /**
     * Walks residing at one vertex together with the vertex's out-edges.
     */
    struct vertex_walks {
        vid_t vertex;
        const vid_t * outedges;
        size_t num_outedges;
        const walk_t * walks;
        size_t num_walks;
        
        vertex_walks(vid_t vertex, const vid_t * outedges, size_t num_outedges, const walk_t * walks, size_t num_walks) :
            vertex(vertex), outedges(outedges), num_outedges(num_outedges), walks(walks), num_walks(num_walks) {}
    };
    
    /**
     * Counters of what happened to walks.
     */
    struct walk_statistics {
        uint64_t steps;
        uint64_t forwarded;
        uint64_t tracked;
        uint64_t untracked_hops;
        uint64_t resets;
        uint64_t deadend_resets;
        
        walk_statistics() : steps(0), forwarded(0), tracked(0), untracked_hops(0), resets(0), deadend_resets(0) {}
        
        void add(const walk_statistics &o) {
            steps += o.steps;
            forwarded += o.forwarded;
            tracked += o.tracked;
            untracked_hops += o.untracked_hops;
            resets += o.resets;
            deadend_resets += o.deadend_resets;
        }
    };
    
    /**
     * Output of one step: the new walk tokens and the visits to report.
     */
    struct walk_step_output {
        std::vector<walk_t> walks;
        std::vector<visit> visits;
        walk_statistics stats;
        
        void clear() {
            walks.clear();
            visits.clear();
            stats = walk_statistics();
        }
    };
    
    class walk_update_function {
    public:
        virtual ~walk_update_function() {}
        
        /**
         * Advances every walk of 'vw' by exactly one step. Appends one token
         * per input walk to out.walks.
         */
        virtual void process_walks_at_vertex(const vertex_walks &vw, const walk_source_range &sources,
                                             random_generator &rnd, walk_step_output &out) const = 0;
        
        /**
         * Vertices whose visits are not tracked for walks started from 'vertex'.
         */
        virtual std::vector<vid_t> not_tracked_vertices(vid_t vertex, const vid_t * outedges, size_t num_outedges) const = 0;
    };
    
    /**
     * Personalized PageRank style walk: with probability reset_probability
     * (or when there is nowhere to go) the walk jumps back to its source.
     * Otherwise it follows a random out-edge. Hops made directly from
     * the source are not tracked, and the source and its out-neighbors are
     * not tracked for the source's own walks.
     */
    class personalized_walk_update : public walk_update_function {
        
        double reset_probability;
        
    public:
        personalized_walk_update(double reset_probability = 0.15) : reset_probability(reset_probability) {
            if (reset_probability < 0.0 || reset_probability > 1.0) {
                throw configuration_error("Reset probability must be within [0, 1]");
            }
        }
        
        double get_reset_probability() const {
            return reset_probability;
        }
        
        virtual void process_walks_at_vertex(const vertex_walks &vw, const walk_source_range &sources,
                                             random_generator &rnd, walk_step_output &out) const {
            out.stats.steps += vw.num_walks;
            
            if (vw.num_outedges == 0) {
                // Reset all walks -- no where to go from here
                for(size_t i=0; i < vw.num_walks; i++) {
                    out.walks.push_back(sources.reset(vw.walks[i]));
                }
                out.stats.deadend_resets += vw.num_walks;
                return;
            }
            
            boost::random::uniform_01<double> coin;
            boost::random::uniform_int_distribution<size_t> pick(0, vw.num_outedges - 1);
            
            for(size_t i=0; i < vw.num_walks; i++) {
                walk_t walk = vw.walks[i];
                if (coin(rnd) < reset_probability) {
                    out.walks.push_back(sources.reset(walk));
                    out.stats.resets++;
                } else {
                    vid_t next_hop = vw.outedges[pick(rnd)];
                    out.walks.push_back(sources.forward(walk, next_hop));
                    out.stats.forwarded++;
                    
                    // Walks that have just been started from their source need not be tracked.
                    if (walk_has_hopped(walk)) {
                        out.visits.push_back(visit(sources.source_of(walk), next_hop));
                        out.stats.tracked++;
                    } else {
                        out.stats.untracked_hops++;
                    }
                }
            }
        }
        
        virtual std::vector<vid_t> not_tracked_vertices(vid_t vertex, const vid_t * outedges, size_t num_outedges) const {
            std::vector<vid_t> not_counted(1 + num_outedges);
            not_counted[0] = vertex;
            for(size_t i=0; i < num_outedges; i++) {
                not_counted[i + 1] = outedges[i];
            }
            return not_counted;
        }
    };
    
}

#endif

