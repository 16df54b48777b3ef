
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
 * SALSA over the circle of trust of one user (Gupta et al., WTF: The Who
 * to Follow Service at Twitter). The vertices of the circle are the hubs;
 * everything they follow is an authority. Hub and authority scores are
 * computed by alternating random walk steps on the bipartite hub-authority
 * graph, and the best authorities are the recommendations.
 *
 * The hub-authority graph is a simple graph: parallel edges of the
 * underlying graph count once, so the out-degree of a hub is its number of
 * distinct out-neighbors, not graph_access::out_degree().
 *
 * The object holds the state of one ego and is rebuilt for each ego. It is
 * not thread-safe; use one instance per thread.
 */

#ifndef DEF_DRUNKARDMOB_CIRCLE_OF_TRUST_SALSA
#define DEF_DRUNKARDMOB_CIRCLE_OF_TRUST_SALSA

#include <vector>
#include <algorithm>
#include <stdint.h>

#include "drunkardmob_types.hpp"
#include "graph/graph_access.hpp"

namespace drunkardmob {
    
    /** Orders by score descending, ties by smaller id. */
    struct scored_vertex_order {
        bool operator()(const scored_vertex &a, const scored_vertex &b) const {
            if (a.value != b.value) return a.value > b.value;
            return a.id < b.id;
        }
    };
    
    class circle_of_trust_salsa {
        
        graph_access &graph;
        
        std::vector<vid_t> hubs;          // in circle order
        std::vector<vid_t> authorities;   // sorted
        std::vector<size_t> hub_offsets;  // CSR over hubs, edges index authorities
        std::vector<uint32_t> hub_edges;
        std::vector<uint32_t> authority_indegree;
        
        std::vector<double> hub_scores;
        std::vector<double> authority_scores;
        
        static void normalize(std::vector<double> &x) {
            double sum = 0.0;
            for(size_t i=0; i < x.size(); i++) sum += x[i];
            if (sum <= 0.0) return;
            for(size_t i=0; i < x.size(); i++) x[i] /= sum;
        }
        
        size_t hub_outdegree(size_t h) const {
            return hub_offsets[h + 1] - hub_offsets[h];
        }
        
    public:
        circle_of_trust_salsa(graph_access &graph) : graph(graph) {}
        
        /**
         * Builds the hub-authority graph for the given circle of trust.
         * Duplicate vertices of the circle and duplicate edges are ignored.
         * Throws graph_access_error if the neighbors cannot be read.
         */
        void initialize_graph(const std::vector<vid_t> &circle) {
            hubs.clear();
            authorities.clear();
            hub_edges.clear();
            hub_offsets.assign(1, 0);
            
            std::vector<vid_t> seen;
            std::vector<std::vector<vid_t> > neighbors;
            for(size_t i=0; i < circle.size(); i++) {
                std::vector<vid_t>::iterator it = std::lower_bound(seen.begin(), seen.end(), circle[i]);
                if (it != seen.end() && *it == circle[i]) continue;
                seen.insert(it, circle[i]);
                hubs.push_back(circle[i]);
                
                std::vector<vid_t> nbrs = graph.out_neighbors(circle[i]);
                std::sort(nbrs.begin(), nbrs.end());
                nbrs.erase(std::unique(nbrs.begin(), nbrs.end()), nbrs.end());
                authorities.insert(authorities.end(), nbrs.begin(), nbrs.end());
                neighbors.push_back(nbrs);
            }
            std::sort(authorities.begin(), authorities.end());
            authorities.erase(std::unique(authorities.begin(), authorities.end()), authorities.end());
            
            authority_indegree.assign(authorities.size(), 0);
            for(size_t h=0; h < hubs.size(); h++) {
                for(size_t j=0; j < neighbors[h].size(); j++) {
                    uint32_t a = (uint32_t) (std::lower_bound(authorities.begin(), authorities.end(), neighbors[h][j]) - authorities.begin());
                    hub_edges.push_back(a);
                    authority_indegree[a]++;
                }
                hub_offsets.push_back(hub_edges.size());
            }
            
            hub_scores.assign(hubs.size(), hubs.empty() ? 0.0 : 1.0 / hubs.size());
            authority_scores.assign(authorities.size(), 0.0);
        }
        
        void initialize_graph(const std::vector<id_count> &circle) {
            std::vector<vid_t> ids(circle.size());
            for(size_t i=0; i < circle.size(); i++) ids[i] = circle[i].id;
            initialize_graph(ids);
        }
        
        /**
         * Runs niters SALSA iterations. Scores on both sides sum to one after
         * every iteration, except when the graph has no edges, in which case
         * the authority scores stay zero and the hub scores uniform.
         */
        void compute_salsa(int niters) {
            if (hub_edges.empty()) return;
            
            for(int iter=0; iter < niters; iter++) {
                // Hubs to authorities
                std::fill(authority_scores.begin(), authority_scores.end(), 0.0);
                for(size_t h=0; h < hubs.size(); h++) {
                    size_t deg = hub_outdegree(h);
                    if (deg == 0) continue;
                    double share = hub_scores[h] / deg;
                    for(size_t e = hub_offsets[h]; e < hub_offsets[h + 1]; e++) {
                        authority_scores[hub_edges[e]] += share;
                    }
                }
                normalize(authority_scores);
                
                // Authorities back to hubs
                std::vector<double> newhubs(hubs.size(), 0.0);
                for(size_t h=0; h < hubs.size(); h++) {
                    for(size_t e = hub_offsets[h]; e < hub_offsets[h + 1]; e++) {
                        uint32_t a = hub_edges[e];
                        newhubs[h] += authority_scores[a] / authority_indegree[a];
                    }
                }
                normalize(newhubs);
                hub_scores.swap(newhubs);
            }
        }
        
        /**
         * Returns at most K authorities not in 'exclude', by score descending.
         * Ties are broken by smaller vertex id.
         */
        std::vector<scored_vertex> top_authorities(int K, const std::vector<vid_t> &exclude) const {
            std::vector<vid_t> excl(exclude);
            std::sort(excl.begin(), excl.end());
            
            std::vector<scored_vertex> candidates;
            for(size_t a=0; a < authorities.size(); a++) {
                if (std::binary_search(excl.begin(), excl.end(), authorities[a])) continue;
                candidates.push_back(scored_vertex(authorities[a], authority_scores[a]));
            }
            size_t n = K < 0 ? 0 : std::min((size_t) K, candidates.size());
            std::partial_sort(candidates.begin(), candidates.begin() + n, candidates.end(), scored_vertex_order());
            candidates.resize(n);
            return candidates;
        }
        
        size_t num_hubs() const {
            return hubs.size();
        }
        
        size_t num_authorities() const {
            return authorities.size();
        }
        
        size_t num_edges() const {
            return hub_edges.size();
        }
        
        /** Score of a hub, 0 if v is not a hub. */
        double hub_score(vid_t v) const {
            for(size_t h=0; h < hubs.size(); h++) {
                if (hubs[h] == v) return hub_scores[h];
            }
            return 0.0;
        }
        
        /** Score of an authority, 0 if v is not an authority. */
        double authority_score(vid_t v) const {
            std::vector<vid_t>::const_iterator it = std::lower_bound(authorities.begin(), authorities.end(), v);
            if (it == authorities.end() || *it != v) return 0.0;
            return authority_scores[it - authorities.begin()];
        }
        
        const std::vector<vid_t> & get_hubs() const {
            return hubs;
        }
        
        const std::vector<vid_t> & get_authorities() const {
            return authorities;
        }
    };
    
}

#endif

