
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
 * Graph held completely in memory as adjacency lists, split into
 * partitions for the walk engine. Useful for small graphs and tests.
 */

#ifndef DEF_DRUNKARDMOB_INMEMORY_GRAPH
#define DEF_DRUNKARDMOB_INMEMORY_GRAPH

#include <vector>

#include "graph/graph_access.hpp"
#include "graph/partition_format.hpp"

namespace drunkardmob {
    
    class inmemory_graph : public graph_access {
        
        std::vector<std::vector<vid_t> > adjacency;
        std::vector<vertex_interval> intervals;
        
    public:
        
        inmemory_graph(size_t nvertices) : adjacency(nvertices) {
            set_partitions(1);
        }
        
        inmemory_graph(const std::vector<std::vector<vid_t> > &adjacency, int nparts = 1) : adjacency(adjacency) {
            set_partitions(nparts);
        }
        
        /**
         * Adds edge from -> to. Grows the graph if needed and resets to
         * one partition; call set_partitions() when done.
         */
        void add_edge(vid_t from, vid_t to) {
            size_t needed = (size_t) std::max(from, to) + 1;
            if (adjacency.size() < needed) adjacency.resize(needed);
            adjacency[from].push_back(to);
            set_partitions(1);
        }
        
        void set_partitions(int nparts) {
            intervals.clear();
            if (adjacency.empty()) return;
            intervals = balanced_intervals(adjacency, nparts);
        }
        
        const std::vector<std::vector<vid_t> > & get_adjacency() const {
            return adjacency;
        }
        
        virtual size_t num_vertices() {
            return adjacency.size();
        }
        
        virtual int num_partitions() {
            return (int) intervals.size();
        }
        
        virtual vertex_interval partition_interval(int p) {
            return intervals[p];
        }
        
        virtual memory_partition * load_partition(int p) {
            vertex_interval iv = intervals[p];
            std::vector<uint64_t> offsets;
            std::vector<vid_t> edges;
            offsets.push_back(0);
            for(vid_t v = iv.first; v <= iv.second; v++) {
                edges.insert(edges.end(), adjacency[v].begin(), adjacency[v].end());
                offsets.push_back(edges.size());
            }
            return new memory_partition(iv.first, iv.second, offsets, edges);
        }
        
        virtual std::vector<vid_t> out_neighbors(vid_t v) {
            if (v >= adjacency.size()) partition_of(v);  // throws
            return adjacency[v];
        }
        
        virtual size_t out_degree(vid_t v) {
            if (v >= adjacency.size()) partition_of(v);
            return adjacency[v].size();
        }
    };
    
}

#endif

