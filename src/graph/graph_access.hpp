
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
 * Graph access contract used by the walk engine and by SALSA.
 * The walk engine processes the graph partition by partition, SALSA and
 * the recommendation stage issue point queries for out-neighbors.
 * Implementations must be safe for concurrent out_neighbors() and
 * out_degree() calls.
 */

#ifndef DEF_DRUNKARDMOB_GRAPH_ACCESS
#define DEF_DRUNKARDMOB_GRAPH_ACCESS

#include <vector>
#include <sstream>

#include "drunkardmob_types.hpp"
#include "graph/memory_partition.hpp"
#include "util/drunkardmob_errors.hpp"

namespace drunkardmob {
    
    class graph_access {
        
    public:
        virtual ~graph_access() {}
        
        virtual size_t num_vertices() = 0;
        
        virtual int num_partitions() = 0;
        
        /** Inclusive vertex interval of partition p. */
        virtual vertex_interval partition_interval(int p) = 0;
        
        /**
         * Loads partition p to memory. Caller owns the returned object.
         * Throws graph_access_error if the partition is missing or corrupt.
         */
        virtual memory_partition * load_partition(int p) = 0;
        
        /**
         * Out-neighbors of v in stable order.
         */
        virtual std::vector<vid_t> out_neighbors(vid_t v) = 0;
        
        virtual size_t out_degree(vid_t v) = 0;
        
        /**
         * Returns the partition containing v. Throws graph_access_error
         * if v is not in any partition.
         */
        int partition_of(vid_t v) {
            int lo = 0, hi = num_partitions() - 1;
            while (lo <= hi) {
                int mid = (lo + hi) / 2;
                vertex_interval iv = partition_interval(mid);
                if (v < iv.first) {
                    hi = mid - 1;
                } else if (v > iv.second) {
                    lo = mid + 1;
                } else {
                    return mid;
                }
            }
            std::stringstream ss;
            ss << "Vertex " << v << " is not in any partition (num vertices: " << num_vertices() << ")";
            throw graph_access_error(ss.str());
        }
    };
    
}

#endif

