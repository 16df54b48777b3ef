
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
 * In-memory view of one graph partition: the out-edges of a contiguous
 * vertex interval in compressed sparse row form. The walk engine loads one
 * partition at a time and advances the walks residing in it.
 */

#ifndef DEF_DRUNKARDMOB_MEMORY_PARTITION
#define DEF_DRUNKARDMOB_MEMORY_PARTITION

#include <vector>
#include <stdint.h>

#include "drunkardmob_types.hpp"

namespace drunkardmob {
    
    class memory_partition {
        
        vid_t first;
        vid_t last;
        std::vector<uint64_t> offsets;  // size = (last - first + 2)
        std::vector<vid_t> edges;
        
    public:
        
        memory_partition() : first(0), last(0), offsets(2, 0) {}
        
        /**
         * Takes over the given arrays. offsets must have (last - first + 2) entries,
         * offsets[i]..offsets[i+1] being the out-edges of vertex first + i.
         */
        memory_partition(vid_t first, vid_t last, std::vector<uint64_t> &_offsets, std::vector<vid_t> &_edges)
            : first(first), last(last) {
            offsets.swap(_offsets);
            edges.swap(_edges);
        }
        
        vid_t first_vertex() const {
            return first;
        }
        
        vid_t last_vertex() const {
            return last;
        }
        
        size_t num_vertices() const {
            return (size_t)(last - first) + 1;
        }
        
        size_t num_edges() const {
            return edges.size();
        }
        
        bool contains(vid_t v) const {
            return v >= first && v <= last;
        }
        
        size_t num_outedges(vid_t v) const {
            return (size_t) (offsets[v - first + 1] - offsets[v - first]);
        }
        
        /**
         * Pointer to the out-neighbors of v, num_outedges(v) entries.
         * Order is the on-disk order and stable for a run.
         */
        const vid_t * outedges(vid_t v) const {
            if (edges.empty()) return NULL;
            return &edges[0] + offsets[v - first];
        }
        
        size_t estimated_memory() const {
            return sizeof(uint64_t) * offsets.size() + sizeof(vid_t) * edges.size();
        }
    };
    
}

#endif

