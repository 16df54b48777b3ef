
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
 * Walk tokens. A walk is a 64-bit value packing its current vertex
 * (high 32 bits), a hop bit telling whether the walk has left its source
 * since the last reset, and the index of its source within the configured
 * source range (low 31 bits). Sorting tokens groups walks by vertex.
 *
 * Reference:
 * Kyrola, A. (2013). DrunkardMob: Billions of Random Walks on Just a PC. In
 * RecSys (pp. 257-264).
 */

#ifndef DEF_DRUNKARDMOB_WALK_STATE
#define DEF_DRUNKARDMOB_WALK_STATE

#include <stdint.h>
#include <sstream>

#include "drunkardmob_types.hpp"
#include "util/drunkardmob_errors.hpp"

#define WALK_HOP_BIT      31
#define WALK_SOURCE_MASK  ((1u << WALK_HOP_BIT) - 1)

namespace drunkardmob {
    
    typedef uint64_t walk_t;
    
    inline walk_t make_walk(uint32_t source_idx, vid_t vertex, bool hop) {
        return ((walk_t) vertex << 32) | ((walk_t) (hop ? 1 : 0) << WALK_HOP_BIT) | (source_idx & WALK_SOURCE_MASK);
    }
    
    inline vid_t walk_vertex(walk_t w) {
        return (vid_t) (w >> 32);
    }
    
    inline uint32_t walk_source_idx(walk_t w) {
        return (uint32_t) (w & WALK_SOURCE_MASK);
    }
    
    /** True if the walk has made at least one hop since it was started or reset. */
    inline bool walk_has_hopped(walk_t w) {
        return ((w >> WALK_HOP_BIT) & 1) != 0;
    }
    
    /**
     * Contiguous range of source vertices [first, first + count).
     */
    struct walk_source_range {
        vid_t first;
        uint32_t count;
        
        walk_source_range() : first(0), count(0) {}
        walk_source_range(vid_t first, uint32_t count) : first(first), count(count) {
            if (count > WALK_SOURCE_MASK + 1u) {
                std::stringstream ss;
                ss << "Too many sources: " << count << " (max " << (WALK_SOURCE_MASK + 1u) << ")";
                throw configuration_error(ss.str());
            }
        }
        
        bool contains(vid_t v) const {
            return v >= first && (uint64_t) v < (uint64_t) first + count;
        }
        
        vid_t source_of(walk_t w) const {
            return first + walk_source_idx(w);
        }
        
        uint32_t index_of(vid_t source) const {
            return source - first;
        }
        
        /** Token of a walk that restarts at its own source. */
        walk_t reset(walk_t w) const {
            return make_walk(walk_source_idx(w), source_of(w), false);
        }
        
        /** Token of a walk that moved to 'dst'. */
        walk_t forward(walk_t w, vid_t dst) const {
            return make_walk(walk_source_idx(w), dst, true);
        }
    };
    
}

#endif

