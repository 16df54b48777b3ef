
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
 * Interface of the walk companion, the service that aggregates the visits
 * of tracked walks into per-source visit distributions. The walk engine and
 * the recommendation pipeline only depend on this interface; the companion
 * may run in the same process (local_companion) or behind a socket
 * (remote_companion).
 */

#ifndef DEF_DRUNKARDMOB_COMPANION
#define DEF_DRUNKARDMOB_COMPANION

#include <vector>

#include "drunkardmob_types.hpp"

namespace drunkardmob {
    
    class walk_companion {
    public:
        virtual ~walk_companion() {}
        
        /**
         * Sets the vertices whose visits are not counted for walks
         * started from 'source'. Must be called before any visit of the source
         * is recorded.
         */
        virtual void set_avoidance(vid_t source, const std::vector<vid_t> &vertices) = 0;
        
        /**
         * Records a batch of visits. Returns without waiting for the
         * visits to be merged.
         */
        virtual void record_visits(const std::vector<visit> &visits) = 0;
        
        /**
         * Blocks until all previously recorded visits have been merged.
         */
        virtual void flush() = 0;
        
        /**
         * Returns at most topN most visited vertices of the source, by count descending.
         * Ties are broken by smaller vertex id.
         */
        virtual std::vector<id_count> get_top(vid_t source, int topN) = 0;
        
        /**
         * Drops the visit distribution of the source.
         */
        virtual void discard(vid_t source) = 0;
    };
    
}

#endif

