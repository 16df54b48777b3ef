
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
 * Keeps the walk tokens in per-partition buckets. Walks for the current
 * pass are read from one set of buckets while the walks produced by the
 * pass are written to the other; flip() swaps them at the pass barrier.
 */

#ifndef DEF_DRUNKARDMOB_WALK_MANAGER
#define DEF_DRUNKARDMOB_WALK_MANAGER

#include <vector>
#include <algorithm>

#include "walks/walk_state.hpp"
#include "util/pthread_tools.hpp"

namespace drunkardmob {
    
    class walk_manager {
        
        std::vector<std::vector<walk_t> > buckets[2];
        std::vector<mutex> locks;
        int cur;
        
    public:
        walk_manager(int nparts) : locks(nparts), cur(0) {
            buckets[0].resize(nparts);
            buckets[1].resize(nparts);
        }
        
        int num_partitions() const {
            return (int) buckets[0].size();
        }
        
        /** Adds a walk to be processed in the current pass. */
        void add_initial(int partition, walk_t w) {
            buckets[cur][partition].push_back(w);
        }
        
        /** Adds walks to be processed in the next pass. Thread-safe. */
        void add_next(int partition, const walk_t * walks, size_t n) {
            if (n == 0) return;
            scoped_lock<mutex> guard(locks[partition]);
            std::vector<walk_t> &b = buckets[1 - cur][partition];
            b.insert(b.end(), walks, walks + n);
        }
        
        void add_next(int partition, walk_t w) {
            add_next(partition, &w, 1);
        }
        
        /**
         * Walks of the current pass residing in the partition,
         * sorted so that walks at the same vertex are adjacent.
         */
        std::vector<walk_t> & current(int partition) {
            std::vector<walk_t> &b = buckets[cur][partition];
            std::sort(b.begin(), b.end());
            return b;
        }
        
        /** Releases the memory of a processed bucket. */
        void release_current(int partition) {
            std::vector<walk_t>().swap(buckets[cur][partition]);
        }
        
        /** Pass barrier: the walks produced become current. */
        void flip() {
            for(size_t p=0; p < buckets[cur].size(); p++) {
                std::vector<walk_t>().swap(buckets[cur][p]);
            }
            cur = 1 - cur;
        }
        
        size_t num_current() const {
            size_t n = 0;
            for(size_t p=0; p < buckets[cur].size(); p++) n += buckets[cur][p].size();
            return n;
        }
        
        size_t num_next() const {
            size_t n = 0;
            for(size_t p=0; p < buckets[1 - cur].size(); p++) n += buckets[1 - cur][p].size();
            return n;
        }
    };
    
}

#endif

