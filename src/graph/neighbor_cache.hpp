
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
 * Bounded LRU cache of out-neighbor lists, sized by a byte budget.
 * Shared by the ranking workers; all operations take the cache lock.
 */

#ifndef DEF_DRUNKARDMOB_NEIGHBOR_CACHE
#define DEF_DRUNKARDMOB_NEIGHBOR_CACHE

#include <list>
#include <map>
#include <vector>

#include "drunkardmob_types.hpp"
#include "util/pthread_tools.hpp"

namespace drunkardmob {
    
    class neighbor_cache {
        
        struct cache_entry {
            std::vector<vid_t> neighbors;
            std::list<vid_t>::iterator lru_pos;
        };
        
        typedef std::map<vid_t, cache_entry> cache_map_t;
        
        size_t budget_bytes;
        size_t used_bytes;
        cache_map_t entries;
        std::list<vid_t> lru;    // front = most recently used
        size_t nhits, nmisses, nevictions;
        mutex lock;
        
    public:
        /** Bytes charged to the budget for one list. */
        static size_t entry_size(size_t nneighbors) {
            return sizeof(vid_t) * nneighbors + sizeof(cache_entry) + 4 * sizeof(void*);
        }
        
        neighbor_cache(size_t budget_bytes) : budget_bytes(budget_bytes), used_bytes(0),
                nhits(0), nmisses(0), nevictions(0) {}
        
        /**
         * Copies the cached neighbors of v to 'out'. Returns false on a miss.
         */
        bool get(vid_t v, std::vector<vid_t> &out) {
            scoped_lock<mutex> guard(lock);
            cache_map_t::iterator it = entries.find(v);
            if (it == entries.end()) {
                nmisses++;
                return false;
            }
            nhits++;
            lru.splice(lru.begin(), lru, it->second.lru_pos);
            out = it->second.neighbors;
            return true;
        }
        
        /**
         * Inserts the neighbor list of v, evicting least recently used
         * lists until it fits. Lists larger than the budget are not cached.
         */
        void put(vid_t v, const std::vector<vid_t> &neighbors) {
            size_t sz = entry_size(neighbors.size());
            if (sz > budget_bytes) return;
            scoped_lock<mutex> guard(lock);
            if (entries.count(v) > 0) return;
            while (used_bytes + sz > budget_bytes && !lru.empty()) {
                vid_t victim = lru.back();
                lru.pop_back();
                cache_map_t::iterator vit = entries.find(victim);
                used_bytes -= entry_size(vit->second.neighbors.size());
                entries.erase(vit);
                nevictions++;
            }
            lru.push_front(v);
            cache_entry &e = entries[v];
            e.neighbors = neighbors;
            e.lru_pos = lru.begin();
            used_bytes += sz;
        }
        
        size_t size() {
            scoped_lock<mutex> guard(lock);
            return entries.size();
        }
        
        size_t memory_used() {
            scoped_lock<mutex> guard(lock);
            return used_bytes;
        }
        
        size_t hits() {
            scoped_lock<mutex> guard(lock);
            return nhits;
        }
        
        size_t misses() {
            scoped_lock<mutex> guard(lock);
            return nmisses;
        }
        
        size_t evictions() {
            scoped_lock<mutex> guard(lock);
            return nevictions;
        }
    };
    
}

#endif

