
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
 * Visit distribution of one source vertex: how many times tracked walks
 * started from the source visited each vertex. Stored as a sorted array of
 * vertex ids with a parallel array of counts. New visits are appended to a
 * small buffer which is merged into the sorted arrays when it fills up or
 * when the distribution is queried.
 */

#ifndef DEF_DRUNKARDMOB_VISIT_DISTRIBUTION
#define DEF_DRUNKARDMOB_VISIT_DISTRIBUTION

#include <vector>
#include <algorithm>
#include <stdint.h>

#include "drunkardmob_types.hpp"

#define VISIT_BUFFER_SIZE 512

namespace drunkardmob {
    
    /** Orders by count descending, ties by smaller id. */
    struct id_count_order {
        bool operator()(const id_count &a, const id_count &b) const {
            if (a.count != b.count) return a.count > b.count;
            return a.id < b.id;
        }
    };
    
    struct id_order {
        bool operator()(const id_count &a, const id_count &b) const {
            return a.id < b.id;
        }
    };
    
    class visit_distribution {
        
        std::vector<vid_t> ids;
        std::vector<uint32_t> counts;
        std::vector<vid_t> buffer;
        std::vector<vid_t> avoid;   // sorted
        uint64_t navoided;
        uint64_t ntotal;
        
    public:
        visit_distribution() : navoided(0), ntotal(0) {}
        
        void set_avoidance(const std::vector<vid_t> &vertices) {
            avoid = vertices;
            std::sort(avoid.begin(), avoid.end());
            avoid.erase(std::unique(avoid.begin(), avoid.end()), avoid.end());
        }
        
        bool is_avoided(vid_t v) const {
            return std::binary_search(avoid.begin(), avoid.end(), v);
        }
        
        void add(vid_t v) {
            if (is_avoided(v)) {
                navoided++;
                return;
            }
            ntotal++;
            buffer.push_back(v);
            if (buffer.size() >= VISIT_BUFFER_SIZE) {
                merge();
            }
        }
        
        /**
         * Merges the buffered visits into the sorted arrays.
         */
        void merge() {
            if (buffer.empty()) return;
            std::sort(buffer.begin(), buffer.end());
            
            std::vector<vid_t> newids;
            std::vector<uint32_t> newcounts;
            newids.reserve(ids.size() + buffer.size());
            newcounts.reserve(ids.size() + buffer.size());
            
            size_t i = 0, j = 0;
            while (i < ids.size() || j < buffer.size()) {
                if (j == buffer.size() || (i < ids.size() && ids[i] < buffer[j])) {
                    newids.push_back(ids[i]);
                    newcounts.push_back(counts[i]);
                    i++;
                } else {
                    vid_t v = buffer[j];
                    uint32_t c = 0;
                    while (j < buffer.size() && buffer[j] == v) {
                        c++; j++;
                    }
                    if (i < ids.size() && ids[i] == v) {
                        c += counts[i];
                        i++;
                    }
                    newids.push_back(v);
                    newcounts.push_back(c);
                }
            }
            ids.swap(newids);
            counts.swap(newcounts);
            buffer.clear();
        }
        
        /**
         * Keeps the 'keep' most visited entries (ties by smaller id) and
         * drops the rest. Returns the number of removed entries.
         */
        size_t shrink(size_t keep) {
            merge();
            if (ids.size() <= keep) return 0;
            std::vector<id_count> all(ids.size());
            for(size_t i=0; i < ids.size(); i++) {
                all[i] = id_count(ids[i], counts[i]);
            }
            std::nth_element(all.begin(), all.begin() + keep, all.end(), id_count_order());
            all.resize(keep);
            std::sort(all.begin(), all.end(), id_order());
            
            size_t removed = ids.size() - keep;
            std::vector<vid_t> newids(keep);
            std::vector<uint32_t> newcounts(keep);
            for(size_t i=0; i < keep; i++) {
                newids[i] = all[i].id;
                newcounts[i] = all[i].count;
            }
            ids.swap(newids);
            counts.swap(newcounts);
            std::vector<vid_t>().swap(buffer);
            return removed;
        }
        
        /**
         * Returns at most topN entries, by count descending and id ascending.
         */
        std::vector<id_count> top(int topN) {
            merge();
            std::vector<id_count> all(ids.size());
            for(size_t i=0; i < ids.size(); i++) {
                all[i] = id_count(ids[i], counts[i]);
            }
            size_t n = topN < 0 ? 0 : std::min((size_t) topN, all.size());
            std::partial_sort(all.begin(), all.begin() + n, all.end(), id_count_order());
            all.resize(n);
            return all;
        }
        
        uint32_t count_of(vid_t v) {
            merge();
            std::vector<vid_t>::iterator it = std::lower_bound(ids.begin(), ids.end(), v);
            if (it == ids.end() || *it != v) return 0;
            return counts[it - ids.begin()];
        }
        
        size_t num_entries() {
            merge();
            return ids.size();
        }
        
        /** Number of visits counted, including evicted ones. */
        uint64_t total_count() const {
            return ntotal;
        }
        
        uint64_t num_avoided() const {
            return navoided;
        }
        
        size_t memory_bytes() const {
            return sizeof(visit_distribution) + ids.capacity() * sizeof(vid_t) + counts.capacity() * sizeof(uint32_t) +
                buffer.capacity() * sizeof(vid_t) + avoid.capacity() * sizeof(vid_t);
        }
    };
    
}

#endif

