
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
 * Graph stored on disk as partition files (see partition_format.hpp).
 * Partitions are loaded whole by the walk engine; point queries read
 * single adjacency lists through the partition index and keep them in a
 * shared LRU neighbor cache.
 */

#ifndef DEF_DRUNKARDMOB_PARTITIONED_GRAPH
#define DEF_DRUNKARDMOB_PARTITIONED_GRAPH

#include <string>
#include <vector>

#include "graph/graph_access.hpp"
#include "graph/neighbor_cache.hpp"
#include "graph/partition_filenames.hpp"
#include "graph/partition_format.hpp"
#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "util/pthread_tools.hpp"

namespace drunkardmob {
    
    class partitioned_graph : public graph_access {
        
        std::string base_filename;
        int nparts;
        std::vector<vertex_interval> intervals;
        
        /* Lazily opened readers and their indices, guarded by index_lock */
        std::vector<partition_reader *> readers;
        std::vector<std::vector<uint64_t> > indices;
        std::vector<bool> index_loaded;
        mutex index_lock;
        
        neighbor_cache cache;
        file_logger &lg;
        
        partitioned_graph(const partitioned_graph&);
        partitioned_graph& operator=(const partitioned_graph&);
        
        /**
         * Returns the reader of partition p with its index loaded.
         */
        partition_reader * indexed_reader(int p) {
            scoped_lock<mutex> guard(index_lock);
            if (!index_loaded[p]) {
                if (readers[p] == NULL) {
                    readers[p] = new partition_reader(filename_partition(base_filename, p, nparts));
                    check_interval(p, readers[p]);
                }
                readers[p]->read_index(indices[p]);
                index_loaded[p] = true;
                logstream(lg, LOG_DEBUG) << "Loaded index of partition " << p << ", "
                    << readers[p]->num_edges() << " edges" << std::endl;
            }
            return readers[p];
        }
        
        void check_interval(int p, partition_reader * reader) {
            if (reader->first_vertex() != intervals[p].first || reader->last_vertex() != intervals[p].second) {
                std::stringstream ss;
                ss << "Partition " << p << " covers " << reader->first_vertex() << " - " << reader->last_vertex()
                   << " but intervals file says " << intervals[p].first << " - " << intervals[p].second;
                throw graph_access_error(ss.str());
            }
        }
        
    public:
        
        /**
         * @param nparts number of partitions; 0 = detect from the intervals file
         * @param cache_budget_bytes byte budget of the neighbor cache
         */
        partitioned_graph(std::string base_filename, int _nparts, size_t cache_budget_bytes, file_logger &lg)
            : base_filename(base_filename), nparts(_nparts), cache(cache_budget_bytes), lg(lg) {
            if (nparts == 0) {
                nparts = find_partitions(base_filename);
                if (nparts == 0) {
                    throw graph_access_error("Could not find partitions for " + base_filename);
                }
                logstream(lg, LOG_INFO) << "Detected number of partitions: " << nparts << std::endl;
            }
            load_vertex_intervals(base_filename, nparts, intervals);
            for(int p=0; p < nparts; p++) {
                logstream(lg, LOG_DEBUG) << "partition: " << intervals[p].first << " - " << intervals[p].second << std::endl;
                if (!file_exists(filename_partition(base_filename, p, nparts))) {
                    throw graph_access_error("Missing partition file: " + filename_partition(base_filename, p, nparts));
                }
            }
            readers.resize(nparts, NULL);
            indices.resize(nparts);
            index_loaded.resize(nparts, false);
        }
        
        virtual ~partitioned_graph() {
            for(size_t i=0; i < readers.size(); i++) {
                if (readers[i] != NULL) delete readers[i];
            }
        }
        
        virtual size_t num_vertices() {
            return (size_t) intervals[nparts - 1].second + 1;
        }
        
        virtual int num_partitions() {
            return nparts;
        }
        
        virtual vertex_interval partition_interval(int p) {
            return intervals[p];
        }
        
        virtual memory_partition * load_partition(int p) {
            partition_reader reader(filename_partition(base_filename, p, nparts));
            check_interval(p, &reader);
            return reader.load();
        }
        
        virtual std::vector<vid_t> out_neighbors(vid_t v) {
            std::vector<vid_t> res;
            if (cache.get(v, res)) return res;
            int p = partition_of(v);
            partition_reader * reader = indexed_reader(p);
            reader->read_neighbors(v, indices[p], res);
            cache.put(v, res);
            return res;
        }
        
        virtual size_t out_degree(vid_t v) {
            int p = partition_of(v);
            indexed_reader(p);
            size_t i = v - intervals[p].first;
            return (size_t) (indices[p][i + 1] - indices[p][i]);
        }
        
        neighbor_cache & get_cache() {
            return cache;
        }
        
        void report_metrics(metrics &m) {
            m.set("graph.cache.hits", cache.hits());
            m.set("graph.cache.misses", cache.misses());
            m.set("graph.cache.evictions", cache.evictions());
            m.set("graph.cache.bytes", cache.memory_used());
        }
    };
    
}

#endif

