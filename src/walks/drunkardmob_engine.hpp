
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
 * DrunkardMob engine: simulates a large number of random walks over a
 * partitioned graph. The graph is processed one partition at a time; all
 * walks residing in the loaded partition are advanced by one step in
 * parallel, and walks that move to another partition are buffered until the
 * next pass. Tracked visits are sent to the walk companion.
 *
 * Random numbers are drawn from a generator seeded with the run seed, the
 * pass and the vertex, so the result of a run does not depend on the number
 * of threads.
 */

#ifndef DEF_DRUNKARDMOB_ENGINE
#define DEF_DRUNKARDMOB_ENGINE

#include <vector>
#include <sstream>
#include <stdint.h>
#include <omp.h>

#include "drunkardmob_types.hpp"
#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "graph/graph_access.hpp"
#include "util/drunkardmob_errors.hpp"
#include "walks/walk_state.hpp"
#include "walks/walk_update.hpp"
#include "walks/walk_manager.hpp"
#include "walks/companion.hpp"

namespace drunkardmob {
    
    /**
     * Seed of the generator used for one vertex in one pass.
     */
    inline uint32_t vertex_seed(uint64_t seed, int pass, vid_t vertex) {
        uint64_t z = seed + 0x9E3779B97F4A7C15ULL * ((uint64_t) pass + 1) + ((uint64_t) vertex << 20) + vertex;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        z = z ^ (z >> 31);
        return (uint32_t) (z ^ (z >> 32));
    }
    
    class drunkardmob_engine {
        
        graph_access &graph;
        file_logger &logger;
        metrics &m;
        
        walk_source_range sources;
        size_t walks_per_source;
        uint64_t seed;
        int exec_threads;
        
        walk_manager * manager;
        walk_statistics stats;
        
        /**
         * Start offsets of the runs of walks residing at the same vertex.
         * The last entry is walks.size().
         */
        void group_by_vertex(const std::vector<walk_t> &walks, const memory_partition &part, std::vector<size_t> &groups) {
            groups.clear();
            for(size_t i=0; i < walks.size(); i++) {
                if (i == 0 || walk_vertex(walks[i]) != walk_vertex(walks[i - 1])) {
                    if (!part.contains(walk_vertex(walks[i]))) {
                        std::stringstream ss;
                        ss << "Walk at vertex " << walk_vertex(walks[i]) << " outside partition interval ["
                           << part.first_vertex() << ", " << part.last_vertex() << "]";
                        throw graph_access_error(ss.str());
                    }
                    groups.push_back(i);
                }
            }
            groups.push_back(walks.size());
        }
        
        void set_avoidance_lists(const memory_partition &part, walk_update_function &update, walk_companion &companion) {
            for(vid_t v = part.first_vertex(); v <= part.last_vertex(); v++) {
                if (sources.contains(v)) {
                    companion.set_avoidance(v, update.not_tracked_vertices(v, part.outedges(v), part.num_outedges(v)));
                }
                if (v == part.last_vertex()) break;
            }
        }
        
        /* Moves the produced walks to the buckets of their partitions */
        void distribute(const std::vector<walk_t> &walks) {
            int nparts = graph.num_partitions();
            std::vector<std::vector<walk_t> > bypart(nparts);
            for(size_t i=0; i < walks.size(); i++) {
                bypart[graph.partition_of(walk_vertex(walks[i]))].push_back(walks[i]);
            }
            for(int p=0; p < nparts; p++) {
                if (!bypart[p].empty()) manager->add_next(p, &bypart[p][0], bypart[p].size());
            }
        }
        
        void process_partition(int pass, int p, walk_update_function &update, walk_companion &companion) {
            std::vector<walk_t> &walks = manager->current(p);
            vertex_interval iv = graph.partition_interval(p);
            bool has_sources = sources.first <= iv.second && (uint64_t) sources.first + sources.count > iv.first;
            if (walks.empty() && (pass > 0 || !has_sources)) {
                logstream(logger, LOG_DEBUG) << "Pass " << pass << ": no walks in partition " << p << std::endl;
                return;
            }
            
            metrics_entry lme = m.start_time();
            memory_partition * part = graph.load_partition(p);
            m.stop_time(lme, "walks.load_partition");
            
            try {
                if (pass == 0) {
                    set_avoidance_lists(*part, update, companion);
                }
                
                std::vector<size_t> groups;
                group_by_vertex(walks, *part, groups);
                int ngroups = (int) groups.size() - 1;
                
                std::vector<walk_step_output> outputs(exec_threads);
                
                metrics_entry eme = m.start_time();
                omp_set_num_threads(exec_threads);
#pragma omp parallel for schedule(dynamic, 64)
                for(int g=0; g < ngroups; g++) {
                    walk_step_output &out = outputs[omp_get_thread_num()];
                    vid_t v = walk_vertex(walks[groups[g]]);
                    vertex_walks vw(v, part->outedges(v), part->num_outedges(v), &walks[groups[g]], groups[g + 1] - groups[g]);
                    random_generator rnd(vertex_seed(seed, pass, v));
                    update.process_walks_at_vertex(vw, sources, rnd, out);
                }
                m.stop_time(eme, "walks.execute");
                
                for(int t=0; t < exec_threads; t++) {
                    distribute(outputs[t].walks);
                    companion.record_visits(outputs[t].visits);
                    stats.add(outputs[t].stats);
                }
                
                logstream(logger, LOG_DEBUG) << "Pass " << pass << ", partition " << p << ": " << walks.size() << " walks at "
                    << ngroups << " vertices, " << part->num_edges() << " edges" << std::endl;
            } catch (...) {
                delete part;
                throw;
            }
            delete part;
            manager->release_current(p);
        }
        
    public:
        drunkardmob_engine(graph_access &graph, file_logger &logger, metrics &m) : graph(graph), logger(logger), m(m),
            walks_per_source(0), seed(0), manager(NULL) {
            exec_threads = omp_get_max_threads();
        }
        
        ~drunkardmob_engine() {
            if (manager != NULL) delete manager;
        }
        
        /**
         * Creates walks_per_source walks for each source in
         * [first_source, first_source + num_sources), positioned at their sources.
         */
        void configure_source_range(vid_t first_source, vid_t num_sources, size_t walks_per_source) {
            if (num_sources == 0 || walks_per_source == 0) {
                throw configuration_error("Number of sources and walks per source must be positive");
            }
            if ((uint64_t) first_source + num_sources > graph.num_vertices()) {
                std::stringstream ss;
                ss << "Source range [" << first_source << ", " << ((uint64_t) first_source + num_sources)
                   << ") exceeds the number of vertices " << graph.num_vertices();
                throw configuration_error(ss.str());
            }
            sources = walk_source_range(first_source, num_sources);
            this->walks_per_source = walks_per_source;
            
            if (manager != NULL) delete manager;
            manager = new walk_manager(graph.num_partitions());
            
            for(vid_t s=0; s < num_sources; s++) {
                vid_t source = first_source + s;
                int p = graph.partition_of(source);
                walk_t w = make_walk(s, source, false);
                for(size_t i=0; i < walks_per_source; i++) {
                    manager->add_initial(p, w);
                }
            }
            logstream(logger, LOG_INFO) << "Configured " << num_sources << " sources starting from " << first_source
                << ", " << walks_per_source << " walks per source" << std::endl;
        }
        
        void set_seed(uint64_t seed) {
            this->seed = seed;
        }
        
        uint64_t get_seed() const {
            return seed;
        }
        
        void set_exec_threads(int nthreads) {
            if (nthreads <= 0) {
                throw configuration_error("Number of execution threads must be positive");
            }
            exec_threads = nthreads;
        }
        
        int get_exec_threads() const {
            return exec_threads;
        }
        
        const walk_source_range & get_sources() const {
            return sources;
        }
        
        size_t num_walks() const {
            return manager == NULL ? 0 : manager->num_current();
        }
        
        /** Counters accumulated over all runs. */
        const walk_statistics & get_statistics() const {
            return stats;
        }
        
        /**
         * Runs niters passes over the graph and flushes the companion.
         */
        void run(walk_update_function &update, walk_companion &companion, int niters) {
            if (manager == NULL) {
                throw configuration_error("Source range must be configured before running the walks");
            }
            if (niters < 0) {
                throw configuration_error("Number of iterations must not be negative");
            }
            
            logstream(logger, LOG_INFO) << "DrunkardMob starting: " << manager->num_current() << " walks, " << niters
                << " iterations, " << graph.num_partitions() << " partitions, " << exec_threads << " threads, seed "
                << seed << std::endl;
            
            m.start_time("walks.runtime");
            for(int pass=0; pass < niters; pass++) {
                metrics_entry pme = m.start_time();
                for(int p=0; p < graph.num_partitions(); p++) {
                    process_partition(pass, p, update, companion);
                }
                manager->flip();
                m.stop_time(pme, "walks.pass");
                logstream(logger, LOG_INFO) << "Pass " << pass << " done, " << stats.steps << " steps, "
                    << stats.tracked << " tracked visits" << std::endl;
            }
            companion.flush();
            m.stop_time("walks.runtime");
            
            m.set("walks.steps", (size_t) stats.steps);
            m.set("walks.forwarded", (size_t) stats.forwarded);
            m.set("walks.tracked", (size_t) stats.tracked);
            m.set("walks.untracked_hops", (size_t) stats.untracked_hops);
            m.set("walks.resets", (size_t) stats.resets);
            m.set("walks.deadend_resets", (size_t) stats.deadend_resets);
        }
    };
    
}

#endif

