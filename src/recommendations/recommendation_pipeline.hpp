
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
 * Who-to-follow recommendations with DrunkardMob and SALSA.
 *
 * Stage 1 runs personalized random walks from every ego of the batch and lets
 * the companion build each ego's visit distribution. Stage 2 takes the most
 * visited vertices of each ego as its circle of trust, runs SALSA on the
 * circle and recommends the best authorities the ego does not follow yet.
 */

#ifndef DEF_DRUNKARDMOB_RECOMMENDATION_PIPELINE
#define DEF_DRUNKARDMOB_RECOMMENDATION_PIPELINE

#include <vector>
#include <string>
#include <sstream>
#include <algorithm>
#include <stdint.h>
#include <omp.h>

#include "drunkardmob_types.hpp"
#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "graph/graph_access.hpp"
#include "walks/walk_update.hpp"
#include "walks/companion.hpp"
#include "walks/drunkardmob_engine.hpp"
#include "salsa/circle_of_trust_salsa.hpp"
#include "output/output.hpp"
#include "util/drunkardmob_errors.hpp"

#define RECOMMENDATION_CHUNK 256

namespace drunkardmob {
    
    struct pipeline_config {
        vid_t first_source;
        vid_t num_sources;
        size_t walks_per_source;
        int niters;
        int circle_size;
        int salsa_iters;
        int ntop;
        double reset_probability;
        uint64_t seed;
        int exec_threads;       // 0 = OpenMP default
        int progress_interval;
        
        pipeline_config() : first_source(0), num_sources(0), walks_per_source(1000), niters(5), circle_size(300),
            salsa_iters(4), ntop(10), reset_probability(0.15), seed(0), exec_threads(0), progress_interval(40) {}
    };
    
    class recommendation_pipeline {
        
        graph_access &graph;
        walk_companion &companion;
        file_logger &logger;
        metrics &m;
        pipeline_config config;
        identity_translate default_translate;
        const vertex_id_translate * translate;
        
        walk_statistics walkstats;
        std::vector<vid_t> failed;
        size_t nempty;
        
        enum ego_status { EGO_OK = 0, EGO_COMPANION_FAILED = 1, EGO_GRAPH_FAILED = 2, EGO_FAILED = 3 };
        
        int num_threads() const {
            return config.exec_threads > 0 ? config.exec_threads : omp_get_max_threads();
        }
        
    public:
        recommendation_pipeline(graph_access &graph, walk_companion &companion, const pipeline_config &config,
                                file_logger &logger, metrics &m) :
            graph(graph), companion(companion), logger(logger), m(m), config(config), translate(&default_translate),
            nempty(0) {
            if (config.circle_size <= 0 || config.ntop < 0 || config.salsa_iters < 0 || config.progress_interval <= 0) {
                throw configuration_error("Circle size and progress interval must be positive, ntop and SALSA iterations non-negative");
            }
        }
        
        void set_vertex_id_translate(const vertex_id_translate * t) {
            translate = (t == NULL ? &default_translate : t);
        }
        
        /**
         * Stage 1: random walks from every ego. Returns after the
         * companion has merged all visits.
         */
        void run_walks() {
            logstream(logger, LOG_INFO) << "Stage 1: random walks for " << config.num_sources << " egos starting from "
                << config.first_source << std::endl;
            metrics_entry me = m.start_time();
            
            personalized_walk_update update(config.reset_probability);
            drunkardmob_engine engine(graph, logger, m);
            if (config.exec_threads > 0) engine.set_exec_threads(config.exec_threads);
            engine.set_seed(config.seed);
            engine.configure_source_range(config.first_source, config.num_sources, config.walks_per_source);
            engine.run(update, companion, config.niters);
            walkstats = engine.get_statistics();
            
            m.stop_time(me, "recommendations.stage1");
        }
        
        /**
         * Recommendations for one ego. The ego's visit distribution is
         * discarded afterwards.
         */
        std::vector<scored_vertex> recommend(vid_t ego, circle_of_trust_salsa &salsa) {
            std::vector<id_count> circle = companion.get_top(ego, config.circle_size);
            companion.discard(ego);
            
            salsa.initialize_graph(circle);
            salsa.compute_salsa(config.salsa_iters);
            
            // Ego and its direct neighbors are not recommended
            std::vector<vid_t> do_not_recommend = graph.out_neighbors(ego);
            do_not_recommend.push_back(ego);
            return salsa.top_authorities(config.ntop, do_not_recommend);
        }
        
        /**
         * Stage 2: circle of trust and SALSA for every ego, in parallel.
         * Results are written in ascending ego order. Egos whose companion
         * request or any other step fails are skipped and listed in
         * failed_egos(); a graph_access_error ends the batch.
         */
        void compute_recommendations(irecommendation_output &output) {
            int nthreads = num_threads();
            logstream(logger, LOG_INFO) << "Stage 2: SALSA recommendations with " << nthreads << " threads" << std::endl;
            metrics_entry me = m.start_time();
            
            std::vector<circle_of_trust_salsa *> salsas;
            for(int t=0; t < nthreads; t++) salsas.push_back(new circle_of_trust_salsa(graph));
            
            failed.clear();
            nempty = 0;
            size_t ndone = 0;
            uint64_t end = (uint64_t) config.first_source + config.num_sources;
            std::string graph_error;
            
            for(uint64_t chunkstart = config.first_source; chunkstart < end && graph_error.empty(); chunkstart += RECOMMENDATION_CHUNK) {
                int chunksize = (int) std::min((uint64_t) RECOMMENDATION_CHUNK, end - chunkstart);
                std::vector<std::vector<scored_vertex> > results(chunksize);
                std::vector<int> status(chunksize, (int) EGO_OK);
                std::vector<std::string> errors(chunksize);
                
                omp_set_num_threads(nthreads);
#pragma omp parallel for schedule(dynamic, 1)
                for(int i=0; i < chunksize; i++) {
                    vid_t ego = (vid_t) (chunkstart + i);
                    try {
                        results[i] = recommend(ego, *salsas[omp_get_thread_num()]);
                    } catch (companion_unavailable &err) {
                        status[i] = EGO_COMPANION_FAILED;
                        errors[i] = err.what();
                    } catch (graph_access_error &err) {
                        status[i] = EGO_GRAPH_FAILED;
                        errors[i] = err.what();
                    } catch (drunkardmob_error &err) {
                        status[i] = EGO_FAILED;
                        errors[i] = err.what();
                    }
                }
                
                for(int i=0; i < chunksize; i++) {
                    vid_t ego = (vid_t) (chunkstart + i);
                    if (status[i] == EGO_GRAPH_FAILED) {
                        std::stringstream ss;
                        ss << "Ego " << ego << ": " << errors[i];
                        graph_error = ss.str();
                        break;
                    }
                    if (status[i] == EGO_COMPANION_FAILED || status[i] == EGO_FAILED) {
                        logstream(logger, LOG_ERROR) << "Could not compute recommendations for " << ego << ": " << errors[i] << std::endl;
                        failed.push_back(ego);
                    } else {
                        std::vector<scored_vertex> &recs = results[i];
                        for(size_t j=0; j < recs.size(); j++) recs[j].id = translate->backward(recs[j].id);
                        if (recs.empty()) nempty++;
                        output.output_recommendations(translate->backward(ego), recs);
                    }
                    
                    ndone++;
                    if (ndone % config.progress_interval == 0) {
                        double t = me.timer_elapsed();
                        logstream(logger, LOG_INFO) << "Computed recommendations for " << ndone << " users in "
                            << t << " secs, average " << (t * 1000.0 / ndone) << " ms" << std::endl;
                    }
                }
            }
            
            for(int t=0; t < nthreads; t++) delete salsas[t];
            m.stop_time(me, "recommendations.stage2");
            m.set("recommendations.egos", ndone);
            m.set("recommendations.failed", failed.size());
            m.set("recommendations.empty", nempty);
            
            if (!graph_error.empty()) {
                logstream(logger, LOG_FATAL) << "Graph access failed, aborting: " << graph_error << std::endl;
                throw graph_access_error(graph_error);
            }
            if (!failed.empty()) {
                logstream(logger, LOG_WARNING) << failed.size() << " egos failed, see the errors above" << std::endl;
            }
            logstream(logger, LOG_INFO) << "Stage 2 done: " << ndone << " egos, " << nempty << " without recommendations" << std::endl;
        }
        
        void run(irecommendation_output &output) {
            run_walks();
            compute_recommendations(output);
            output.close();
        }
        
        const std::vector<vid_t> & failed_egos() const {
            return failed;
        }
        
        size_t num_empty() const {
            return nempty;
        }
        
        const walk_statistics & walk_stats() const {
            return walkstats;
        }
        
        const pipeline_config & get_config() const {
            return config;
        }
    };
    
}

#endif

