
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
 * Includes the headers of a DrunkardMob application and helpers for
 * setting up the logger, the companion and the metrics reporting from
 * command line options.
 */

#ifndef DEF_DRUNKARDMOB_ALLBASIC_INCLUDES
#define DEF_DRUNKARDMOB_ALLBASIC_INCLUDES

#include <omp.h>
#include <cstring>
#include <ctime>
#include <sstream>
#include <string>
#include <stdint.h>

#include "drunkardmob_types.hpp"

#include "graph/graph_access.hpp"
#include "graph/partitioned_graph.hpp"

#include "logger/logger.hpp"

#include "metrics/metrics.hpp"
#include "metrics/reps/basic_reporter.hpp"
#include "metrics/reps/file_reporter.hpp"

#include "output/output.hpp"
#include "recommendations/recommendation_pipeline.hpp"

#include "util/cmdopts.hpp"
#include "util/drunkardmob_errors.hpp"

#include "walks/companion.hpp"
#include "walks/local_companion.hpp"
#include "walks/remote_companion.hpp"

namespace drunkardmob {
    
    /**
     * Applies the options 'loglevel' and 'logfile' to the logger.
     */
    inline void configure_logger(const cmdopts &opts, file_logger &logger) {
        std::string level = opts.get_option_string("loglevel", "info");
        int lvl = parse_log_level(level);
        if (lvl < 0) {
            throw configuration_error("Unknown log level: " + level);
        }
        logger.set_log_level(lvl);
        std::string logfile = opts.get_option_string("logfile", "");
        if (logfile != "" && !logger.set_log_file(logfile)) {
            throw configuration_error("Could not open log file " + logfile);
        }
    }
    
    /**
     * Reads the batch parameters. Throws configuration_error if a
     * required parameter is missing or malformed.
     */
    inline pipeline_config pipeline_config_from_options(const cmdopts &opts) {
        pipeline_config config;
        uint64_t first_source = opts.get_option_long("firstsource", 0);
        if (first_source > UINT32_MAX) {
            throw configuration_error("firstsource is not a valid vertex id");
        }
        config.first_source = (vid_t) first_source;
        int nsources = opts.get_option_int("nsources");
        if (nsources <= 0) {
            throw configuration_error("nsources must be positive");
        }
        config.num_sources = (vid_t) nsources;
        config.walks_per_source = (size_t) opts.get_option_long("walkspersource", 1000);
        config.niters = opts.get_option_int("niters", 5);
        config.circle_size = opts.get_option_int("circlesize", 300);
        config.salsa_iters = opts.get_option_int("salsa.niters", 4);
        config.ntop = opts.get_option_int("ntop", 10);
        config.reset_probability = opts.get_option_double("walks.reset_probability", 0.15);
        config.seed = opts.get_option_long("walks.seed", (uint64_t) time(NULL));
        config.exec_threads = opts.get_option_int("execthreads", omp_get_max_threads());
        config.progress_interval = opts.get_option_int("pipeline.progress_interval", 40);
        return config;
    }
    
    /**
     * Entries each source keeps under memory pressure: the circle of trust size.
     */
    inline size_t companion_keep_top(const cmdopts &opts) {
        int circle = opts.get_option_int("circlesize", 300);
        if (circle <= 0) {
            throw configuration_error("circlesize must be positive");
        }
        return (size_t) circle;
    }
    
    /**
     * Creates the companion named by the option 'companion': "local" for an
     * in-process companion, host:port for a remote one. Caller owns the result.
     */
    inline walk_companion * create_companion(const cmdopts &opts, file_logger &logger) {
        std::string address = opts.get_option_string("companion", "local");
        if (address == "local") {
            int nthreads = opts.get_option_int("companion.threads", 4);
            size_t membudget = (size_t) opts.get_option_long("companion.membudget_mb", 0) * 1024 * 1024;
            return new local_companion(nthreads, membudget, logger, companion_keep_top(opts));
        }
        std::string host, port;
        parse_companion_address(address, host, port);
        logstream(logger, LOG_INFO) << "Using remote companion at " << host << ":" << port << std::endl;
        return new remote_companion(host, port, logger);
    }
    
    /**
     * Reports the metrics with the reporters listed in 'metrics.reporter'
     * (comma separated: console, file).
     */
    inline void metrics_report(metrics &m, const cmdopts &opts, file_logger &logger) {
        std::string reporters = opts.get_option_string("metrics.reporter", "console");
        std::stringstream ss(reporters);
        std::string repname;
        
        while(std::getline(ss, repname, ',')) {
            if (repname == "basic" || repname == "console") {
                basic_reporter rep;
                m.report(rep);
            } else if (repname == "file") {
                file_reporter rep(opts.get_option_string("metrics.reporter.filename", "metrics.txt"));
                m.report(rep);
            } else {
                logstream(logger, LOG_WARNING) << "Could not find metrics reporter with name [" << repname << "], ignoring." << std::endl;
            }
        }
    }
    
}

#endif

