
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
 * Twitter's Who-To-Follow (WTF) algorithm on DrunkardMob. For every user in
 * [firstsource, firstsource + nsources), personalized random walks are run
 * to find the user's circle of trust, that is, the vertices most often
 * visited by walks started from the user. SALSA on the circle of trust then
 * ranks the candidates to recommend.
 *
 * Usage: twitterwtf file <graph> firstsource 0 nsources 1000 [walkspersource 1000]
 *        [niters 5] [companion local|host:port] [output recs.txt]
 *
 * The graph must be partitioned in advance (see graph/partition_format.hpp).
 */

#include <string>
#include <iostream>

#include "drunkardmob_basic_includes.hpp"

using namespace drunkardmob;

int main(int argc, const char ** argv) {
    file_logger logger;
    
    try {
        /* Reads the configuration file and the command line */
        cmdopts opts(argc, argv);
        configure_logger(opts, logger);
        if (!opts.has_config_file()) {
            logstream(logger, LOG_DEBUG) << "No configuration file found, using command line only" << std::endl;
        }
        
        metrics m("twitterwtf");
        
        std::string filename = opts.get_option_string("file");
        pipeline_config config = pipeline_config_from_options(opts);
        int nparts = opts.get_option_int("nparts", 0);
        size_t cachesize = (size_t) opts.get_option_long("graph.cachesize_mb", 64) * 1024 * 1024;
        
        partitioned_graph graph(filename, nparts, cachesize, logger);
        walk_companion * companion = create_companion(opts, logger);
        
        irecommendation_output * output;
        std::string outfile = opts.get_option_string("output", "");
        if (outfile != "") {
            output = new basic_text_output(outfile);
        } else {
            output = new log_output(logger);
        }
        
        logstream(logger, LOG_INFO) << "Seed for the walks: " << config.seed << std::endl;
        
        try {
            recommendation_pipeline pipeline(graph, *companion, config, logger, m);
            pipeline.run(*output);
            if (!pipeline.failed_egos().empty()) {
                logstream(logger, LOG_ERROR) << "No recommendations for " << pipeline.failed_egos().size()
                    << " users because the companion was unavailable" << std::endl;
            }
        } catch (drunkardmob_error &err) {
            delete output;
            delete companion;
            throw;
        }
        
        local_companion * lc = dynamic_cast<local_companion *>(companion);
        if (lc != NULL) lc->report_metrics(m);
        graph.report_metrics(m);
        
        delete output;
        delete companion;
        
        metrics_report(m, opts, logger);
    } catch (configuration_error &err) {
        logstream(logger, LOG_FATAL) << "Configuration error: " << err.what() << std::endl;
        return 1;
    } catch (drunkardmob_error &err) {
        logstream(logger, LOG_FATAL) << err.what() << std::endl;
        return 2;
    }
    return 0;
}
