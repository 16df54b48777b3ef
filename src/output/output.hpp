
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
 * Output of the recommendations. Each ego's list is written through an
 * irecommendation_output; vertex ids are translated back to the original ids
 * of the input graph with a vertex_id_translate at output time.
 */

#ifndef DEF_DRUNKARDMOB_OUTPUT_HPP
#define DEF_DRUNKARDMOB_OUTPUT_HPP

#include <fstream>
#include <string>
#include <vector>

#include "drunkardmob_types.hpp"
#include "logger/logger.hpp"
#include "util/pthread_tools.hpp"
#include "util/drunkardmob_errors.hpp"

namespace drunkardmob {
    
    /**
     * Maps internal vertex ids back to the ids of the input graph.
     */
    class vertex_id_translate {
    public:
        virtual ~vertex_id_translate() {}
        virtual vid_t backward(vid_t internal_id) const = 0;
    };
    
    class identity_translate : public vertex_id_translate {
    public:
        virtual vid_t backward(vid_t internal_id) const {
            return internal_id;
        }
    };
    
    /**
     * Translation by adding a constant offset, for graphs whose
     * ids were shifted to start from zero.
     */
    class offset_translate : public vertex_id_translate {
        vid_t offset;
    public:
        offset_translate(vid_t offset) : offset(offset) {}
        virtual vid_t backward(vid_t internal_id) const {
            return internal_id + offset;
        }
    };
    
    class irecommendation_output {
    public:
        virtual ~irecommendation_output() {}
        
        /* Ids are already translated */
        virtual void output_recommendations(vid_t ego, const std::vector<scored_vertex> &recommendations) = 0;
        
        // Called automatically at the end
        virtual void close() = 0;
    };
    
    /**
     * Writes one line per recommendation: ego, recommended vertex and score.
     */
    class basic_text_output : public irecommendation_output {
        
        std::ofstream strm;
        std::string delimiter;
        mutex lock;
        
    public:
        
        basic_text_output(std::string filename, std::string delimiter="\t") : strm(filename.c_str(), std::ofstream::out),
                delimiter(delimiter) {
            if (!strm.good()) {
                throw configuration_error("Could not open output file " + filename);
            }
            strm.precision(10);
        }
        
        ~basic_text_output() {
            strm.close();
        }
        
        void output_recommendations(vid_t ego, const std::vector<scored_vertex> &recommendations) {
            lock.lock();
            for(size_t i=0; i < recommendations.size(); i++) {
                strm << ego << delimiter << recommendations[i].id << delimiter << recommendations[i].value << "\n";
            }
            lock.unlock();
        }
        
        void close() {
            strm.close();
        }
        
    };
    
    /**
     * Writes the recommendations to the log at LOG_INFO.
     */
    class log_output : public irecommendation_output {
        
        file_logger &logger;
        
    public:
        log_output(file_logger &logger) : logger(logger) {}
        
        void output_recommendations(vid_t ego, const std::vector<scored_vertex> &recommendations) {
            logstream(logger, LOG_INFO) << "Recommendations for " << ego << std::endl;
            for(size_t i=0; i < recommendations.size(); i++) {
                logstream(logger, LOG_INFO) << "  recommend: " << recommendations[i].id << " (" << recommendations[i].value << ")" << std::endl;
            }
        }
        
        void close() {}
    };
    
}

#endif

