
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
 * Returns standard filenames for the partitioned graph files.
 * All functions expect a "basefilename".
 */

#ifndef DRUNKARDMOB_FILENAMES_DEF
#define DRUNKARDMOB_FILENAMES_DEF

#include <fstream>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <sstream>
#include <unistd.h>
#include <vector>

#include "drunkardmob_types.hpp"
#include "util/drunkardmob_errors.hpp"

namespace drunkardmob {
    
    static inline std::string filename_intervals(std::string basefilename, int nparts) {
        std::stringstream ss;
        ss << basefilename;
        ss << "." << nparts << ".intervals";
        return ss.str();
    }
    
    static inline std::string filename_partition(std::string basefilename, int p, int nparts) {
        std::stringstream ss;
        ss << basefilename;
        ss << ".part.";
        ss << p << "_" << nparts << ".adj";
        return ss.str();
    }
    
    static inline bool file_exists(std::string sname) {
        int tryf = open(sname.c_str(), O_RDONLY);
        if (tryf < 0) {
            return false;
        } else {
            close(tryf);
            return true;
        }
    }
    
    /**
     * Returns the number of partitions if the graph has been
     * partitioned, or 0 if not found.
     * @param partition_string "auto" or the number of partitions
     */
    static inline int find_partitions(std::string base_filename, std::string partition_string="auto") {
        int start_num = 1;
        int last_num = 2400;
        if (partition_string != "auto") {
            start_num = atoi(partition_string.c_str());
            last_num = start_num;
            if (start_num <= 0) {
                throw configuration_error("Invalid number of partitions: " + partition_string);
            }
        }
        for(int n = start_num; n <= last_num; n++) {
            if (file_exists(filename_intervals(base_filename, n))) {
                return n;
            }
        }
        return 0;
    }
    
    /**
     * Loads vertex intervals. The intervals file has the last vertex of
     * each partition on its own line.
     */
    static inline void load_vertex_intervals(std::string base_filename, int nparts, std::vector<vertex_interval> & intervals) {
        std::string intervalsFilename = filename_intervals(base_filename, nparts);
        std::ifstream intervalsF(intervalsFilename.c_str());
        
        if (!intervalsF.good()) {
            throw graph_access_error("Could not load intervals-file: " + intervalsFilename);
        }
        
        intervals.clear();
        
        vid_t st=0, en;
        for(int i=0; i < nparts; i++) {
            if (!(intervalsF >> en) || en < st) {
                throw graph_access_error("Corrupt intervals-file: " + intervalsFilename);
            }
            intervals.push_back(vertex_interval(st, en));
            st = en + 1;
        }
    }
    
    static inline void write_vertex_intervals(std::string base_filename, const std::vector<vertex_interval> & intervals) {
        std::string intervalsFilename = filename_intervals(base_filename, (int) intervals.size());
        std::ofstream intervalsF(intervalsFilename.c_str());
        for(size_t i=0; i < intervals.size(); i++) {
            intervalsF << intervals[i].second << std::endl;
        }
        if (!intervalsF.good()) {
            throw graph_access_error("Could not write intervals-file: " + intervalsFilename);
        }
    }
    
}

#endif

