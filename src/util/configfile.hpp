
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
 * Parses a simple key=value configuration file.
 * Lines starting with '#' or '%' are comments.
 */

#ifndef DRUNKARDMOB_CONFIGFILE_DEF
#define DRUNKARDMOB_CONFIGFILE_DEF

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <map>

namespace drunkardmob {
    
    static inline std::string trim(std::string str) {
        const std::string trimChars = " \f\n\r\t\v";
        std::string::size_type pos = str.find_last_not_of(trimChars);
        str.erase(pos + 1);
        pos = str.find_first_not_of(trimChars);
        str.erase(0, pos);
        return str;
    }
    
    /**
     * Configuration file name. Environment variable DRUNKARDMOB_ROOT
     * can point to the directory containing conf/.
     */
    static inline std::string filename_config() {
        char * root = getenv("DRUNKARDMOB_ROOT");
        if (root != NULL) {
            return std::string(root) + "/conf/drunkardmob.cnf";
        } else {
            return "conf/drunkardmob.cnf";
        }
    }
    
    /**
     * Configuration file name - local version which can
     * override the version in the version control.
     */
    static inline std::string filename_config_local() {
        char * root = getenv("DRUNKARDMOB_ROOT");
        if (root != NULL) {
            return std::string(root) + "/conf/drunkardmob.local.cnf";
        } else {
            return "conf/drunkardmob.local.cnf";
        }
    }
    
    /**
     * Reads key-values of a configuration file into 'conf'. Existing keys are overwritten.
     * @param filename filename of the configuration file
     * @param secondary_filename secondary filename if the first version is not found.
     * @return false if neither file could be read
     */
    static inline bool loadconfig(std::string filename, std::string secondary_filename,
                                  std::map<std::string, std::string> &conf) {
        FILE * f = fopen(filename.c_str(), "r");
        if (f == NULL) {
            f = fopen(secondary_filename.c_str(), "r");
            if (f == NULL) {
                return false;
            }
        }
        
        char s[4096];
        while(fgets(s, 4096, f) != NULL) {
            std::string line(s);
            if (line.empty() || line[0] == '#' || line[0] == '%') continue; // Comment
            
            size_t eq = line.find('=');
            if (eq == std::string::npos) continue;
            std::string key = trim(line.substr(0, eq));
            std::string val = trim(line.substr(eq + 1));
            if (!key.empty() && !val.empty()) {
                conf[key] = val;
            }
        }
        fclose(f);
        return true;
    }
    
}


#endif

