
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
 * Command line options. Options are read from the configuration file
 * and from the command line, given either as "--key=value" or as
 * "key value". Command line wins over the configuration file.
 */

#ifndef DRUNKARDMOB_CMDOPTS_DEF
#define DRUNKARDMOB_CMDOPTS_DEF


#include <string>
#include <map>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <climits>
#include <stdint.h>

#include "util/configfile.hpp"
#include "util/drunkardmob_errors.hpp"

namespace drunkardmob { 
    
    class cmdopts {
        
        std::vector<std::string> args;
        std::map<std::string, std::string> conf;
        bool config_file_found;
        
    public:
        
        cmdopts() : config_file_found(false) {}
        
        /**
         * @param load_config_file if true, conf/drunkardmob.cnf (or the local
         *        override) is read before the command line.
         */
        cmdopts(int argc, const char ** argv, bool load_config_file = true) : config_file_found(false) {
            if (load_config_file) {
                config_file_found = loadconfig(filename_config_local(), filename_config(), conf);
            }
            for (int i = 0; i < argc; i++) {
                args.push_back(std::string(argv[i]));
            }
            
            /* Load --key=value type arguments into the conf map */
            std::string prefix = "--";
            for (size_t i = 1; i < args.size(); i++) {
                std::string arg = args[i];
                if (arg.substr(0, prefix.size()) == prefix) {
                    arg = arg.substr(prefix.size());
                    size_t a = arg.find_first_of("=", 0);
                    if (a != arg.npos) {
                        conf[arg.substr(0, a)] = arg.substr(a + 1);
                    } else {
                        throw configuration_error("Option without value: --" + arg);
                    }
                }
            }
        }
        
        bool has_config_file() const {
            return config_file_found;
        }
        
        void set_conf(std::string key, std::string value) {
            conf[key] = value;
        }
        
        bool has_option(const std::string &option_name) const {
            std::string v;
            return lookup(option_name, v);
        }
        
        std::string get_option_string(const std::string &option_name) const {
            std::string v;
            if (!lookup(option_name, v)) {
                throw configuration_error("Missing required option: " + option_name);
            }
            return v;
        }
        
        std::string get_option_string(const std::string &option_name, std::string default_value) const {
            std::string v;
            return lookup(option_name, v) ? v : default_value;
        }
        
        int get_option_int(const std::string &option_name) const {
            return parse_int(option_name, get_option_string(option_name));
        }
        
        int get_option_int(const std::string &option_name, int default_value) const {
            std::string v;
            if (!lookup(option_name, v)) return default_value;
            return parse_int(option_name, v);
        }
        
        uint64_t get_option_long(const std::string &option_name, uint64_t default_value) const {
            std::string v;
            if (!lookup(option_name, v)) return default_value;
            long long x = parse_long(option_name, v);
            if (x < 0) {
                throw configuration_error("Option " + option_name + " must be non-negative: " + v);
            }
            return (uint64_t) x;
        }
        
        double get_option_double(const std::string &option_name, double default_value) const {
            std::string v;
            if (!lookup(option_name, v)) return default_value;
            char * end = NULL;
            errno = 0;
            double x = strtod(v.c_str(), &end);
            if (errno != 0 || end == v.c_str() || *end != '\0') {
                throw configuration_error("Option " + option_name + " is not a number: " + v);
            }
            return x;
        }
        
        /**
         * Returns all options that were set, command line and configuration file merged.
         */
        std::map<std::string, std::string> all_options() const {
            std::map<std::string, std::string> res = conf;
            for (size_t i = 1; i + 1 < args.size(); i++) {
                if (args[i].substr(0, 2) != "--") res[args[i]] = args[i + 1];
            }
            return res;
        }
        
    private:
        
        bool lookup(const std::string &option_name, std::string &value) const {
            /* "key value" pairs; the last occurrence wins */
            for (int i = (int) args.size() - 2; i >= 1; i -= 1) {
                if (args[i] == option_name) {
                    value = args[i + 1];
                    return true;
                }
            }
            std::map<std::string, std::string>::const_iterator it = conf.find(option_name);
            if (it != conf.end()) {
                value = it->second;
                return true;
            }
            return false;
        }
        
        static long long parse_long(const std::string &option_name, const std::string &v) {
            char * end = NULL;
            errno = 0;
            long long x = strtoll(v.c_str(), &end, 10);
            if (errno != 0 || end == v.c_str() || *end != '\0') {
                throw configuration_error("Option " + option_name + " is not an integer: " + v);
            }
            return x;
        }
        
        static int parse_int(const std::string &option_name, const std::string &v) {
            long long x = parse_long(option_name, v);
            if (x < INT_MIN || x > INT_MAX) {
                throw configuration_error("Option " + option_name + " is out of range: " + v);
            }
            return (int) x;
        }
        
    };
    
} // End namespace


#endif

