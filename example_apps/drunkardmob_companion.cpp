
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
 * Standalone walk companion. Serves the visit distributions of a
 * twitterwtf run started with --companion=host:port.
 *
 * Usage: drunkardmob_companion port 9100 [companion.threads 4] [companion.membudget_mb 0] [circlesize 300]
 */

#include <string>
#include <iostream>

#include "drunkardmob_basic_includes.hpp"
#include "walks/companion_server.hpp"

using namespace drunkardmob;

int main(int argc, const char ** argv) {
    file_logger logger;
    
    try {
        cmdopts opts(argc, argv);
        configure_logger(opts, logger);
        
        int port = opts.get_option_int("port", 9100);
        if (port < 0 || port > 65535) {
            throw configuration_error("Invalid port");
        }
        int nthreads = opts.get_option_int("companion.threads", 4);
        size_t membudget = (size_t) opts.get_option_long("companion.membudget_mb", 0) * 1024 * 1024;
        
        local_companion companion(nthreads, membudget, logger, companion_keep_top(opts));
        companion_server server(companion, (unsigned short) port, logger);
        server.run();
    } catch (configuration_error &err) {
        logstream(logger, LOG_FATAL) << "Configuration error: " << err.what() << std::endl;
        return 1;
    } catch (drunkardmob_error &err) {
        logstream(logger, LOG_FATAL) << err.what() << std::endl;
        return 2;
    }
    return 0;
}
