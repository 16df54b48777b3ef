
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
 * Exceptions thrown by drunkardmob components.
 */

#ifndef DEF_DRUNKARDMOB_ERRORS
#define DEF_DRUNKARDMOB_ERRORS

#include <stdexcept>
#include <string>

namespace drunkardmob {
    
    class drunkardmob_error : public std::runtime_error {
    public:
        explicit drunkardmob_error(const std::string &msg) : std::runtime_error(msg) {}
    };
    
    /**
     * Missing or malformed configuration parameter. Fatal at startup.
     */
    class configuration_error : public drunkardmob_error {
    public:
        explicit configuration_error(const std::string &msg) : drunkardmob_error(msg) {}
    };
    
    /**
     * Unreadable or corrupt graph partition. Aborts the whole batch.
     */
    class graph_access_error : public drunkardmob_error {
    public:
        explicit graph_access_error(const std::string &msg) : drunkardmob_error(msg) {}
    };
    
    /**
     * Companion could not be reached or answered with garbage.
     * Fatal for the ego vertex whose query failed.
     */
    class companion_unavailable : public drunkardmob_error {
    public:
        explicit companion_unavailable(const std::string &msg) : drunkardmob_error(msg) {}
    };
    
}

#endif

