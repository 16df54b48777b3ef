
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
 * Basic types shared by the walk engine, the companion and SALSA.
 */

#ifndef DEF_DRUNKARDMOB_TYPES
#define DEF_DRUNKARDMOB_TYPES


#include <stdint.h>
#include <utility>

namespace drunkardmob {
    
    typedef uint32_t vid_t;
    
    /**
     * Inclusive vertex interval of one graph partition.
     */
    typedef std::pair<vid_t, vid_t> vertex_interval;
    
    /**
     * (vertex, count) pair returned by the companion. Used as
     * the circle of trust of an ego vertex.
     */
    struct id_count {
        vid_t id;
        uint32_t count;
        
        id_count() : id(0), count(0) {}
        id_count(vid_t id, uint32_t count) : id(id), count(count) {}
    };
    
    /**
     * A tracked visit: walk started from 'source' arrived at 'vertex'.
     */
    struct visit {
        vid_t source;
        vid_t vertex;
        
        visit() : source(0), vertex(0) {}
        visit(vid_t source, vid_t vertex) : source(source), vertex(vertex) {}
    };
    
    /**
     * A scored vertex, for example a recommended authority.
     */
    struct scored_vertex {
        vid_t id;
        double value;
        
        scored_vertex() : id(0), value(0.0) {}
        scored_vertex(vid_t id, double value) : id(id), value(value) {}
    };
    
}


#endif

