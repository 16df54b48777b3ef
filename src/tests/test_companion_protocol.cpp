
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
 * Tests for the companion protocol, the companion server and the remote companion.
 */

#include <vector>
#include <string>
#include <sstream>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "util/pthread_tools.hpp"
#include "graph/inmemory_graph.hpp"
#include "walks/companion_protocol.hpp"
#include "walks/companion_server.hpp"
#include "walks/remote_companion.hpp"
#include "walks/local_companion.hpp"
#include "recommendations/recommendation_pipeline.hpp"
#include "tests/tests.hpp"

using namespace drunkardmob;

static file_logger logger;

static void * server_thread(void * arg) {
    companion_server * server = (companion_server *) arg;
    server->run();
    return NULL;
}

static std::string port_string(unsigned short port) {
    std::stringstream ss;
    ss << port;
    return ss.str();
}

int test_message_codec() {
    std::vector<id_count> top;
    top.push_back(id_count(7, 100));
    top.push_back(id_count(4000000000u, 1));
    companion_message msg = encode_top(top);
    ASSERTEQ((int) msg.type, (int) MSG_TOP);
    ASSERTEQ(msg.payload.size(), (size_t) (4 + 2 * 8));
    ASSERTEQ((int) msg.payload[0], 2);     // little-endian count
    std::vector<id_count> decoded = decode_top(msg);
    ASSERTEQ(decoded.size(), (size_t) 2);
    ASSERTEQ(decoded[1].id, (vid_t) 4000000000u);
    ASSERTEQ(decoded[1].count, (uint32_t) 1);
    ASSERTTRUE(msg.fully_read());
    
    /* Count larger than the payload */
    companion_message bad(MSG_TOP);
    bad.put_u32(1000);
    bad.put_u32(1);
    ASSERTTHROWS(decode_top(bad), companion_unavailable);
    
    companion_message truncated(MSG_GET_TOP);
    truncated.payload.push_back(1);
    ASSERTTHROWS(truncated.get_u32(), companion_unavailable);
    
    companion_message err = encode_error("no such thing");
    ASSERTEQ(err.get_string(), std::string("no such thing"));
    return 0;
}

int test_remote_companion() {
    local_companion local(2, 0, logger);
    companion_server server(local, 0, logger);
    pthread_t t;
    pthread_create(&t, NULL, server_thread, &server);
    
    {
        remote_companion remote("127.0.0.1", port_string(server.local_port()), logger);
        std::vector<vid_t> avoid;
        avoid.push_back(3);
        remote.set_avoidance(1, avoid);
        
        std::vector<visit> visits;
        for(int i=0; i < 5; i++) visits.push_back(visit(1, 10));
        for(int i=0; i < 2; i++) visits.push_back(visit(1, 11));
        visits.push_back(visit(1, 3));
        visits.push_back(visit(2, 10));
        remote.record_visits(visits);
        remote.flush();
        
        std::vector<id_count> top = remote.get_top(1, 10);
        ASSERTEQ(top.size(), (size_t) 2);
        ASSERTEQ(top[0].id, (vid_t) 10);
        ASSERTEQ(top[0].count, (uint32_t) 5);
        ASSERTEQ(top[1].id, (vid_t) 11);
        ASSERTEQ(remote.get_top(2, 10).size(), (size_t) 1);
        
        remote.discard(1);
        ASSERTEQ(remote.get_top(1, 10).size(), (size_t) 0);
        ASSERTEQ(local.num_sources(), (size_t) 1);
    }
    
    server.stop();
    pthread_join(t, NULL);
    ASSERTTRUE(server.num_requests() >= 7);
    return 0;
}

int test_unreachable_companion() {
    unsigned short port;
    {
        /* Find a port nobody listens on */
        local_companion local(1, 0, logger);
        companion_server server(local, 0, logger);
        port = server.local_port();
    }
    remote_companion remote("127.0.0.1", port_string(port), logger);
    ASSERTTHROWS(remote.get_top(1, 10), companion_unavailable);
    ASSERTTHROWS(remote.flush(), companion_unavailable);
    return 0;
}

int test_pipeline_with_remote_companion() {
    std::vector<std::vector<vid_t> > adj(6);
    for(int v=0; v < 6; v++) adj[v].push_back((vid_t) ((v + 1) % 6));
    inmemory_graph graph(adj, 2);
    
    local_companion local(2, 0, logger);
    companion_server server(local, 0, logger);
    pthread_t t;
    pthread_create(&t, NULL, server_thread, &server);
    
    {
        remote_companion remote("127.0.0.1", port_string(server.local_port()), logger);
        metrics m("test");
        pipeline_config config;
        config.num_sources = 6;
        config.walks_per_source = 200;
        config.niters = 3;
        config.circle_size = 5;
        config.seed = 7;
        config.exec_threads = 3;
        recommendation_pipeline pipeline(graph, remote, config, logger, m);
        
        class counting_output : public irecommendation_output {
        public:
            size_t n;
            counting_output() : n(0) {}
            void output_recommendations(vid_t ego, const std::vector<scored_vertex> &recs) {
                if (recs.size() == 2) n++;
            }
            void close() {}
        } out;
        pipeline.run(out);
        ASSERTEQ(out.n, (size_t) 6);
        ASSERTTRUE(pipeline.failed_egos().empty());
    }
    
    server.stop();
    pthread_join(t, NULL);
    return 0;
}

int main(int argc, const char ** argv) {
    logger.set_log_level(LOG_ERROR);
    int ret = 0;
    RUN_TEST(test_message_codec);
    RUN_TEST(test_remote_companion);
    RUN_TEST(test_unreachable_companion);
    RUN_TEST(test_pipeline_with_remote_companion);
    return ret;
}
