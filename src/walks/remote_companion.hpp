
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
 * Walk companion running in another process, accessed over TCP. Each call
 * is one blocking request/response. Transport failures are reported as
 * companion_unavailable; the connection is reopened on the next call.
 */

#ifndef DEF_DRUNKARDMOB_REMOTE_COMPANION
#define DEF_DRUNKARDMOB_REMOTE_COMPANION

#include <string>
#include <vector>
#include <cstdlib>
#include <algorithm>
#include <boost/asio.hpp>

#include "logger/logger.hpp"
#include "util/pthread_tools.hpp"
#include "util/drunkardmob_errors.hpp"
#include "walks/companion.hpp"
#include "walks/companion_protocol.hpp"

#define REMOTE_VISITS_PER_MESSAGE (1 << 20)

namespace drunkardmob {
    
    /**
     * Splits "host:port". Throws configuration_error if malformed.
     */
    inline void parse_companion_address(const std::string &address, std::string &host, std::string &port) {
        size_t colon = address.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon == address.size() - 1) {
            throw configuration_error("Companion address must be of the form host:port, was: " + address);
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
        char * end = NULL;
        long p = strtol(port.c_str(), &end, 10);
        if (*end != '\0' || p <= 0 || p > 65535) {
            throw configuration_error("Invalid companion port: " + port);
        }
    }
    
    class remote_companion : public walk_companion {
        
        std::string host, port;
        file_logger &logger;
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket socket;
        bool connected;
        mutex lock;
        
        /* Caller holds the lock */
        void connect() {
            if (connected) return;
            boost::system::error_code ec;
            boost::asio::ip::tcp::resolver resolver(io);
            boost::asio::ip::tcp::resolver::results_type endpoints = resolver.resolve(host, port, ec);
            if (ec) {
                throw companion_unavailable("Could not resolve companion " + host + ":" + port + ": " + ec.message());
            }
            boost::asio::connect(socket, endpoints, ec);
            if (ec) {
                throw companion_unavailable("Could not connect to companion " + host + ":" + port + ": " + ec.message());
            }
            socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
            connected = true;
            logstream(logger, LOG_INFO) << "Connected to companion " << host << ":" << port << std::endl;
        }
        
        /* Caller holds the lock */
        void disconnect() {
            boost::system::error_code ec;
            socket.close(ec);
            connected = false;
        }
        
        /**
         * Sends a request and returns the reply. ERROR replies and
         * replies of an unexpected type raise companion_unavailable.
         */
        companion_message call(const companion_message &request, uint8_t expected_reply) {
            scoped_lock<mutex> guard(lock);
            companion_message reply;
            try {
                connect();
                write_message(socket, request);
                if (!read_message(socket, reply)) {
                    throw companion_unavailable("Companion closed the connection");
                }
            } catch (companion_unavailable &err) {
                logstream(logger, LOG_ERROR) << err.what() << std::endl;
                disconnect();
                throw;
            }
            if (reply.type == MSG_ERROR) {
                throw companion_unavailable("Companion error: " + reply.get_string());
            }
            if (reply.type != expected_reply) {
                disconnect();
                std::stringstream ss;
                ss << "Unexpected companion reply type " << (int) reply.type << " to request " << (int) request.type;
                throw companion_unavailable(ss.str());
            }
            return reply;
        }
        
    public:
        remote_companion(std::string host, std::string port, file_logger &logger) : host(host), port(port),
            logger(logger), socket(io), connected(false) {}
        
        virtual ~remote_companion() {
            disconnect();
        }
        
        virtual void set_avoidance(vid_t source, const std::vector<vid_t> &vertices) {
            call(encode_set_avoidance(source, vertices), MSG_OK);
        }
        
        virtual void record_visits(const std::vector<visit> &visits) {
            for(size_t i=0; i < visits.size(); i += REMOTE_VISITS_PER_MESSAGE) {
                size_t n = std::min((size_t) REMOTE_VISITS_PER_MESSAGE, visits.size() - i);
                call(encode_record_visits(&visits[i], n), MSG_OK);
            }
        }
        
        virtual void flush() {
            call(companion_message(MSG_FLUSH), MSG_OK);
        }
        
        virtual std::vector<id_count> get_top(vid_t source, int topN) {
            companion_message reply = call(encode_get_top(source, topN), MSG_TOP);
            return decode_top(reply);
        }
        
        virtual void discard(vid_t source) {
            call(encode_source(MSG_DISCARD, source), MSG_OK);
        }
    };
    
}

#endif

