
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
 * TCP server exposing a walk companion to remote_companion clients. Each
 * accepted connection is served by its own thread; requests are executed
 * against the wrapped companion and answered in order.
 */

#ifndef DEF_DRUNKARDMOB_COMPANION_SERVER
#define DEF_DRUNKARDMOB_COMPANION_SERVER

#include <vector>
#include <set>
#include <boost/asio.hpp>

#include "logger/logger.hpp"
#include "util/pthread_tools.hpp"
#include "util/drunkardmob_errors.hpp"
#include "walks/companion.hpp"
#include "walks/companion_protocol.hpp"

namespace drunkardmob {
    
    class companion_server;
    
    struct companion_session {
        companion_server * server;
        boost::asio::ip::tcp::socket * socket;
        
        companion_session(companion_server * server, boost::asio::ip::tcp::socket * socket) :
            server(server), socket(socket) {}
    };
    
    inline void * companion_session_thread(void * arg);
    
    class companion_server {
        
        walk_companion &companion;
        file_logger &logger;
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor;
        thread_group sessions;
        mutex lock;
        std::set<boost::asio::ip::tcp::socket *> open_sockets;
        bool stopping;
        size_t nrequests;
        
        friend void * companion_session_thread(void * arg);
        
        /**
         * Executes one request. Errors of the companion are returned to
         * the client as ERROR replies.
         */
        companion_message handle(companion_message &request) {
            try {
                switch (request.type) {
                    case MSG_SET_AVOIDANCE: {
                        vid_t source = request.get_u32();
                        std::vector<vid_t> vertices = decode_vertices(request);
                        companion.set_avoidance(source, vertices);
                        return companion_message(MSG_OK);
                    }
                    case MSG_RECORD_VISITS: {
                        std::vector<visit> visits = decode_visits(request);
                        companion.record_visits(visits);
                        return companion_message(MSG_OK);
                    }
                    case MSG_FLUSH:
                        companion.flush();
                        return companion_message(MSG_OK);
                    case MSG_GET_TOP: {
                        vid_t source = request.get_u32();
                        int topN = (int) request.get_u32();
                        return encode_top(companion.get_top(source, topN));
                    }
                    case MSG_DISCARD:
                        companion.discard(request.get_u32());
                        return companion_message(MSG_OK);
                    default: {
                        std::stringstream ss;
                        ss << "Unknown request type " << (int) request.type;
                        return encode_error(ss.str());
                    }
                }
            } catch (drunkardmob_error &err) {
                logstream(logger, LOG_ERROR) << "Request " << (int) request.type << " failed: " << err.what() << std::endl;
                return encode_error(err.what());
            }
        }
        
        void serve(boost::asio::ip::tcp::socket * socket) {
            try {
                companion_message request;
                while (read_message(*socket, request)) {
                    companion_message reply = handle(request);
                    write_message(*socket, reply);
                    lock.lock();
                    nrequests++;
                    lock.unlock();
                }
            } catch (companion_unavailable &err) {
                lock.lock();
                bool expected = stopping;
                lock.unlock();
                if (!expected) {
                    logstream(logger, LOG_WARNING) << "Closing companion session: " << err.what() << std::endl;
                }
            }
            lock.lock();
            open_sockets.erase(socket);
            lock.unlock();
            boost::system::error_code ec;
            socket->close(ec);
            delete socket;
        }
        
    public:
        /**
         * Binds to the port on all interfaces. Port 0 picks a free port,
         * see local_port().
         */
        companion_server(walk_companion &companion, unsigned short port, file_logger &logger) :
            companion(companion), logger(logger), acceptor(io), stopping(false), nrequests(0) {
            boost::system::error_code ec;
            boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::tcp::v4(), port);
            acceptor.open(endpoint.protocol(), ec);
            if (!ec) acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
            if (!ec) acceptor.bind(endpoint, ec);
            if (!ec) acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
            if (ec) {
                std::stringstream ss;
                ss << "Could not listen on port " << port << ": " << ec.message();
                throw configuration_error(ss.str());
            }
        }
        
        ~companion_server() {
            stop();
            sessions.join();
        }
        
        unsigned short local_port() const {
            return acceptor.local_endpoint().port();
        }
        
        size_t num_requests() {
            scoped_lock<mutex> guard(lock);
            return nrequests;
        }
        
        /**
         * Accepts connections until stop() is called. Returns after all
         * sessions have ended.
         */
        void run() {
            logstream(logger, LOG_INFO) << "Companion server listening on port " << local_port() << std::endl;
            while (true) {
                boost::asio::ip::tcp::socket * socket = new boost::asio::ip::tcp::socket(io);
                boost::system::error_code ec;
                acceptor.accept(*socket, ec);
                
                lock.lock();
                bool stop_now = stopping;
                if (!ec && !stop_now) open_sockets.insert(socket);
                lock.unlock();
                
                if (ec || stop_now) {
                    if (ec && !stop_now) {
                        logstream(logger, LOG_ERROR) << "Accept failed: " << ec.message() << std::endl;
                    }
                    boost::system::error_code cec;
                    socket->close(cec);
                    delete socket;
                    if (stop_now) break;
                    continue;
                }
                
                socket->set_option(boost::asio::ip::tcp::no_delay(true), ec);
                companion_session * session = new companion_session(this, socket);
                if (!sessions.launch(companion_session_thread, session)) {
                    logstream(logger, LOG_ERROR) << "Could not launch session thread" << std::endl;
                    lock.lock();
                    open_sockets.erase(socket);
                    lock.unlock();
                    delete session;
                    socket->close(ec);
                    delete socket;
                }
            }
            sessions.join();
            logstream(logger, LOG_INFO) << "Companion server stopped after " << num_requests() << " requests" << std::endl;
        }
        
        /**
         * Stops accepting connections and closes open sessions.
         */
        void stop() {
            lock.lock();
            if (stopping) {
                lock.unlock();
                return;
            }
            stopping = true;
            for(std::set<boost::asio::ip::tcp::socket *>::iterator it = open_sockets.begin(); it != open_sockets.end(); ++it) {
                boost::system::error_code ec;
                (*it)->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            }
            lock.unlock();
            
            // Wake up the blocking accept
            boost::system::error_code ec;
            boost::asio::io_context wio;
            boost::asio::ip::tcp::socket wake(wio);
            wake.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), local_port()), ec);
            wake.close(ec);
        }
    };
    
    inline void * companion_session_thread(void * arg) {
        companion_session * session = (companion_session *) arg;
        session->server->serve(session->socket);
        delete session;
        return NULL;
    }
    
}

#endif

