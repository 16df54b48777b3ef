
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
 * Binary protocol between remote_companion and companion_server. Every
 * message is a one byte type, a four byte little-endian payload length and
 * the payload. Integers in the payload are little-endian uint32.
 *
 *   SET_AVOIDANCE  source, n, n x vertex                -> OK
 *   RECORD_VISITS  n, n x (source, vertex)              -> OK
 *   FLUSH          (empty)                              -> OK
 *   GET_TOP        source, topN                         -> TOP n, n x (vertex, count)
 *   DISCARD        source                               -> OK
 *
 * Any request may be answered with ERROR carrying a message string.
 */

#ifndef DEF_DRUNKARDMOB_COMPANION_PROTOCOL
#define DEF_DRUNKARDMOB_COMPANION_PROTOCOL

#include <vector>
#include <string>
#include <sstream>
#include <stdint.h>
#include <boost/asio.hpp>

#include "drunkardmob_types.hpp"
#include "util/drunkardmob_errors.hpp"

#define COMPANION_MAX_PAYLOAD (256u * 1024u * 1024u)

namespace drunkardmob {
    
    enum companion_message_type {
        MSG_SET_AVOIDANCE = 1,
        MSG_RECORD_VISITS = 2,
        MSG_FLUSH = 3,
        MSG_GET_TOP = 4,
        MSG_DISCARD = 5,
        MSG_OK = 100,
        MSG_TOP = 101,
        MSG_ERROR = 102
    };
    
    /**
     * Message under construction or received.
     */
    struct companion_message {
        uint8_t type;
        std::vector<uint8_t> payload;
        size_t pos;   // read position
        
        companion_message() : type(0), pos(0) {}
        companion_message(uint8_t type) : type(type), pos(0) {}
        
        void put_u32(uint32_t x) {
            for(int i=0; i < 4; i++) {
                payload.push_back((uint8_t) ((x >> (8 * i)) & 0xff));
            }
        }
        
        void put_string(const std::string &s) {
            put_u32((uint32_t) s.size());
            payload.insert(payload.end(), s.begin(), s.end());
        }
        
        uint32_t get_u32() {
            if (pos + 4 > payload.size()) {
                std::stringstream ss;
                ss << "Truncated companion message of type " << (int) type << " (" << payload.size() << " bytes)";
                throw companion_unavailable(ss.str());
            }
            uint32_t x = 0;
            for(int i=0; i < 4; i++) {
                x |= ((uint32_t) payload[pos + i]) << (8 * i);
            }
            pos += 4;
            return x;
        }
        
        std::string get_string() {
            uint32_t len = get_u32();
            if (pos + len > payload.size()) {
                throw companion_unavailable("Truncated string in companion message");
            }
            std::string s(payload.begin() + pos, payload.begin() + pos + len);
            pos += len;
            return s;
        }
        
        bool fully_read() const {
            return pos == payload.size();
        }
    };
    
    inline companion_message encode_set_avoidance(vid_t source, const std::vector<vid_t> &vertices) {
        companion_message msg(MSG_SET_AVOIDANCE);
        msg.put_u32(source);
        msg.put_u32((uint32_t) vertices.size());
        for(size_t i=0; i < vertices.size(); i++) msg.put_u32(vertices[i]);
        return msg;
    }
    
    inline companion_message encode_record_visits(const visit * visits, size_t n) {
        companion_message msg(MSG_RECORD_VISITS);
        msg.payload.reserve(4 + 8 * n);
        msg.put_u32((uint32_t) n);
        for(size_t i=0; i < n; i++) {
            msg.put_u32(visits[i].source);
            msg.put_u32(visits[i].vertex);
        }
        return msg;
    }
    
    inline companion_message encode_get_top(vid_t source, int topN) {
        companion_message msg(MSG_GET_TOP);
        msg.put_u32(source);
        msg.put_u32((uint32_t) (topN < 0 ? 0 : topN));
        return msg;
    }
    
    inline companion_message encode_source(uint8_t type, vid_t source) {
        companion_message msg(type);
        msg.put_u32(source);
        return msg;
    }
    
    inline companion_message encode_top(const std::vector<id_count> &top) {
        companion_message msg(MSG_TOP);
        msg.put_u32((uint32_t) top.size());
        for(size_t i=0; i < top.size(); i++) {
            msg.put_u32(top[i].id);
            msg.put_u32(top[i].count);
        }
        return msg;
    }
    
    inline companion_message encode_error(const std::string &what) {
        companion_message msg(MSG_ERROR);
        msg.put_string(what);
        return msg;
    }
    
    /**
     * Reads a list length and checks that the payload can hold it.
     */
    inline uint32_t decode_count(companion_message &msg, size_t entry_bytes) {
        uint32_t n = msg.get_u32();
        if ((uint64_t) n * entry_bytes > msg.payload.size() - msg.pos) {
            std::stringstream ss;
            ss << "Companion message claims " << n << " entries but has " << (msg.payload.size() - msg.pos) << " bytes left";
            throw companion_unavailable(ss.str());
        }
        return n;
    }
    
    inline std::vector<vid_t> decode_vertices(companion_message &msg) {
        uint32_t n = decode_count(msg, 4);
        std::vector<vid_t> v(n);
        for(uint32_t i=0; i < n; i++) v[i] = msg.get_u32();
        return v;
    }
    
    inline std::vector<visit> decode_visits(companion_message &msg) {
        uint32_t n = decode_count(msg, 8);
        std::vector<visit> v(n);
        for(uint32_t i=0; i < n; i++) {
            v[i].source = msg.get_u32();
            v[i].vertex = msg.get_u32();
        }
        return v;
    }
    
    inline std::vector<id_count> decode_top(companion_message &msg) {
        uint32_t n = decode_count(msg, 8);
        std::vector<id_count> v(n);
        for(uint32_t i=0; i < n; i++) {
            v[i].id = msg.get_u32();
            v[i].count = msg.get_u32();
        }
        return v;
    }
    
    /**
     * Writes a message. Throws companion_unavailable on failure.
     */
    inline void write_message(boost::asio::ip::tcp::socket &socket, const companion_message &msg) {
        if (msg.payload.size() > COMPANION_MAX_PAYLOAD) {
            throw companion_unavailable("Companion message too large");
        }
        uint8_t header[5];
        uint32_t len = (uint32_t) msg.payload.size();
        header[0] = msg.type;
        for(int i=0; i < 4; i++) header[1 + i] = (uint8_t) ((len >> (8 * i)) & 0xff);
        
        std::vector<boost::asio::const_buffer> bufs;
        bufs.push_back(boost::asio::buffer(header, 5));
        if (len > 0) bufs.push_back(boost::asio::buffer(&msg.payload[0], len));
        
        boost::system::error_code ec;
        boost::asio::write(socket, bufs, ec);
        if (ec) {
            throw companion_unavailable("Could not write to companion: " + ec.message());
        }
    }
    
    /**
     * Reads a message. Returns false if the peer closed the connection
     * cleanly before a new message started. Throws companion_unavailable
     * on other failures.
     */
    inline bool read_message(boost::asio::ip::tcp::socket &socket, companion_message &msg) {
        uint8_t header[5];
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(header, 5), ec);
        if (ec == boost::asio::error::eof) {
            return false;
        }
        if (ec) {
            throw companion_unavailable("Could not read from companion: " + ec.message());
        }
        uint32_t len = 0;
        for(int i=0; i < 4; i++) len |= ((uint32_t) header[1 + i]) << (8 * i);
        if (len > COMPANION_MAX_PAYLOAD) {
            std::stringstream ss;
            ss << "Companion message too large: " << len << " bytes";
            throw companion_unavailable(ss.str());
        }
        msg.type = header[0];
        msg.pos = 0;
        msg.payload.resize(len);
        if (len > 0) {
            boost::asio::read(socket, boost::asio::buffer(&msg.payload[0], len), ec);
            if (ec) {
                throw companion_unavailable("Could not read from companion: " + ec.message());
            }
        }
        return true;
    }
    
}

#endif

