
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
 * I/O Utils. Failures are reported as graph_access_error.
 */

#ifndef DEF_DRUNKARDMOB_IOUTIL_HPP
#define DEF_DRUNKARDMOB_IOUTIL_HPP

#include <unistd.h>
#include <stdlib.h>
#include <stdint.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <algorithm>
#include <sstream>
#include <string>
#include <zlib.h>

#include "util/drunkardmob_errors.hpp"

namespace drunkardmob {
    
    static inline std::string io_error_message(const std::string &what, const std::string &fname) {
        std::stringstream ss;
        ss << what << " " << fname << ": " << strerror(errno);
        return ss.str();
    }
    
    // Reads given number of bytes to a buffer
    template <typename T>
    void preada(int f, T * tbuf, size_t nbytes, size_t off, const std::string &fname) {
        size_t nread = 0;
        char * buf = (char*)tbuf;
        while(nread<nbytes) {
            ssize_t a = pread(f, buf, nbytes - nread, off + nread);
            if (a == (-1)) {
                if (errno == EINTR) continue;
                throw graph_access_error(io_error_message("Could not read", fname));
            }
            if (a == 0) {
                std::stringstream ss;
                ss << "Unexpected end of file " << fname << " at offset " << (off + nread)
                   << " (wanted " << nbytes << " bytes at " << off << ")";
                throw graph_access_error(ss.str());
            }
            buf += a;
            nread += a;
        }
    }
    
    template <typename T>
    void writea(int f, const T * tbuf, size_t nbytes, const std::string &fname) {
        size_t nwritten = 0;
        const char * buf = (const char*)tbuf;
        while(nwritten<nbytes) {
            ssize_t a = write(f, buf, nbytes-nwritten);
            if (a == (-1)) {
                if (errno == EINTR) continue;
                throw graph_access_error(io_error_message("Could not write", fname));
            }
            buf += a;
            nwritten += a;
        }
    }
    
    template <typename T>
    void pwritea(int f, const T * tbuf, size_t nbytes, size_t off, const std::string &fname) {
        size_t nwritten = 0;
        const char * buf = (const char*)tbuf;
        while(nwritten<nbytes) {
            ssize_t a = pwrite(f, buf, nbytes-nwritten, off+nwritten);
            if (a == (-1)) {
                if (errno == EINTR) continue;
                throw graph_access_error(io_error_message("Could not write", fname));
            }
            buf += a;
            nwritten += a;
        }
    }
    
    static inline size_t get_filesize(int f, const std::string &fname) {
        struct stat st;
        if (fstat(f, &st) != 0) {
            throw graph_access_error(io_error_message("Could not stat", fname));
        }
        return (size_t) st.st_size;
    }
    
    /**
     * Running zlib crc32 over a buffer. Start with crc = 0.
     */
    static inline uint32_t crc32_update(uint32_t crc, const void * buf, size_t nbytes) {
        const Bytef * p = (const Bytef *) buf;
        uLong c = crc;
        // crc32() takes a uInt length
        while (nbytes > 0) {
            uInt chunk = (uInt) std::min(nbytes, (size_t) (1u << 30));
            c = crc32(c, p, chunk);
            p += chunk;
            nbytes -= chunk;
        }
        return (uint32_t) c;
    }
    
}

#endif

