
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
 * Usage:
 * A file_logger is created by the program and handed by reference to every
 * component that logs. To log, use the logstream(logger, level) macro:
 *
 *     logstream(lg, LOG_INFO) << "Starting pass " << iter << std::endl;
 *
 * or the printf-style logprintf(logger, level, fmt, ...).
 *
 * There are 2 output levels. A "soft" output level which is set by calling
 * set_log_level() on the logger instance, and a "hard" output level
 * OUTPUTLEVEL which is set at compile time. A message is written if its level
 * passes both. The hard level optimizes away logging calls at compile time.
 *
 * Adapted from the GraphLab logger (Yucheng Low). There is no process-wide
 * logger: each logger object owns its file and its per-thread stream buffers.
 */

#ifndef DRUNKARDMOB_LOG_LOG_HPP
#define DRUNKARDMOB_LOG_LOG_HPP
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <cstring>
#include <cstdarg>
#include <string>
#include <pthread.h>
/**
 * \def LOG_FATAL
 *   Used for fatal and probably irrecoverable conditions
 * \def LOG_ERROR
 *   Used for errors which are recoverable within the scope of the function
 * \def LOG_WARNING
 *   Logs interesting conditions which are probably not fatal
 * \def LOG_INFO
 *   Used for providing general useful information
 * \def LOG_DEBUG
 *   Debugging purposes only
 */
#define LOG_NONE 5
#define LOG_FATAL 4
#define LOG_ERROR 3
#define LOG_WARNING 2
#define LOG_INFO 1
#define LOG_DEBUG 0

/**
 * \def OUTPUTLEVEL
 *  The minimum level to log at
 */
#ifndef OUTPUTLEVEL
#define OUTPUTLEVEL LOG_DEBUG
#endif
/// If set, logs to screen will be printed in color
#define COLOROUTPUT


#if OUTPUTLEVEL == LOG_NONE
// totally disable logging
#define logprintf(lg,lvl,fmt,...)
#define logstream(lg,lvl) (drunkardmob::null_stream())
#else

#define logprintf(lg,lvl,fmt,...)                 \
    (drunkardmob::log_dispatch<(lvl >= OUTPUTLEVEL)>::exec((lg),lvl,__FILE__, __func__ ,__LINE__,fmt,##__VA_ARGS__))

#define logstream(lg,lvl)                      \
    (drunkardmob::log_stream_dispatch<(lvl >= OUTPUTLEVEL)>::exec((lg),lvl,__FILE__, __func__ ,__LINE__) )
#endif

namespace drunkardmob {
    
    static const char* log_level_names[] = {  "DEBUG:    ",
        "INFO:     ",
        "WARNING:  ",
        "ERROR:    ",
        "FATAL:    "};
    
    namespace logger_impl {
        struct streambuff_tls_entry {
            std::stringstream streambuffer;
            bool streamactive;
            int streamloglevel;
            streambuff_tls_entry() : streamactive(false), streamloglevel(LOG_INFO) {}
        };
    }
    
    /**
     * Parses a level name ("debug", "info", "warning", "error", "fatal").
     * Returns -1 if the name is not recognized.
     */
    static inline int parse_log_level(const std::string &name) {
        if (name == "debug") return LOG_DEBUG;
        if (name == "info") return LOG_INFO;
        if (name == "warning") return LOG_WARNING;
        if (name == "error") return LOG_ERROR;
        if (name == "fatal") return LOG_FATAL;
        return -1;
    }
    
    /**
     logging class.
     This writes to a file, and/or the system console.
     */
    class file_logger {
        
#define LOG_COLOR_BRIGHT    1
#define LOG_COLOR_RED       1
#define LOG_COLOR_GREEN     2
#define LOG_COLOR_YELLOW    3
        
    public:
        
        /** By default the logger writes to the console only, at level LOG_INFO. */
        file_logger() {
            log_to_console = true;
            log_level = LOG_INFO;
            pthread_mutex_init(&mut, NULL);
            pthread_key_create(&streambuffkey, streambuffdestructor);
        }
        
        ~file_logger() {
            if (fout.is_open()) {
                fout.flush();
                fout.close();
            }
            pthread_key_delete(streambuffkey);
            pthread_mutex_destroy(&mut);
        }
        
        /// If consolelog is true, subsequent logger output will be written to stderr
        void set_log_to_console(bool consolelog) {
            log_to_console = consolelog;
        }
        
        /// Returns the current logger file.
        std::string get_log_file() const {
            return log_file;
        }
        
        /// Returns true if output is being written to stderr
        bool get_log_to_console() const {
            return log_to_console;
        }
        
        /// Returns the current logger level
        int get_log_level() const {
            return log_level;
        }
        
        /** Sets the current logger level. All logging commands below the current
         logger level will not be written. */
        void set_log_level(int new_log_level) {
            log_level = new_log_level;
        }
        
        /** Closes the current logger file if one exists.
         If 'file' is not an empty string, it will be opened and
         all subsequent logger output will be written into 'file'.
         Any existing content of 'file' will be cleared.
         Return true on success and false on failure.
         */
        bool set_log_file(std::string file) {
            pthread_mutex_lock(&mut);
            if (fout.is_open()) {
                fout.flush();
                fout.close();
                log_file = "";
            }
            bool ok = true;
            if (file.length() > 0) {
                fout.open(file.c_str());
                if (fout.fail()) {
                    ok = false;
                } else {
                    log_file = file;
                }
            }
            pthread_mutex_unlock(&mut);
            return ok;
        }
        
        template <typename T>
        file_logger& operator<<(const T &a) {
            logger_impl::streambuff_tls_entry * entry = tls_entry();
            if (entry != NULL && entry->streamactive) entry->streambuffer << a;
            return *this;
        }
        
        file_logger& operator<<(const char* a) {
            logger_impl::streambuff_tls_entry * entry = tls_entry();
            if (entry != NULL && entry->streamactive) {
                entry->streambuffer << a;
                size_t len = strlen(a);
                if (len > 0 && a[len - 1] == '\n') {
                    stream_flush();
                }
            }
            return *this;
        }
        
        file_logger& operator<<(std::ostream& (*f)(std::ostream&)) {
            logger_impl::streambuff_tls_entry * entry = tls_entry();
            if (entry != NULL && entry->streamactive) {
                typedef std::ostream& (*endltype)(std::ostream&);
                if (endltype(f) == endltype(std::endl)) {
                    entry->streambuffer << "\n";
                    stream_flush();
                }
            }
            return *this;
        }
        
        void _log(int lineloglevel, const char* file, const char* function,
                  int line, const char* fmt, va_list ap) {
            if (lineloglevel < 0 || lineloglevel > LOG_FATAL || lineloglevel < log_level) return;
            file = basename_of(file);
            
            char str[1024];
            int byteswritten = snprintf(str, 1022, "%s%s(%s:%d): ",
                                        log_level_names[lineloglevel], file, function, line);
            if (byteswritten < 0) return;
            if (byteswritten > 1022) byteswritten = 1022;
            int n = vsnprintf(str + byteswritten, 1022 - byteswritten, fmt, ap);
            if (n > 0) byteswritten += std::min(n, 1022 - byteswritten - 1);
            str[byteswritten] = '\n';
            str[byteswritten + 1] = 0;
            _lograw(lineloglevel, str, byteswritten + 1);
        }
        
        file_logger& start_stream(int lineloglevel, const char* file, const char* function, int line) {
            logger_impl::streambuff_tls_entry * entry = tls_entry();
            if (entry == NULL) {
                entry = new logger_impl::streambuff_tls_entry();
                pthread_setspecific(streambuffkey, entry);
            }
            file = basename_of(file);
            
            if (lineloglevel >= log_level) {
                if (entry->streambuffer.str().length() == 0) {
                    entry->streambuffer << log_level_names[lineloglevel] << file
                    << "(" << function << ":" << line << "): ";
                }
                entry->streamactive = true;
                entry->streamloglevel = lineloglevel;
            } else {
                entry->streamactive = false;
            }
            return *this;
        }
        
    private:
        
        static void streambuffdestructor(void* v) {
            logger_impl::streambuff_tls_entry* t =
            reinterpret_cast<logger_impl::streambuff_tls_entry*>(v);
            delete t;
        }
        
        static const char * basename_of(const char * file) {
            const char * slash = strrchr(file, '/');
            return (slash != NULL ? slash + 1 : file);
        }
        
        logger_impl::streambuff_tls_entry * tls_entry() {
            return reinterpret_cast<logger_impl::streambuff_tls_entry*>(pthread_getspecific(streambuffkey));
        }
        
        void textcolor(FILE* handle, int attr, int fg) {
            fprintf(handle, "%c[%d;%dm", 0x1B, attr, fg + 30);
        }
        
        void reset_color(FILE* handle) {
            fprintf(handle, "%c[0m", 0x1B);
        }
        
        void _lograw(int lineloglevel, const char* buf, int len) {
            pthread_mutex_lock(&mut);
            if (fout.is_open() && fout.good()) {
                fout.write(buf, len);
                fout.flush();
            }
            if (log_to_console) {
#ifdef COLOROUTPUT
                if (lineloglevel == LOG_FATAL || lineloglevel == LOG_ERROR) {
                    textcolor(stderr, LOG_COLOR_BRIGHT, LOG_COLOR_RED);
                } else if (lineloglevel == LOG_WARNING) {
                    textcolor(stderr, LOG_COLOR_BRIGHT, LOG_COLOR_GREEN);
                } else if (lineloglevel == LOG_DEBUG) {
                    textcolor(stderr, LOG_COLOR_BRIGHT, LOG_COLOR_YELLOW);
                }
#endif
                std::cerr.write(buf, len);
#ifdef COLOROUTPUT
                reset_color(stderr);
#endif
            }
            pthread_mutex_unlock(&mut);
        }
        
        void stream_flush() {
            logger_impl::streambuff_tls_entry * entry = tls_entry();
            if (entry != NULL) {
                std::string s = entry->streambuffer.str();
                _lograw(entry->streamloglevel, s.c_str(), (int) s.length());
                entry->streambuffer.str("");
            }
        }
        
        file_logger(const file_logger&);
        file_logger& operator=(const file_logger&);
        
        std::ofstream fout;
        std::string log_file;
        pthread_key_t streambuffkey;
        pthread_mutex_t mut;
        bool log_to_console;
        int log_level;
    };
    
    /**
     Wrapper to generate 0 code if the output level is lower than the log level
     */
    template <bool dostuff>
    struct log_dispatch {};
    
    template <>
    struct log_dispatch<true> {
        inline static void exec(file_logger &lg, int loglevel, const char* file, const char* function,
                                int line, const char* fmt, ... ) {
            va_list argp;
            va_start(argp, fmt);
            lg._log(loglevel, file, function, line, fmt, argp);
            va_end(argp);
        }
    };
    
    template <>
    struct log_dispatch<false> {
        inline static void exec(file_logger &lg, int loglevel, const char* file, const char* function,
                                int line, const char* fmt, ... ) {}
    };
    
    
    struct null_stream {
        template<typename T>
        inline null_stream operator<<(const T &t) { return null_stream(); }
        inline null_stream operator<<(const char* a) { return null_stream(); }
        inline null_stream operator<<(std::ostream& (*f)(std::ostream&)) { return null_stream(); }
    };
    
    
    template <bool dostuff>
    struct log_stream_dispatch {};
    
    template <>
    struct log_stream_dispatch<true> {
        inline static file_logger& exec(file_logger &lg, int lineloglevel, const char* file, const char* function, int line) {
            return lg.start_stream(lineloglevel, file, function, line);
        }
    };
    
    template <>
    struct log_stream_dispatch<false> {
        inline static null_stream exec(file_logger &lg, int lineloglevel, const char* file, const char* function, int line) {
            return null_stream();
        }
    };
    
}

#endif

