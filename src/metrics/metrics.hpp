
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
 * Metrics. Counters and timers of one run, reported at the end
 * through an imetrics_reporter.
 */

#ifndef DEF_DRUNKARDMOB_METRICS_HPP
#define DEF_DRUNKARDMOB_METRICS_HPP

#include <cstdio>
#include <cstring>
#include <map>
#include <string>
#include <limits>
#include <algorithm>
#include <sys/time.h>

#include "util/pthread_tools.hpp"

namespace drunkardmob {
    
    
    enum metrictype {REAL, INTEGER, TIME, STRING};
    
    // Data structure for storing metric entries
    // NOTE: This data structure is not very optimal, should
    // of course use inheritance. But for this purpose,
    // it works fine as the number of metrics entry is small.
    struct metrics_entry {
        size_t count;
        double value;
        double minvalue;
        double cumvalue;
        double maxvalue;
        metrictype valtype;
        std::string stringval;
        timeval start_time;
        double lasttime;
        
        metrics_entry() : count(0), value(0), minvalue(0), cumvalue(0), maxvalue(0), valtype(REAL), lasttime(0) {}
        
        inline metrics_entry(double firstvalue, metrictype _valtype) {
            minvalue = firstvalue;
            maxvalue = firstvalue;
            value = firstvalue;
            valtype = _valtype;
            cumvalue = value;
            count = 1;
            lasttime = 0;
        };
        inline metrics_entry(std::string svalue) {
            valtype = STRING;
            stringval = svalue;
            count = 0; value = cumvalue = minvalue = maxvalue = lasttime = 0;
        }
        inline metrics_entry(metrictype _valtype) {
            valtype = _valtype;
            count = 0;
            cumvalue = 0;
            value = 0;
            lasttime = 0;
            minvalue = std::numeric_limits<double>::max();
            maxvalue = std::numeric_limits<double>::min();
        }
        inline void adj(double v) {
            if (count == 0) {
                minvalue = v;
                maxvalue = v;
            } else {
                minvalue = std::min(v,minvalue);
                maxvalue = std::max(v,maxvalue);
            }
        }
        
        inline void add(double x) {
            adj(x);
            value += x;
            cumvalue += x;
            ++count;
        }
        
        inline void set(double v) {
            adj(v);
            value = v;
            cumvalue += v;
            ++count;
        }
        
        inline void timer_start() {
            gettimeofday(&start_time, NULL);
        }
        /** Seconds since timer_start(), timer keeps running. */
        inline double timer_elapsed() const {
            timeval now;
            gettimeofday(&now, NULL);
            return now.tv_sec - start_time.tv_sec + ((double)(now.tv_usec - start_time.tv_usec)) / 1.0E6;
        }
        inline void timer_stop() {
            timeval end;
            gettimeofday(&end, NULL);
            lasttime = end.tv_sec - start_time.tv_sec + ((double)(end.tv_usec - start_time.tv_usec)) / 1.0E6;      
            add(lasttime);
        }
    };
    
    class imetrics_reporter {
        
    public:
        virtual ~imetrics_reporter() {}
        virtual void do_report(std::string name, std::string id, std::map<std::string, metrics_entry> &  entries) = 0;
    };    
    
    /**
     * Metrics instance for logging metrics of a single object type.
     * Name of the metrics instance is set on construction.
     * All methods are thread-safe.
     */
    class metrics {
        
        std::string name, ident;
        std::map<std::string, metrics_entry> entries;
        mutex mlock;
        
    public: 
        inline metrics(std::string _name = "", std::string _id = "") : name(_name), ident (_id) {
            this->set("app", _name);
        }
        
        inline void clear() {
            scoped_lock<mutex> guard(mlock);
            entries.clear();
        }
        
        inline std::string iterkey(std::string key, int iter) {
            char s[256];
            snprintf(s, 256, "%s.%d", key.c_str(), iter);
            return std::string(s);
        }
        
        /**
         * Add to an existing value or create new.
         */
        inline void add(std::string key, double value, metrictype type = REAL) {
            scoped_lock<mutex> guard(mlock);
            if (entries.count(key) == 0) {
                entries[key] = metrics_entry(value, type);
            } else {
                entries[key].add(value);
            }
        }
        
        inline void set(std::string key, size_t value) {
            set(key, (double)value, INTEGER);
        }
        
        inline void set(std::string key, int value) {
            set(key, (double)value, INTEGER);
        }  
        
        inline void set(std::string key, double value, metrictype type = REAL) {
            scoped_lock<mutex> guard(mlock);
            if (entries.count(key) == 0) {
                entries[key] = metrics_entry(value, type);
            } else {
                entries[key].set(value);
            }
        }
        
        inline void set(std::string key, std::string s) {
            scoped_lock<mutex> guard(mlock);
            if (entries.count(key) == 0) {
                entries[key] = metrics_entry(s);
            } else {
                entries[key].stringval = s;
            }
        }
        
        inline void start_time(std::string key) {
            scoped_lock<mutex> guard(mlock);
            if (entries.count(key) == 0) {
                entries[key] = metrics_entry(TIME);
            } 
            entries[key].timer_start();
        }
        
        metrics_entry start_time() {
            metrics_entry me(TIME);  
            me.timer_start();
            return me;
        }
        
        inline void stop_time(metrics_entry me, std::string key) {
            me.timer_stop();
            scoped_lock<mutex> guard(mlock);
            if (entries.count(key) == 0) {
                entries[key] = metrics_entry(TIME);
            } 
            entries[key].add(me.lasttime);
        }
        
        inline void stop_time(std::string key) {
            scoped_lock<mutex> guard(mlock);
            entries[key].timer_stop();
        }
        
        inline bool has(std::string key) {
            scoped_lock<mutex> guard(mlock);
            return entries.count(key) > 0;
        }
        
        inline metrics_entry get(std::string key) {
            scoped_lock<mutex> guard(mlock);
            return entries[key];
        }
        
        void report(imetrics_reporter & reporter) {
            if (name != "") {
                std::map<std::string, metrics_entry> copy;
                {
                    scoped_lock<mutex> guard(mlock);
                    copy = entries;
                }
                reporter.do_report(name, ident, copy);
            }
        }
        
    };
    
}


#endif

