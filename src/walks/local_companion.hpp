
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
 * In-process walk companion. Sources are striped over a fixed number of
 * worker threads; each worker owns the visit distributions of its sources and
 * consumes visit batches from its own queue. When a memory budget is set,
 * the largest distributions of a stripe drop their least visited entries
 * once the stripe exceeds its share of the budget.
 */

#ifndef DEF_DRUNKARDMOB_LOCAL_COMPANION
#define DEF_DRUNKARDMOB_LOCAL_COMPANION

#include <vector>
#include <map>
#include <algorithm>
#include <stdint.h>

#include "logger/logger.hpp"
#include "metrics/metrics.hpp"
#include "util/pthread_tools.hpp"
#include "util/synchronized_queue.hpp"
#include "util/drunkardmob_errors.hpp"
#include "walks/companion.hpp"
#include "walks/visit_distribution.hpp"

namespace drunkardmob {
    
    class local_companion;
    
    struct companion_stripe {
        int id;
        local_companion * companion;
        mutex lock;
        synchronized_queue<std::vector<visit> *> queue;
        std::map<vid_t, visit_distribution *> distributions;
        size_t evicted;
        uint64_t avoided_discarded;
        
        companion_stripe(int id, local_companion * companion) : id(id), companion(companion),
            evicted(0), avoided_discarded(0) {}
        
        ~companion_stripe() {
            for(std::map<vid_t, visit_distribution *>::iterator it = distributions.begin();
                it != distributions.end(); ++it) {
                delete it->second;
            }
        }
        
        /* Caller holds the lock */
        visit_distribution * get_or_create(vid_t source) {
            std::map<vid_t, visit_distribution *>::iterator it = distributions.find(source);
            if (it != distributions.end()) return it->second;
            visit_distribution * d = new visit_distribution();
            distributions[source] = d;
            return d;
        }
        
        /* Caller holds the lock */
        size_t memory_bytes() const {
            size_t mem = 0;
            for(std::map<vid_t, visit_distribution *>::const_iterator it = distributions.begin();
                it != distributions.end(); ++it) {
                mem += it->second->memory_bytes() + 4 * sizeof(void*);
            }
            return mem;
        }
    };
    
    inline void * companion_worker_thread(void * arg);
    
    class local_companion : public walk_companion {
        
        std::vector<companion_stripe *> stripes;
        thread_group workers;
        size_t membudget;
        size_t keep_top;
        file_logger &logger;
        
        mutex pending_lock;
        conditional pending_zero;
        size_t pending;
        
        friend void * companion_worker_thread(void * arg);
        
        companion_stripe * stripe_of(vid_t source) {
            return stripes[source % stripes.size()];
        }
        
        void process_batch(companion_stripe * stripe, std::vector<visit> * batch) {
            {
                scoped_lock<mutex> guard(stripe->lock);
                for(size_t i=0; i < batch->size(); i++) {
                    const visit &v = (*batch)[i];
                    stripe->get_or_create(v.source)->add(v.vertex);
                }
                if (membudget > 0) {
                    enforce_budget(stripe);
                }
            }
            delete batch;
            
            pending_lock.lock();
            pending--;
            if (pending == 0) pending_zero.broadcast();
            pending_lock.unlock();
        }
        
        /**
         * Shrinks the largest distributions of the stripe until it is back
         * under three quarters of its budget share. Every source keeps at
         * least its keep_top most visited entries, so the stripe may stay
         * over budget when it has very many sources. Caller holds the
         * stripe lock.
         */
        void enforce_budget(companion_stripe * stripe) {
            size_t stripe_budget = membudget / stripes.size();
            size_t mem = stripe->memory_bytes();
            if (mem <= stripe_budget) return;
            size_t target = stripe_budget - stripe_budget / 4;
            
            size_t evicted_now = 0;
            while (mem > target) {
                visit_distribution * largest = NULL;
                size_t nlargest = 0;
                for(std::map<vid_t, visit_distribution *>::iterator it = stripe->distributions.begin();
                    it != stripe->distributions.end(); ++it) {
                    size_t n = it->second->num_entries();
                    if (n > keep_top && n > nlargest) {
                        largest = it->second;
                        nlargest = n;
                    }
                }
                if (largest == NULL) break;   // all at the floor
                
                size_t excess = (mem - target) / (sizeof(vid_t) + sizeof(uint32_t)) + 1;
                size_t keep = nlargest > excess ? nlargest - excess : 0;
                evicted_now += largest->shrink(std::max(keep, keep_top));
                mem = stripe->memory_bytes();
            }
            stripe->evicted += evicted_now;
            if (evicted_now > 0) logstream(logger, LOG_WARNING) << "Companion stripe " << stripe->id << " over memory budget, evicted "
                << evicted_now << " least visited entries, memory now " << mem << " bytes" << std::endl;
            if (evicted_now > 0 && mem > stripe_budget) logstream(logger, LOG_WARNING) << "Companion stripe " << stripe->id
                << " stays over budget with " << stripe->distributions.size() << " sources at " << keep_top << " entries" << std::endl;
        }
        
    public:
        /**
         * @param nthreads number of worker threads (sources are striped over them)
         * @param membudget_bytes memory budget for the distributions, 0 for unbounded
         * @param keep_top number of most visited entries every source keeps under memory pressure
         */
        local_companion(int nthreads, size_t membudget_bytes, file_logger &logger, size_t keep_top = 300) :
            membudget(membudget_bytes), keep_top(keep_top), logger(logger), pending(0) {
            if (nthreads <= 0) {
                throw configuration_error("Companion needs at least one worker thread");
            }
            for(int i=0; i < nthreads; i++) {
                stripes.push_back(new companion_stripe(i, this));
            }
            for(int i=0; i < nthreads; i++) {
                if (!workers.launch(companion_worker_thread, stripes[i])) {
                    shutdown();
                    throw drunkardmob_error("Could not launch companion worker thread");
                }
            }
            logstream(logger, LOG_INFO) << "Started companion with " << nthreads << " threads, memory budget "
                << (membudget_bytes / 1024 / 1024) << " MB" << std::endl;
        }
        
        virtual ~local_companion() {
            shutdown();
        }
        
        virtual void set_avoidance(vid_t source, const std::vector<vid_t> &vertices) {
            companion_stripe * stripe = stripe_of(source);
            scoped_lock<mutex> guard(stripe->lock);
            stripe->get_or_create(source)->set_avoidance(vertices);
        }
        
        virtual void record_visits(const std::vector<visit> &visits) {
            if (visits.empty()) return;
            std::vector<std::vector<visit> *> batches(stripes.size(), (std::vector<visit> *) NULL);
            for(size_t i=0; i < visits.size(); i++) {
                size_t s = visits[i].source % stripes.size();
                if (batches[s] == NULL) batches[s] = new std::vector<visit>();
                batches[s]->push_back(visits[i]);
            }
            for(size_t s=0; s < batches.size(); s++) {
                if (batches[s] == NULL) continue;
                pending_lock.lock();
                pending++;
                pending_lock.unlock();
                stripes[s]->queue.push(batches[s]);
            }
        }
        
        virtual void flush() {
            pending_lock.lock();
            while (pending > 0) {
                pending_zero.wait(pending_lock);
            }
            pending_lock.unlock();
        }
        
        virtual std::vector<id_count> get_top(vid_t source, int topN) {
            companion_stripe * stripe = stripe_of(source);
            scoped_lock<mutex> guard(stripe->lock);
            std::map<vid_t, visit_distribution *>::iterator it = stripe->distributions.find(source);
            if (it == stripe->distributions.end()) {
                return std::vector<id_count>();
            }
            return it->second->top(topN);
        }
        
        virtual void discard(vid_t source) {
            companion_stripe * stripe = stripe_of(source);
            scoped_lock<mutex> guard(stripe->lock);
            std::map<vid_t, visit_distribution *>::iterator it = stripe->distributions.find(source);
            if (it != stripe->distributions.end()) {
                stripe->avoided_discarded += it->second->num_avoided();
                delete it->second;
                stripe->distributions.erase(it);
            }
        }
        
        int num_threads() const {
            return (int) stripes.size();
        }
        
        size_t num_sources() {
            size_t n = 0;
            for(size_t s=0; s < stripes.size(); s++) {
                scoped_lock<mutex> guard(stripes[s]->lock);
                n += stripes[s]->distributions.size();
            }
            return n;
        }
        
        /** Visits dropped because the vertex was on the source's avoidance list. */
        uint64_t total_avoided() {
            uint64_t n = 0;
            for(size_t s=0; s < stripes.size(); s++) {
                scoped_lock<mutex> guard(stripes[s]->lock);
                n += stripes[s]->avoided_discarded;
                for(std::map<vid_t, visit_distribution *>::iterator it = stripes[s]->distributions.begin();
                    it != stripes[s]->distributions.end(); ++it) {
                    n += it->second->num_avoided();
                }
            }
            return n;
        }
        
        /** Entries removed by compaction. */
        size_t total_evicted() {
            size_t n = 0;
            for(size_t s=0; s < stripes.size(); s++) {
                scoped_lock<mutex> guard(stripes[s]->lock);
                n += stripes[s]->evicted;
            }
            return n;
        }
        
        size_t memory_bytes() {
            size_t mem = 0;
            for(size_t s=0; s < stripes.size(); s++) {
                scoped_lock<mutex> guard(stripes[s]->lock);
                mem += stripes[s]->memory_bytes();
            }
            return mem;
        }
        
        void report_metrics(metrics &m) {
            m.set("companion.threads", (size_t) stripes.size());
            m.set("companion.sources", num_sources());
            m.set("companion.avoided_visits", (size_t) total_avoided());
            m.set("companion.evicted_entries", total_evicted());
            m.set("companion.memory_bytes", memory_bytes());
        }
        
    private:
        void shutdown() {
            for(size_t s=0; s < stripes.size(); s++) {
                stripes[s]->queue.close();
            }
            workers.join();
            for(size_t s=0; s < stripes.size(); s++) {
                std::vector<visit> * batch;
                while (stripes[s]->queue.safepop(&batch)) {
                    delete batch;
                }
                delete stripes[s];
            }
            stripes.clear();
        }
    };
    
    inline void * companion_worker_thread(void * arg) {
        companion_stripe * stripe = (companion_stripe *) arg;
        std::vector<visit> * batch;
        while (stripe->queue.wait_pop(&batch)) {
            stripe->companion->process_batch(stripe, batch);
        }
        return NULL;
    }
    
}

#endif

