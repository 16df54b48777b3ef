
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
 * A collection of utilities for threading. Originally from GraphLab.
 */

#ifndef DEF_DRUNKARDMOB_PTHREAD_TOOLS_HPP
#define DEF_DRUNKARDMOB_PTHREAD_TOOLS_HPP

#include <cstdio>
#include <cstdlib>
#include <pthread.h>
#include <sched.h>
#include <sys/time.h>
#include <cassert>
#include <vector>

#undef _POSIX_SPIN_LOCKS
#define _POSIX_SPIN_LOCKS -1

namespace drunkardmob {
    
    /**
     * \class mutex
     *
     * Wrapper around pthread's mutex On single core systems mutex
     * should be used.  On multicore systems, spinlock should be used.
     */
    class mutex {
    private:
        mutable pthread_mutex_t m_mut;
        mutex(const mutex&);
        mutex& operator=(const mutex&);
    public:
        mutex() {
            int error = pthread_mutex_init(&m_mut, NULL);
            assert(!error);
        }
        inline void lock() const {
            int error = pthread_mutex_lock( &m_mut  );
            assert(!error);
        }
        inline void unlock() const {
            int error = pthread_mutex_unlock( &m_mut );
            assert(!error);
        }
        inline bool try_lock() const {
            return pthread_mutex_trylock( &m_mut ) == 0;
        }
        ~mutex(){
            int error = pthread_mutex_destroy( &m_mut );
            if (error)
                perror("Error: failed to destroy mutex");
        }
        friend class conditional;
    }; // End of Mutex
    
    //! spinlocks are disabled, spinlock is typedefed to a mutex.
    typedef mutex spinlock;
    
    /**
     * Holds a lock for the duration of a scope.
     */
    template <typename lock_t>
    class scoped_lock {
        const lock_t &l;
        scoped_lock(const scoped_lock&);
        scoped_lock& operator=(const scoped_lock&);
    public:
        explicit scoped_lock(const lock_t &l) : l(l) { l.lock(); }
        ~scoped_lock() { l.unlock(); }
    };
    
    
    /**
     * \class conditional
     * Wrapper around pthread's condition variable
     */
    class conditional {
    private:
        mutable pthread_cond_t  m_cond;
        conditional(const conditional&);
        conditional& operator=(const conditional&);
    public:
        conditional() {
            int error = pthread_cond_init(&m_cond, NULL);
            assert(!error);
        }
        inline void wait(const mutex& mut) const {
            int error = pthread_cond_wait(&m_cond, &mut.m_mut);
            assert(!error);
        }
        inline int timedwait(const mutex& mut, int sec) const {
            struct timespec timeout;
            struct timeval tv;
            gettimeofday(&tv, NULL);
            timeout.tv_nsec = 0;
            timeout.tv_sec = tv.tv_sec + sec;
            return pthread_cond_timedwait(&m_cond, &mut.m_mut, &timeout);
        }
        inline void signal() const {
            int error = pthread_cond_signal(&m_cond);
            assert(!error);
        }
        inline void broadcast() const {
            int error = pthread_cond_broadcast(&m_cond);
            assert(!error);
        }
        ~conditional() {
            pthread_cond_destroy(&m_cond);
        }
    }; // End conditional
    
    
    /**
     * Group of pthreads running the same start routine. Threads
     * are joined with join() or on destruction.
     */
    class thread_group {
        std::vector<pthread_t> threads;
        thread_group(const thread_group&);
        thread_group& operator=(const thread_group&);
    public:
        thread_group() {}
        
        ~thread_group() {
            join();
        }
        
        /**
         * Launches a thread. Returns false if the thread could not be created.
         */
        bool launch(void * (*start_routine)(void *), void * arg) {
            pthread_t t;
            int error = pthread_create(&t, NULL, start_routine, arg);
            if (error) return false;
            threads.push_back(t);
            return true;
        }
        
        void join() {
            for(size_t i=0; i < threads.size(); i++) {
                pthread_join(threads[i], NULL);
            }
            threads.clear();
        }
        
        size_t size() const {
            return threads.size();
        }
    };
    
}
#endif

