#ifndef DRUNKARDMOB_SYNCHRONIZED_QUEUE_HPP
#define DRUNKARDMOB_SYNCHRONIZED_QUEUE_HPP

#include <queue>
#include "util/pthread_tools.hpp"

// From graphlab

namespace drunkardmob {
    
        
        template <typename T>
        class synchronized_queue {
            
        public:
            synchronized_queue() : closed(false) { };
            ~synchronized_queue() { };
            
            void push(const T &item) {
                _queuelock.lock();
                _queue.push(item);
                _queuelock.unlock();
                _nonempty.signal();
            }
            
            bool safepop(T * ret) {
                _queuelock.lock();
                if (_queue.size() == 0) {
                    _queuelock.unlock();
                    
                    return false;
                }
                *ret = _queue.front();
                _queue.pop();
                _queuelock.unlock();
                return true;
            }
            
            /**
             * Blocks until an item is available. Returns false if the
             * queue was closed and is empty.
             */
            bool wait_pop(T * ret) {
                _queuelock.lock();
                while (_queue.size() == 0 && !closed) {
                    _nonempty.wait(_queuelock);
                }
                if (_queue.size() == 0) {
                    _queuelock.unlock();
                    return false;
                }
                *ret = _queue.front();
                _queue.pop();
                _queuelock.unlock();
                return true;
            }
            
            /** Wakes up all waiting consumers. Items pushed before remain poppable. */
            void close() {
                _queuelock.lock();
                closed = true;
                _queuelock.unlock();
                _nonempty.broadcast();
            }
            
            size_t size() const {
                _queuelock.lock();
                size_t sz = _queue.size();
                _queuelock.unlock();
                return sz;
            }
        private:
            std::queue<T> _queue;
            mutex _queuelock;
            conditional _nonempty;
            bool closed;
        };
        
    }
#endif
