// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

// FIFO channel between the dispatcher and one controller thread. pop() blocks
// until an item arrives or the queue is closed; a closed queue still hands out
// the items already in it unless they were discarded by abort().
template <typename T>
class ClosableQueue {
public:
    ClosableQueue() = default;

    ClosableQueue(const ClosableQueue&) = delete;
    ClosableQueue& operator=(const ClosableQueue&) = delete;

    // Returns false if the queue is already closed.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_closed) {
                return false;
            }
            _items.push_back(std::move(item));
        }
        _ready.notify_one();
        return true;
    }

    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(_mutex);
        _ready.wait(lock, [this] { return _closed || !_items.empty(); });
        if (_items.empty()) {
            return false;
        }
        item = std::move(_items.front());
        _items.pop_front();
        ++_inFlight;
        return true;
    }

    // The consumer finished the item it last popped.
    void taskDone() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_inFlight) {
                --_inFlight;
            }
        }
        _drained.notify_all();
    }

    // Blocks until every pushed item was popped and finished.
    void waitDrained() {
        std::unique_lock<std::mutex> lock(_mutex);
        _drained.wait(lock, [this] { return _items.empty() && _inFlight == 0; });
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
        }
        _ready.notify_all();
    }

    // Close and drop everything not yet popped.
    void abort() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
            _items.clear();
        }
        _ready.notify_all();
        _drained.notify_all();
    }

    // Empty and open again, ready for the next batch.
    void reopen() {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.clear();
        _inFlight = 0;
        _closed   = false;
    }

private:
    std::mutex              _mutex;
    std::condition_variable _ready;
    std::condition_variable _drained;
    std::deque<T>           _items;
    size_t                  _inFlight = 0;
    bool                    _closed   = false;
};
