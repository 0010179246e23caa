//
//  Pacer.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef Pacer_hpp
#define Pacer_hpp

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>

class Pacer
{
public:
    virtual ~Pacer(void) = default;
    // Returns false if the wait was cut short by an interruption
    virtual const bool Pause(const std::chrono::milliseconds Interval) = 0;
};

using PacerPtr = std::shared_ptr<Pacer>;

//
// Blocks the calling thread for the full interval. The wait is
// sliced so that a pending interrupt ends it early.
//
class SleepPacer : public Pacer
{
public:
    SleepPacer(const std::atomic<bool>* Interrupted = nullptr) : m_Interrupted(Interrupted) {}
    const bool Pause(const std::chrono::milliseconds Interval) override;
private:
    const std::atomic<bool>* m_Interrupted;
};

//
// Single consumer queue that enforces a fixed delay after each item
// it hands out, except the last one. Items are consumed strictly in
// the order they were pushed.
//
template <typename T>
class PacedQueue
{
public:
    PacedQueue(Pacer& Pacer, const std::chrono::milliseconds Interval) : m_Pacer(Pacer), m_Interval(Interval) {}
    void Push(T Item) { m_Items.push_back(std::move(Item)); }
    const size_t Size(void) const { return m_Items.size(); }
    const bool Empty(void) const { return m_Items.empty(); }
    const std::chrono::milliseconds GetInterval(void) const { return m_Interval; }

    // Returns the number of items consumed. Stops early once Interrupted
    // is set, leaving the remaining items queued.
    const size_t
    Drain(
        const std::function<void(T&)>& Consumer,
        const std::atomic<bool>* Interrupted = nullptr
    )
    {
        size_t consumed = 0;

        while (!m_Items.empty())
        {
            if (Interrupted != nullptr && Interrupted->load())
            {
                break;
            }

            T item = std::move(m_Items.front());
            m_Items.pop_front();
            Consumer(item);
            consumed++;

            if (!m_Items.empty())
            {
                m_Pacer.Pause(m_Interval);
            }
        }

        return consumed;
    }
private:
    Pacer& m_Pacer;
    std::chrono::milliseconds m_Interval;
    std::deque<T> m_Items;
};

#endif /* Pacer_hpp */
