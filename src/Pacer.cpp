//
//  Pacer.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <algorithm>
#include <thread>

#include "Pacer.hpp"

// Granularity at which a sleeping pacer notices an interrupt
#define PAUSE_SLICE_MS 100

const bool
SleepPacer::Pause(
    const std::chrono::milliseconds Interval
)
{
    const auto deadline = std::chrono::steady_clock::now() + Interval;

    while (true)
    {
        if (m_Interrupted != nullptr && m_Interrupted->load())
        {
            return false;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(
            std::min(remaining + std::chrono::milliseconds(1), std::chrono::milliseconds(PAUSE_SLICE_MS))
        );
    }
}
