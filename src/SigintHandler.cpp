//
//  SigintHandler.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <csignal>

#include "SigintHandler.hpp"

static_assert(std::atomic<bool>::is_always_lock_free, "atomics must be lock-free to be signal-safe");

static std::atomic<bool>* g_Interrupted = nullptr;

extern "C" void
HashLookupSigintHandler(
    int Signal
)
{
    if (g_Interrupted != nullptr)
    {
        g_Interrupted->store(true);
    }
    // A second interrupt terminates the process
    std::signal(Signal, SIG_DFL);
}

SigintHandler::SigintHandler(
    std::atomic<bool>& Interrupted
)
{
    g_Interrupted = &Interrupted;
    std::signal(SIGINT, &HashLookupSigintHandler);
}

SigintHandler::~SigintHandler(
    void
)
{
    std::signal(SIGINT, SIG_DFL);
    g_Interrupted = nullptr;
}
