//
//  SigintHandler.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef SigintHandler_hpp
#define SigintHandler_hpp

#include <atomic>

// Sets the given flag on the first SIGINT, after which the default
// handler applies again. At most one instance may exist at a time.
class SigintHandler
{
public:
    SigintHandler(std::atomic<bool>& Interrupted);
    ~SigintHandler(void);
    SigintHandler(const SigintHandler& Other) = delete;
    SigintHandler& operator=(const SigintHandler& Other) = delete;
};

#endif /* SigintHandler_hpp */
