//
//  Check.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef Check_hpp
#define Check_hpp

#include <cstdlib>
#include <iostream>

namespace hashlookup
{

[[noreturn]] inline void
CheckFailed(
    const char* Expression,
    const char* Function,
    const char* File,
    const int Line
)
{
    std::cerr << "Check failed in " << Function << ": " << Expression << " (" << File << ":" << Line << ")" << std::endl;
    std::abort();
}

template <typename L, typename R>
inline void
CheckEqual(
    const L& Left,
    const R& Right,
    const char* Expression,
    const char* Function,
    const char* File,
    const int Line
)
{
    if (!(Left == Right))
    {
        std::cerr << "Values differ: " << Left << " != " << Right << std::endl;
        CheckFailed(Expression, Function, File, Line);
    }
}

} // namespace hashlookup

#define CHECK(condition) \
    do { if (!(condition)) hashlookup::CheckFailed(#condition, __func__, __FILE__, __LINE__); } while (0)
#define CHECK_EQ(left, right) \
    hashlookup::CheckEqual((left), (right), #left " == " #right, __func__, __FILE__, __LINE__)

// Invariants that only hold if this code is correct, compiled out of release builds
#ifdef DEBUG
#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(left, right) CHECK_EQ(left, right)
#else
#define DCHECK(condition) do { } while (0)
#define DCHECK_EQ(left, right) do { } while (0)
#endif

#endif /* Check_hpp */
