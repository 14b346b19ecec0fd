#pragma once

#include <cstddef>

namespace buflist {

    // Number of chunks the cursor walks one by one before it falls back to a
    // binary search over chunk start offsets. Sequential reads only ever move
    // one chunk at a time, so a small window covers them.
    #ifndef BUFLIST_CURSOR_LINEAR_SCAN
    #define BUFLIST_CURSOR_LINEAR_SCAN (4)
    #endif
    constexpr size_t CURSOR_LINEAR_SCAN = BUFLIST_CURSOR_LINEAR_SCAN;

    // Upper bound on views handed to a single scatter/gather write.
    // Kept below IOV_MAX on every platform we target.
    #ifndef BUFLIST_MAX_VECTORED_CHUNKS
    #define BUFLIST_MAX_VECTORED_CHUNKS (64)
    #endif
    constexpr size_t MAX_VECTORED_CHUNKS = BUFLIST_MAX_VECTORED_CHUNKS;

    static_assert(CURSOR_LINEAR_SCAN > 0, "BUFLIST_CURSOR_LINEAR_SCAN must be positive");
    static_assert(MAX_VECTORED_CHUNKS > 0, "BUFLIST_MAX_VECTORED_CHUNKS must be positive");

} // namespace buflist
