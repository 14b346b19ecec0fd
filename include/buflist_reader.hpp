#pragma once

#include "buflist_chunk.hpp"
#include "buflist_error.hpp"
#include "buflist_result.hpp"
#include <cstdint>
#include <limits>

namespace buflist {

    // Seek target, relative to the start, the current position or the end.
    struct SeekFrom {
        enum class Whence {
            Start,
            Current,
            End,
        };

        Whence whence;
        uint64_t start_offset; // used by Whence::Start
        int64_t delta;         // used by Whence::Current and Whence::End

        static SeekFrom start(uint64_t offset) { return SeekFrom{Whence::Start, offset, 0}; }
        static SeekFrom current(int64_t delta) { return SeekFrom{Whence::Current, 0, delta}; }
        static SeekFrom end(int64_t delta) { return SeekFrom{Whence::End, 0, delta}; }
    };

    // base + delta without wrapping. Fails when the result would be negative
    // or would not fit in 64 bits.
    inline Result<uint64_t, Error> offset_position(uint64_t base, int64_t delta) {
        if (delta >= 0) {
            uint64_t step = static_cast<uint64_t>(delta);
            if (base > std::numeric_limits<uint64_t>::max() - step) return Error::InvalidSeek;
            return base + step;
        }
        // -(delta + 1) + 1 avoids overflowing on INT64_MIN
        uint64_t step = static_cast<uint64_t>(-(delta + 1)) + 1;
        if (step > base) return Error::InvalidSeek;
        return base - step;
    }

    inline Result<uint64_t, Error> resolve_seek(SeekFrom target, uint64_t position, uint64_t total_length) {
        switch (target.whence) {
            case SeekFrom::Whence::Start: return target.start_offset;
            case SeekFrom::Whence::Current: return offset_position(position, target.delta);
            case SeekFrom::Whence::End: return offset_position(total_length, target.delta);
        }
        return Error::Unknown;
    }

    // Positioned, seekable reader over the logical concatenation of a chunk list.
    //
    // Positions are absolute byte offsets from the start of the data and always
    // lie in [min_position(), total_length()]. Reaching total_length() is the
    // exhausted state: reads return 0 and fill_buf() returns an empty view.
    class SeekableReader {
    public:
        virtual ~SeekableReader() = default;

        virtual uint64_t position() const = 0;
        virtual uint64_t total_length() const = 0;

        // Lowest position seek() can still reach.
        virtual uint64_t min_position() const = 0;

        uint64_t remaining() const { return total_length() - position(); }

        // Returns the new position. Targets past the end clamp to total_length().
        virtual Result<uint64_t, Error> seek(SeekFrom target) = 0;

        // Copies up to out.size bytes and advances past them.
        virtual size_t read(MutableByteView out) = 0;

        // Borrowed view of the rest of the chunk under the cursor. Does not move.
        virtual ByteView fill_buf() const = 0;

        // Moves past count bytes of what fill_buf() exposed.
        // Throws std::logic_error if count is larger than that.
        virtual void consume(size_t count) = 0;

        // Fills each buffer in order, stopping at the first one left short.
        size_t read_vectored(MutableByteView* bufs, size_t count) {
            size_t total = 0;
            for (size_t i = 0; i < count; ++i) {
                size_t n = read(bufs[i]);
                total += n;
                if (n < bufs[i].size) break;
            }
            return total;
        }

        // Fills out completely, or fails without moving.
        Result<Empty, Error> read_exact(MutableByteView out) {
            if (remaining() < out.size) return Error::UnexpectedEof;
            size_t filled = 0;
            while (filled < out.size) {
                size_t n = read(MutableByteView(out.data + filled, out.size - filled));
                if (n == 0) return Error::UnexpectedEof;
                filled += n;
            }
            return Empty{};
        }
    };

} // namespace buflist
