#pragma once

#include "buflist_chunk_list.hpp"
#include "buflist_reader.hpp"
#include "zf_log.h"
#include <algorithm> // for std::min
#include <cstring>   // for std::memcpy
#include <stdexcept>
#include <string>
#include <utility>

namespace buflist {

    // Seekable reader that owns its ChunkList and releases chunks as soon as
    // the position has moved past them.
    //
    // Reads, fills and consumes behave exactly like Cursor. The difference is
    // memory: every chunk lying wholly behind the position is advanced off the
    // list, so a long sequential read holds at most one consumed chunk.
    // The price is that seek() cannot go below min_position(), the start of
    // the chunk currently under the cursor.
    class DrainingCursor : public SeekableReader {
    public:
        explicit DrainingCursor(ChunkList list)
            : _list(std::move(list)), _total(_list.remaining()) {}

        DrainingCursor(const DrainingCursor&) = delete;
        DrainingCursor& operator=(const DrainingCursor&) = delete;
        DrainingCursor(DrainingCursor&&) = default;
        DrainingCursor& operator=(DrainingCursor&&) = default;

        // Chunks not yet released; the front one may be partly read.
        const ChunkList& get_ref() const { return _list; }

        // Hands back the unread bytes as a list of their own.
        ChunkList into_inner() && {
            ChunkList rest = std::move(_list);
            rest.advance(static_cast<size_t>(_pos - _drained));
            _list.clear();
            _drained = _pos = _total;
            return rest;
        }

        uint64_t position() const override { return _pos; }
        uint64_t total_length() const override { return _total; }
        uint64_t min_position() const override { return _drained; }

        Result<uint64_t, Error> seek(SeekFrom target) override {
            auto resolved = resolve_seek(target, _pos, _total);
            if (resolved.is_err()) return resolved;

            uint64_t new_pos = std::min(resolved.unwrap(), _total);
            if (new_pos < _drained) {
                ZF_LOGD("DrainingCursor::seek: target %llu is below drain point %llu",
                        static_cast<unsigned long long>(new_pos),
                        static_cast<unsigned long long>(_drained));
                return Error::SeekBeforeDrainPoint;
            }
            _pos = new_pos;
            drain();
            return _pos;
        }

        size_t read(MutableByteView out) override {
            size_t written = 0;
            while (written < out.size) {
                ByteView available = fill_buf();
                if (available.empty()) break;
                size_t n = std::min(available.size, out.size - written);
                std::memcpy(out.data + written, available.data, n);
                written += n;
                _pos += n;
                drain();
            }
            return written;
        }

        ByteView fill_buf() const override {
            ByteView front = _list.front_chunk();
            if (front.empty()) return ByteView();
            size_t offset = static_cast<size_t>(_pos - _drained);
            return ByteView(front.data + offset, front.size - offset);
        }

        void consume(size_t count) override {
            size_t available = fill_buf().size;
            if (count > available) {
                ZF_LOGE("DrainingCursor::consume: count %zu exceeds %zu bytes available at position %llu",
                        count, available, static_cast<unsigned long long>(_pos));
                throw std::logic_error("DrainingCursor::consume: count " + std::to_string(count) +
                                       " exceeds available " + std::to_string(available));
            }
            _pos += count;
            drain();
        }

    private:
        // Releases every front chunk that ends at or before the position.
        // Afterwards either the list is empty (position == total) or the
        // position falls inside the front chunk.
        void drain() {
            while (_list.has_remaining()) {
                size_t front = _list.front_chunk().size;
                if (_drained + front > _pos) break;
                _list.advance(front);
                _drained += front;
            }
        }

        ChunkList _list;
        uint64_t _total;
        // absolute offset of the list's front chunk
        uint64_t _drained = 0;
        uint64_t _pos = 0;
    };

} // namespace buflist
