#pragma once

#include "buflist_chunk_list.hpp"
#include "buflist_config.hpp"
#include "buflist_reader.hpp"
#include "zf_log.h"
#include <algorithm> // for std::min, std::upper_bound
#include <cstring>   // for std::memcpy
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace buflist {

    // Seekable reader over a ChunkList that never modifies the list.
    //
    // The list is either borrowed (the caller keeps it alive and unmodified for
    // the cursor's lifetime) or owned (moved in). Either way the full range
    // stays reachable: seeking backwards is always possible.
    //
    // The cursor keeps a table of chunk start offsets and the index of the
    // chunk under the current position. Short moves walk the table, long
    // jumps binary search it.
    class Cursor : public SeekableReader {
    public:
        explicit Cursor(const ChunkList& list) : _list(&list) { build_index(); }

        explicit Cursor(ChunkList&& list)
            : _owned(std::make_shared<const ChunkList>(std::move(list))), _list(_owned.get()) {
            build_index();
        }

        const ChunkList& get_ref() const { return *_list; }

        // Chunk handles are reference counted, so this copy shares the bytes.
        ChunkList into_inner() const { return *_list; }

        uint64_t position() const override { return _pos; }
        uint64_t total_length() const override { return _start_pos.back(); }
        uint64_t min_position() const override { return 0; }

        void set_position(uint64_t pos) { set_pos(pos); }

        Result<uint64_t, Error> seek(SeekFrom target) override {
            auto resolved = resolve_seek(target, _pos, total_length());
            if (resolved.is_err()) return resolved;
            set_pos(resolved.unwrap());
            return _pos;
        }

        size_t read(MutableByteView out) override {
            size_t written = 0;
            while (written < out.size && _chunk < num_chunks()) {
                const Chunk& chunk = *_list->get_chunk(_chunk);
                size_t offset = static_cast<size_t>(_pos - _start_pos[_chunk]);
                size_t n = std::min(chunk.size() - offset, out.size - written);
                std::memcpy(out.data + written, chunk.data() + offset, n);
                written += n;
                _pos += n;
                if (offset + n == chunk.size()) ++_chunk;
            }
            return written;
        }

        ByteView fill_buf() const override {
            if (_chunk >= num_chunks()) return ByteView();
            const Chunk& chunk = *_list->get_chunk(_chunk);
            size_t offset = static_cast<size_t>(_pos - _start_pos[_chunk]);
            return ByteView(chunk.data() + offset, chunk.size() - offset);
        }

        void consume(size_t count) override {
            size_t available = fill_buf().size;
            if (count > available) {
                ZF_LOGE("Cursor::consume: count %zu exceeds %zu bytes available at position %llu",
                        count, available, static_cast<unsigned long long>(_pos));
                throw std::logic_error("Cursor::consume: count " + std::to_string(count) +
                                       " exceeds available " + std::to_string(available));
            }
            set_pos(_pos + count);
        }

        // Index of the chunk under the cursor; num_chunks() when exhausted.
        size_t chunk_index() const { return _chunk; }

    private:
        size_t num_chunks() const { return _start_pos.size() - 1; }

        void build_index() {
            _start_pos.reserve(_list->num_chunks() + 1);
            uint64_t next = 0;
            for (const Chunk& chunk : *_list) {
                _start_pos.push_back(next);
                next += chunk.size();
            }
            _start_pos.push_back(next);
        }

        bool chunk_contains(size_t chunk, uint64_t pos) const {
            return chunk < num_chunks() && _start_pos[chunk] <= pos && pos < _start_pos[chunk + 1];
        }

        void set_pos(uint64_t new_pos) {
            const uint64_t total = total_length();
            if (new_pos >= total) {
                _pos = total;
                _chunk = num_chunks();
                return;
            }

            size_t chunk = _chunk;
            for (size_t steps = 0; !chunk_contains(chunk, new_pos) && steps < CURSOR_LINEAR_SCAN; ++steps) {
                if (chunk < num_chunks() && _start_pos[chunk + 1] <= new_pos) {
                    ++chunk;
                } else {
                    --chunk;
                }
            }

            if (!chunk_contains(chunk, new_pos)) {
                // last chunk starting at or before new_pos; _start_pos[0] == 0 so it exists
                auto it = std::upper_bound(_start_pos.begin(), _start_pos.end() - 1, new_pos);
                chunk = static_cast<size_t>(it - _start_pos.begin()) - 1;
            }

            _chunk = chunk;
            _pos = new_pos;
        }

        std::shared_ptr<const ChunkList> _owned;
        const ChunkList* _list;

        // start offset of every chunk, plus the total length as the last entry
        std::vector<uint64_t> _start_pos;
        size_t _chunk = 0;
        uint64_t _pos = 0;
    };

} // namespace buflist
