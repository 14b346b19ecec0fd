#pragma once

#include "buflist_chunk.hpp"
#include "zf_log.h"
#include <algorithm> // for std::min
#include <cstring>   // for std::memcpy
#include <deque>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace buflist {

    // An ordered FIFO of chunks that together form one logical byte stream.
    //
    // Chunks are appended at the back and consumed from the front. The total
    // number of unconsumed bytes is tracked incrementally, so remaining() is O(1).
    //
    // Invariants:
    //   - no stored chunk is empty
    //   - _remaining == sum of the stored chunk sizes
    class ChunkList {
    public:
        using const_iterator = std::deque<Chunk>::const_iterator;

        ChunkList() = default;

        explicit ChunkList(Chunk chunk) { push_chunk(std::move(chunk)); }

        ChunkList(std::initializer_list<Chunk> chunks) { extend(chunks.begin(), chunks.end()); }

        ChunkList(const ChunkList&) = default;
        ChunkList& operator=(const ChunkList&) = default;

        // The moved-from list is left empty, with a matching byte count.
        ChunkList(ChunkList&& other) : _chunks(std::move(other._chunks)), _remaining(other._remaining) {
            other.clear();
        }

        ChunkList& operator=(ChunkList&& other) {
            if (this != &other) {
                _chunks = std::move(other._chunks);
                _remaining = other._remaining;
                other.clear();
            }
            return *this;
        }

        template<typename InputIt>
        static ChunkList from_range(InputIt first, InputIt last) {
            ChunkList list;
            list.extend(first, last);
            return list;
        }

        // Appends a chunk and returns the handle that was stored. Empty chunks
        // are dropped so the list never holds zero-length entries.
        Chunk push_chunk(Chunk chunk) {
            if (!chunk.empty()) {
                _remaining += chunk.size();
                _chunks.push_back(chunk);
            }
            return chunk;
        }

        Chunk push_chunk(const void* data, size_t len) {
            return push_chunk(Chunk::copy_from(data, len));
        }

        Chunk push_chunk(std::vector<uint8_t>&& bytes) {
            return push_chunk(Chunk(std::move(bytes)));
        }

        template<typename InputIt>
        void extend(InputIt first, InputIt last) {
            for (; first != last; ++first) {
                push_chunk(*first);
            }
        }

        template<typename Container>
        void extend(const Container& chunks) {
            extend(std::begin(chunks), std::end(chunks));
        }

        size_t num_chunks() const { return _chunks.size(); }
        size_t num_bytes() const { return _remaining; }
        size_t remaining() const { return _remaining; }
        bool has_remaining() const { return _remaining > 0; }
        bool empty() const { return _chunks.empty(); }

        // nullptr when index is past the last chunk
        const Chunk* get_chunk(size_t index) const {
            return index < _chunks.size() ? &_chunks[index] : nullptr;
        }

        ByteView front_chunk() const {
            return _chunks.empty() ? ByteView() : _chunks.front().view();
        }

        const_iterator begin() const { return _chunks.begin(); }
        const_iterator end() const { return _chunks.end(); }

        // Fills out with views of the leading chunks, up to max entries.
        // Returns the number of views written.
        size_t chunks_vectored(ByteView* out, size_t max) const {
            size_t filled = 0;
            for (auto it = _chunks.begin(); it != _chunks.end() && filled < max; ++it) {
                out[filled++] = it->view();
            }
            return filled;
        }

        // Discards count bytes from the front. Fully consumed chunks are
        // popped, a partially consumed front chunk is narrowed in place.
        void advance(size_t count) {
            check_consumable("advance", count);

            size_t to_skip = count;
            while (to_skip > 0) {
                Chunk& front = _chunks.front();
                if (front.size() <= to_skip) {
                    to_skip -= front.size();
                    _chunks.pop_front();
                } else {
                    front.advance(to_skip);
                    to_skip = 0;
                }
            }
            _remaining -= count;
        }

        // Removes len bytes from the front and returns them as one contiguous
        // chunk. A request served by the front chunk alone is a zero-copy slice.
        Chunk copy_to_contiguous(size_t len) {
            check_consumable("copy_to_contiguous", len);
            if (len == 0) return Chunk();

            Chunk& front = _chunks.front();
            if (len <= front.size()) {
                Chunk head = front.split_to(len);
                if (front.empty()) _chunks.pop_front();
                _remaining -= len;
                return head;
            }

            std::vector<uint8_t> out(len);
            size_t copied = 0;
            for (auto it = _chunks.begin(); copied < len; ++it) {
                size_t n = std::min(it->size(), len - copied);
                std::memcpy(out.data() + copied, it->data(), n);
                copied += n;
            }
            advance(len);
            return Chunk(std::move(out));
        }

        void clear() {
            _chunks.clear();
            _remaining = 0;
        }

    private:
        void check_consumable(const char* op, size_t count) const {
            if (count > _remaining) {
                ZF_LOGE("ChunkList::%s: count %zu exceeds remaining %zu", op, count, _remaining);
                throw std::out_of_range(std::string("ChunkList::") + op + ": count " + std::to_string(count) +
                                        " exceeds remaining " + std::to_string(_remaining));
            }
        }

        std::deque<Chunk> _chunks;
        size_t _remaining = 0;
    };

} // namespace buflist
