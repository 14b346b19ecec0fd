#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>   // for std::memcmp, std::strlen
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace buflist {

    // Non-owning view over bytes somebody else keeps alive.
    struct ByteView {
        const uint8_t* data;
        size_t size;

        ByteView() : data(nullptr), size(0) {}
        ByteView(const uint8_t* ptr, size_t len) : data(ptr), size(len) {}
        ByteView(const void* ptr, size_t len) : data(static_cast<const uint8_t*>(ptr)), size(len) {}

        bool empty() const { return size == 0; }

        const uint8_t& operator[](size_t index) const { return data[index]; }

        const uint8_t* begin() const { return data; }
        const uint8_t* end() const { return data + size; }

        std::string_view as_chars() const {
            return std::string_view(reinterpret_cast<const char*>(data), size);
        }
    };

    // Writable destination for reads.
    struct MutableByteView {
        uint8_t* data;
        size_t size;

        MutableByteView() : data(nullptr), size(0) {}
        MutableByteView(uint8_t* ptr, size_t len) : data(ptr), size(len) {}
        MutableByteView(void* ptr, size_t len) : data(static_cast<uint8_t*>(ptr)), size(len) {}
        MutableByteView(std::vector<uint8_t>& vec) : data(vec.data()), size(vec.size()) {}

        bool empty() const { return size == 0; }
    };

    // An immutable run of bytes. The backing store is reference counted and
    // shared between every chunk sliced from it; narrowing a chunk only moves
    // its (offset, size) window and never touches the bytes themselves.
    class Chunk {
    public:
        Chunk() = default;

        // Adopts the vector as backing storage without copying it.
        explicit Chunk(std::vector<uint8_t>&& bytes) {
            if (bytes.empty()) return;
            auto owner = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
            _size = owner->size();
            // aliasing constructor: the handle points at the bytes but keeps the vector alive
            _storage = std::shared_ptr<const uint8_t>(owner, owner->data());
        }

        static Chunk copy_from(const void* data, size_t len) {
            if (len == 0) return Chunk();
            if (data == nullptr) throw std::invalid_argument("Chunk::copy_from: null data with non-zero length");
            const auto* ptr = static_cast<const uint8_t*>(data);
            return Chunk(std::vector<uint8_t>(ptr, ptr + len));
        }

        static Chunk copy_from(std::string_view str) {
            return copy_from(str.data(), str.size());
        }

        // Wraps memory that outlives every chunk (string literals, static tables).
        // Nothing is copied and nothing is freed.
        static Chunk from_static(const void* data, size_t len) {
            Chunk chunk;
            if (len == 0) return chunk;
            if (data == nullptr) throw std::invalid_argument("Chunk::from_static: null data with non-zero length");
            chunk._storage = std::shared_ptr<const uint8_t>(static_cast<const uint8_t*>(data), [](const uint8_t*) {});
            chunk._size = len;
            return chunk;
        }

        static Chunk from_static(const char* str) {
            return from_static(str, str ? std::strlen(str) : 0);
        }

        const uint8_t* data() const { return _storage ? _storage.get() + _offset : nullptr; }
        size_t size() const { return _size; }
        bool empty() const { return _size == 0; }

        ByteView view() const { return ByteView(data(), _size); }

        const uint8_t& operator[](size_t index) const { return data()[index]; }

        const uint8_t* begin() const { return data(); }
        const uint8_t* end() const { return data() + _size; }

        // Zero-copy sub-range [begin, end) of the visible bytes.
        Chunk slice(size_t begin, size_t end) const {
            if (begin > end || end > _size) {
                throw std::out_of_range("Chunk::slice: range [" + std::to_string(begin) + ", " +
                                        std::to_string(end) + ") out of bounds for size " +
                                        std::to_string(_size));
            }
            Chunk result;
            if (begin == end) return result;
            result._storage = _storage;
            result._offset = _offset + begin;
            result._size = end - begin;
            return result;
        }

        // Drops count bytes from the front of the visible range.
        void advance(size_t count) {
            if (count > _size) {
                throw std::out_of_range("Chunk::advance: count " + std::to_string(count) +
                                        " exceeds size " + std::to_string(_size));
            }
            _offset += count;
            _size -= count;
            if (_size == 0) reset();
        }

        // Returns the first count bytes and narrows this chunk past them.
        Chunk split_to(size_t count) {
            Chunk head = slice(0, count);
            advance(count);
            return head;
        }

        bool shares_storage_with(const Chunk& other) const {
            return _storage != nullptr && _storage == other._storage;
        }

        long use_count() const { return _storage.use_count(); }

        void reset() {
            _storage.reset();
            _offset = 0;
            _size = 0;
        }

    private:
        std::shared_ptr<const uint8_t> _storage;
        size_t _offset = 0;
        size_t _size = 0;
    };

    inline bool operator==(const Chunk& a, const Chunk& b) {
        if (a.size() != b.size()) return false;
        return a.size() == 0 || std::memcmp(a.data(), b.data(), a.size()) == 0;
    }

    inline bool operator!=(const Chunk& a, const Chunk& b) {
        return !(a == b);
    }

} // namespace buflist
