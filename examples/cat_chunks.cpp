// Reads a file piece by piece into a ChunkList and writes it to stdout
// without ever joining the pieces into one buffer.
//
//   cat_chunks <file> [chunk_size] [tail_bytes]
//
// With tail_bytes, only the last tail_bytes bytes are written, located with a
// Cursor seek relative to the end.

#include "buflist.hpp"
#include "buflist_logger.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/uio.h>
#include <unistd.h>

static bool parse_size(const char* text, size_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') return false;
    out = static_cast<size_t>(value);
    return true;
}

static bool read_file_chunks(const char* path, size_t chunk_size, buflist::ChunkList& list) {
    int fd = open(path, O_RDONLY);
    if (fd < 0) {
        ZF_LOGE(BUFLIST_ADD_LOCATION("open(%s) failed: %s", path, strerror(errno)));
        return false;
    }

    while (true) {
        std::vector<uint8_t> piece(chunk_size);
        ssize_t n;
        do {
            n = read(fd, piece.data(), piece.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            ZF_LOGE(BUFLIST_ADD_LOCATION("read(%s) failed: %s", path, strerror(errno)));
            close(fd);
            return false;
        }
        if (n == 0) break;

        piece.resize(static_cast<size_t>(n));
        list.push_chunk(std::move(piece));
    }

    close(fd);
    ZF_LOGI("read %zu bytes in %zu chunks from %s", list.num_bytes(), list.num_chunks(), path);
    return true;
}

// Forward-only path: hand the front chunks to writev, then advance past what
// the kernel took.
static bool write_all(int fd, buflist::ChunkList& list) {
    buflist::ByteView views[buflist::MAX_VECTORED_CHUNKS];
    struct iovec iov[buflist::MAX_VECTORED_CHUNKS];

    while (list.has_remaining()) {
        size_t count = list.chunks_vectored(views, buflist::MAX_VECTORED_CHUNKS);
        for (size_t i = 0; i < count; ++i) {
            iov[i].iov_base = const_cast<uint8_t*>(views[i].data);
            iov[i].iov_len = views[i].size;
        }

        ssize_t written;
        do {
            written = writev(fd, iov, static_cast<int>(count));
        } while (written < 0 && errno == EINTR);

        if (written < 0) {
            ZF_LOGE(BUFLIST_ADD_LOCATION("writev failed: %s", strerror(errno)));
            return false;
        }
        list.advance(static_cast<size_t>(written));
    }
    return true;
}

// Seekable path: position a cursor near the end and stream out with fill/consume.
static bool write_tail(int fd, const buflist::ChunkList& list, size_t tail_bytes) {
    buflist::Cursor cursor(list);

    int64_t delta = -static_cast<int64_t>(std::min<uint64_t>(tail_bytes, cursor.total_length()));
    auto pos = cursor.seek(buflist::SeekFrom::end(delta));
    if (pos.is_err()) {
        ZF_LOGE("seek failed: %s", buflist::to_str(pos.unwrap_err()));
        return false;
    }
    ZF_LOGD("writing from position %llu of %llu",
            static_cast<unsigned long long>(pos.unwrap()),
            static_cast<unsigned long long>(cursor.total_length()));

    while (true) {
        buflist::ByteView available = cursor.fill_buf();
        if (available.empty()) break;

        ssize_t written;
        do {
            written = write(fd, available.data, available.size);
        } while (written < 0 && errno == EINTR);

        if (written < 0) {
            ZF_LOGE(BUFLIST_ADD_LOCATION("write failed: %s", strerror(errno)));
            return false;
        }
        cursor.consume(static_cast<size_t>(written));
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        fprintf(stderr, "Usage: %s <file> [chunk_size] [tail_bytes]\n", argv[0]);
        fprintf(stderr, "  chunk_size  bytes per read() call (default 4096)\n");
        fprintf(stderr, "  tail_bytes  only write the last N bytes\n");
        return 1;
    }

    buflist::LoggerConfig log_config = buflist::logger_config_from_env();
    buflist::LoggerStatus log_status = buflist::start_logging(log_config);
    if (log_status != buflist::LoggerStatus::Success) {
        fprintf(stderr, "logger: %s\n", buflist::to_str(log_status));
    }

    size_t chunk_size = 4096;
    if (argc >= 3 && (!parse_size(argv[2], chunk_size) || chunk_size == 0)) {
        fprintf(stderr, "invalid chunk_size: %s\n", argv[2]);
        return 1;
    }

    bool tail = false;
    size_t tail_bytes = 0;
    if (argc == 4) {
        if (!parse_size(argv[3], tail_bytes)) {
            fprintf(stderr, "invalid tail_bytes: %s\n", argv[3]);
            return 1;
        }
        tail = true;
    }

    buflist::ChunkList list;
    if (!read_file_chunks(argv[1], chunk_size, list)) {
        return 1;
    }

    bool ok = tail ? write_tail(STDOUT_FILENO, list, tail_bytes) : write_all(STDOUT_FILENO, list);
    return ok ? 0 : 1;
}
