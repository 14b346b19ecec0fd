#pragma once

#include <ostream>

namespace buflist {

    enum class Error {
        Unknown,
        // Seek target before the start of the data, or not representable
        InvalidSeek,
        // Seek target below the point a draining cursor has already released
        SeekBeforeDrainPoint,
        // read_exact asked for more bytes than remain
        UnexpectedEof,
    };

    inline const char* to_str(Error error) {
        switch (error) {
            case Error::Unknown: return "Unknown error";
            case Error::InvalidSeek: return "Invalid seek to a negative or overflowing position";
            case Error::SeekBeforeDrainPoint: return "Seek before the drained part of the list";
            case Error::UnexpectedEof: return "Unexpected end of data";
            default: return "Unknown error";
        }
    }

    inline std::ostream& operator<<(std::ostream& os, Error error) {
        return os << to_str(error);
    }

} // namespace buflist
