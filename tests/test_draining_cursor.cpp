#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "buflist_cursor.hpp"
#include "buflist_draining_cursor.hpp"

using buflist::ByteView;
using buflist::Chunk;
using buflist::ChunkList;
using buflist::Cursor;
using buflist::DrainingCursor;
using buflist::Error;
using buflist::MutableByteView;
using buflist::SeekFrom;

class DrainingCursorTest : public ::testing::Test {
protected:
    static ChunkList make_list(const std::vector<std::string>& pieces) {
        ChunkList list;
        for (const auto& piece : pieces) {
            list.push_chunk(Chunk::copy_from(piece));
        }
        return list;
    }

    static std::string read_n(buflist::SeekableReader& reader, size_t n) {
        std::vector<uint8_t> buf(n);
        size_t got = reader.read(buf);
        return std::string(buf.begin(), buf.begin() + got);
    }

    // "ab" "cde" "f" "ghij": chunk starts 0, 2, 5, 6; total 10
    DrainingCursor cursor{make_list({"ab", "cde", "f", "ghij"})};
};

TEST_F(DrainingCursorTest, StartsWithNothingDrained) {
    EXPECT_EQ(cursor.position(), 0u);
    EXPECT_EQ(cursor.min_position(), 0u);
    EXPECT_EQ(cursor.total_length(), 10u);
    EXPECT_EQ(cursor.get_ref().num_chunks(), 4u);
}

TEST_F(DrainingCursorTest, ReadReleasesFinishedChunks) {
    EXPECT_EQ(read_n(cursor, 3), "abc");
    EXPECT_EQ(cursor.min_position(), 2u);
    EXPECT_EQ(cursor.get_ref().num_chunks(), 3u);
    EXPECT_EQ(cursor.get_ref().remaining(), 8u);

    EXPECT_EQ(read_n(cursor, 3), "def");
    EXPECT_EQ(cursor.min_position(), 6u);
    EXPECT_EQ(cursor.get_ref().num_chunks(), 1u);

    EXPECT_EQ(read_n(cursor, 10), "ghij");
    EXPECT_EQ(cursor.position(), 10u);
    EXPECT_EQ(cursor.min_position(), 10u);
    EXPECT_FALSE(cursor.get_ref().has_remaining());
    EXPECT_EQ(read_n(cursor, 1), "");
}

TEST_F(DrainingCursorTest, BackwardSeekWithinCurrentChunk) {
    read_n(cursor, 4);
    EXPECT_EQ(cursor.min_position(), 2u);

    EXPECT_EQ(cursor.seek(SeekFrom::current(-2)).unwrap(), 2u);
    EXPECT_EQ(read_n(cursor, 3), "cde");
}

TEST_F(DrainingCursorTest, BackwardSeekBelowDrainPointFails) {
    read_n(cursor, 6);
    ASSERT_EQ(cursor.min_position(), 6u);

    auto res = cursor.seek(SeekFrom::start(5));
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.unwrap_err(), Error::SeekBeforeDrainPoint);
    EXPECT_EQ(cursor.position(), 6u);

    EXPECT_EQ(cursor.seek(SeekFrom::current(-7)).unwrap_err(), Error::InvalidSeek);
    EXPECT_EQ(cursor.position(), 6u);
    EXPECT_EQ(read_n(cursor, 2), "gh");
}

TEST_F(DrainingCursorTest, ForwardSeekDrainsSkippedChunks) {
    EXPECT_EQ(cursor.seek(SeekFrom::start(7)).unwrap(), 7u);
    EXPECT_EQ(cursor.min_position(), 6u);
    EXPECT_EQ(cursor.get_ref().num_chunks(), 1u);
    EXPECT_EQ(cursor.fill_buf().as_chars(), "hij");
}

TEST_F(DrainingCursorTest, SeekPastEndDrainsEverything) {
    EXPECT_EQ(cursor.seek(SeekFrom::end(5)).unwrap(), 10u);
    EXPECT_EQ(cursor.min_position(), 10u);
    EXPECT_TRUE(cursor.fill_buf().empty());
    EXPECT_EQ(cursor.seek(SeekFrom::end(-1)).unwrap_err(), Error::SeekBeforeDrainPoint);
}

TEST_F(DrainingCursorTest, FillConsumeProtocol) {
    cursor.seek(SeekFrom::start(3));
    ByteView first = cursor.fill_buf();
    ByteView again = cursor.fill_buf();
    EXPECT_EQ(first.as_chars(), "de");
    EXPECT_EQ(first.data, again.data);

    EXPECT_THROW(cursor.consume(3), std::logic_error);
    EXPECT_EQ(cursor.position(), 3u);

    cursor.consume(2);
    EXPECT_EQ(cursor.min_position(), 5u);
    EXPECT_EQ(cursor.fill_buf().as_chars(), "f");
}

TEST_F(DrainingCursorTest, IntoInnerReturnsUnreadBytes) {
    read_n(cursor, 3);
    ChunkList rest = std::move(cursor).into_inner();

    EXPECT_EQ(rest.remaining(), 7u);
    EXPECT_EQ(rest.front_chunk().as_chars(), "de");
    EXPECT_EQ(rest.num_chunks(), 3u);
}

TEST_F(DrainingCursorTest, ReadExactAndVectored) {
    std::vector<uint8_t> four(4);
    ASSERT_TRUE(cursor.read_exact(four).is_ok());
    EXPECT_EQ(std::string(four.begin(), four.end()), "abcd");

    std::vector<uint8_t> a(3), b(8);
    MutableByteView bufs[] = {a, b};
    EXPECT_EQ(cursor.read_vectored(bufs, 2), 6u);
    EXPECT_EQ(std::string(a.begin(), a.end()), "efg");

    EXPECT_EQ(cursor.read_exact(four).unwrap_err(), Error::UnexpectedEof);
}

// Every operation a draining cursor accepts must give the same answer a
// non-draining cursor gives over the same bytes.
TEST_F(DrainingCursorTest, AgreesWithCursorOnReachableOperations) {
    ChunkList source = make_list({"The ", "quick", " ", "brown fox ", "jumps", " over", " the lazy dog"});
    Cursor reference(source);
    DrainingCursor draining(source);

    struct Step { char op; int64_t arg; };
    const Step steps[] = {
        {'r', 3}, {'s', -2}, {'r', 6}, {'f', 0}, {'c', 2}, {'e', -9}, {'r', 4},
        {'a', 30}, {'r', 1}, {'s', 0}, {'f', 0}, {'r', 100}, {'s', 5},
    };

    for (const Step& step : steps) {
        switch (step.op) {
            case 'r':
                EXPECT_EQ(read_n(draining, static_cast<size_t>(step.arg)),
                          read_n(reference, static_cast<size_t>(step.arg)));
                break;
            case 's': {
                auto d = draining.seek(SeekFrom::current(step.arg));
                if (d.is_ok()) {
                    EXPECT_EQ(d.unwrap(), reference.seek(SeekFrom::current(step.arg)).unwrap());
                }
                break;
            }
            case 'e': {
                auto d = draining.seek(SeekFrom::end(step.arg));
                if (d.is_ok()) {
                    EXPECT_EQ(d.unwrap(), reference.seek(SeekFrom::end(step.arg)).unwrap());
                }
                break;
            }
            case 'a': {
                auto d = draining.seek(SeekFrom::start(static_cast<uint64_t>(step.arg)));
                if (d.is_ok()) {
                    EXPECT_EQ(d.unwrap(), reference.seek(SeekFrom::start(static_cast<uint64_t>(step.arg))).unwrap());
                }
                break;
            }
            case 'f':
                EXPECT_EQ(draining.fill_buf().as_chars(), reference.fill_buf().as_chars());
                break;
            case 'c':
                draining.consume(static_cast<size_t>(step.arg));
                reference.consume(static_cast<size_t>(step.arg));
                break;
        }
        ASSERT_EQ(draining.position(), reference.position());
        ASSERT_GE(draining.position(), draining.min_position());
    }

    // the source list was copied in, never drained
    EXPECT_EQ(source.remaining(), 43u);
}
