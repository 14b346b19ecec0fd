#pragma once

// buflist: a zero-copy list of byte chunks with forward and seekable readers.
//
//   buflist::ChunkList list;
//   list.push_chunk(buflist::Chunk::from_static("hello"));
//   list.push_chunk(buflist::Chunk::copy_from(received, received_len));
//
//   buflist::Cursor cursor(list);          // borrows, full seek range
//   cursor.seek(buflist::SeekFrom::end(-3));
//
//   buflist::DrainingCursor drain(std::move(list)); // owns, frees as it reads

#include "buflist_config.hpp"
#include "buflist_error.hpp"
#include "buflist_result.hpp"
#include "buflist_chunk.hpp"
#include "buflist_chunk_list.hpp"
#include "buflist_reader.hpp"
#include "buflist_cursor.hpp"
#include "buflist_draining_cursor.hpp"
