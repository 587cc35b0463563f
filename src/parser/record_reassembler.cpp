#include "stream_ingest/record_reassembler.hpp"
#include "stream_ingest/record_boundary.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace si {

RecordReassembler::RecordReassembler(ReassemblerConfig cfg, RecordHandler on_record,
                                     ErrorCallback on_error)
  : cfg_(std::move(cfg)), on_record_(std::move(on_record)), on_error_(std::move(on_error)) {
  fields_.reserve(16);
}

void RecordReassembler::report(IngestError::Kind kind, std::string message, std::uint64_t offset) {
  if (on_error_) on_error_(IngestError{kind, std::move(message), offset});
}

void RecordReassembler::emit(std::uint64_t offset) {
  RecordView rv(&fields_, offset);
  ++records_;
  std::string err;
  bool ok = false;
  try {
    ok = on_record_(rv, &err);
  } catch (const std::exception& e) {
    err = e.what();
  }
  if (!ok) {
    ++handler_errors_;
    report(IngestError::Kind::Handler, err.empty() ? "record handler failed" : err, offset);
  }
}

bool RecordReassembler::append_carry(std::string_view bytes, bool terminated) {
  if (carry_.size() + bytes.size() > cfg_.max_record_bytes) {
    report(IngestError::Kind::Oversize,
           "record exceeds max_record_bytes (" + std::to_string(cfg_.max_record_bytes) + ")",
           carry_offset_);
    carry_.clear();
    skipping_ = !terminated;  // drop the rest of this record
    return false;
  }
  carry_.append(bytes.data(), bytes.size());
  return true;
}

void RecordReassembler::stash(std::string_view tail, std::uint64_t offset) {
  carry_.clear();
  carry_offset_ = offset;
  if (append_carry(tail, ends_with_terminator(tail)))
    carry_high_water_ = std::max(carry_high_water_, carry_.size());
}

bool RecordReassembler::reassemble_carry(bool at_eof) {
  DelimitedParser parser(cfg_.parse, carry_, at_eof);
  bool ok = true;
  while (true) {
    ParseStatus st = parser.next(fields_);
    if (st == ParseStatus::Record) {
      emit(carry_offset_ + parser.record_start());
      continue;
    }
    if (st == ParseStatus::Malformed) {
      ++parse_errors_;
      report(at_eof ? IngestError::Kind::FinalFlush : IngestError::Kind::Parse,
             parser.error(), carry_offset_ + parser.record_start());
      ok = false;
    }
    break;
  }
  carry_.clear();
  return ok;
}

void RecordReassembler::feed(std::string_view chunk) {
  ++chunks_;
  const std::uint64_t base = base_;
  base_ += chunk.size();
  std::size_t pos = 0;

  if (skipping_) {
    const std::size_t end = record_end(chunk);
    if (end == std::string_view::npos) return;
    skipping_ = false;
    pos = end;
  }

  if (!carry_.empty()) {
    bool complete = true;
    if (!ends_with_terminator(carry_)) {
      // Dangling carry: this chunk's bytes up to the first terminator complete it.
      const std::size_t end = record_end(chunk, pos);
      if (end == std::string_view::npos) {
        if (append_carry(chunk.substr(pos), false))
          carry_high_water_ = std::max(carry_high_water_, carry_.size());
        return;
      }
      complete = append_carry(chunk.substr(pos, end - pos), true);
      pos = end;
    }
    // Either just completed, or a record deferred at the previous boundary
    // that this chunk's existence confirms.
    if (complete && !reassemble_carry(false)) {
      skipping_ = !ends_with_terminator(chunk);
      return;
    }
  }

  const std::string_view rest = chunk.substr(pos);
  const std::uint64_t rest_base = base + pos;
  DelimitedParser parser(cfg_.parse, rest);
  while (true) {
    ParseStatus st = parser.next(fields_);
    if (st == ParseStatus::Exhausted) break;

    if (st == ParseStatus::Dangling) {
      stash(rest.substr(parser.offset()), rest_base + parser.offset());
      break;
    }

    if (st == ParseStatus::Malformed) {
      // Abort the rest of this chunk; resume at the next record boundary.
      ++parse_errors_;
      report(IngestError::Kind::Parse, parser.error(), rest_base + parser.record_start());
      skipping_ = !ends_with_terminator(chunk);
      break;
    }

    if (parser.offset() == rest.size()) {
      // Flush with the chunk's last byte: hold it until the next chunk or end of stream.
      stash(rest.substr(parser.record_start()), rest_base + parser.record_start());
      break;
    }

    if (parser.offset() - parser.record_start() > cfg_.max_record_bytes) {
      report(IngestError::Kind::Oversize,
             "record exceeds max_record_bytes (" + std::to_string(cfg_.max_record_bytes) + ")",
             rest_base + parser.record_start());
      continue;
    }
    emit(rest_base + parser.record_start());
  }
}

bool RecordReassembler::finish() {
  if (skipping_) {
    skipping_ = false;
    carry_.clear();
    return true;
  }
  if (carry_.empty()) return true;
  flush_failed_ = !reassemble_carry(true);
  return !flush_failed_;
}

ConsumeStatus RecordReassembler::consume(ChunkChannel& in, const CancelToken& cancel,
                                         const ChunkObserver& observe) {
  Chunk c;
  while (true) {
    switch (in.recv(c, cancel)) {
      case ChunkChannel::RecvStatus::Cancelled:
        return ConsumeStatus::Cancelled;
      case ChunkChannel::RecvStatus::Failed:
        return ConsumeStatus::SourceFailed;
      case ChunkChannel::RecvStatus::Closed:
        // A failed flush is reported through on_error_ and flush_failed().
        finish();
        return ConsumeStatus::Completed;
      case ChunkChannel::RecvStatus::Chunk:
        if (observe) observe(c);
        feed(c.view());
        break;
    }
  }
}

}
