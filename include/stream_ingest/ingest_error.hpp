#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace si {

struct IngestError {
  enum class Kind {
    Read,        // positional read failed (not end-of-stream)
    Parse,       // malformed record inside a chunk
    Oversize,    // record exceeded max_record_bytes
    FinalFlush,  // trailing carry could not be parsed at end of stream
    Handler,     // record handler rejected a record
    Config,
  };

  Kind kind = Kind::Parse;
  std::string message;
  std::uint64_t offset = 0;  // stream offset of the offending bytes
};

const char* to_string(IngestError::Kind k) noexcept;

using ErrorCallback = std::function<void(const IngestError&)>;

// Default sink: one "[reassemble] ..." line on std::cerr.
void log_error(const IngestError& e);

}
