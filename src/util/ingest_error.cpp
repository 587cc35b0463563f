#include "stream_ingest/ingest_error.hpp"
#include <iostream>

namespace si {

const char* to_string(IngestError::Kind k) noexcept {
  switch (k) {
    case IngestError::Kind::Read:       return "read";
    case IngestError::Kind::Parse:      return "parse";
    case IngestError::Kind::Oversize:   return "oversize";
    case IngestError::Kind::FinalFlush: return "final_flush";
    case IngestError::Kind::Handler:    return "handler";
    case IngestError::Kind::Config:     return "config";
  }
  return "unknown";
}

void log_error(const IngestError& e) {
  std::cerr << "[reassemble] " << to_string(e.kind)
            << " error at offset " << e.offset << ": " << e.message << "\n";
}

}
