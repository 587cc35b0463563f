#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace si {

// Lightweight view over one reassembled record. Field views point into the
// current chunk or the carry buffer and are valid only during the handler call.
class RecordView {
public:
  RecordView() = default;
  RecordView(const std::vector<std::string_view>* fields, std::uint64_t offset)
      : fields_(fields), offset_(offset) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  // Stream offset of the record's first byte.
  std::uint64_t offset() const noexcept { return offset_; }

  const std::vector<std::string_view>* fields() const noexcept { return fields_; }

  std::vector<std::string> to_strings() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) out.emplace_back((*fields_)[i]);
    return out;
  }

private:
  const std::vector<std::string_view>* fields_{nullptr};
  std::uint64_t offset_{0};
};

}
