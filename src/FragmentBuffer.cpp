#include "gmatch/FragmentBuffer.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace gmatch {

FragmentBuffer::FragmentBuffer(std::string_view segment) {
  append(segment);
}

FragmentBuffer::FragmentBuffer(std::initializer_list<std::string_view> segments) {
  segments_.reserve(segments.size());
  for (auto segment : segments) {
    append(segment);
  }
}

void FragmentBuffer::append(std::string_view segment) {
  segments_.push_back(segment);
  combined_length_ += segment.size();
}

auto FragmentBuffer::segment(size_t index) const noexcept -> std::optional<std::string_view> {
  if (index >= segments_.size()) {
    return std::nullopt;
  }
  return segments_[index];
}

auto FragmentBuffer::to_string() const -> std::string {
  std::string out;
  out.reserve(combined_length_);
  for (auto segment : segments_) {
    out.append(segment);
  }
  return out;
}

auto FragmentBuffer::matches_prefix_of(std::string_view target) const noexcept -> bool {
  size_t offset = 0;
  for (auto segment : segments_) {
    if (segment.size() > target.size() - offset || target.compare(offset, segment.size(), segment) != 0) {
      return false;
    }
    offset += segment.size();
  }
  return true;
}

auto FragmentBuffer::occurrences_in(std::string_view target) const noexcept -> OccurrenceSearch {
  return OccurrenceSearch{*this, target};
}

auto FragmentBuffer::next_non_empty_segment(size_t from) const noexcept -> size_t {
  while (from < segments_.size() && segments_[from].empty()) {
    ++from;
  }
  return from;
}

auto FragmentBuffer::operator==(FragmentBuffer const& other) const noexcept -> bool {
  if (combined_length_ != other.combined_length_) {
    return false;
  }

  size_t left         = next_non_empty_segment(0);
  size_t right        = other.next_non_empty_segment(0);
  size_t left_offset  = 0;
  size_t right_offset = 0;

  while (left < segments_.size() && right < other.segments_.size()) {
    auto left_rest  = segments_[left].substr(left_offset);
    auto right_rest = other.segments_[right].substr(right_offset);
    auto window     = std::min(left_rest.size(), right_rest.size());

    if (left_rest.substr(0, window) != right_rest.substr(0, window)) {
      return false;
    }

    if (window == left_rest.size()) {
      left        = next_non_empty_segment(left + 1);
      left_offset = 0;
    } else {
      left_offset += window;
    }
    if (window == right_rest.size()) {
      right        = other.next_non_empty_segment(right + 1);
      right_offset = 0;
    } else {
      right_offset += window;
    }
  }

  return left == segments_.size() && right == other.segments_.size();
}

auto FragmentBuffer::operator==(std::string_view other) const noexcept -> bool {
  return combined_length_ == other.size() && matches_prefix_of(other);
}

OccurrenceSearch::OccurrenceSearch(FragmentBuffer const& buffer, std::string_view target) noexcept
    : buffer_(&buffer), target_(target) {
  if (auto first = buffer.next_non_empty_segment(0); first < buffer.segments_.size()) {
    anchor_ = buffer.segments_[first];
  }
}

auto OccurrenceSearch::next() noexcept -> std::optional<size_t> {
  if (finished_) {
    return std::nullopt;
  }

  // An empty literal occurs at every offset, including one past the end.
  if (!anchor_) {
    if (cursor_ <= target_.size()) {
      return cursor_++;
    }
    finished_ = true;
    return std::nullopt;
  }

  while (cursor_ < target_.size()) {
    auto hit = target_.find(*anchor_, cursor_);
    if (hit == std::string_view::npos) {
      break;
    }
    cursor_ = hit + 1;
    if (buffer_->matches_prefix_of(target_.substr(hit))) {
      return hit;
    }
  }

  finished_ = true;
  return std::nullopt;
}

} // namespace gmatch
