#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmatch {

class OccurrenceSearch;

// One logical literal stored as borrowed views, possibly split where escape
// sequences interrupted the pattern text. Segment boundaries carry no meaning:
// equality and matching only look at the concatenated content.
class FragmentBuffer {
  std::vector<std::string_view> segments_;
  size_t                        combined_length_ = 0;

public:
  FragmentBuffer() = default;
  explicit FragmentBuffer(std::string_view segment);
  FragmentBuffer(std::initializer_list<std::string_view> segments);

  void append(std::string_view segment);

  [[nodiscard]] auto combined_length() const noexcept -> size_t {
    return combined_length_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return combined_length_ == 0;
  }
  [[nodiscard]] auto segment_count() const noexcept -> size_t {
    return segments_.size();
  }
  [[nodiscard]] auto segment(size_t index) const noexcept -> std::optional<std::string_view>;
  [[nodiscard]] auto to_string() const -> std::string;

  // True if the content is a prefix of target; trailing characters are allowed.
  [[nodiscard]] auto matches_prefix_of(std::string_view target) const noexcept -> bool;

  // Lazily yields every offset of target where matches_prefix_of holds, ascending.
  [[nodiscard]] auto occurrences_in(std::string_view target) const noexcept -> OccurrenceSearch;

  [[nodiscard]] auto operator==(FragmentBuffer const& other) const noexcept -> bool;
  [[nodiscard]] auto operator==(std::string_view other) const noexcept -> bool;

private:
  [[nodiscard]] auto next_non_empty_segment(size_t from) const noexcept -> size_t;

  friend class OccurrenceSearch;
};

// Cursor over the occurrences of a FragmentBuffer in a target string. Not
// restartable: a fresh search has to be requested from the buffer.
class OccurrenceSearch {
  FragmentBuffer const*           buffer_;
  std::string_view                target_;
  std::optional<std::string_view> anchor_;
  size_t                          cursor_   = 0;
  bool                            finished_ = false;

public:
  OccurrenceSearch(FragmentBuffer const& buffer, std::string_view target) noexcept;

  [[nodiscard]] auto next() noexcept -> std::optional<size_t>;

  class iterator {
    OccurrenceSearch*     search_ = nullptr;
    std::optional<size_t> current_;

  public:
    using value_type      = size_t;
    using difference_type = std::ptrdiff_t;

    iterator() = default;
    explicit iterator(OccurrenceSearch& search) noexcept
        : search_(&search), current_(search.next()) {}

    auto operator*() const noexcept -> size_t {
      return *current_;
    }
    auto operator++() noexcept -> iterator& {
      current_ = search_->next();
      return *this;
    }
    void operator++(int) noexcept {
      ++*this;
    }
    friend auto operator==(iterator const& it, std::default_sentinel_t) noexcept -> bool {
      return !it.current_.has_value();
    }
  };

  auto begin() noexcept -> iterator {
    return iterator{*this};
  }
  auto end() const noexcept -> std::default_sentinel_t {
    return {};
  }
};

} // namespace gmatch
