#pragma once

/** \file filtering.hpp
 *  \brief Collection adapter: filter, count, search ranges of candidates with a predicate.
 *
 * All functions preserve the source's iteration order. where() is lazy and restartable:
 * every begin() walks the source again and re-applies the predicate; nothing is cached.
 * Lookups return copies of the matching elements, owned by the caller.
 *
 * Errors:
 * - first / single with no match: not_found
 * - single / single_or_default with more than one match: precondition_failed
 */

#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"

namespace criteria {

template <typename Range>
concept candidate_range = std::ranges::forward_range<const Range> &&
                          std::ranges::common_range<const Range>;

/**
 * \brief Lazy filtered view over a borrowed source.
 *
 * The view refers to the source and owns a copy of the predicate; iterators are valid while
 * both the view and the source are alive.
 */
template <candidate_range Range, typename T>
class filtered_view : public std::ranges::view_interface<filtered_view<Range, T>> {
  using base_iterator = std::ranges::iterator_t<const Range>;

public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using iterator_concept = std::forward_iterator_tag;
    using value_type = std::ranges::range_value_t<const Range>;
    using difference_type = std::ranges::range_difference_t<const Range>;
    using reference = std::ranges::range_reference_t<const Range>;

    iterator() = default;

    auto operator*() const -> reference { return *it_; }

    auto operator++() -> iterator& {
      ++it_;
      satisfy();
      return *this;
    }

    auto operator++(int) -> iterator {
      auto tmp = *this;
      ++*this;
      return tmp;
    }

    friend auto operator==(const iterator& a, const iterator& b) -> bool { return a.it_ == b.it_; }

  private:
    friend class filtered_view;

    iterator(base_iterator it, base_iterator end, const predicate<T>* pred)
        : it_(std::move(it)), end_(std::move(end)), pred_(pred) {}

    void satisfy() {
      while (it_ != end_ && !pred_->test(*it_)) ++it_;
    }

    base_iterator it_{};
    base_iterator end_{};
    const predicate<T>* pred_{nullptr};
  };

  filtered_view(const Range& source, predicate<T> pred)
      : source_(&source), pred_(std::move(pred)) {}

  [[nodiscard]] auto begin() const -> iterator {
    iterator it(std::ranges::begin(*source_), std::ranges::end(*source_), &pred_);
    it.satisfy();
    return it;
  }

  [[nodiscard]] auto end() const -> iterator {
    return iterator(std::ranges::end(*source_), std::ranges::end(*source_), &pred_);
  }

  [[nodiscard]] auto filter() const noexcept -> const predicate<T>& { return pred_; }

private:
  const Range* source_;
  predicate<T> pred_;
};

template <candidate_range Range, typename T>
[[nodiscard]] auto where(const Range& source, const predicate<T>& pred) -> filtered_view<Range, T> {
  return filtered_view<Range, T>(source, pred);
}

// The view borrows its source; temporaries would dangle.
template <candidate_range Range, typename T>
void where(const Range&& source, const predicate<T>& pred) = delete;

/** \brief Materialise the satisfying elements in source order. */
template <candidate_range Range, typename T>
[[nodiscard]] auto to_vector(const Range& source, const predicate<T>& pred)
    -> std::vector<std::ranges::range_value_t<const Range>> {
  std::vector<std::ranges::range_value_t<const Range>> out;
  for (const auto& item : source) {
    if (pred.test(item)) out.push_back(item);
  }
  return out;
}

template <candidate_range Range, typename T>
[[nodiscard]] auto count(const Range& source, const predicate<T>& pred) -> std::size_t {
  std::size_t n = 0;
  for (const auto& item : source) {
    if (pred.test(item)) ++n;
  }
  return n;
}

/** \brief True if any element satisfies pred; false for an empty source. */
template <candidate_range Range, typename T>
[[nodiscard]] auto any(const Range& source, const predicate<T>& pred) -> bool {
  for (const auto& item : source) {
    if (pred.test(item)) return true;
  }
  return false;
}

/** \brief True if every element satisfies pred; true for an empty source. */
template <candidate_range Range, typename T>
[[nodiscard]] auto all(const Range& source, const predicate<T>& pred) -> bool {
  for (const auto& item : source) {
    if (!pred.test(item)) return false;
  }
  return true;
}

template <candidate_range Range, typename T>
[[nodiscard]] auto first_or_default(const Range& source, const predicate<T>& pred)
    -> std::optional<std::ranges::range_value_t<const Range>> {
  for (const auto& item : source) {
    if (pred.test(item)) return item;
  }
  return std::nullopt;
}

template <candidate_range Range, typename T>
[[nodiscard]] auto first(const Range& source, const predicate<T>& pred)
    -> std::expected<std::ranges::range_value_t<const Range>, core::error> {
  auto found = first_or_default(source, pred);
  if (!found) {
    return std::unexpected(core::error{core::error_code::not_found,
                                       "no element satisfies " + pred.describe(),
                                       "filtering.first"});
  }
  return std::move(*found);
}

/** \brief The only satisfying element, nullopt if none; precondition_failed if several. */
template <candidate_range Range, typename T>
[[nodiscard]] auto single_or_default(const Range& source, const predicate<T>& pred)
    -> std::expected<std::optional<std::ranges::range_value_t<const Range>>, core::error> {
  std::optional<std::ranges::range_value_t<const Range>> found;
  for (const auto& item : source) {
    if (!pred.test(item)) continue;
    if (found) {
      return std::unexpected(core::error{core::error_code::precondition_failed,
                                         "more than one element satisfies " + pred.describe(),
                                         "filtering.single"});
    }
    found.emplace(item);
  }
  return found;
}

template <candidate_range Range, typename T>
[[nodiscard]] auto single(const Range& source, const predicate<T>& pred)
    -> std::expected<std::ranges::range_value_t<const Range>, core::error> {
  auto found = single_or_default(source, pred);
  if (!found) return std::unexpected(std::move(found.error()));
  if (!*found) {
    return std::unexpected(core::error{core::error_code::not_found,
                                       "no element satisfies " + pred.describe(),
                                       "filtering.single"});
  }
  return std::move(**found);
}

} // namespace criteria
