#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "vimeo/error.hpp"

namespace vimeo {

struct PagingLinks {
  std::optional<std::string> next;
  std::optional<std::string> previous;
  std::optional<std::string> first;
  std::optional<std::string> last;
};

/**
 * One page of a listing whose successor is reached by following the
 * server-provided `paging.next` link. The last page has no `next` link.
 */
template <typename Item>
class LinkPage {
public:
  using FetchPageFn = std::function<LinkPage<Item>(const std::string& link)>;

  LinkPage(std::vector<Item> data,
           std::int64_t total,
           std::int64_t page,
           std::int64_t per_page,
           PagingLinks paging,
           FetchPageFn fetch_page,
           nlohmann::json raw = nlohmann::json::object())
      : data_(std::move(data)),
        total_(total),
        page_(page),
        per_page_(per_page),
        paging_(std::move(paging)),
        fetch_page_(std::move(fetch_page)),
        raw_(std::move(raw)) {}

  const std::vector<Item>& data() const { return data_; }
  std::vector<Item>& data() { return data_; }

  bool empty() const { return data_.empty(); }

  std::int64_t total() const { return total_; }
  std::int64_t page() const { return page_; }
  std::int64_t per_page() const { return per_page_; }
  const PagingLinks& paging() const { return paging_; }

  bool has_next_page() const { return paging_.next.has_value() && !paging_.next->empty(); }

  const nlohmann::json& raw() const { return raw_; }

  LinkPage next_page() const {
    if (!has_next_page()) {
      throw VimeoError("No next page available; call has_next_page() before next_page().");
    }
    return fetch_page_(*paging_.next);
  }

  /**
   * Follows `next` links from this page to the last one and returns every
   * item in server order. No deduplication is performed.
   */
  std::vector<Item> collect_all() const {
    std::vector<Item> items = data_;
    if (!has_next_page()) {
      return items;
    }
    LinkPage current = next_page();
    while (true) {
      items.insert(items.end(), current.data().begin(), current.data().end());
      if (!current.has_next_page()) {
        break;
      }
      current = current.next_page();
    }
    return items;
  }

private:
  std::vector<Item> data_;
  std::int64_t total_;
  std::int64_t page_;
  std::int64_t per_page_;
  PagingLinks paging_;
  FetchPageFn fetch_page_;
  nlohmann::json raw_;
};

}  // namespace vimeo
