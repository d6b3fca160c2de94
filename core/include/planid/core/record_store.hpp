#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace planid::core {

template <typename T>
concept HasCanonicalId = requires(T value) {
  { value.id.text } -> std::convertible_to<std::string>;
};

// Insertion-ordered records indexed by canonical identifier text.
template <HasCanonicalId T>
class RecordStore {
 public:
  RecordStore() = default;

  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool contains(std::string_view id) const { return index_by_id_.contains(std::string(id)); }

  [[nodiscard]] T* find(std::string_view id) {
    auto it = index_by_id_.find(std::string(id));
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  [[nodiscard]] const T* find(std::string_view id) const {
    auto it = index_by_id_.find(std::string(id));
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  // A second insert of the same id is refused.
  bool insert(T value) {
    std::string key = value.id.text;
    if (index_by_id_.contains(key)) {
      return false;
    }
    items_.push_back(std::move(value));
    index_by_id_.emplace(std::move(key), items_.size() - 1);
    return true;
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  std::vector<T> items_;
  std::unordered_map<std::string, std::size_t> index_by_id_;
};

}  // namespace planid::core
