#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "omd/core/metadata_kind.hpp"

namespace omd::core {

using Values = std::vector<std::string>;

// Per-key separator lists applied when a store is parsed
using SeparatorRules = std::unordered_map<std::string, std::vector<std::string>>;

// Ordered mapping from key to an ordered sequence of values.
//
// Keys are unique and keep insertion order. A key mapped to an empty
// sequence ("declared, no values") is distinct from an absent key.
// Values are never deduplicated implicitly.
class MetadataStore {
 public:
  using Entry = std::pair<std::string, Values>;
  using const_iterator = std::vector<Entry>::const_iterator;

  MetadataStore() = default;
  MetadataStore(std::initializer_list<Entry> entries);

  // Iteration in key order
  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool empty() const noexcept { return entries_.empty(); }
  size_t size() const noexcept { return entries_.size(); }

  bool contains(const std::string& key) const noexcept;
  std::optional<Values> get(const std::string& key) const;
  std::vector<std::string> keys() const;

  // Creates the key when absent; otherwise appends (or replaces when
  // overwrite is set).
  void add(const std::string& key, const Values& values, bool overwrite = false);

  // Deletes the key entirely. No-op when absent.
  void remove(const std::string& key);

  // Removes every occurrence of each listed value; the key stays declared.
  void removeValues(const std::string& key, const Values& values);

  // Deletes keys whose sequence is empty
  void removeEmpty();

  // An empty key list selects every key of the store
  void removeDuplicateValues(const std::vector<std::string>& keys = {});
  void orderValues(const std::vector<std::string>& keys = {}, Order order = Order::kAsc);
  void orderKeys(Order order = Order::kAsc);

  // True when the key exists and every listed value is present.
  // An empty list only checks for the key.
  bool has(const std::string& key, const std::optional<Values>& values = std::nullopt) const;

  // Re-splits the values of configured keys on each separator
  void splitValues(const SeparatorRules& rules);

  bool operator==(const MetadataStore& other) const = default;

 private:
  std::vector<Entry> entries_;

  std::vector<Entry>::iterator findEntry(const std::string& key);
  std::vector<Entry>::const_iterator findEntry(const std::string& key) const;
  std::vector<std::string> selectKeys(const std::vector<std::string>& keys) const;
};

// Comma-joined rendering used by inline fields and plain text output
std::string joinValues(const Values& values, std::string_view separator = ", ");

// Splits on the separator, trims each piece, and drops empty pieces
Values splitValues(std::string_view text, std::string_view separator = ",");

}  // namespace omd::core
