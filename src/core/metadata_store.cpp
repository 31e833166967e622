#include "omd/core/metadata_store.hpp"

#include <algorithm>
#include <functional>
#include <unordered_set>

namespace omd::core {

namespace {

std::string_view trim(std::string_view text) {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

}  // namespace

MetadataStore::MetadataStore(std::initializer_list<Entry> entries) {
  for (const auto& [key, values] : entries) {
    add(key, values);
  }
}

bool MetadataStore::contains(const std::string& key) const noexcept {
  return findEntry(key) != entries_.end();
}

std::optional<Values> MetadataStore::get(const std::string& key) const {
  auto it = findEntry(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> MetadataStore::keys() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto& entry : entries_) {
    result.push_back(entry.first);
  }
  return result;
}

void MetadataStore::add(const std::string& key, const Values& values, bool overwrite) {
  auto it = findEntry(key);
  if (it == entries_.end()) {
    entries_.emplace_back(key, values);
    return;
  }
  if (overwrite) {
    it->second = values;
  } else {
    it->second.insert(it->second.end(), values.begin(), values.end());
  }
}

void MetadataStore::remove(const std::string& key) {
  auto it = findEntry(key);
  if (it != entries_.end()) {
    entries_.erase(it);
  }
}

void MetadataStore::removeValues(const std::string& key, const Values& values) {
  auto it = findEntry(key);
  if (it == entries_.end()) {
    return;
  }
  auto& current = it->second;
  current.erase(std::remove_if(current.begin(), current.end(),
                               [&values](const std::string& v) {
                                 return std::find(values.begin(), values.end(), v) != values.end();
                               }),
                current.end());
}

void MetadataStore::removeEmpty() {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const Entry& entry) { return entry.second.empty(); }),
                 entries_.end());
}

void MetadataStore::removeDuplicateValues(const std::vector<std::string>& keys) {
  for (const auto& key : selectKeys(keys)) {
    auto it = findEntry(key);
    if (it == entries_.end()) {
      continue;
    }
    std::unordered_set<std::string> seen;
    Values unique;
    unique.reserve(it->second.size());
    for (auto& value : it->second) {
      if (seen.insert(value).second) {
        unique.push_back(std::move(value));
      }
    }
    it->second = std::move(unique);
  }
}

void MetadataStore::orderValues(const std::vector<std::string>& keys, Order order) {
  for (const auto& key : selectKeys(keys)) {
    auto it = findEntry(key);
    if (it == entries_.end()) {
      continue;
    }
    // std::string comparison goes through char_traits<char>, i.e. unsigned bytes
    if (order == Order::kAsc) {
      std::stable_sort(it->second.begin(), it->second.end());
    } else {
      std::stable_sort(it->second.begin(), it->second.end(), std::greater<>());
    }
  }
}

void MetadataStore::orderKeys(Order order) {
  std::stable_sort(entries_.begin(), entries_.end(),
                   [order](const Entry& a, const Entry& b) {
                     return order == Order::kAsc ? a.first < b.first : b.first < a.first;
                   });
}

bool MetadataStore::has(const std::string& key, const std::optional<Values>& values) const {
  auto it = findEntry(key);
  if (it == entries_.end()) {
    return false;
  }
  if (!values.has_value()) {
    return true;
  }
  return std::all_of(values->begin(), values->end(), [&it](const std::string& v) {
    return std::find(it->second.begin(), it->second.end(), v) != it->second.end();
  });
}

void MetadataStore::splitValues(const SeparatorRules& rules) {
  for (auto& [key, values] : entries_) {
    auto rule = rules.find(key);
    if (rule == rules.end()) {
      continue;
    }
    for (const auto& separator : rule->second) {
      if (separator.empty()) {
        continue;
      }
      values = core::splitValues(joinValues(values, separator), separator);
    }
  }
}

std::vector<MetadataStore::Entry>::iterator MetadataStore::findEntry(const std::string& key) {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&key](const Entry& entry) { return entry.first == key; });
}

std::vector<MetadataStore::Entry>::const_iterator MetadataStore::findEntry(
    const std::string& key) const {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&key](const Entry& entry) { return entry.first == key; });
}

std::vector<std::string> MetadataStore::selectKeys(const std::vector<std::string>& keys) const {
  return keys.empty() ? this->keys() : keys;
}

std::string joinValues(const Values& values, std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      result += separator;
    }
    result += values[i];
  }
  return result;
}

Values splitValues(std::string_view text, std::string_view separator) {
  Values result;
  if (separator.empty()) {
    auto piece = trim(text);
    if (!piece.empty()) {
      result.emplace_back(piece);
    }
    return result;
  }

  size_t start = 0;
  while (start <= text.size()) {
    auto pos = text.find(separator, start);
    auto piece = trim(text.substr(start, pos == std::string_view::npos ? std::string_view::npos
                                                                       : pos - start));
    if (!piece.empty()) {
      result.emplace_back(piece);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + separator.size();
  }
  return result;
}

}  // namespace omd::core
