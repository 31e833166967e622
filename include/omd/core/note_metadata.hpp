#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/metadata_kind.hpp"
#include "omd/core/metadata_store.hpp"

namespace omd::core {

// Default location of configured fields, used by moveToDefaults()
using FieldDefaults = std::map<std::string, MetadataKind>;

// Uniform operation surface over a note's frontmatter and inline stores.
// MetadataKind::kAll applies an operation to each store independently.
class NoteMetadata {
 public:
  NoteMetadata() = default;
  NoteMetadata(MetadataStore frontmatter, MetadataStore inline_fields);

  const MetadataStore& frontmatter() const noexcept { return frontmatter_; }
  const MetadataStore& inlineFields() const noexcept { return inline_; }

  // Store for a single kind; kAll is rejected
  Result<MetadataStore*> store(MetadataKind kind);

  // Absent `values` declares the key with no values. With kAll the key is
  // extended in every store that holds it, or created in the frontmatter
  // when neither does.
  void add(const std::string& key, const std::optional<Values>& values,
           MetadataKind kind, bool overwrite = false);

  // Absent `values` deletes the key; otherwise every occurrence of each
  // value is removed and the key stays declared.
  void remove(const std::string& key, const std::optional<Values>& values, MetadataKind kind);

  void removeEmpty(MetadataKind kind);

  // Appends the source sequence of each key to the destination and deletes
  // it from the source. An empty key list moves every source key.
  Result<void> move(const std::vector<std::string>& keys, MetadataKind from, MetadataKind to);

  // Moves each configured field into its default store
  void moveToDefaults(const FieldDefaults& defaults);

  void removeDuplicateValues(const std::vector<std::string>& keys, MetadataKind kind);
  void orderValues(const std::vector<std::string>& keys, Order order, MetadataKind kind);
  void orderKeys(Order order, MetadataKind kind);

  // Either sub-order is skipped when its direction is absent
  void order(const std::vector<std::string>& keys, std::optional<Order> key_order,
             std::optional<Order> value_order, MetadataKind kind);

  bool has(const std::string& key, const std::optional<Values>& values, MetadataKind kind) const;

  // Frontmatter values then inline values; nullopt when neither has the key
  std::optional<Values> get(const std::string& key, MetadataKind kind) const;

 private:
  MetadataStore frontmatter_;
  MetadataStore inline_;

  static void moveKey(const std::string& key, MetadataStore& from, MetadataStore& to);

  template <typename Fn>
  void forEachStore(MetadataKind kind, Fn&& fn) {
    if (kind != MetadataKind::kInline) {
      fn(frontmatter_);
    }
    if (kind != MetadataKind::kFrontmatter) {
      fn(inline_);
    }
  }
};

}  // namespace omd::core
