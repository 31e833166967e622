#include "omd/core/note_metadata.hpp"

namespace omd::core {

NoteMetadata::NoteMetadata(MetadataStore frontmatter, MetadataStore inline_fields)
    : frontmatter_(std::move(frontmatter)), inline_(std::move(inline_fields)) {}

Result<MetadataStore*> NoteMetadata::store(MetadataKind kind) {
  switch (kind) {
    case MetadataKind::kFrontmatter:
      return &frontmatter_;
    case MetadataKind::kInline:
      return &inline_;
    case MetadataKind::kAll:
      break;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Operation needs a single metadata kind, not 'all'"));
}

void NoteMetadata::add(const std::string& key, const std::optional<Values>& values,
                       MetadataKind kind, bool overwrite) {
  const Values& new_values = values.has_value() ? *values : Values{};

  if (kind == MetadataKind::kAll) {
    bool in_frontmatter = frontmatter_.contains(key);
    bool in_inline = inline_.contains(key);
    if (!in_frontmatter && !in_inline) {
      frontmatter_.add(key, new_values, overwrite);
      return;
    }
    if (in_frontmatter) {
      frontmatter_.add(key, new_values, overwrite);
    }
    if (in_inline) {
      inline_.add(key, new_values, overwrite);
    }
    return;
  }

  forEachStore(kind, [&](MetadataStore& store) { store.add(key, new_values, overwrite); });
}

void NoteMetadata::remove(const std::string& key, const std::optional<Values>& values,
                          MetadataKind kind) {
  forEachStore(kind, [&](MetadataStore& store) {
    if (values.has_value()) {
      store.removeValues(key, *values);
    } else {
      store.remove(key);
    }
  });
}

void NoteMetadata::removeEmpty(MetadataKind kind) {
  forEachStore(kind, [](MetadataStore& store) { store.removeEmpty(); });
}

Result<void> NoteMetadata::move(const std::vector<std::string>& keys, MetadataKind from,
                                MetadataKind to) {
  auto source = store(from);
  if (!source.has_value()) {
    return std::unexpected(source.error());
  }
  auto destination = store(to);
  if (!destination.has_value()) {
    return std::unexpected(destination.error());
  }
  if (from == to) {
    return {};
  }

  auto selected = keys.empty() ? (*source)->keys() : keys;
  for (const auto& key : selected) {
    moveKey(key, **source, **destination);
  }
  return {};
}

void NoteMetadata::moveToDefaults(const FieldDefaults& defaults) {
  for (const auto& [key, kind] : defaults) {
    if (kind == MetadataKind::kAll) {
      continue;
    }
    if (kind == MetadataKind::kFrontmatter) {
      moveKey(key, inline_, frontmatter_);
    } else {
      moveKey(key, frontmatter_, inline_);
    }
  }
}

void NoteMetadata::moveKey(const std::string& key, MetadataStore& from, MetadataStore& to) {
  auto values = from.get(key);
  if (!values.has_value()) {
    return;
  }
  to.add(key, *values);
  from.remove(key);
}

void NoteMetadata::removeDuplicateValues(const std::vector<std::string>& keys,
                                         MetadataKind kind) {
  forEachStore(kind, [&](MetadataStore& store) { store.removeDuplicateValues(keys); });
}

void NoteMetadata::orderValues(const std::vector<std::string>& keys, Order order,
                               MetadataKind kind) {
  forEachStore(kind, [&](MetadataStore& store) { store.orderValues(keys, order); });
}

void NoteMetadata::orderKeys(Order order, MetadataKind kind) {
  forEachStore(kind, [&](MetadataStore& store) { store.orderKeys(order); });
}

void NoteMetadata::order(const std::vector<std::string>& keys, std::optional<Order> key_order,
                         std::optional<Order> value_order, MetadataKind kind) {
  if (key_order.has_value()) {
    orderKeys(*key_order, kind);
  }
  if (value_order.has_value()) {
    orderValues(keys, *value_order, kind);
  }
}

bool NoteMetadata::has(const std::string& key, const std::optional<Values>& values,
                       MetadataKind kind) const {
  bool in_frontmatter = kind != MetadataKind::kInline && frontmatter_.has(key, values);
  bool in_inline = kind != MetadataKind::kFrontmatter && inline_.has(key, values);
  return in_frontmatter || in_inline;
}

std::optional<Values> NoteMetadata::get(const std::string& key, MetadataKind kind) const {
  std::optional<Values> result;
  if (kind != MetadataKind::kInline) {
    result = frontmatter_.get(key);
  }
  if (kind != MetadataKind::kFrontmatter) {
    auto inline_values = inline_.get(key);
    if (inline_values.has_value()) {
      if (result.has_value()) {
        result->insert(result->end(), inline_values->begin(), inline_values->end());
      } else {
        result = std::move(inline_values);
      }
    }
  }
  return result;
}

}  // namespace omd::core
