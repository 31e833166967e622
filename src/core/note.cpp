#include "omd/core/note.hpp"

#include <regex>

#include "omd/core/frontmatter.hpp"

namespace omd::core {

std::string_view noteStateToString(NoteState state) noexcept {
  switch (state) {
    case NoteState::kUnparsed: return "unparsed";
    case NoteState::kClean: return "clean";
    case NoteState::kDirty: return "dirty";
    case NoteState::kPersisted: return "persisted";
  }
  return "unparsed";
}

Note::Note(std::string raw_text, std::filesystem::path path)
    : path_(std::move(path)), raw_text_(std::move(raw_text)) {}

Result<void> Note::parse(const ParseOptions& options) {
  if (state_ != NoteState::kUnparsed) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Note is already parsed"));
  }

  parse_options_ = options;
  segments_.inline_separators = options.inline_separators;
  auto parts = Frontmatter::split(raw_text_);
  segments_.preamble = parts.preamble;
  segments_.frontmatter_block = parts.block;

  MetadataStore frontmatter;
  auto parsed = Frontmatter::parse(raw_text_, options.frontmatter_separators);
  if (parsed.has_value()) {
    frontmatter = std::move(parsed->store());
    segments_.frontmatter_valid = parsed->exists();
    segments_.body = std::move(parts.body);
  } else {
    // The broken block stays part of the body and is written back verbatim
    frontmatter_error_ = parsed.error();
    segments_.frontmatter_valid = false;
    segments_.body = raw_text_.substr(parts.preamble.size());
  }

  auto inline_fields = InlineMetadata::parse(segments_.body, options.inline_separators);
  segments_.reindex();

  metadata_ = NoteMetadata(std::move(frontmatter), std::move(inline_fields.store()));
  content_ = raw_text_;
  state_ = NoteState::kClean;

  if (frontmatter_error_.has_value()) {
    return std::unexpected(*frontmatter_error_);
  }
  return {};
}

Result<void> Note::checkParsed() const {
  if (state_ == NoteState::kUnparsed) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Note has not been parsed"));
  }
  return {};
}

Result<void> Note::add(const std::string& key, const std::optional<Values>& values,
                       MetadataKind kind, bool overwrite) {
  return mutate([&] { metadata_.add(key, values, kind, overwrite); });
}

Result<void> Note::remove(const std::string& key, const std::optional<Values>& values,
                          MetadataKind kind) {
  return mutate([&] { metadata_.remove(key, values, kind); });
}

Result<void> Note::removeEmpty(MetadataKind kind) {
  return mutate([&] { metadata_.removeEmpty(kind); });
}

Result<void> Note::move(const std::vector<std::string>& keys, MetadataKind from,
                        MetadataKind to) {
  auto parsed = checkParsed();
  if (!parsed.has_value()) {
    return parsed;
  }
  auto moved = metadata_.move(keys, from, to);
  if (!moved.has_value()) {
    return moved;
  }
  state_ = NoteState::kDirty;
  return {};
}

Result<void> Note::moveToDefaults(const FieldDefaults& defaults) {
  return mutate([&] { metadata_.moveToDefaults(defaults); });
}

Result<void> Note::removeDuplicateValues(const std::vector<std::string>& keys,
                                         MetadataKind kind) {
  return mutate([&] { metadata_.removeDuplicateValues(keys, kind); });
}

Result<void> Note::orderValues(const std::vector<std::string>& keys, Order order,
                               MetadataKind kind) {
  return mutate([&] { metadata_.orderValues(keys, order, kind); });
}

Result<void> Note::orderKeys(Order order, MetadataKind kind) {
  return mutate([&] { metadata_.orderKeys(order, kind); });
}

Result<void> Note::order(const std::vector<std::string>& keys, std::optional<Order> key_order,
                         std::optional<Order> value_order, MetadataKind kind) {
  return mutate([&] { metadata_.order(keys, key_order, value_order, kind); });
}

Result<void> Note::append(const std::string& text, bool allow_repeat) {
  auto parsed = checkParsed();
  if (!parsed.has_value()) {
    return parsed;
  }
  if (!allow_repeat && segments_.body.find(text) != std::string::npos) {
    return {};
  }
  setBody(segments_.body + "\n" + text);
  return {};
}

Result<void> Note::sub(const std::string& pattern, const std::string& replacement,
                       bool is_regex) {
  auto parsed = checkParsed();
  if (!parsed.has_value()) {
    return parsed;
  }
  if (pattern.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Empty substitution pattern"));
  }

  std::string body;
  if (is_regex) {
    try {
      std::regex regex(pattern);
      body = std::regex_replace(segments_.body, regex, replacement);
    } catch (const std::regex_error& e) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid pattern '" + pattern + "': " + e.what()));
    }
  } else {
    body.reserve(segments_.body.size());
    size_t pos = 0;
    while (true) {
      auto found = segments_.body.find(pattern, pos);
      if (found == std::string::npos) {
        body.append(segments_.body, pos, std::string::npos);
        break;
      }
      body.append(segments_.body, pos, found - pos);
      body += replacement;
      pos = found + pattern.size();
    }
  }

  if (body != segments_.body) {
    setBody(std::move(body));
  }
  return {};
}

void Note::setBody(std::string body) {
  auto before = InlineMetadata::parse(segments_.body, parse_options_.inline_separators);
  segments_.body = std::move(body);
  segments_.reindex();
  auto after = InlineMetadata::parse(segments_.body, parse_options_.inline_separators);

  // Keys whose field lines the edit changed take their values from the new text
  for (const auto& [key, values] : after.store()) {
    if (before.store().get(key) != values) {
      metadata_.add(key, values, MetadataKind::kInline, true);
    }
  }
  for (const auto& [key, values] : before.store()) {
    if (!after.store().contains(key)) {
      metadata_.remove(key, std::nullopt, MetadataKind::kInline);
    }
  }
  state_ = NoteState::kDirty;
}

bool Note::has(const std::string& key, const std::optional<Values>& values,
               MetadataKind kind) const {
  return metadata_.has(key, values, kind);
}

std::optional<Values> Note::get(const std::string& key, MetadataKind kind) const {
  return metadata_.get(key, kind);
}

Result<std::string> Note::updateContent(const ComposeOptions& options) {
  auto parsed = checkParsed();
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }
  if (state_ != NoteState::kDirty) {
    return content_;
  }
  ContentComposer composer(options);
  content_ = composer.compose(metadata_, segments_);
  state_ = NoteState::kClean;
  return content_;
}

Result<void> Note::markPersisted() {
  if (state_ == NoteState::kUnparsed || state_ == NoteState::kDirty) {
    return std::unexpected(makeError(
        ErrorCode::kInvalidState,
        "Note must be recomposed before it is written (state: " +
            std::string(noteStateToString(state_)) + ")"));
  }
  state_ = NoteState::kPersisted;
  return {};
}

}  // namespace omd::core
