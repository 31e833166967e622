#include "omd/core/metadata_kind.hpp"

namespace omd::core {

std::string_view metadataKindToString(MetadataKind kind) noexcept {
  switch (kind) {
    case MetadataKind::kFrontmatter: return "frontmatter";
    case MetadataKind::kInline: return "inline";
    case MetadataKind::kAll: return "all";
  }
  return "all";
}

Result<MetadataKind> metadataKindFromString(std::string_view str) {
  if (str == "frontmatter" || str == "fm") return MetadataKind::kFrontmatter;
  if (str == "inline") return MetadataKind::kInline;
  if (str == "all") return MetadataKind::kAll;
  return makeErrorResult<MetadataKind>(ErrorCode::kInvalidArgument,
                                       "Unknown metadata kind: " + std::string(str));
}

std::string_view orderToString(Order order) noexcept {
  switch (order) {
    case Order::kAsc: return "asc";
    case Order::kDesc: return "desc";
  }
  return "asc";
}

Result<Order> orderFromString(std::string_view str) {
  if (str == "asc") return Order::kAsc;
  if (str == "desc") return Order::kDesc;
  return makeErrorResult<Order>(ErrorCode::kInvalidArgument,
                                "Unknown sort order: " + std::string(str));
}

}  // namespace omd::core
