#pragma once

#include <string>
#include <string_view>

#include "omd/common.hpp"

namespace omd::core {

// Which metadata store(s) an operation targets
enum class MetadataKind {
  kFrontmatter,
  kInline,
  kAll
};

// Sort direction (ordinal, byte-wise comparison)
enum class Order {
  kAsc,
  kDesc
};

std::string_view metadataKindToString(MetadataKind kind) noexcept;
Result<MetadataKind> metadataKindFromString(std::string_view str);

std::string_view orderToString(Order order) noexcept;
Result<Order> orderFromString(std::string_view str);

}  // namespace omd::core
