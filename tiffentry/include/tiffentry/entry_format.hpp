#pragma once

/**
 * @file entry_format.hpp
 * @brief Structured (JSON) and display renderings of IFD entries
 *
 * Both variants serialize to the same field names:
 *
 * @code{.json}
 * {"tagID": 256, "typeID": 3, "count": 1, "valueOffset": [0, 64, 0, 0]}
 * @endcode
 *
 * `valueOffset` holds the raw bytes of the entry in file order (4 for Classic TIFF,
 * 8 for BigTIFF). It is never folded into an integer since its meaning depends on
 * the type and count.
 *
 * The display form is a single line with the tag and type right-aligned on five
 * columns:
 *
 * @code
 * <TagID:   256, TypeID:     3, Count: 1, ValueOffset: [0 64 0 0]>
 * @endcode
 */

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "entry.hpp"

namespace tiffentry {

/// @brief nlohmann::basic_json conversion hook (found by ADL)
template <typename BasicJsonType>
void to_json(BasicJsonType& j, const Entry& entry);

/// @brief nlohmann::basic_json conversion hook (found by ADL)
template <typename BasicJsonType>
void to_json(BasicJsonType& j, const EntryBig& entry);

/// @brief Structured representation with fields in declaration order
[[nodiscard]] nlohmann::ordered_json to_json(const Entry& entry);

/// @brief Structured representation with fields in declaration order
[[nodiscard]] nlohmann::ordered_json to_json(const EntryBig& entry);

/// @brief Single-line human readable rendering
[[nodiscard]] std::string to_string(const Entry& entry);

/// @brief Single-line human readable rendering
[[nodiscard]] std::string to_string(const EntryBig& entry);

std::ostream& operator<<(std::ostream& os, const Entry& entry);
std::ostream& operator<<(std::ostream& os, const EntryBig& entry);

} // namespace tiffentry

#define TIFFENTRY_ENTRY_FORMAT_HEADER
#include "impl/entry_format_impl.hpp"
