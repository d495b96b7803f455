#pragma once

// This file contains the implementation of entry serialization.
// Do not include this file directly - it is included by entry_format.hpp

#include <ostream>
#include <string>
#include <utility>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include "../entry.hpp"

#ifndef TIFFENTRY_ENTRY_FORMAT_HEADER
#include "../entry_format.hpp" // for linters
#endif

namespace tiffentry {

namespace format_impl {

template <typename BasicJsonType, typename EntryT>
inline void entry_to_json(BasicJsonType& j, const EntryT& entry) {
    BasicJsonType value_offset = BasicJsonType::array();
    for (uint8_t byte : entry.value_offset()) {
        value_offset.push_back(byte);
    }

    j = BasicJsonType::object();
    j["tagID"] = entry.tag_id();
    j["typeID"] = entry.type_id();
    j["count"] = entry.count();
    j["valueOffset"] = std::move(value_offset);
}

template <typename EntryT>
inline std::string entry_to_string(const EntryT& entry) {
    return fmt::format("<TagID: {:5d}, TypeID: {:5d}, Count: {}, ValueOffset: [{}]>",
                       entry.tag_id(), entry.type_id(), entry.count(),
                       fmt::join(entry.value_offset(), " "));
}

} // namespace format_impl

template <typename BasicJsonType>
inline void to_json(BasicJsonType& j, const Entry& entry) {
    format_impl::entry_to_json(j, entry);
}

template <typename BasicJsonType>
inline void to_json(BasicJsonType& j, const EntryBig& entry) {
    format_impl::entry_to_json(j, entry);
}

inline nlohmann::ordered_json to_json(const Entry& entry) {
    nlohmann::ordered_json j;
    format_impl::entry_to_json(j, entry);
    return j;
}

inline nlohmann::ordered_json to_json(const EntryBig& entry) {
    nlohmann::ordered_json j;
    format_impl::entry_to_json(j, entry);
    return j;
}

inline std::string to_string(const Entry& entry) {
    return format_impl::entry_to_string(entry);
}

inline std::string to_string(const EntryBig& entry) {
    return format_impl::entry_to_string(entry);
}

inline std::ostream& operator<<(std::ostream& os, const Entry& entry) {
    return os << to_string(entry);
}

inline std::ostream& operator<<(std::ostream& os, const EntryBig& entry) {
    return os << to_string(entry);
}

} // namespace tiffentry
