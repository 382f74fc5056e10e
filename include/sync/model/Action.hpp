#pragma once

#include "fs/model/FileRecord.hpp"

#include <optional>
#include <string_view>

namespace fm::sync::model {

enum class ActionType {
    Copy,
    Skip,
};

enum class Reason {
    Missing,          // only in source
    MetadataChanged,  // shallow: size or mtime differ
    ContentChanged,   // deep: digests differ
    Unverifiable,     // deep: a side could not be hashed, source is readable
    Unchanged,
};

// Immutable once planned
struct Action {
    ActionType type{ActionType::Skip};
    Reason reason{Reason::Unchanged};
    fs::model::FileRecord source{};
    std::optional<fs::model::FileRecord> destination{};
};

std::string_view to_string(ActionType type);
std::string_view to_string(Reason reason);

}
