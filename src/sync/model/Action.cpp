#include "sync/model/Action.hpp"

namespace fm::sync::model {

std::string_view to_string(const ActionType type) {
    switch (type) {
    case ActionType::Copy: return "copy";
    case ActionType::Skip: return "skip";
    }
    return "unknown";
}

std::string_view to_string(const Reason reason) {
    switch (reason) {
    case Reason::Missing: return "missing";
    case Reason::MetadataChanged: return "metadata_changed";
    case Reason::ContentChanged: return "content_changed";
    case Reason::Unverifiable: return "unverifiable";
    case Reason::Unchanged: return "unchanged";
    }
    return "unknown";
}

}
