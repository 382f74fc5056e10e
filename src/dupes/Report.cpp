#include "dupes/Report.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

using namespace fm::dupes;
using namespace fm::dupes::model;
using namespace fm::fs::model;
using namespace fm::logging;
using json = nlohmann::json;

namespace {

std::optional<FileRecord> restat(const std::filesystem::path& p) {
    try {
        return FileRecord::fromPath(p.parent_path(), p);
    } catch (const fm::error::NotFoundError&) {
        LogRegistry::dupes()->warn("[Report] File not found (already deleted?): {}", p.string());
    } catch (const fm::error::Error& e) {
        LogRegistry::dupes()->warn("[Report] Cannot use {}: {}", p.string(), e.what());
    }
    return std::nullopt;
}

}

void Report::write(const std::filesystem::path& path, const std::vector<DuplicateGroup>& groups) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) error::throwFromErrorCode(ec, "Failed to create report directory", path.parent_path());
    }

    // JSON cannot carry these names byte for byte; they are written with U+FFFD in place
    // of the bad bytes, so a reload reports them as missing instead of deleting them
    for (const auto& g : groups)
        for (const auto& f : g.members)
            if (!util::isValidUtf8(f.absolute_path.string()))
                LogRegistry::dupes()->warn("[Report] Path is not valid UTF-8, it will not survive a reload: {}",
                                           f.absolute_path.string());

    std::string text;
    try {
        const json doc = groups;
        text = doc.dump(4, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw error::IOError(std::string("Failed to serialize report: ") + e.what(), path);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) error::throwFromErrorCode(std::error_code(errno, std::generic_category()), "Failed to open report", path);
    out << text << '\n';
    if (!out) throw error::IOError("Failed to write report", path);

    LogRegistry::dupes()->info("[Report] Report saved to {}", path.string());
}

LoadedReport Report::load(const std::filesystem::path& path) {
    LogRegistry::dupes()->info("[Report] Loading duplicate data from {}", path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in) throw error::ConfigError("Failed to open input report: " + path.string(), path);

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw error::ConfigError("Failed to parse input report " + path.string() + ": " + e.what(), path);
    }
    if (!doc.is_array()) throw error::ConfigError("Input report is not a JSON array: " + path.string(), path);

    LoadedReport out;
    for (const auto& item : doc) {
        DuplicateGroup g;
        std::vector<std::string> files;
        try {
            const auto hex = item.at("digest").get<std::string>();
            const auto digest = crypto::Digest256::fromHex(hex);
            if (!digest) throw error::ConfigError("Malformed digest '" + hex + "' in " + path.string(), path);
            g.digest = *digest;
            g.size_bytes = item.at("size_bytes").get<uintmax_t>();
            files = item.at("files").get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            throw error::ConfigError("Malformed group in " + path.string() + ": " + e.what(), path);
        }

        if (files.size() < 2) {
            LogRegistry::dupes()->warn("[Report] Ignoring group {} with fewer than two files", g.digest.hex());
            continue;
        }

        bool retainedPresent = true;
        for (size_t i = 0; i < files.size(); ++i) {
            const std::filesystem::path p(files[i]);
            auto rec = restat(p);

            if (!rec) {
                if (i == 0) {
                    retainedPresent = false;
                    break;
                }
                ++out.files_missing;
                continue;
            }

            if (rec->size_bytes != g.size_bytes) {
                LogRegistry::dupes()->warn("[Report] Size of {} changed ({} -> {}), skipping",
                                           p.string(), g.size_bytes, rec->size_bytes);
                if (i == 0) {
                    retainedPresent = false;
                    break;
                }
                ++out.files_skipped;
                continue;
            }

            rec->relative_path = p.generic_string();
            rec->digest = g.digest;
            g.members.push_back(std::move(*rec));
        }

        if (!retainedPresent) {
            LogRegistry::dupes()->warn("[Report] Retained file {} is not usable, skipping group {}",
                                       files.front(), g.digest.hex());
            ++out.groups_skipped;
            continue;
        }

        if (g.members.size() < 2) continue;
        out.groups.push_back(std::move(g));
    }

    LogRegistry::dupes()->info("[Report] Loaded {} groups from {}", out.groups.size(), path.string());
    return out;
}

std::filesystem::path Report::defaultPath(const std::filesystem::path& reportDir, const std::string& stamp) {
    return reportDir / ("out_" + stamp + ".json");
}
