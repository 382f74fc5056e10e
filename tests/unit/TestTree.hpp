#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <string>

namespace fm::test {

// Scratch directory removed on destruction
class TestTree {
public:
    TestTree();
    ~TestTree();

    TestTree(const TestTree&) = delete;
    TestTree& operator=(const TestTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path path(const std::string& rel) const { return root_ / rel; }

    // Creates parent directories as needed
    std::filesystem::path write(const std::string& rel, const std::string& content) const;

    [[nodiscard]] std::string read(const std::string& rel) const;
    [[nodiscard]] bool exists(const std::string& rel) const;

    void setMtime(const std::string& rel, util::EpochNanos t) const;
    [[nodiscard]] util::EpochNanos mtime(const std::string& rel) const;

    std::filesystem::path mkdir(const std::string& rel) const;

    static std::string readFile(const std::filesystem::path& p);
    static util::EpochNanos mtimeOf(const std::filesystem::path& p);

private:
    std::filesystem::path root_;
};

// Fixed instants a few days apart, so retention order never depends on write timing
inline constexpr util::EpochNanos T0 = 1'700'000'000'000'000'000;
inline constexpr util::EpochNanos DAY = 86'400'000'000'000;

}
