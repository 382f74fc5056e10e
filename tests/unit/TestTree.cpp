#include "TestTree.hpp"
#include "util/files.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace fm::test;
namespace stdfs = std::filesystem;

TestTree::TestTree()
    : root_(stdfs::temp_directory_path() / ("fm_tree_" + util::generate_random_suffix(12))) {
    stdfs::create_directories(root_);
}

TestTree::~TestTree() {
    std::error_code ec;
    // restore permissions that tests may have taken away, or remove_all fails
    for (auto it = stdfs::recursive_directory_iterator(root_, stdfs::directory_options::skip_permission_denied, ec);
         !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec))
            stdfs::permissions(it->path(), stdfs::perms::owner_all, stdfs::perm_options::add, ec);
    }
    stdfs::remove_all(root_, ec);
}

stdfs::path TestTree::write(const std::string& rel, const std::string& content) const {
    const auto p = path(rel);
    stdfs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("TestTree: cannot write " + p.string());
    out << content;
    return p;
}

std::string TestTree::read(const std::string& rel) const {
    return readFile(path(rel));
}

std::string TestTree::readFile(const stdfs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("TestTree: cannot read " + p.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool TestTree::exists(const std::string& rel) const {
    std::error_code ec;
    return stdfs::exists(stdfs::symlink_status(path(rel), ec));
}

void TestTree::setMtime(const std::string& rel, const util::EpochNanos t) const {
    using namespace std::chrono;
    const sys_time<nanoseconds> sys{nanoseconds{t}};
    stdfs::last_write_time(path(rel), file_clock::from_sys(sys));
}

fm::util::EpochNanos TestTree::mtime(const std::string& rel) const {
    return mtimeOf(path(rel));
}

fm::util::EpochNanos TestTree::mtimeOf(const stdfs::path& p) {
    return util::toEpochNanos(stdfs::last_write_time(p));
}

stdfs::path TestTree::mkdir(const std::string& rel) const {
    const auto p = path(rel);
    stdfs::create_directories(p);
    return p;
}
