#include "test_helpers.hpp"

#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace decoyfs {
namespace testing {

namespace {

class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { Logger::instance().set_level(LogLevel::ERROR); }
};

::testing::Environment* const quiet_logs = ::testing::AddGlobalTestEnvironment(new QuietLogs);

} // namespace

TempDir::TempDir() {
    const char* tmp = getenv("TMPDIR");
    std::string tmpl = std::string(tmp && tmp[0] ? tmp : "/tmp") + "/decoyfs-test-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(&buf[0])) {
        ADD_FAILURE() << "mkdtemp failed for " << tmpl;
        return;
    }
    path_ = &buf[0];
}

TempDir::~TempDir() {
    if (path_.empty()) return;
    if (!remove_tree(path_)) {
        ADD_FAILURE() << "could not remove " << path_;
    }
}

void make_dir(const std::string& path, mode_t mode) {
    ASSERT_EQ(0, mkdir(path.c_str(), mode)) << path;
    ASSERT_EQ(0, chmod(path.c_str(), mode)) << path;
}

void write_file(const std::string& path, const std::string& content, mode_t mode) {
    std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out.good()) << path;
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    ASSERT_EQ(0, chmod(path.c_str(), mode)) << path;
}

void make_symlink(const std::string& target, const std::string& link) {
    ASSERT_EQ(0, symlink(target.c_str(), link.c_str())) << link;
}

std::string read_host_file(const std::string& path) {
    std::ifstream in(path.c_str(), std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void set_mtime(const std::string& path, int64_t mtime) {
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(mtime);
    times[0].tv_nsec = 0;
    times[1].tv_sec = static_cast<time_t>(mtime);
    times[1].tv_nsec = 0;
    ASSERT_EQ(0, utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW)) << path;
}

} // namespace testing
} // namespace decoyfs
