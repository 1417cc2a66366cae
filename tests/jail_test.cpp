#include <decoyfs/fs/jail.hpp>
#include <decoyfs/core/utils.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <thread>
#include <vector>
#include <sys/stat.h>

namespace decoyfs {
namespace {

// Template tree mirrored into every jail:
//   /music.mp3  /pub/readme.txt  /pub/deep/x.bin
//   /latest -> pub/readme.txt   /escape -> /   /sibling -> ../tftp
class ProtocolJailTest : public ::testing::Test {
protected:
    void SetUp() override {
        template_dir_ = tmp_.sub("template");
        testing::make_dir(template_dir_);
        testing::write_file(template_dir_ + "/music.mp3", std::string(1024, 'm'));
        testing::make_dir(template_dir_ + "/pub");
        testing::write_file(template_dir_ + "/pub/readme.txt", "read me\n");
        testing::make_dir(template_dir_ + "/pub/deep");
        testing::write_file(template_dir_ + "/pub/deep/x.bin", "x");
        testing::make_symlink("pub/readme.txt", template_dir_ + "/latest");
        testing::make_symlink("/", template_dir_ + "/escape");
        testing::make_symlink("../tftp", template_dir_ + "/sibling");
        testing::make_dir(tmp_.sub("empty"));

        ASSERT_TRUE(root_.open(tmp_.sub("jail")));
    }

    void TearDown() override {
        root_.close();
    }

    testing::TempDir tmp_;
    std::string template_dir_;
    JailRoot root_;
};

TEST_F(ProtocolJailTest, InitializeMirrorsTemplate) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());
    EXPECT_TRUE(jail.is_initialized());
    EXPECT_EQ("ftp", jail.protocol());
    EXPECT_EQ("/", jail.root());
    EXPECT_EQ("/ftp", jail.home());
    EXPECT_EQ("/", jail.getcwd());

    EXPECT_EQ("read me\n", testing::read_host_file(root_.host_dir() + "/ftp/pub/readme.txt"));
    std::vector<std::string> claimed = root_.protocols();
    ASSERT_EQ(1u, claimed.size());
    EXPECT_EQ("ftp", claimed[0]);
}

TEST_F(ProtocolJailTest, SecondInitializeOfSameProtocolFails) {
    ProtocolJail first(root_);
    ProtocolJail second(root_);
    ASSERT_TRUE(first.initialize("ftp", template_dir_).is_ok());
    EXPECT_EQ(FsError::AlreadyExists, second.initialize("ftp", template_dir_).code);
    EXPECT_FALSE(second.is_initialized());

    // The first session's tree is untouched
    StatInfo st;
    EXPECT_TRUE(first.stat("/music.mp3", st).is_ok());
}

TEST_F(ProtocolJailTest, ConcurrentInitializeHasOneWinner) {
    const int kThreads = 8;
    std::atomic<int> winners(0);
    std::atomic<int> collisions(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.push_back(std::thread([&]() {
            ProtocolJail jail(root_);
            FsStatus status = jail.initialize("ftp", template_dir_);
            if (status.is_ok()) {
                ++winners;
            } else if (status.code == FsError::AlreadyExists) {
                ++collisions;
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    EXPECT_EQ(1, winners.load());
    EXPECT_EQ(kThreads - 1, collisions.load());
}

TEST_F(ProtocolJailTest, ProtocolsAreIsolated) {
    ProtocolJail ftp(root_);
    ProtocolJail tftp(root_);
    ASSERT_TRUE(ftp.initialize("ftp", template_dir_).is_ok());
    ASSERT_TRUE(tftp.initialize("tftp", tmp_.sub("empty")).is_ok());

    StatInfo st;
    EXPECT_TRUE(ftp.stat("/music.mp3", st).is_ok());
    EXPECT_EQ(FsError::NotFound, tftp.stat("/music.mp3", st).code);
    EXPECT_EQ(FsError::NotFound, tftp.stat("../ftp/music.mp3", st).code);

    // A link aimed at another protocol's home does not lead there
    EXPECT_EQ(FsError::NotADirectory, ftp.chdir("sibling").code);
    EXPECT_EQ("/", ftp.getcwd());
}

TEST_F(ProtocolJailTest, InvalidProtocolNames) {
    ProtocolJail jail(root_);
    EXPECT_EQ(FsError::InvalidArgument, jail.initialize("", template_dir_).code);
    EXPECT_EQ(FsError::InvalidArgument, jail.initialize("..", template_dir_).code);
    EXPECT_EQ(FsError::InvalidArgument, jail.initialize("a/b", template_dir_).code);
}

TEST_F(ProtocolJailTest, EmptyPaths) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    StatInfo st;
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("").code);
    EXPECT_EQ(FsError::NotFound, jail.stat("", st).code);
    std::vector<std::string> names;
    EXPECT_EQ(FsError::NotADirectory, jail.listdir("", names).code);
    EXPECT_EQ("/", jail.getcwd());
}

TEST_F(ProtocolJailTest, RejectsTemplateContainingJailRoot) {
    JailRoot nested;
    ASSERT_TRUE(nested.open(template_dir_ + "/jail"));

    ProtocolJail jail(nested);
    EXPECT_EQ(FsError::InvalidArgument, jail.initialize("ftp", template_dir_).code);
    EXPECT_FALSE(jail.is_initialized());
    EXPECT_TRUE(nested.protocols().empty());

    // Nothing was written into the template
    struct stat st;
    EXPECT_NE(0, ::stat((template_dir_ + "/jail/ftp").c_str(), &st));
    std::vector<std::string> entries;
    ASSERT_TRUE(nested.store().list_dir("/", entries).is_ok());
    EXPECT_TRUE(entries.empty());
    nested.close();
}

TEST_F(ProtocolJailTest, ChdirWithinHome) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    ASSERT_TRUE(jail.chdir("pub").is_ok());
    EXPECT_EQ("/pub", jail.getcwd());
    ASSERT_TRUE(jail.chdir("deep").is_ok());
    EXPECT_EQ("/pub/deep", jail.getcwd());
    ASSERT_TRUE(jail.chdir("..").is_ok());
    EXPECT_EQ("/pub", jail.getcwd());
    ASSERT_TRUE(jail.chdir("/").is_ok());
    EXPECT_EQ("/", jail.getcwd());
    ASSERT_TRUE(jail.chdir("./pub/./deep/../").is_ok());
    EXPECT_EQ("/pub", jail.getcwd());
}

TEST_F(ProtocolJailTest, ChdirFailuresKeepCwd) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());
    ASSERT_TRUE(jail.chdir("/pub").is_ok());

    EXPECT_EQ(FsError::NotADirectory, jail.chdir("missing").code);
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("readme.txt").code);
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("../..").code);
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("/../../etc").code);
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("").code);
    EXPECT_EQ("/pub", jail.getcwd());
}

TEST_F(ProtocolJailTest, ResolveNeverClimbsAboveHome) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    std::string out;
    EXPECT_TRUE(jail.resolve("a/b/../c", out));
    EXPECT_EQ("/a/c", out);
    EXPECT_TRUE(jail.resolve("/", out));
    EXPECT_EQ("/", out);
    EXPECT_FALSE(jail.resolve("..", out));
    EXPECT_FALSE(jail.resolve("/a/../../b", out));
}

TEST_F(ProtocolJailTest, RandomChdirSequenceStaysInsideHome) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    const char* const moves[] = {
        "..", "../..", "/", "pub", "deep", "/pub/deep", "../../..",
        "escape", "sibling", "latest", ".", "./..", "/..", "pub/../.."
    };
    const size_t kMoves = sizeof(moves) / sizeof(moves[0]);

    std::mt19937 rng(20221002);
    std::uniform_int_distribution<size_t> pick(0, kMoves - 1);
    for (int i = 0; i < 500; ++i) {
        FsStatus status = jail.chdir(moves[pick(rng)]);
        if (!status.is_ok()) {
            EXPECT_EQ(FsError::NotADirectory, status.code);
        }
        std::string cwd = jail.getcwd();
        ASSERT_FALSE(cwd.empty());
        ASSERT_EQ('/', cwd[0]);
        ASSERT_TRUE(cwd == "/" || cwd == "/pub" || cwd == "/pub/deep") << cwd;
    }
}

TEST_F(ProtocolJailTest, SymlinkOutOfJailIsNotFollowed) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    EXPECT_EQ(FsError::NotADirectory, jail.chdir("escape").code);
    EXPECT_EQ(FsError::NotADirectory, jail.chdir("escape/etc").code);

    StatInfo st;
    EXPECT_EQ(FsError::NotFound, jail.stat("escape/etc/passwd", st).code);
    EXPECT_EQ(FsError::NotFound, jail.utime("escape", 1, 1).code);
    EXPECT_EQ(FsError::NotFound, jail.chmod("escape", 0777).code);

    std::vector<std::string> names;
    EXPECT_EQ(FsError::NotADirectory, jail.listdir("escape", names).code);

    // The link itself is still visible
    ASSERT_TRUE(jail.stat("escape", st).is_ok());
    EXPECT_TRUE(st.is_symlink());
}

TEST_F(ProtocolJailTest, StatUsesPlaceholdersAndDoesNotFollowLinks) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    StatInfo st;
    ASSERT_TRUE(jail.stat("music.mp3", st).is_ok());
    EXPECT_EQ(1024, st.size);
    EXPECT_EQ("owner", st.owner);
    EXPECT_EQ("group", st.group);
    EXPECT_FALSE(st.is_dir());

    ASSERT_TRUE(jail.stat("/pub", st).is_ok());
    EXPECT_TRUE(st.is_dir());

    ASSERT_TRUE(jail.stat("latest", st).is_ok());
    EXPECT_TRUE(st.is_symlink());
    EXPECT_EQ(static_cast<int64_t>(std::string("pub/readme.txt").size()), st.size);

    EXPECT_EQ(FsError::NotFound, jail.stat("nothing-here", st).code);
    EXPECT_EQ(FsError::NotFound, jail.stat("music.mp3/inside", st).code);
    EXPECT_EQ(FsError::NotFound, jail.stat("../../etc/passwd", st).code);
}

TEST_F(ProtocolJailTest, Readlink) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    std::string target;
    ASSERT_TRUE(jail.readlink("latest", target).is_ok());
    EXPECT_EQ("pub/readme.txt", target);
    ASSERT_TRUE(jail.readlink("/escape", target).is_ok());
    EXPECT_EQ("/", target);

    EXPECT_EQ(FsError::NotASymlink, jail.readlink("music.mp3", target).code);
    EXPECT_EQ(FsError::NotFound, jail.readlink("gone", target).code);
}

TEST_F(ProtocolJailTest, TimesAndPermissions) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());
    ASSERT_TRUE(jail.chdir("pub").is_ok());

    ASSERT_TRUE(jail.utime("readme.txt", testing::kOldMtime, testing::kRecentMtime).is_ok());
    int64_t mtime = 0;
    ASSERT_TRUE(jail.getmtime("readme.txt", mtime).is_ok());
    EXPECT_EQ(testing::kRecentMtime, mtime);

    ASSERT_TRUE(jail.chmod("readme.txt", 0600).is_ok());
    uint32_t mode = 0;
    ASSERT_TRUE(jail.get_permissions("/pub/readme.txt", mode).is_ok());
    EXPECT_EQ(0600u, mode);

    ASSERT_TRUE(jail.set_permissions("readme.txt", 0644).is_ok());
    ASSERT_TRUE(jail.get_permissions("readme.txt", mode).is_ok());
    EXPECT_EQ(0644u, mode);

    // chmod through a link inside the jail changes the target
    ASSERT_TRUE(jail.chmod("/latest", 0640).is_ok());
    ASSERT_TRUE(jail.get_permissions("readme.txt", mode).is_ok());
    EXPECT_EQ(0640u, mode);

    EXPECT_EQ(FsError::NotFound, jail.getmtime("missing", mtime).code);
    EXPECT_EQ(FsError::NotFound, jail.utime("missing", 1, 1).code);
}

TEST_F(ProtocolJailTest, Listdir) {
    ProtocolJail jail(root_);
    ASSERT_TRUE(jail.initialize("ftp", template_dir_).is_ok());

    std::vector<std::string> names;
    ASSERT_TRUE(jail.listdir("/", names).is_ok());
    ASSERT_EQ(5u, names.size());
    EXPECT_EQ("escape", names[0]);
    EXPECT_EQ("latest", names[1]);
    EXPECT_EQ("music.mp3", names[2]);
    EXPECT_EQ("pub", names[3]);
    EXPECT_EQ("sibling", names[4]);

    EXPECT_EQ(FsError::NotADirectory, jail.listdir("music.mp3", names).code);
    EXPECT_EQ(FsError::NotADirectory, jail.listdir("..", names).code);
}

TEST_F(ProtocolJailTest, OperationsBeforeInitialize) {
    ProtocolJail jail(root_);
    StatInfo st;
    EXPECT_EQ(FsError::InvalidArgument, jail.stat("/", st).code);
    EXPECT_EQ(FsError::InvalidArgument, jail.chdir("/").code);
}

TEST(JailRootTest, TemporaryRootIsRemovedOnClose) {
    std::string dir;
    {
        JailRoot root;
        ASSERT_TRUE(root.open());
        dir = root.host_dir();
        ASSERT_TRUE(root.claim("ftp").is_ok());
        struct stat st;
        ASSERT_EQ(0, ::stat((dir + "/ftp").c_str(), &st));
    }
    struct stat st;
    EXPECT_NE(0, ::stat(dir.c_str(), &st));
}

TEST(JailRootTest, SuppliedRootKeepsUnclaimedEntries) {
    testing::TempDir tmp;
    testing::make_dir(tmp.sub("jail"));
    testing::make_dir(tmp.sub("jail/existing"));

    JailRoot root;
    ASSERT_TRUE(root.open(tmp.sub("jail")));
    ASSERT_TRUE(root.claim("ftp").is_ok());
    EXPECT_EQ(FsError::AlreadyExists, root.claim("existing").code);
    root.close();

    struct stat st;
    EXPECT_EQ(0, ::stat(tmp.sub("jail/existing").c_str(), &st));
    EXPECT_NE(0, ::stat(tmp.sub("jail/ftp").c_str(), &st));
    EXPECT_FALSE(root.is_open());
}

TEST(JailRootTest, KeepOnClose) {
    testing::TempDir tmp;
    JailRoot root;
    ASSERT_TRUE(root.open(tmp.sub("jail"), true));
    ASSERT_TRUE(root.claim("ftp").is_ok());
    root.close();

    struct stat st;
    EXPECT_EQ(0, ::stat(tmp.sub("jail/ftp").c_str(), &st));
}

TEST(JailRootTest, ClaimRequiresOpenRoot) {
    JailRoot root;
    EXPECT_EQ(FsError::InvalidArgument, root.claim("ftp").code);
}

} // namespace
} // namespace decoyfs
