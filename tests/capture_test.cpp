#include <decoyfs/capture/capture.hpp>
#include <decoyfs/capture/catalog.hpp>
#include <decoyfs/core/utils.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <ctime>
#include <sstream>
#include <stdexcept>
#include <streambuf>

namespace decoyfs {
namespace {

CaptureRecord make_record(const std::string& stored, const std::string& sha, int64_t finished) {
    CaptureRecord r;
    r.stored_name = stored;
    r.original_name = stored + ".orig";
    r.protocol = "ftp";
    r.size = 11;
    r.sha256 = sha;
    r.started_at = finished - 5;
    r.finished_at = finished;
    return r;
}

// Serves its data once, then fails the way a dropped connection does
class ResetAfterBuf : public std::streambuf {
public:
    explicit ResetAfterBuf(const std::string& data) : data_(data), served_(false) {}

protected:
    int_type underflow() override {
        if (served_ || data_.empty()) {
            throw std::runtime_error("connection reset");
        }
        served_ = true;
        setg(&data_[0], &data_[0], &data_[0] + data_.size());
        return traits_type::to_int_type(data_[0]);
    }

private:
    std::string data_;
    bool served_;
};

class CaptureCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(catalog_.open(tmp_.sub("db/captures.db"))) << catalog_.last_error();
    }

    testing::TempDir tmp_;
    CaptureCatalog catalog_;
};

TEST_F(CaptureCatalogTest, RecordAndList) {
    CaptureRecord first = make_record("one", "aa", 1000);
    CaptureRecord second = make_record("two", "bb", 2000);
    ASSERT_TRUE(catalog_.record(first));
    ASSERT_TRUE(catalog_.record(second));
    EXPECT_GT(first.id, 0);
    EXPECT_GT(second.id, first.id);
    EXPECT_EQ(2, catalog_.count());

    std::vector<CaptureRecord> rows = catalog_.list();
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("two", rows[0].stored_name);
    EXPECT_EQ("one", rows[1].stored_name);
    EXPECT_EQ("one.orig", rows[1].original_name);
    EXPECT_EQ("ftp", rows[1].protocol);
    EXPECT_EQ(11, rows[1].size);
    EXPECT_EQ(995, rows[1].started_at);

    EXPECT_EQ(1u, catalog_.list(1).size());
}

TEST_F(CaptureCatalogTest, StoredNamesAreUnique) {
    CaptureRecord r = make_record("dup", "aa", 1000);
    ASSERT_TRUE(catalog_.record(r));
    CaptureRecord again = make_record("dup", "bb", 2000);
    EXPECT_FALSE(catalog_.record(again));
    EXPECT_FALSE(catalog_.last_error().empty());
    EXPECT_EQ(1, catalog_.count());
}

TEST_F(CaptureCatalogTest, FindByDigestReturnsFirstCapture) {
    CaptureRecord a = make_record("a", "same", 1000);
    CaptureRecord b = make_record("b", "same", 2000);
    ASSERT_TRUE(catalog_.record(a));
    ASSERT_TRUE(catalog_.record(b));

    CaptureRecord found;
    ASSERT_TRUE(catalog_.find_by_digest("same", found));
    EXPECT_EQ("a", found.stored_name);
    EXPECT_FALSE(catalog_.find_by_digest("other", found));
    EXPECT_FALSE(catalog_.find_by_digest("", found));
}

TEST_F(CaptureCatalogTest, SurvivesReopen) {
    CaptureRecord r = make_record("kept", "cc", 1000);
    ASSERT_TRUE(catalog_.record(r));
    catalog_.close();
    EXPECT_FALSE(catalog_.is_open());

    ASSERT_TRUE(catalog_.open(tmp_.sub("db/captures.db")));
    EXPECT_EQ(1, catalog_.count());
}

TEST(CaptureCatalogClosedTest, OperationsFailCleanly) {
    CaptureCatalog catalog;
    CaptureRecord r = make_record("x", "y", 1);
    EXPECT_FALSE(catalog.record(r));
    EXPECT_EQ(0, catalog.count());
    EXPECT_TRUE(catalog.list().empty());
}

class UploadCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        CaptureConfig config;
        config.data_dir = tmp_.sub("uploads");
        config.catalog_path = tmp_.sub("db/captures.db");
        config.chunk_size = 3;
        ASSERT_TRUE(capture_.open(config)) << capture_.last_error();
    }

    testing::TempDir tmp_;
    UploadCapture capture_;
};

TEST_F(UploadCaptureTest, StreamsIntoStoreAndCatalog) {
    std::istringstream in("hello world");
    CaptureRecord rec;
    ASSERT_TRUE(capture_.capture("ftp", "Hello World.txt", in, rec).is_ok());

    EXPECT_EQ("ftp", rec.protocol);
    EXPECT_EQ("Hello World.txt", rec.original_name);
    EXPECT_EQ(11, rec.size);
    EXPECT_EQ("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9", rec.sha256);
    EXPECT_GT(rec.id, 0);
    EXPECT_LE(rec.started_at, rec.finished_at);

    const std::string suffix = " - hello-world-txt";
    ASSERT_GT(rec.stored_name.size(), suffix.size());
    EXPECT_EQ(suffix, rec.stored_name.substr(rec.stored_name.size() - suffix.size()));
    EXPECT_EQ("hello world", testing::read_host_file(capture_.data_dir() + "/" + rec.stored_name));

    CaptureRecord found;
    ASSERT_TRUE(capture_.catalog().find_by_digest(rec.sha256, found));
    EXPECT_EQ(rec.stored_name, found.stored_name);
}

TEST_F(UploadCaptureTest, CollisionIsReportedNotRetried) {
    // Occupy the name for the current second and the few after it
    time_t now = time(NULL);
    for (int i = 0; i < 5; ++i) {
        testing::write_file(capture_.data_dir() + "/" + sanitize_file_name("dup.bin", now + i), "first");
    }

    std::istringstream in("second");
    CaptureRecord rec;
    EXPECT_EQ(FsError::AlreadyExists, capture_.capture("ftp", "dup.bin", in, rec).code);
    EXPECT_EQ(0, capture_.catalog().count());
    EXPECT_EQ("first", testing::read_host_file(capture_.data_dir() + "/" + sanitize_file_name("dup.bin", now)));
}

TEST_F(UploadCaptureTest, BrokenInputIsAnErrorAndKeepsReceivedBytes) {
    ResetAfterBuf buf("0123456789");
    std::istream in(&buf);
    CaptureRecord rec;
    EXPECT_EQ(FsError::IoError, capture_.capture("ftp", "cut.bin", in, rec).code);
    EXPECT_EQ(0, capture_.catalog().count());

    std::vector<std::string> names;
    ASSERT_TRUE(capture_.store().list_dir("/", names).is_ok());
    ASSERT_EQ(1u, names.size());
    EXPECT_EQ("0123456789", testing::read_host_file(capture_.data_dir() + "/" + names[0]));
}

TEST_F(UploadCaptureTest, EmptyInputIsAnEmptyCapture) {
    std::istringstream in("");
    CaptureRecord rec;
    ASSERT_TRUE(capture_.capture("ftp", "empty.bin", in, rec).is_ok());
    EXPECT_EQ(0, rec.size);
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", rec.sha256);
    EXPECT_EQ(1, capture_.catalog().count());
}

TEST_F(UploadCaptureTest, BeginHandsOutExclusiveWriter) {
    UploadWriter writer;
    ASSERT_TRUE(capture_.begin("notes.txt", writer).is_ok());
    size_t accepted = 0;
    ASSERT_TRUE(writer.write_chunk("abc", accepted).is_ok());
    ASSERT_TRUE(writer.close().is_ok());
    EXPECT_EQ("abc", testing::read_host_file(capture_.data_dir() + "/" + writer.name()));
}

TEST(UploadCaptureClosedTest, CatalogIsOptional) {
    testing::TempDir tmp;
    CaptureConfig config;
    config.data_dir = tmp.sub("uploads");
    UploadCapture capture;
    ASSERT_TRUE(capture.open(config));
    EXPECT_FALSE(capture.catalog().is_open());

    std::istringstream in("payload");
    CaptureRecord rec;
    ASSERT_TRUE(capture.capture("tftp", "fw.bin", in, rec).is_ok());
    EXPECT_EQ(0, rec.id);
    EXPECT_EQ("payload", testing::read_host_file(capture.data_dir() + "/" + rec.stored_name));
}

TEST(UploadCaptureClosedTest, BeginBeforeOpen) {
    UploadCapture capture;
    UploadWriter writer;
    EXPECT_EQ(FsError::InvalidArgument, capture.begin("x", writer).code);
}

} // namespace
} // namespace decoyfs
