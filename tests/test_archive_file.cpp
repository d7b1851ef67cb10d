#include "fake_file_system.hpp"
#include "filetar/archive_file.hpp"
#include "filetar/archive_run.hpp"
#include "io/gzip_writer.hpp"
#include "testing.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace filetar {
namespace {

struct Recorded {
    std::vector<std::pair<std::uint64_t, std::string>> events;
    std::vector<Result> errors;
    int completes = 0;
};

Observer Record(Recorded& r) {
    Observer o;
    o.next = [&r](const ProgressEvent& e) { r.events.emplace_back(e.bytes, e.header->name); };
    o.error = [&r](const Result& res) { r.errors.push_back(res); };
    o.complete = [&r]() { ++r.completes; };
    return o;
}

off_t FileSize(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return -1;
    return st.st_size;
}

class ArchiveFileTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    boost::asio::io_context io;
};

TEST_F(ArchiveFileTests, ArchivesSingleFileAndReportsProgress) {
    const std::string src = tmp / "index.js";
    const std::string dst = tmp / "tmp/archive.tar";
    const std::string content(500, 'j');
    testutil::WriteFile(src, content);
    ASSERT_EQ(::mkdir((tmp / "tmp").c_str(), 0755), 0);

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, dst, op).ok);

    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    EXPECT_FALSE(sub.Closed());
    io.run();

    EXPECT_TRUE(rec.errors.empty()) << rec.errors[0].msg;
    EXPECT_EQ(rec.completes, 1);
    EXPECT_TRUE(sub.Closed());

    ASSERT_GE(rec.events.size(), 2u);
    EXPECT_EQ(rec.events.front().first, 0u);
    EXPECT_EQ(rec.events.front().second, "index.js");
    EXPECT_EQ(rec.events.back().first, 500u);
    for (size_t i = 1; i < rec.events.size(); ++i) {
        EXPECT_GE(rec.events[i].first, rec.events[i - 1].first);
    }

    auto entries = testutil::ExtractTar(testutil::ReadFile(dst));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, "index.js");
    EXPECT_EQ(entries[0].contents, content);
}

TEST_F(ArchiveFileTests, CreatesMissingParentDirectories) {
    const std::string src = tmp / "a.txt";
    const std::string dst = tmp / "x/y/z/a.tar";
    testutil::WriteFile(src, "nested");

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, dst, op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_TRUE(rec.errors.empty()) << rec.errors[0].msg;
    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(testutil::ExtractTar(testutil::ReadFile(dst))[0].contents, "nested");
}

TEST_F(ArchiveFileTests, DirectoryAtDestinationFailsWithEISDIR) {
    const std::string src = tmp / "a.txt";
    const std::string dst = tmp / "taken";
    testutil::WriteFile(src, "x");
    ASSERT_EQ(::mkdir(dst.c_str(), 0755), 0);

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, dst, op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].err, EISDIR);
    EXPECT_EQ(rec.completes, 0);
    EXPECT_TRUE(rec.events.empty());
}

TEST_F(ArchiveFileTests, DirectoryAtDestinationDoesNotRetryDirectoryCreation) {
    auto fs = std::make_shared<testutil::FakeFileSystem>();
    fs->kinds["/src/a.txt"] = FileKind::Regular;
    fs->open_results.push_back(Result::Fail(EISDIR, "is a directory"));

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, "/src/a.txt", "/dst/out", op).ok);
    op.SetFileSystem(fs);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].err, EISDIR);
    EXPECT_EQ(fs->mkdir_calls, 1);
    EXPECT_EQ(fs->open_calls, 1);
}

TEST_F(ArchiveFileTests, RenamedAndGzippedArchive) {
    const std::string src = tmp / "a.txt";
    const std::string dst = tmp / "out.tar.gz";
    testutil::WriteFile(src, "content to compress");

    ArchiveOptions opts;
    opts.map_header = [](EntryHeader& h) { h.name = "modified.txt"; };
    std::shared_ptr<GzipWriter> gz;
    ASSERT_TRUE(GzipWriter::Create(6, gz).ok);
    opts.post_pack_transform = gz;

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, dst, opts, op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_TRUE(rec.errors.empty()) << rec.errors[0].msg;
    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(rec.events.back().second, "modified.txt");

    const std::string bytes = testutil::ReadFile(dst);
    EXPECT_EQ(testutil::FilterName(bytes), "gzip");
    auto entries = testutil::ExtractTar(bytes);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, "modified.txt");
    EXPECT_EQ(entries[0].contents, "content to compress");
}

TEST_F(ArchiveFileTests, CancelMidTransferStopsEverything) {
    const std::string src = tmp / "big.bin";
    const std::string dst = tmp / "big.tar";
    testutil::WriteFile(src, std::string(4 * 1024 * 1024, 'b'));

    ArchiveOptions opts;
    opts.packer.chunk_size = 16 * 1024;
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, dst, opts, op).ok);

    Recorded rec;
    Subscription sub;
    off_t size_at_cancel = -1;
    Observer o = Record(rec);
    o.next = [&](const ProgressEvent& e) {
        rec.events.emplace_back(e.bytes, e.header->name);
        if (e.bytes >= 64 * 1024 && size_at_cancel < 0) {
            sub.Cancel();
            size_at_cancel = FileSize(dst);
        }
    };
    sub = op.Subscribe(std::move(o));
    io.run();

    EXPECT_TRUE(sub.Closed());
    EXPECT_EQ(rec.completes, 0);
    EXPECT_TRUE(rec.errors.empty());
    ASSERT_GE(size_at_cancel, 0);
    EXPECT_EQ(FileSize(dst), size_at_cancel);
    EXPECT_LT(size_at_cancel, 4 * 1024 * 1024);
    EXPECT_LT(rec.events.back().first, 4u * 1024 * 1024);
}

TEST_F(ArchiveFileTests, CancelBeforeStatDeliversNothing) {
    const std::string src = tmp / "a.txt";
    testutil::WriteFile(src, "x");

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, src, tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    sub.Cancel();
    io.run();

    EXPECT_TRUE(rec.events.empty());
    EXPECT_TRUE(rec.errors.empty());
    EXPECT_EQ(rec.completes, 0);
    EXPECT_FALSE(testutil::Exists(tmp / "a.tar"));
}

TEST_F(ArchiveFileTests, MissingSourceFailsWithENOENT) {
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "nope.txt", tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].err, ENOENT);
    EXPECT_FALSE(testutil::Exists(tmp / "a.tar"));
}

TEST_F(ArchiveFileTests, DirectorySourceIsRejected) {
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp.Path(), tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].msg, "Expected " + tmp.Path() + " to be a file path, but it was a directory.");
}

TEST_F(ArchiveFileTests, SymlinkSourceIsRejected) {
    testutil::WriteFile(tmp / "t.txt", "x");
    ASSERT_EQ(::symlink((tmp / "t.txt").c_str(), (tmp / "l").c_str()), 0);

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "l", tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].msg, "Expected " + (tmp / "l") + " to be a file path, but it was a symbolic link.");
}

TEST_F(ArchiveFileTests, FileInTheWayOfParentDirectoryFails) {
    testutil::WriteFile(tmp / "a.txt", "x");
    testutil::WriteFile(tmp / "blocker", "not a dir");

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "a.txt", tmp / "blocker/sub/a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_TRUE(rec.errors[0].err == EEXIST || rec.errors[0].err == ENOTDIR) << rec.errors[0].msg;
    EXPECT_EQ(rec.completes, 0);
}

TEST_F(ArchiveFileTests, NonReadableMapStreamResultFails) {
    testutil::WriteFile(tmp / "a.txt", "x");
    ArchiveOptions opts;
    opts.map_stream = [](std::shared_ptr<IReadable>, const EntryHeader&) -> std::shared_ptr<IStream> {
        return std::make_shared<testutil::MemoryWritable>();
    };

    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "a.txt", tmp / "a.tar", opts, op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();

    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].msg,
              "The function passed to `map_stream` option must return a stream that is readable, "
              "but returned a writable stream.");
    EXPECT_EQ(rec.completes, 0);
}

TEST_F(ArchiveFileTests, ArgumentErrorsAreReturnedBeforeSubscribe) {
    ArchiveOperation op;
    auto res = ArchiveFileFromArguments(io, {tmp / "a.txt", tmp / "a.txt"}, op);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.err, EINVAL);
    EXPECT_EQ(io.poll(), 0u);
}

TEST_F(ArchiveFileTests, SecondSubscribeIsRejected) {
    testutil::WriteFile(tmp / "a.txt", "x");
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "a.txt", tmp / "a.tar", op).ok);

    Recorded first;
    Recorded second;
    auto sub1 = op.Subscribe(Record(first));
    auto sub2 = op.Subscribe(Record(second));
    io.run();

    EXPECT_EQ(first.completes, 1);
    ASSERT_EQ(second.errors.size(), 1u);
    EXPECT_EQ(second.errors[0].err, EALREADY);
    EXPECT_TRUE(second.events.empty());
    EXPECT_EQ(second.completes, 0);
}

TEST_F(ArchiveFileTests, DroppedSubscriptionStillCompletes) {
    testutil::WriteFile(tmp / "a.txt", "keep going");
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "a.txt", tmp / "a.tar", op).ok);

    Recorded rec;
    (void)op.Subscribe(Record(rec));
    io.run();

    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(testutil::ExtractTar(testutil::ReadFile(tmp / "a.tar"))[0].contents, "keep going");
}

TEST_F(ArchiveFileTests, CancelAfterCompleteIsIgnored) {
    testutil::WriteFile(tmp / "a.txt", "done");
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "a.txt", tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();
    ASSERT_EQ(rec.completes, 1);
    const size_t events = rec.events.size();

    sub.Cancel();
    sub.Cancel();
    io.restart();
    io.run();

    EXPECT_TRUE(sub.Closed());
    EXPECT_EQ(rec.completes, 1);
    EXPECT_TRUE(rec.errors.empty());
    EXPECT_EQ(rec.events.size(), events);
    EXPECT_EQ(testutil::ExtractTar(testutil::ReadFile(tmp / "a.tar"))[0].contents, "done");
}

TEST_F(ArchiveFileTests, CancelAfterErrorIsIgnored) {
    ArchiveOperation op;
    ASSERT_TRUE(ArchiveFile(io, tmp / "missing.txt", tmp / "a.tar", op).ok);
    Recorded rec;
    auto sub = op.Subscribe(Record(rec));
    io.run();
    ASSERT_EQ(rec.errors.size(), 1u);

    sub.Cancel();
    io.restart();
    io.run();

    EXPECT_TRUE(sub.Closed());
    EXPECT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.completes, 0);
}

class ArchiveRunTests : public ::testing::Test {
  protected:
    boost::asio::io_context io;
    std::shared_ptr<testutil::FakeFileSystem> fs = std::make_shared<testutil::FakeFileSystem>();
    Recorded rec;

    std::shared_ptr<ArchiveRun> Make(const std::string& source) {
        ArchiveRequest request;
        EXPECT_TRUE(ValidateRequest(source, "/dst/out.tar", ArchiveOptions{}, request).ok);
        return std::make_shared<ArchiveRun>(io, std::move(request), fs, Record(rec));
    }
};

TEST(ArchiveRunStateTests, StateStaysCompletedAfterCancel) {
    testutil::TemporaryDirectory tmp;
    boost::asio::io_context io;
    testutil::WriteFile(tmp / "a.txt", "abc");
    ArchiveRequest request;
    ASSERT_TRUE(ValidateRequest(tmp / "a.txt", tmp / "a.tar", ArchiveOptions{}, request).ok);
    Recorded rec;
    auto run = std::make_shared<ArchiveRun>(io, std::move(request), DefaultFileSystem(), Record(rec));
    run->Start();
    io.run();
    ASSERT_EQ(run->CurrentState(), ArchiveRun::State::Completed);

    run->Cancel();
    EXPECT_EQ(run->CurrentState(), ArchiveRun::State::Completed);
    EXPECT_TRUE(run->Closed());
    EXPECT_EQ(rec.completes, 1);
    EXPECT_TRUE(testutil::Exists(tmp / "a.tar"));
}

TEST_F(ArchiveRunTests, StateStaysFailedAfterCancel) {
    auto run = Make("/src/missing.txt");
    run->Start();
    io.run();
    ASSERT_EQ(run->CurrentState(), ArchiveRun::State::Failed);

    run->Cancel();
    EXPECT_EQ(run->CurrentState(), ArchiveRun::State::Failed);
    EXPECT_EQ(rec.errors.size(), 1u);
}

TEST_F(ArchiveRunTests, CancelWhileResolvingDestination) {
    fs->kinds["/src/a.txt"] = FileKind::Regular;
    auto run = Make("/src/a.txt");
    run->Start();

    ASSERT_EQ(io.run_one(), 1u); // stat
    ASSERT_EQ(run->CurrentState(), ArchiveRun::State::Resolving);
    ASSERT_EQ(io.run_one(), 1u); // first open
    ASSERT_EQ(fs->writers.size(), 1u);

    run->Cancel();
    EXPECT_EQ(run->CurrentState(), ArchiveRun::State::Cancelled);
    EXPECT_TRUE(fs->writers[0]->Destroyed());

    io.run();
    EXPECT_EQ(run->CurrentState(), ArchiveRun::State::Cancelled);
    EXPECT_TRUE(rec.events.empty());
    EXPECT_TRUE(rec.errors.empty());
    EXPECT_EQ(rec.completes, 0);
    EXPECT_EQ(fs->open_calls, 1);
    EXPECT_EQ(fs->mkdir_calls, 0);
}

TEST(ArchiveRunStateTests, StateNames) {
    EXPECT_EQ(StateName(ArchiveRun::State::Piping), "piping");
    EXPECT_EQ(StateName(ArchiveRun::State::Cancelled), "cancelled");
}

} // namespace
} // namespace filetar
