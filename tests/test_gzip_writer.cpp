#include "io/gzip_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace {

std::span<const std::uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

std::string Gunzip(const std::string& gz) {
    z_stream s{};
    EXPECT_EQ(inflateInit2(&s, 16 + MAX_WBITS), Z_OK);
    s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(gz.data()));
    s.avail_in = static_cast<uInt>(gz.size());

    std::string out;
    char buf[4096];
    int ret;
    do {
        s.next_out = reinterpret_cast<Bytef*>(buf);
        s.avail_out = sizeof(buf);
        ret = inflate(&s, Z_NO_FLUSH);
        EXPECT_TRUE(ret == Z_OK || ret == Z_STREAM_END) << ret;
        out.append(buf, sizeof(buf) - s.avail_out);
    } while (ret == Z_OK);
    inflateEnd(&s);
    return out;
}

std::string Drain(filetar::GzipWriter& gz, filetar::ReadStatus& last) {
    std::string out;
    std::vector<std::uint8_t> chunk;
    while (true) {
        auto res = gz.Read(chunk, last);
        EXPECT_TRUE(res.ok) << res.msg;
        if (last != filetar::ReadStatus::Data)
            break;
        out += testutil::Bytes(chunk);
    }
    return out;
}

TEST(GzipWriterTests, CompressesWhatIsWritten) {
    std::shared_ptr<filetar::GzipWriter> gz;
    ASSERT_TRUE(filetar::GzipWriter::Create(Z_DEFAULT_COMPRESSION, gz).ok);

    std::string input;
    for (int i = 0; i < 5000; ++i)
        input += "line " + std::to_string(i) + "\n";

    ASSERT_TRUE(gz->Write(AsBytes(input.substr(0, 1000))).ok);
    ASSERT_TRUE(gz->Write(AsBytes(input.substr(1000))).ok);

    filetar::ReadStatus st;
    std::string compressed = Drain(*gz, st);
    EXPECT_EQ(st, filetar::ReadStatus::Pending);

    ASSERT_TRUE(gz->End().ok);
    compressed += Drain(*gz, st);
    EXPECT_EQ(st, filetar::ReadStatus::End);

    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(compressed[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 0x8b);
    EXPECT_LT(compressed.size(), input.size());
    EXPECT_EQ(Gunzip(compressed), input);
}

TEST(GzipWriterTests, EmptyInputStillProducesValidStream) {
    std::shared_ptr<filetar::GzipWriter> gz;
    ASSERT_TRUE(filetar::GzipWriter::Create(9, gz).ok);
    ASSERT_TRUE(gz->End().ok);

    filetar::ReadStatus st;
    const std::string compressed = Drain(*gz, st);
    EXPECT_EQ(st, filetar::ReadStatus::End);
    EXPECT_EQ(Gunzip(compressed), "");
}

TEST(GzipWriterTests, RejectsBadLevel) {
    std::shared_ptr<filetar::GzipWriter> gz;
    auto res = filetar::GzipWriter::Create(10, gz);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.err, EINVAL);
}

TEST(GzipWriterTests, WriteAfterEndOrDestroyFails) {
    std::shared_ptr<filetar::GzipWriter> gz;
    ASSERT_TRUE(filetar::GzipWriter::Create(1, gz).ok);
    ASSERT_TRUE(gz->End().ok);
    EXPECT_FALSE(gz->Write(AsBytes("late")).ok);

    gz->Destroy();
    gz->Destroy();
    std::vector<std::uint8_t> chunk;
    filetar::ReadStatus st;
    EXPECT_EQ(gz->Read(chunk, st).err, EBADF);
}

TEST(GzipWriterTests, IsClassifiedAsTransform) {
    std::shared_ptr<filetar::GzipWriter> gz;
    ASSERT_TRUE(filetar::GzipWriter::Create(1, gz).ok);
    EXPECT_EQ(filetar::ClassifyStream(gz.get()), filetar::StreamKind::Transform);
}

} // namespace
