#include "../test_config.h"

#include "container/SvxDecoder.hpp"
#include "container/SvxEncoder.hpp"
#include "converter/Errors.hpp"

class SvxDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        samples = SampleBuffer{10, -10, 100, -100, 0};
        bytes = EncodeSvx(samples, 8363);
    }

    SampleBuffer samples;
    std::vector<uint8_t> bytes;
};

TEST_F(SvxDecoderTest, DecodesWellFormedContainer) {
    const DecodedSvx decoded = DecodeSvx(bytes);

    EXPECT_EQ(decoded.metadata.sample_rate, 8363);
    EXPECT_EQ(decoded.metadata.one_shot_samples, 5u);
    EXPECT_EQ(decoded.samples, samples);
    EXPECT_EQ(decoded.body_size, 5u);
    EXPECT_EQ(decoded.file_size, bytes.size());
}

TEST_F(SvxDecoderTest, RejectsShortFile) {
    bytes.resize(47);
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
    EXPECT_THROW(DecodeSvx({}), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsWrongFormTag) {
    bytes[0] = 'L';
    bytes[1] = 'I';
    bytes[2] = 'S';
    bytes[3] = 'T';
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsWrongFormType) {
    bytes[8] = 'A';
    bytes[9] = 'I';
    bytes[10] = 'F';
    bytes[11] = 'F';
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsMissingHeaderChunk) {
    bytes[12] = 'N';
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsHeaderSizeOtherThanTwenty) {
    bytes[19] = 22;
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsMissingBodyChunk) {
    bytes[40] = 'b';
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, RejectsBodyRunningPastEnd) {
    bytes[47] = 200;
    EXPECT_THROW(DecodeSvx(bytes), MalformedContainer);
}

TEST_F(SvxDecoderTest, ReadSvxFileReportsMissingFile) {
    ScratchDirectory scratch;
    EXPECT_THROW(ReadSvxFile(scratch.Path() / "nope.iff"), IOError);
}

TEST_F(SvxDecoderTest, ReadContainerBytesReturnsWholeFile) {
    ScratchDirectory scratch;
    const std::filesystem::path path = scratch.Path() / "odd.iff";
    WriteSvxFile(path, samples, 8363);

    // Five samples leave a pad byte after BODY.
    const std::vector<uint8_t> read = ReadContainerBytes(path);
    EXPECT_EQ(read, bytes);
    EXPECT_EQ(read.size(), 54u);
}

TEST_F(SvxDecoderTest, ReadingDirectoryIsAnIOError) {
    ScratchDirectory scratch;
    EXPECT_THROW(ReadContainerBytes(scratch.Path()), IOError);
    EXPECT_THROW(ReadSvxFile(scratch.Path()), IOError);
}

TEST_F(SvxDecoderTest, PeakMagnitude) {
    EXPECT_EQ(PeakMagnitude(samples), 100);
    EXPECT_EQ(PeakMagnitude(SampleBuffer{}), 0);
    EXPECT_EQ(PeakMagnitude(SampleBuffer{-128, 3}), 128);
}
