#include <gtest/gtest.h>
#include "../../src/common/stream.h"

#include <limits>

using namespace Statfan;

class StreamTest : public ::testing::Test {
protected:
    StreamOutput out_;
};

TEST_F(StreamTest, VIntUsesBase128LittleEndian) {
    out_.WriteVInt(300);
    ASSERT_EQ(out_.size(), 2u);
    EXPECT_EQ(static_cast<uint8_t>(out_.bytes()[0]), 0xAC);
    EXPECT_EQ(static_cast<uint8_t>(out_.bytes()[1]), 0x02);

    StreamInput in(out_.bytes());
    EXPECT_EQ(in.ReadVInt(), 300u);
    EXPECT_NO_THROW(in.ExpectEnd());
}

TEST_F(StreamTest, ZLongKeepsNegativeValuesSmall) {
    out_.WriteZLong(-1);
    EXPECT_EQ(out_.size(), 1u);
    out_.WriteZLong(std::numeric_limits<int64_t>::min());
    out_.WriteZLong(std::numeric_limits<int64_t>::max());

    StreamInput in(out_.bytes());
    EXPECT_EQ(in.ReadZLong(), -1);
    EXPECT_EQ(in.ReadZLong(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(in.ReadZLong(), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(in.remaining(), 0u);
}

TEST_F(StreamTest, StringsAndOptionals) {
    out_.WriteString("logs");
    out_.WriteOptionalString(std::nullopt);
    out_.WriteOptionalString(std::string("node-1"));
    out_.WriteString("");

    StreamInput in(out_.bytes());
    EXPECT_EQ(in.ReadString(), "logs");
    EXPECT_FALSE(in.ReadOptionalString().has_value());
    EXPECT_EQ(in.ReadOptionalString().value(), "node-1");
    EXPECT_EQ(in.ReadString(), "");
}

TEST_F(StreamTest, NullAndEmptyArraysAreDistinct) {
    std::vector<std::string> empty;
    out_.WriteStringArrayNullable(nullptr);
    out_.WriteStringArrayNullable(&empty);

    StreamInput in(out_.bytes());
    EXPECT_FALSE(in.ReadStringArrayNullable().has_value());
    auto decoded = in.ReadStringArrayNullable();
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST_F(StreamTest, TruncatedStringThrows) {
    out_.WriteString("truncated payload");
    std::string bytes = out_.bytes().substr(0, 5);

    StreamInput in(bytes);
    EXPECT_THROW(in.ReadString(), CodecError);
}

TEST_F(StreamTest, EmptyInputThrows) {
    StreamInput in(std::string_view{});
    EXPECT_THROW(in.ReadByte(), CodecError);
    EXPECT_THROW(in.ReadVInt(), CodecError);
}

TEST_F(StreamTest, MalformedBoolThrows) {
    out_.WriteByte(2);
    StreamInput in(out_.bytes());
    EXPECT_THROW(in.ReadBool(), CodecError);
}

TEST_F(StreamTest, OverlongVIntThrows) {
    for (int i = 0; i < 5; ++i) {
        out_.WriteByte(0xFF);
    }
    StreamInput in(out_.bytes());
    EXPECT_THROW(in.ReadVInt(), CodecError);
}

TEST_F(StreamTest, LengthAboveLimitThrowsBeforeAllocating) {
    out_.WriteVInt(1u << 30);
    StreamLimits limits;
    limits.max_bytes_length = 1024;

    StreamInput in(out_.bytes(), limits);
    EXPECT_THROW(in.ReadBytes(), CodecError);
}

TEST_F(StreamTest, CollectionSizeAboveLimitThrows) {
    out_.WriteVInt(11);
    StreamLimits limits;
    limits.max_collection_size = 10;

    StreamInput in(out_.bytes(), limits);
    EXPECT_THROW(in.ReadCollectionSize(), CodecError);
}

TEST_F(StreamTest, ExpectEndRejectsTrailingBytes) {
    out_.WriteVInt(7);
    out_.WriteByte(0);

    StreamInput in(out_.bytes());
    EXPECT_EQ(in.ReadVInt(), 7u);
    EXPECT_THROW(in.ExpectEnd(), CodecError);
}
