#include <string>

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>
#include <gtest/gtest.h>
#include <utcnow.hpp>

using namespace utcnow;

// Checks the hand-written wire codec against the protobuf runtime's
// well-known Timestamp type
class ProtobufInteropTest : public ::testing::Test {
protected:
    Synchronizer sync;
    Converter convert{sync};

    static WireBytes serialize(const google::protobuf::Timestamp& ts) {
        std::string raw;
        EXPECT_TRUE(ts.SerializeToString(&raw));
        return WireBytes(raw.begin(), raw.end());
    }

    static google::protobuf::Timestamp parse(const WireBytes& bytes) {
        google::protobuf::Timestamp ts;
        EXPECT_TRUE(ts.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())));
        return ts;
    }
};

TEST_F(ProtobufInteropTest, EncodingMatchesRuntime) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(1670329924);
    ts.set_nanos(170660000);

    auto ours = convert.as_message_bytes("2022-12-06T12:32:04.170660Z");
    ASSERT_TRUE(ours.has_value());
    EXPECT_EQ(*ours, serialize(ts));
}

TEST_F(ProtobufInteropTest, RuntimeDecodesOurBytes) {
    const char* values[] = {"1970-01-01T00:00:00Z", "1969-12-31T23:43:19.446001Z",
                            "0001-01-01T00:00:00Z", "9999-12-31T23:59:59.999999Z"};
    for (const char* value : values) {
        auto bytes = convert.as_message_bytes(value);
        ASSERT_TRUE(bytes.has_value()) << value;
        auto ts = parse(*bytes);
        auto msg = convert.as_message(value);
        ASSERT_TRUE(msg.has_value());
        EXPECT_EQ(ts.seconds(), msg->seconds) << value;
        EXPECT_EQ(ts.nanos(), msg->nanos) << value;
    }
}

TEST_F(ProtobufInteropTest, WeDecodeRuntimeBytes) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(-1001);
    ts.set_nanos(446001000);

    auto result = convert.rfc3339_timestamp(serialize(ts));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->str(), "1969-12-31T23:43:19.446001Z");
}

TEST_F(ProtobufInteropTest, AgreesWithTimeUtilFormatting) {
    const char* values[] = {"2022-12-06T12:32:04.170660Z", "1996-12-20T00:39:57.000000Z",
                            "2000-02-29T23:59:59.999999Z"};
    for (const char* value : values) {
        google::protobuf::Timestamp ts;
        ASSERT_TRUE(google::protobuf::util::TimeUtil::FromString(value, &ts)) << value;
        auto ours = convert.rfc3339_timestamp(serialize(ts));
        ASSERT_TRUE(ours.has_value()) << value;
        EXPECT_EQ(ours->str(), value);
    }
}
