#include <gtest/gtest.h>
#include <duet/core/error.hpp>

namespace duet::core::test {

TEST(ErrorTest, BasicErrorCode) {
    std::error_code ec = make_error_code(ErrorCode::InvalidArgument);
    EXPECT_EQ(ec.message(), "Invalid argument");
    EXPECT_STREQ(ec.category().name(), "duet");
}

TEST(ErrorTest, RoomErrorMessages) {
    EXPECT_EQ(make_error_code(ErrorCode::RoomFull).message(), "Room is full");
    EXPECT_EQ(make_error_code(ErrorCode::InvalidRoom).message(), "Invalid room identifier");
    EXPECT_EQ(make_error_code(ErrorCode::ProtocolViolation).message(), "Protocol violation");
}

TEST(ErrorTest, ErrorConditionMapping) {
    EXPECT_TRUE(make_error_code(ErrorCode::FileNotFound) == std::errc::no_such_file_or_directory);
    EXPECT_TRUE(make_error_code(ErrorCode::PermissionDenied) == std::errc::permission_denied);
    EXPECT_TRUE(make_error_code(ErrorCode::DeviceBusy) == std::errc::device_or_resource_busy);
    EXPECT_TRUE(make_error_code(ErrorCode::DeviceNotFound) == std::errc::no_such_device);
}

TEST(ErrorTest, ErrorException) {
    try {
        throw Error(ErrorCode::ConnectionFailed, "Failed to connect to relay");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConnectionFailed);
        EXPECT_STREQ(e.what(), "Failed to connect to relay");
        EXPECT_TRUE(e.error_code() == std::errc::connection_refused);
    }
}

TEST(ErrorTest, ThrowErrorHelper) {
    try {
        throw_error(ErrorCode::TransportFailed, "ICE failed");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::TransportFailed);
        EXPECT_STREQ(e.what(), "ICE failed");
        EXPECT_GT(e.location().line(), 0u);
    }
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> result = 42;
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
    EXPECT_THROW(result.error(), Error);
}

TEST(ErrorTest, ResultError) {
    Result<int> result(ErrorCode::InvalidData, "Invalid integer");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidData);
    EXPECT_THROW(result.value(), Error);
}

TEST(ErrorTest, ResultFromError) {
    Error error(ErrorCode::RoomFull, "room r1 is full");
    Result<std::string> result(error);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::RoomFull);
    EXPECT_STREQ(result.error().what(), "room r1 is full");
}

TEST(ErrorTest, ResultMoveValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    auto value = std::move(result).value();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 7);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> result;
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_NO_THROW(result.value());

    Result<void> failed(ErrorCode::NotInRoom, "not a member");
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code(), ErrorCode::NotInRoom);
    EXPECT_THROW(failed.value(), Error);
}

} // namespace duet::core::test
