#include "vault/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <string>

// Test fixture for ErrorHandling tests
class ErrorHandlingTest : public ::testing::Test {};

TEST_F(ErrorHandlingTest, TestVaultExceptionConstruction) {
  vault::VaultException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
}

TEST_F(ErrorHandlingTest, TestThrowError) {
  try {
    vault::throwError("Test error message");
    FAIL() << "Expected VaultException";
  } catch (const vault::VaultException &e) {
    ASSERT_STREQ("Test error message", e.what());
  }
}

// ErrorCode tests

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(vault::errorCodeToString(vault::ErrorCode::Ok), "Ok");
  EXPECT_EQ(vault::errorCodeToString(vault::ErrorCode::InvalidArgument), "InvalidArgument");
  EXPECT_EQ(vault::errorCodeToString(vault::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(vault::errorCodeToString(vault::ErrorCode::DeviceUnavailable), "DeviceUnavailable");
  EXPECT_EQ(vault::errorCodeToString(vault::ErrorCode::Internal), "Internal");
}

// Result<T> tests

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = vault::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), vault::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = vault::Result<int>::error(vault::ErrorCode::NotFound, "missing");
  EXPECT_FALSE(r.isOk());
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), vault::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsOnError) {
  auto r = vault::Result<int>::error(vault::ErrorCode::Internal, "broken");
  EXPECT_THROW(r.value(), vault::VaultException);
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = vault::Result<float>::ok(1.5f);
  auto err = vault::Result<float>::error(vault::ErrorCode::InvalidArgument);
  EXPECT_FLOAT_EQ(ok.valueOr(0.0f), 1.5f);
  EXPECT_FLOAT_EQ(err.valueOr(0.0f), 0.0f);
}

TEST_F(ErrorHandlingTest, ResultVoid) {
  auto ok = vault::Result<void>::ok();
  EXPECT_TRUE(ok.isOk());

  auto err = vault::Result<void>::error(vault::ErrorCode::InvalidState, "bad state");
  EXPECT_TRUE(err.isError());
  EXPECT_EQ(err.code(), vault::ErrorCode::InvalidState);
  EXPECT_EQ(err.message(), "bad state");
}

TEST_F(ErrorHandlingTest, ResultIsMovable) {
  auto r = vault::Result<std::string>::ok("keycard");
  auto moved = std::move(r);
  EXPECT_EQ(moved.value(), "keycard");
}
