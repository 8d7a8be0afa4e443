#include <gtest/gtest.h>

#include "rag_api/server.hpp"

namespace rag_api {

TEST(ServerTest, ParsesKnownLogLevels) {
  EXPECT_EQ(Server::parse_log_level("debug"), crow::LogLevel::Debug);
  EXPECT_EQ(Server::parse_log_level("warning"), crow::LogLevel::Warning);
  EXPECT_EQ(Server::parse_log_level("critical"), crow::LogLevel::Critical);
}

TEST(ServerTest, UnknownLogLevelIsRejected) {
  EXPECT_THROW(Server::parse_log_level("WARNING"), ServerError);
  EXPECT_THROW(Server("127.0.0.1", 3030, "loud"), ServerError);
}

TEST(ServerTest, StopBeforeStartIsNoOp) {
  Server server("127.0.0.1", 3030);

  EXPECT_FALSE(server.is_running());
  EXPECT_NO_THROW(server.stop());
  EXPECT_EQ(server.address(), "127.0.0.1:3030");
}

}  // namespace rag_api
