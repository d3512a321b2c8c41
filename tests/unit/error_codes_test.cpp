#include <partpipe/error.hpp>
#include <catch2/catch_all.hpp>

#include <string>

TEST_CASE("error codes stable subset", "[errors]") {
  using partpipe::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::out_of_memory) == 5002u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::unsupported) == 9005u);
}

TEST_CASE("error code names", "[errors]") {
  using partpipe::core::error_code;
  using partpipe::core::to_string;
  REQUIRE(std::string(to_string(error_code::not_found)) == "not_found");
  REQUIRE(std::string(to_string(error_code::config_invalid)) == "config_invalid");
  REQUIRE(std::string(to_string(error_code::data_integrity)) == "data_integrity");
  REQUIRE(std::string(to_string(error_code::out_of_memory)) == "out_of_memory");
  REQUIRE(std::string(to_string(static_cast<error_code>(1002))) == "unknown");
}

TEST_CASE("default error is internal", "[errors]") {
  partpipe::core::error e{};
  REQUIRE(e.code == partpipe::core::error_code::internal);
  REQUIRE(e.message.empty());
}
