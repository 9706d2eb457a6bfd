#include <chtest.hpp>

#include <rpclb/core/log.h>
#include <rpclb/core/status.h>

#include <string>

TEST_CASE("Log levels parse by name") {
    REQUIRE(rpclb::log::ParseLevel("debug") == chlog::level::debug);
    REQUIRE(rpclb::log::ParseLevel("warning") == chlog::level::warn);
    REQUIRE(rpclb::log::ParseLevel("off") == chlog::level::off);
    REQUIRE(rpclb::log::ParseLevel("verbose") == chlog::level::info);

    REQUIRE(rpclb::log::IsKnownLevel("critical"));
    REQUIRE(!rpclb::log::IsKnownLevel("verbose"));
    REQUIRE(!rpclb::log::IsKnownLevel(""));
}

TEST_CASE("Init can be repeated") {
    rpclb::log::LogOptions opt;
    opt.level = "error";
    rpclb::log::Init(opt);
    rpclb::log::Init("warn");
    rpclb::log::info("suppressed at warn level");
    rpclb::log::warn("logger is usable after repeated Init");
}

TEST_CASE("Status renders code and message") {
    rpclb::Status st(rpclb::StatusCode::failed_precondition, "no target is available");
    REQUIRE(!st.ok());
    REQUIRE(st.ToString() == "failed_precondition: no target is available");
    REQUIRE(rpclb::Status::Ok().ToString() == "ok");
    REQUIRE(std::string(rpclb::StatusCodeName(rpclb::StatusCode::unavailable)) == "unavailable");
}
