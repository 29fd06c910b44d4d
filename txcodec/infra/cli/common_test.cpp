// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <catch2/catch_test_macros.hpp>

namespace txcodec::cmd::common {

TEST_CASE("Logging options", "[txcodec][infra][cli]") {
    CLI::App cli{"test"};
    log::Settings settings;
    add_logging_options(cli, settings);

    SECTION("defaults") {
        cli.parse("", /*program_name_included=*/false);
        CHECK(settings.log_verbosity == log::Level::kInfo);
        CHECK(!settings.log_std_out);
        CHECK(settings.log_file.empty());
    }

    SECTION("explicit values") {
        cli.parse("--log.verbosity trace --log.stdout --log.nocolor --log.file out.log", false);
        CHECK(settings.log_verbosity == log::Level::kTrace);
        CHECK(settings.log_std_out);
        CHECK(settings.log_nocolor);
        CHECK(settings.log_file == "out.log");
    }

    SECTION("unknown level") {
        CHECK_THROWS_AS(cli.parse("--log.verbosity chatty", false), CLI::ParseError);
    }
}

}  // namespace txcodec::cmd::common
