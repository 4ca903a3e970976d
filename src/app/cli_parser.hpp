#pragma once
#include <string>
#include "protocol/cli_request.hpp"
#include "core/errors/loop_errors.hpp"

namespace storyloop::app::cli {
    storyloop::core::errors::Result<storyloop::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
