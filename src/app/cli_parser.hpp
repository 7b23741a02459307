#pragma once
#include <string>
#include "protocol/collection_request.hpp"
#include "core/errors/collector_errors.hpp"

namespace diagcollect::app::cli {
    struct ParsedCommand {
        bool show_help = false;
        diagcollect::protocol::CollectionRequest request;
    };

    diagcollect::core::errors::Result<ParsedCommand> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
