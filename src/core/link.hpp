#pragma once

#include <string>
#include <core/types.hpp>

// Parse a Jupyter link such as "http://localhost:8888/?token=abc" into its
// port and auth token. The port must be explicit and not the scheme's
// default, and a `token` query parameter must be present. The token is
// percent-decoded.
Result<LinkParts> parse_link(const std::string& link);
