#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Render `rjy list` rows as a borderless table with a rule under the titles:
//   Key (host:port)  Process ID  Status     Link
// With `use_color`, the status is green when connected and red otherwise.
std::string render_session_table(const std::vector<SessionRow>& rows, bool use_color);
