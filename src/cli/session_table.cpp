#include "session_table.hpp"
#include "theme.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>

std::string render_session_table(const std::vector<SessionRow>& rows, bool use_color) {
    const std::array<std::string, 4> titles = {"Key (host:port)", "Process ID", "Status", "Link"};

    std::vector<std::array<std::string, 4>> cells;
    cells.reserve(rows.size());
    for (const auto& r : rows) {
        cells.push_back({r.key,
                         r.pid ? std::to_string(*r.pid) : std::string(),
                         status_label(r.status),
                         r.link});
    }

    std::array<size_t, 4> width{};
    for (size_t c = 0; c < titles.size(); c++) {
        width[c] = titles[c].size();
        for (const auto& row : cells) width[c] = std::max(width[c], row[c].size());
    }

    auto line = [&](const std::array<std::string, 4>& row, bool is_title, SessionStatus status) {
        std::string out = " ";
        for (size_t c = 0; c < row.size(); c++) {
            // Last column is not padded
            std::string cell = c + 1 == row.size()
                ? row[c] : fmt::format("{:<{}}", row[c], width[c]);
            if (use_color && is_title) {
                cell = theme::bold(cell);
            } else if (use_color && c == 2) {
                cell = theme::bold(status == SessionStatus::Connected
                                   ? theme::green(cell) : theme::red(cell));
            }
            out += cell;
            if (c + 1 < row.size()) out += " | ";
        }
        return out + "\n";
    };

    std::string out = line(titles, true, SessionStatus::Disconnected);

    std::string rule = " ";
    for (size_t c = 0; c < width.size(); c++) {
        rule += std::string(width[c], '-');
        if (c + 1 < width.size()) rule += "-+-";
    }
    out += (use_color ? theme::dim(rule) : rule) + "\n";

    for (size_t i = 0; i < cells.size(); i++) {
        out += line(cells[i], false, rows[i].status);
    }
    return out;
}
