#include "search_job.hpp"

#include <algorithm>  // for std::find_if
#include <array>
#include <cstddef>
#include <cctype>
#include <sstream>
#include <string_view>
#include <utility>

SearchJob &SearchJob::set_position(Position pos) {
    position = std::move(pos);
    return *this;
}

SearchJob &SearchJob::set_engine_option(std::string key, std::string value) {
    engine_options.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

SearchJob &SearchJob::set_go_option(std::string key, std::string value) {
    go_options.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

SearchJob &SearchJob::apply_time_control(const TimeControl &tc) {
    set_go_option("wtime", std::to_string(tc.wtime_ms));
    set_go_option("winc", std::to_string(tc.winc_ms));
    set_go_option("btime", std::to_string(tc.btime_ms));
    set_go_option("binc", std::to_string(tc.binc_ms));
    return *this;
}

SearchJob &SearchJob::set_engine_options(const std::string &options_str) {
    if (options_str.empty()) {
        return *this;
    }

    // Helper lambda to trim whitespace from both ends of a string
    auto trim = [](std::string &s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                        [](unsigned char ch) { return !std::isspace(ch); }));
        s.erase(
            std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
    };

    size_t current_pos = 0;
    const std::string name_keyword = "name ";
    const std::string value_keyword = " value ";

    // Each option starts at "name " and runs until the next "name ".
    while ((current_pos = options_str.find(name_keyword, current_pos)) != std::string::npos) {
        size_t next_name_pos = options_str.find(name_keyword, current_pos + name_keyword.length());
        std::string block = options_str.substr(current_pos, next_name_pos - current_pos);
        current_pos = next_name_pos;

        size_t value_pos = block.find(value_keyword);
        if (value_pos != std::string::npos) {
            std::string opt_name =
                block.substr(name_keyword.length(), value_pos - name_keyword.length());
            std::string opt_value = block.substr(value_pos + value_keyword.length());

            trim(opt_name);
            trim(opt_value);

            if (!opt_name.empty()) {
                set_engine_option(std::move(opt_name), std::move(opt_value));
            }
        }

        if (next_name_pos == std::string::npos) {
            break;
        }
    }
    return *this;
}

namespace {

constexpr std::array<std::string_view, 2> GO_FLAGS = {"infinite", "ponder"};

constexpr std::array<std::string_view, 12> GO_KEYWORDS = {
    "searchmoves", "ponder", "wtime", "btime",    "winc",     "binc",
    "movestogo",   "depth",  "nodes", "mate",     "movetime", "infinite"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N> &words, const std::string &word) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

}  // namespace

SearchJob &SearchJob::set_go_options(const std::string &go_args) {
    std::istringstream ss(go_args);
    std::string key;
    bool have_key = static_cast<bool>(ss >> key);
    while (have_key) {
        if (contains(GO_FLAGS, key)) {
            set_go_option(key, "");
            have_key = static_cast<bool>(ss >> key);
            continue;
        }

        std::string value, token;
        have_key = false;
        if (key == "searchmoves") {
            while (ss >> token) {
                if (contains(GO_KEYWORDS, token)) {
                    have_key = true;
                    break;
                }
                if (!value.empty()) value += ' ';
                value += token;
            }
        } else if (ss >> value) {
            have_key = static_cast<bool>(ss >> token);
        }

        if (!value.empty()) {
            set_go_option(key, value);
        }
        key = token;
    }
    return *this;
}

const OptionMap &SearchJob::get_engine_options() const {
    return engine_options;
}

const Position &SearchJob::get_position() const {
    return position;
}

const OptionMap &SearchJob::get_go_options() const {
    return go_options;
}
