#pragma once

#include <string>
#include <unordered_map>

#include "time_manager.hpp"
#include "types.hpp"

// --- Search Request ---

// Option name -> value. Keys are unique, the last write wins, order is not kept.
using OptionMap = std::unordered_map<std::string, std::string>;

// Everything one search sends to the engine: setoption pairs, the position
// and the "go" limits. Setters return *this so calls chain:
//   SearchJob job;
//   job.set_position(Startpos{}).set_go_option("depth", "12");
class SearchJob {
   private:
    OptionMap engine_options;
    Position position = Startpos{};
    OptionMap go_options;

   public:
    SearchJob &set_position(Position pos);
    SearchJob &set_engine_option(std::string key, std::string value);
    SearchJob &set_go_option(std::string key, std::string value);

    // Overwrites wtime/winc/btime/binc with the values of tc
    SearchJob &apply_time_control(const TimeControl &tc);

    // Parses "name Hash value 64 name Threads value 2" into engine options.
    // Names and values may contain spaces; blocks without " value " are skipped.
    SearchJob &set_engine_options(const std::string &options_str);

    // Parses the arguments of a "go" line ("depth 10 movetime 500 infinite").
    // Flags without a value (infinite, ponder) get an empty value,
    // searchmoves keeps the following move tokens, a trailing key without
    // a value is skipped.
    SearchJob &set_go_options(const std::string &go_args);

    const OptionMap &get_engine_options() const;
    const Position &get_position() const;
    const OptionMap &get_go_options() const;
};
