// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Logging setup, formatting of the output to stdout, and checks on
// input/output files.

#pragma once

#include "setting.h"

#include <spdlog/pattern_formatter.h>
#include <string_view>

namespace lstmatch {

// spdlog flag that prints a label such as [warning] for warnings and
// nothing for info messages
class lstmatch_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set up the default logger with a timestamped pattern and a second
// logger called "plain" which prints just the message text.
auto initLogging() -> void;

// Print the name of a processing section, e.g.
//
// ###################
// # Reading stations #
// ###################
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Print information about the host system, how the executable was
// built, and the number of threads.
auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void;

// Print the percentage of work done (iteration / work_size). Meant for
// OpenMP parallel for loops with dynamic scheduling. Only the master
// thread prints.
auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void;

// Check that the file of a setting can be opened. If required is
// false an empty setting is accepted.
auto checkPresenceOfFile(const Setting<std::string>& setting,
                         const bool required) -> void;

auto checkFileWritable(const std::string& filename) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

// Remove leading and trailing whitespace
auto trim(const std::string& str) -> std::string;

auto lower(const std::string& str) -> std::string;

// Lower case with spaces replaced by underscores. Station table
// column names are normalized this way on input.
auto normalizeName(const std::string& str) -> std::string;

} // namespace lstmatch
