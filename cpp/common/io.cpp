// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include "time.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <omp.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <unistd.h>

namespace lstmatch {

auto lstmatch_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                     const std::tm& /* tm_time */,
                                     spdlog::memory_buf_t& dest) -> void
{
    std::string text {};
    switch (log_msg.level) {
    case spdlog::level::info:
        break;
    case spdlog::level::warn:
        text = " [warning]";
        break;
    case spdlog::level::err:
        text = " [error]";
        break;
    case spdlog::level::debug:
        text = " [debug]";
        break;
    case spdlog::level::off:
    case spdlog::level::trace:
    case spdlog::level::critical:
    case spdlog::level::n_levels:
    default:
        text = " [unknown]";
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    dest.append(text.data(), text.data() + text.size());
}

auto lstmatch_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<lstmatch_formatter_flag>();
}

auto initLogging() -> void
{
    if (!spdlog::get("plain")) {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<lstmatch_formatter_flag>('*').set_pattern(
          "[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        spdlog::stdout_color_mt("plain");
        spdlog::get("plain")->set_pattern("%v");
    }
    spdlog::set_level(spdlog::level::info);
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    if (incl_empty_line) {
        spdlog::get("plain")->info("");
    }
    std::string hash_line(heading.size() + 4, '#');
    spdlog::get("plain")->info(hash_line);
    spdlog::get("plain")->info("# " + heading + " #");
    spdlog::get("plain")->info(hash_line);
}

auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void
{
    spdlog::get("plain")->info("Version                 : {}", project_version);
    if (git_commit != "GITDIR-N") {
        spdlog::get("plain")->info("Commit hash             : {}", git_commit);
    }
    spdlog::get("plain")->info("Date and timezone       : {}", getDate());
    spdlog::get("plain")->info("Host system             : {}",
                               cmake_host_system);
    spdlog::get("plain")->info("Executable location     : {}", executable);
    spdlog::get("plain")->info("C++ compiler            : {}", compiler);
    spdlog::get("plain")->info("C++ compiler flags      : {}", compiler_flags);
    spdlog::get("plain")->info("Number of threads       : {}",
                               omp_get_max_threads());
    for (bool first_line { true };
         const auto& lib : splitString(libraries, ' ')) {
        if (first_line) {
            spdlog::get("plain")->info("Linking against         : {}", lib);
            first_line = false;
        } else {
            spdlog::get("plain")->info("                          {}", lib);
        }
    }
}

auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void
{
    if (omp_get_thread_num() != 0) {
        return;
    }
    spdlog::info(
      "{} {:6.2f}%",
      text,
      std::min(100.0, 1e2 * iteration / static_cast<double>(work_size)));
}

auto checkPresenceOfFile(const Setting<std::string>& setting,
                         const bool required) -> void
{
    if (!required && setting.empty()) {
        return;
    }
    if (setting.empty()) {
        throw std::runtime_error { "missing " + setting.keyToStr() };
    }
    try {
        std::ifstream file { setting };
        file.exceptions(std::ifstream::failbit);
    } catch (const std::ifstream::failure& e) {
        const std::string msg { "\nCould not open file: " + setting };
        throw std::ifstream::failure { e.what() + msg, e.code() };
    }
}

auto checkFileWritable(const std::string& filename) -> void
{
    if (!filename.empty()) {
        std::string dir { std::filesystem::path { filename }.parent_path() };
        if (!dir.empty() && static_cast<bool>(access(dir.c_str(), W_OK))) {
            throw std::runtime_error { filename + " is not writable" };
        }
    }
}

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>
{
    std::stringstream ss { list };
    std::string name {};
    std::vector<std::string> strings {};
    while (getline(ss, name, delimiter)) {
        strings.push_back(name);
    }
    return strings;
}

auto trim(const std::string& str) -> std::string
{
    constexpr const char* whitespace { " \t\r\n" };
    const auto first { str.find_first_not_of(whitespace) };
    if (first == std::string::npos) {
        return {};
    }
    const auto last { str.find_last_not_of(whitespace) };
    return str.substr(first, last - first + 1);
}

auto lower(const std::string& str) -> std::string
{
    std::string str_l { str };
    for (size_t i {}; i < str_l.length(); ++i) {
        str_l[i] = static_cast<char>(std::tolower(str_l[i]));
    }
    return str_l;
}

auto normalizeName(const std::string& str) -> std::string
{
    std::string name { lower(trim(str)) };
    std::ranges::replace(name, ' ', '_');
    return name;
}

} // namespace lstmatch
