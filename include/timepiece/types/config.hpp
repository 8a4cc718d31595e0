#ifndef TIMEPIECE_CONFIG_HPP
#define TIMEPIECE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Runtime configuration for timepiece output and misuse policy.
 */

#include <cstdio>
#include <string>

#include "../namespaces/ini_parser.hpp"

namespace timepiece {

/**
 * @brief Global configuration for report output and bracket policy.
 *
 * All settings can be modified at runtime. Config changes are not
 * thread-safe; set them up before timers are in use.
 */
struct Config {
    FILE* out = stdout;            ///< Destination of print() and summaries (default: stdout)
    bool strict_reentry = false;   ///< enter() on an already active timer throws std::logic_error
    bool warn_on_misuse = true;    ///< Warn on stderr about tolerated misuse (exit without enter)

    struct {
        bool print_frequency = true;  ///< Append a Freq (Hz) column to the summary table
        int  name_width = 40;         ///< Width of the timer name column
    } summary;

    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    ~Config() {
        close_output();
    }

    /**
     * @brief Close the output file opened by load_from_file(), if any,
     * and fall back to stdout.
     */
    void close_output() {
        if (owns_out_ && out) {
            std::fclose(out);
        }
        owns_out_ = false;
        out = stdout;
    }

    /**
     * @brief Load configuration from an INI file.
     *
     * Supported sections: [output], [behavior], [summary]. Unknown keys and
     * malformed lines are reported on stderr and skipped.
     *
     * @param path Path to INI file (relative or absolute)
     * @return true on success, false if the file could not be opened
     *
     * Example INI format:
     * @code
     * [output]
     * file = "timing.log"
     *
     * [behavior]
     * strict_reentry = yes
     *
     * [summary]
     * print_frequency = false
     * name_width = 32
     * @endcode
     */
    inline bool load_from_file(const char* path);

private:
    bool owns_out_ = false;

    inline void apply(const std::string& section, const std::string& key,
                      const std::string& value, const char* path, int line_num);
};

inline Config config;

/**
 * @brief Access the global configuration.
 */
inline Config& get_config() {
    return config;
}

inline bool Config::load_from_file(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (!f) {
        std::fprintf(stderr, "timepiece: Warning: Could not open config file: %s\n", path);
        return false;
    }

    std::string current_section;
    char line_buf[512];
    int line_num = 0;

    while (std::fgets(line_buf, sizeof(line_buf), f)) {
        ++line_num;
        std::string line = ini_parser::trim(line_buf);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = ini_parser::to_lower(ini_parser::trim(line.substr(1, line.length() - 2)));
            if (current_section != "output" && current_section != "behavior" && current_section != "summary") {
                std::fprintf(stderr, "timepiece: Warning: Unknown section [%s] in %s:%d\n",
                             current_section.c_str(), path, line_num);
            }
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::fprintf(stderr, "timepiece: Warning: Invalid line in %s:%d (no '=')\n", path, line_num);
            continue;
        }

        std::string key = ini_parser::to_lower(ini_parser::trim(line.substr(0, eq_pos)));
        std::string value = ini_parser::strip_inline_comment(line.substr(eq_pos + 1));
        apply(current_section, key, value, path, line_num);
    }

    std::fclose(f);
    return true;
}

inline void Config::apply(const std::string& section, const std::string& key,
                          const std::string& value, const char* path, int line_num) {
    bool ok = true;

    if (section == "output") {
        if (key == "file") {
            std::string file = ini_parser::unquote(value);
            FILE* new_out = std::fopen(file.c_str(), "w");
            if (!new_out) {
                std::fprintf(stderr, "timepiece: Warning: Could not open output file '%s' in %s:%d\n",
                             file.c_str(), path, line_num);
                return;
            }
            close_output();
            out = new_out;
            owns_out_ = true;
            return;
        }
        ok = false;
    }
    else if (section == "behavior") {
        if (key == "strict_reentry") {
            strict_reentry = ini_parser::parse_bool(value, strict_reentry, ok);
        }
        else if (key == "warn_on_misuse") {
            warn_on_misuse = ini_parser::parse_bool(value, warn_on_misuse, ok);
        }
        else {
            ok = false;
        }
    }
    else if (section == "summary") {
        if (key == "print_frequency") {
            summary.print_frequency = ini_parser::parse_bool(value, summary.print_frequency, ok);
        }
        else if (key == "name_width") {
            summary.name_width = ini_parser::parse_int(value, summary.name_width, ok);
        }
        else {
            ok = false;
        }
    }
    else {
        // Warned once at the section header
        return;
    }

    if (!ok) {
        std::fprintf(stderr, "timepiece: Warning: Ignoring '%s = %s' in %s:%d\n",
                     key.c_str(), value.c_str(), path, line_num);
    }
}

/**
 * @brief Load configuration from file into the global config.
 *
 * @code
 * timepiece::load_config("timepiece.ini");
 * @endcode
 */
inline bool load_config(const char* path) {
    return get_config().load_from_file(path);
}

} // namespace timepiece

#endif // TIMEPIECE_CONFIG_HPP
