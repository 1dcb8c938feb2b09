// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_COMMON_LOGGING_H_
#define DAGPOOL_SRC_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace dagpool::logging {
    /// Stream that discards everything written to it. Default logfile
    /// destination when a log only prints to stdout.
    class null_stream : public std::ostream {
      public:
        /// Constructor. Sets the instance's stream buffer to nullptr.
        null_stream();
    };

    /// Severity of a log statement. A \ref log prints statements at its
    /// configured level and above.
    enum class log_level : uint8_t {
        /// Per-message tracing, including silently rejected messages.
        trace,
        /// Diagnostic information such as stale messages being dropped.
        debug,
        /// General information about the state of the node.
        info,
        /// Misbehaving peers and undeliverable messages.
        warn,
        /// Serious, critical errors.
        error,
        /// Errors after which the node cannot continue.
        fatal
    };

    /// Thread-safe logger writing to stdout and/or a logfile.
    class log {
      public:
        /// \brief Creates a new log instance.
        /// \param level the log level (and above) to print.
        /// \param use_stdout indicates if the logger should print to stdout.
        /// \param logfile stream receiving a copy of every statement.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile
                     = std::make_unique<null_stream>());

        /// Enables or disables printing the log output to stdout.
        /// \param stdout_enabled true if the log should print to stdout.
        void set_stdout_enabled(bool stdout_enabled);

        /// Changes the logfile output to another destination.
        /// \param logfile the stream to which to write log output.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

        /// Changes the log level threshold.
        /// \param level minimum level of statements to print.
        void set_loglevel(log_level level);

        /// Flushes stdout.
        static void flush();

        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list at the fatal level, flushes and
        /// terminates the process with EXIT_FAILURE.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                std::forward<Targs>(args)...);
            flush();
            std::exit(EXIT_FAILURE);
        }

        /// Returns the current log level of the logger.
        [[nodiscard]] auto get_log_level() const -> log_level;

        /// Indicates whether statements at the given level would be printed.
        /// Lets callers skip building expensive arguments.
        /// \param level level to check.
        /// \return true if the level is at or above the threshold.
        [[nodiscard]] auto enabled(log_level level) const -> bool;

      private:
        bool m_stdout{true};
        log_level m_loglevel{};
        std::mutex m_stream_mut{};
        std::unique_ptr<std::ostream> m_logfile;

        static auto to_string(log_level level) -> std::string;
        static void write_log_prefix(std::stringstream& ss, log_level level);

        template<typename... Targs>
        void write_log_statement(log_level level, Targs&&... args) {
            if(!enabled(level)) {
                return;
            }
            std::stringstream ss;
            write_log_prefix(ss, level);
            ((ss << " " << args), ...);
            ss << "\n";
            auto formatted_statement = ss.str();
            const std::lock_guard<std::mutex> lock(m_stream_mut);
            if(m_stdout) {
                std::cout << formatted_statement;
            }
            *m_logfile << formatted_statement;
        }
    };

    /// Parses an upper-case level name (TRACE, DEBUG, INFO, WARN, ERROR or
    /// FATAL).
    /// \param level level name.
    /// \return the log level, or std::nullopt if the name is unknown.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;
}

#endif // DAGPOOL_SRC_COMMON_LOGGING_H_
