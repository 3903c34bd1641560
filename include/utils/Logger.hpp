#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace CodeRisk
{
    namespace Utils
    {
        /**
         * Log severity levels used across the analyzer.
         *
         *  - TRACE: per-line / per-token diagnostics
         *  - DEBUG: per-analysis details (counts, timings)
         *  - INFO: component lifecycle (catalog loaded, classifier trained)
         *  - WARN: degraded paths (untrained classifier, unsupported language)
         *  - ERROR: configuration or I/O failures
         *  - CRITICAL: unrecoverable failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "debug", "INFO", "warn", ... (case-insensitive).
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. Every line carries a
         * timestamp and level:
         *
         *   [2026-10-19 14:23:45] [INFO] RuleCatalog loaded 46 rules
         *
         * Output goes to a console stream (stderr by default) and,
         * optionally, to an append-mode log file.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger attempts to open the file
             * in append mode. If opening fails, logging falls back to the
             * console only.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /// Open (or replace) the file sink. Returns false if the file cannot be opened.
            bool openFile(std::string_view filePath);

            /// Log a message with a given severity.
            void log(LogLevel level, std::string_view message);

            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            static const char *toString(LogLevel level) noexcept;

            /// Write a fully formatted line to the active sinks.
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Process-wide logger (stderr, INFO level until configured).
         *
         *   Logger &log = getLogger();
         *   log.info("Started analysis");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace CodeRisk
