#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace CodeRisk
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *  - Values may contain '=' (only the first one splits).
         *
         * Example:
         *   log_level          = INFO
         *   smell.long_line    = 120
         *   classifier.seed    = 42
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened.
             * Malformed lines are skipped; valid lines are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Parse configuration text directly (replaces the current values).
            void loadFromString(std::string_view text);

            /// Manually set a configuration key-value pair.
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            /// Raw string value for a key; std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or invalid.
            std::optional<int> getInt(std::string_view key) const;

            /// Non-negative size value; std::nullopt if missing, invalid or negative.
            std::optional<std::size_t> getSize(std::string_view key) const;

            std::size_t getSizeOr(std::string_view key, std::size_t defaultValue) const;

            /// Double value; std::nullopt if missing or invalid.
            std::optional<double> getDouble(std::string_view key) const;

            double getDoubleOr(std::string_view key, double defaultValue) const;

            /// All keys starting with prefix, in lexicographic order.
            std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

            /// Number of loaded keys.
            std::size_t size() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

            static std::unordered_map<std::string, std::string> parse(std::string_view text);

        private:
            std::unordered_map<std::string, std::string> m_values;

            // Protects m_values; the config can be reloaded while components read it.
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace CodeRisk
