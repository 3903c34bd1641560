#include "utils/ConfigLoader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Utils
    {
        std::unordered_map<std::string, std::string> ConfigLoader::parse(std::string_view text)
        {
            std::unordered_map<std::string, std::string> values;

            for (std::string_view line : split(text, '\n', false))
            {
                // Windows-style line endings.
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }

                const std::string_view stripped = trim(line);
                if (stripped.empty() || stripped.front() == '#' || stripped.front() == ';')
                {
                    continue;
                }

                const auto pos = stripped.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                const std::string_view key   = trim(stripped.substr(0, pos));
                const std::string_view value = trim(stripped.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                // Last occurrence wins if a key is repeated.
                values[std::string(key)] = std::string(value);
            }

            return values;
        }

        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            std::ostringstream buffer;
            buffer << in.rdbuf();
            auto newValues = parse(buffer.str());

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
            return true;
        }

        void ConfigLoader::loadFromString(std::string_view text)
        {
            auto newValues = parse(text);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::string(defaultValue);
            }
            return *v;
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                int value       = std::stoi(*v, &idx);
                if (idx != v->size())
                {
                    // Trailing characters make this invalid.
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        std::optional<std::size_t> ConfigLoader::getSize(std::string_view key) const
        {
            auto v = getInt(key);
            if (!v || *v < 0)
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(*v);
        }

        std::size_t ConfigLoader::getSizeOr(std::string_view key, std::size_t defaultValue) const
        {
            auto v = getSize(key);
            return v ? *v : defaultValue;
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                double value    = std::stod(*v, &idx);
                if (idx != v->size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        double ConfigLoader::getDoubleOr(std::string_view key,
                                         double defaultValue) const
        {
            auto v = getDouble(key);
            return v ? *v : defaultValue;
        }

        std::vector<std::string> ConfigLoader::keysWithPrefix(std::string_view prefix) const
        {
            std::vector<std::string> keys;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (const auto &kv : m_values)
                {
                    if (startsWith(kv.first, prefix))
                    {
                        keys.push_back(kv.first);
                    }
                }
            }
            std::sort(keys.begin(), keys.end());
            return keys;
        }

        std::size_t ConfigLoader::size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.size();
        }

    } // namespace Utils
} // namespace CodeRisk
