#include "input/SourceReader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "core/Language.hpp"

namespace CodeRisk
{
    namespace Input
    {
        std::optional<std::string> SourceReader::readFile(const std::string &filePath)
        {
            if (filePath == "-")
                return readStream(std::cin);

            std::ifstream file(filePath, std::ios::in | std::ios::binary);
            if (!file.is_open())
                return std::nullopt;
            return readStream(file);
        }

        std::optional<std::string> SourceReader::readStream(std::istream &input)
        {
            std::ostringstream buffer;
            buffer << input.rdbuf();
            if (input.bad())
                return std::nullopt;
            return buffer.str();
        }

        std::string SourceReader::inferLanguage(const std::string &filePath)
        {
            const std::string ext = std::filesystem::path(filePath).extension().string();
            return core::languageTagForExtension(ext);
        }

    } // namespace Input
} // namespace CodeRisk
