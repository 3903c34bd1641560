#pragma once

#include <istream>
#include <optional>
#include <string>

namespace CodeRisk
{
    namespace Input
    {
        /**
         * SourceReader
         *
         * Loads a whole source file into memory, bytes unchanged.
         * "-" reads standard input.
         *
         * Design notes:
         *  - Failures are reported as std::nullopt; the caller logs them.
         *  - The file handle lives only for the duration of the read (RAII).
         */
        class SourceReader
        {
        public:
            static std::optional<std::string> readFile(const std::string &filePath);

            static std::optional<std::string> readStream(std::istream &input);

            /// Language tag from the file extension ("src/app.py" -> "python"); "" if unknown.
            static std::string inferLanguage(const std::string &filePath);
        };

    } // namespace Input
} // namespace CodeRisk
