#pragma once

#include <filesystem>
#include <string>

namespace docxpdf::infrastructure {

/**
 * @brief Whole-file binary I/O for staged uploads and rendered PDFs.
 */
class BinaryFile {
public:
    /**
     * @brief Reads the entire file into out.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool Read(const std::filesystem::path& path, std::string& out, std::string& error);

    /**
     * @brief Creates or truncates path and writes bytes to it.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool Write(const std::filesystem::path& path, const std::string& bytes, std::string& error);
};

} // namespace docxpdf::infrastructure
