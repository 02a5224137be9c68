#include "infrastructure/BinaryFile.hpp"

#include <fstream>
#include <iterator>

namespace docxpdf::infrastructure {

bool BinaryFile::Read(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "Could not open " + path.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Read failed: " + path.string();
        return false;
    }
    return true;
}

bool BinaryFile::Write(const std::filesystem::path& path, const std::string& bytes, std::string& error) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        error = "Could not create " + path.string();
        return false;
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (ofs.fail()) {
        error = "Write failed: " + path.string();
        return false;
    }
    return true;
}

} // namespace docxpdf::infrastructure
