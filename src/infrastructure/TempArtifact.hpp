/**
 * @file TempArtifact.hpp
 * @brief Scoped ownership of a temporary file or directory.
 */

#pragma once

#include <filesystem>
#include <string>

namespace docxpdf::infrastructure {

/**
 * @class TempArtifact
 * @brief Owns a filesystem path for the lifetime of one request and deletes it on scope exit.
 *
 * Deletion is best-effort: failures are logged and never propagated, so cleanup
 * cannot mask the primary outcome of the request.
 */
class TempArtifact {
public:
    explicit TempArtifact(std::filesystem::path path);
    ~TempArtifact();

    TempArtifact(const TempArtifact&) = delete;
    TempArtifact& operator=(const TempArtifact&) = delete;

    TempArtifact(TempArtifact&& other) noexcept;
    TempArtifact& operator=(TempArtifact&& other) noexcept;

    /**
     * @brief Reserves "<dir>/<random prefix>_<filename>". Nothing is created on disk.
     *
     * Stems longer than 100 characters are cut so the name stays within filesystem limits.
     */
    static TempArtifact InDirectory(const std::filesystem::path& dir, const std::string& filename);

    /**
     * @brief Creates a fresh, uniquely-named directory under dir.
     * @throws std::filesystem::filesystem_error if it cannot be created.
     */
    static TempArtifact CreateDirectory(const std::filesystem::path& dir, const std::string& label);

    /** @brief 32 lowercase hex characters from a per-thread random engine. */
    static std::string UniquePrefix();

    const std::filesystem::path& path() const { return m_path; }
    std::string string() const { return m_path.string(); }

private:
    void removeQuietly() noexcept;

    std::filesystem::path m_path;
    bool m_owned = true;
};

} // namespace docxpdf::infrastructure
