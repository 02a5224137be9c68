#include "infrastructure/TempArtifact.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace docxpdf::infrastructure {

namespace fs = std::filesystem;

namespace {

// Prefix + '_' + stem + extension must stay under NAME_MAX (255) for any accepted upload.
constexpr std::size_t kMaxStemLength = 100;

std::string ShortenedName(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return filename.substr(0, kMaxStemLength);
    }
    return filename.substr(0, std::min(dot, kMaxStemLength)) + filename.substr(dot);
}

} // namespace

TempArtifact::TempArtifact(fs::path path) : m_path(std::move(path)) {}

TempArtifact::~TempArtifact() {
    removeQuietly();
}

TempArtifact::TempArtifact(TempArtifact&& other) noexcept
    : m_path(std::move(other.m_path)), m_owned(other.m_owned) {
    other.m_owned = false;
}

TempArtifact& TempArtifact::operator=(TempArtifact&& other) noexcept {
    if (this != &other) {
        removeQuietly();
        m_path = std::move(other.m_path);
        m_owned = other.m_owned;
        other.m_owned = false;
    }
    return *this;
}

TempArtifact TempArtifact::InDirectory(const fs::path& dir, const std::string& filename) {
    return TempArtifact(dir / (UniquePrefix() + "_" + ShortenedName(filename)));
}

TempArtifact TempArtifact::CreateDirectory(const fs::path& dir, const std::string& label) {
    TempArtifact artifact(dir / (label + "_" + UniquePrefix()));
    fs::create_directories(artifact.path());
    return artifact;
}

std::string TempArtifact::UniquePrefix() {
    thread_local std::mt19937_64 engine(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(16) << dist(engine)
       << std::setw(16) << dist(engine);
    return ss.str();
}

void TempArtifact::removeQuietly() noexcept {
    if (!m_owned || m_path.empty()) {
        return;
    }
    m_owned = false;

    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[TempArtifact] Failed to remove " << m_path.string() << ": " << ec.message() << std::endl;
    }
}

} // namespace docxpdf::infrastructure
