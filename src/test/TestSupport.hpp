// Shared helpers for the test executables: scratch directories and a scripted stand-in for the office suite.
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <sys/stat.h>

namespace docxpdf::test {

namespace fs = std::filesystem;

/** @brief Fresh, empty directory under the system temp dir. */
inline fs::path MakeScratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("docxpdf_test_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline size_t CountEntries(const fs::path& dir) {
    size_t n = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++n;
    return n;
}

inline void WriteText(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string ReadText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

enum class FakeOfficeMode {
    Render,     ///< Writes <outdir>/<stem>.pdf (header + input bytes) and exits 0.
    Fail,       ///< Prints a diagnostic on stderr and exits 1.
    Silent,     ///< Exits 0 without writing anything.
    Hang        ///< Sleeps far past any test timeout.
};

/**
 * @brief Writes an executable shell script that accepts the office command line.
 *
 * Every invocation appends the input path to "<script>.calls", which is reset on each write.
 */
inline fs::path WriteFakeOffice(const fs::path& dir, FakeOfficeMode mode, const std::string& name = "fake-office.sh") {
    fs::path script = dir / name;
    std::string body =
        "#!/bin/sh\n"
        "outdir=\"\"\n"
        "input=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    --outdir) outdir=\"$2\"; shift 2 ;;\n"
        "    --convert-to) shift 2 ;;\n"
        "    --headless) shift ;;\n"
        "    *) input=\"$1\"; shift ;;\n"
        "  esac\n"
        "done\n"
        "echo \"$input\" >> \"$0.calls\"\n";

    switch (mode) {
        case FakeOfficeMode::Render:
            body +=
                "name=$(basename \"$input\")\n"
                "stem=\"${name%.*}\"\n"
                "printf '%%PDF-1.4\\n%% rendered %s\\n' \"$name\" > \"$outdir/$stem.pdf\"\n"
                "cat \"$input\" >> \"$outdir/$stem.pdf\"\n"
                "echo \"convert $input -> $outdir/$stem.pdf using filter : writer_pdf_Export\"\n"
                "exit 0\n";
            break;
        case FakeOfficeMode::Fail:
            body +=
                "echo \"Error: source file could not be loaded\" 1>&2\n"
                "exit 1\n";
            break;
        case FakeOfficeMode::Silent:
            body += "exit 0\n";
            break;
        case FakeOfficeMode::Hang:
            body += "exec sleep 30\n";
            break;
    }

    WriteText(script, body);
    ::chmod(script.c_str(), 0755);

    fs::path calls = script;
    calls += ".calls";
    fs::remove(calls);
    return script;
}

inline size_t FakeOfficeCalls(const fs::path& script) {
    fs::path calls = script;
    calls += ".calls";
    if (!fs::exists(calls)) return 0;
    std::ifstream in(calls);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

} // namespace docxpdf::test
