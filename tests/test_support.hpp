#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// RAII temp directory that auto-deletes.
struct TmpDir {
    fs::path path;

    TmpDir() {
        auto tmpl_path = fs::temp_directory_path() / "glu_test_XXXXXX";
        std::string tmpl = tmpl_path.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }

    std::string make_dir(const std::string& name) const {
        fs::create_directories(path / name);
        return file(name);
    }
};

// Writes an executable /bin/sh script and returns its path.
inline std::string write_script(const std::string& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return path;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
