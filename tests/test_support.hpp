#pragma once

#include <debpack/platform.hpp>

#include <filesystem>
#include <string>

namespace debpack::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("debpack_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline std::string write_text(const std::string& path, const std::string& content,
                              unsigned mode = 0644) {
    fs::create_directories(fs::path(path).parent_path());
    write_file(path, content);
    fs::permissions(path, static_cast<fs::perms>(mode), fs::perm_options::replace);
    return path;
}

inline std::string write_cargo_manifest(const TempDir& dir, const std::string& name,
                                        const std::string& version) {
    return write_text(dir.file("Cargo.toml"),
                      "[package]\n"
                      "name = \"" + name + "\"\n"
                      "version = \"" + version + "\"\n"
                      "edition = \"2021\"\n");
}

inline std::string write_release_binary(const TempDir& dir, const std::string& name) {
    return write_text(dir.file("target/release/" + name), "#!/bin/sh\necho ok\n", 0700);
}

} // namespace debpack::test
