#ifndef TEMP_DIR_H
#define TEMP_DIR_H

#include <string>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace test_helpers {

// RAII temporary directory under /tmp, removed with its contents on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "inkwell_test_") {
        std::string tmpl = "/tmp/" + prefix + "XXXXXX";
        if (char* path = mkdtemp(&tmpl[0])) {
            path_ = path;
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file_path(const std::string& name) const {
        return path_ + "/" + name;
    }

    bool valid() const { return !path_.empty(); }

private:
    std::string path_;
};

} // namespace test_helpers

#endif // TEMP_DIR_H
