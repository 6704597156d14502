#include "output_writer.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace topsellers {

namespace {

/// Removes the temporary file unless commit() was called.
class TempFile {
public:
    explicit TempFile(fs::path path) : mPath(std::move(path)) {}
    ~TempFile() {
        if (!mCommitted) {
            std::error_code ec;
            fs::remove(mPath, ec);
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const fs::path& path() const { return mPath; }
    void commit() { mCommitted = true; }

private:
    fs::path mPath;
    bool     mCommitted = false;
};

fs::path makeTempPath(const fs::path& target) {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

    fs::path tmp = target;
    tmp += ".tmp-" + std::to_string(stamp) + "-" + std::to_string(counter++);
    return tmp;
}

fs::path parentOrCurrent(const fs::path& target) {
    return target.has_parent_path() ? target.parent_path() : fs::path(".");
}

} // namespace

void syncToDisk(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw IoError("cannot open " + path + " to sync: " + std::strerror(errno));
    }
    const int rc  = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw IoError("fsync failed for " + path + ": " + std::strerror(err));
    }
}

std::string OutputWriter::render(const OutputDocument& doc) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : doc.items) {
        array.push_back(itemToJson(item));
    }
    return array.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

void OutputWriter::write(const OutputDocument& doc, const std::string& path) const {
    if (path.empty()) {
        throw IoError("output path is empty");
    }

    const fs::path target(path);
    const std::string text = render(doc);

    TempFile tmp(makeTempPath(target));
    {
        std::ofstream out(tmp.path(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IoError("cannot open " + tmp.path().string() + " for writing");
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            throw IoError("failed writing " + tmp.path().string());
        }
    }

    syncToDisk(tmp.path().string());

    std::error_code ec;
    fs::rename(tmp.path(), target, ec);
    if (ec) {
        throw IoError("cannot move " + tmp.path().string() + " to " + path +
                      ": " + ec.message());
    }
    tmp.commit();

    // The file is already in place; a failed directory sync only weakens
    // durability of the rename itself.
    try {
        syncToDisk(parentOrCurrent(target).string());
    } catch (const IoError& e) {
        std::cerr << "[Writer] Warning: " + std::string(e.what()) + "\n";
    }

    if (mVerbose) {
        std::cerr << "[Writer] " + std::to_string(doc.items.size()) +
                         " item(s), " + std::to_string(text.size()) +
                         " bytes -> " + path + "\n";
    }
}

} // namespace topsellers
