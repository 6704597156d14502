#pragma once

#include "models.hpp"

#include <string>

namespace topsellers {

/// Renders an OutputDocument as a JSON array and persists it atomically.
class OutputWriter {
public:
    explicit OutputWriter(bool verbose = false) : mVerbose(verbose) {}

    /// Deterministic rendering: 4-space indent, sorted keys, trailing newline.
    static std::string render(const OutputDocument& doc);

    /// Write @p doc to @p path via a temporary file in the same directory,
    /// fsync'ed before the rename so a crash never exposes an empty file.
    /// On failure the temporary file is removed and @p path is left as it was.
    /// @throws IoError
    void write(const OutputDocument& doc, const std::string& path) const;

private:
    bool mVerbose;
};

/// fsync a file or directory.
/// @throws IoError if it cannot be opened or synced.
void syncToDisk(const std::string& path);

} // namespace topsellers
