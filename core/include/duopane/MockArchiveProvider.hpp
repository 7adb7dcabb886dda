#pragma once
#include "ArchiveProvider.hpp"

#include <map>
#include <mutex>

namespace duopane {

// In-memory archive backend for tests. Archives are registered (or produced
// by compress) as name -> content maps; extract writes real files.
class MockArchiveProvider : public ArchiveProvider {
public:
    struct Entry {
        std::string name; // relative path inside the archive
        std::string content;
    };

    std::vector<std::string> supportedExtensions() const override {
        return {".mock", ".mock.gz"};
    }

    void addArchive(const std::string &archivePath, std::vector<Entry> entries);

    bool list(const std::string &archivePath, std::vector<FileEntry> &out,
              std::string &err) override;

    OperationResult extract(const std::string &archivePath,
                            const std::string &destination, ProgressCB progress,
                            std::function<bool()> shouldCancel) override;

    OperationResult compress(const std::vector<std::string> &sources,
                             const std::string &archivePath, ProgressCB progress,
                             std::function<bool()> shouldCancel) override;

private:
    std::mutex mtx_;
    std::map<std::string, std::vector<Entry>> archives_;
};

} // namespace duopane
