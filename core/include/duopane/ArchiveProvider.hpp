// Abstract archive backend. Codecs live outside this engine; jobs only go
// through this contract, picked by file extension.
#pragma once
#include "JobModel.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace duopane {

class ArchiveProvider {
public:
    using ProgressCB = std::function<void(const ProgressSnapshot &)>;

    virtual ~ArchiveProvider() = default;

    // Lower-case extensions including the dot (".zip", ".tar.gz").
    virtual std::vector<std::string> supportedExtensions() const = 0;

    virtual bool list(const std::string &archivePath, std::vector<FileEntry> &out,
                      std::string &err) = 0;

    // Extracts everything into `destination`. Per-entry problems go into the
    // result; returning with result.fatal set aborts the job.
    virtual OperationResult extract(const std::string &archivePath,
                                    const std::string &destination,
                                    ProgressCB progress,
                                    std::function<bool()> shouldCancel) = 0;

    virtual OperationResult compress(const std::vector<std::string> &sources,
                                     const std::string &archivePath,
                                     ProgressCB progress,
                                     std::function<bool()> shouldCancel) = 0;
};

// Extension -> provider lookup. Providers are shared with whoever registered
// them; the longest matching suffix wins.
class ArchiveRegistry {
public:
    void registerProvider(std::shared_ptr<ArchiveProvider> provider);
    std::shared_ptr<ArchiveProvider> providerFor(const std::string &path) const;
    bool isArchive(const std::string &path) const { return providerFor(path) != nullptr; }
    std::vector<std::string> supportedExtensions() const;

private:
    std::vector<std::pair<std::string, std::shared_ptr<ArchiveProvider>>> byExt_;
};

} // namespace duopane
