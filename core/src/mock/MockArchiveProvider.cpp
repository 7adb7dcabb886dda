#include "duopane/MockArchiveProvider.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace duopane {

void MockArchiveProvider::addArchive(const std::string& archivePath,
                                     std::vector<Entry> entries) {
  std::lock_guard<std::mutex> lk(mtx_);
  archives_[archivePath] = std::move(entries);
}

bool MockArchiveProvider::list(const std::string& archivePath,
                               std::vector<FileEntry>& out,
                               std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = archives_.find(archivePath);
  if (it == archives_.end()) {
    err = "Archive not found in mock: " + archivePath;
    return false;
  }
  out.clear();
  for (const auto& e : it->second) {
    FileEntry fe;
    fe.path = e.name;
    fe.name = fs::path(e.name).filename().string();
    fe.size = e.content.size();
    out.push_back(fe);
  }
  return true;
}

OperationResult MockArchiveProvider::extract(const std::string& archivePath,
                                             const std::string& destination,
                                             ProgressCB progress,
                                             std::function<bool()> shouldCancel) {
  OperationResult r;
  std::vector<Entry> entries;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = archives_.find(archivePath);
    if (it == archives_.end()) {
      r.addError(archivePath, "Archive not found in mock", true);
      return r;
    }
    entries = it->second;
  }
  std::uint64_t total = 0;
  for (const auto& e : entries) total += e.content.size();

  std::uint64_t index = 0;
  for (const auto& e : entries) {
    if (shouldCancel && shouldCancel()) {
      r.cancelled = true;
      return r;
    }
    ++index;
    const fs::path target = fs::path(destination) / e.name;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
      r.addError(target.string(), "Cannot create file");
      ++r.filesSkipped;
      continue;
    }
    out.write(e.content.data(), static_cast<std::streamsize>(e.content.size()));
    out.close();
    ++r.filesProcessed;
    r.bytesProcessed += e.content.size();
    r.producedPaths.push_back(target.string());
    if (progress) {
      ProgressSnapshot s;
      s.currentFile = e.name;
      s.fileIndex = index;
      s.fileTotal = entries.size();
      s.bytesDone = r.bytesProcessed;
      s.bytesTotal = total;
      progress(s);
    }
  }
  r.success = r.errors.empty();
  return r;
}

OperationResult MockArchiveProvider::compress(const std::vector<std::string>& sources,
                                              const std::string& archivePath,
                                              ProgressCB progress,
                                              std::function<bool()> shouldCancel) {
  OperationResult r;
  std::vector<Entry> entries;
  std::uint64_t index = 0;
  for (const auto& src : sources) {
    if (shouldCancel && shouldCancel()) {
      r.cancelled = true;
      return r;
    }
    ++index;
    std::ifstream in(src, std::ios::binary);
    if (!in) {
      r.addError(src, "Cannot open source");
      ++r.filesSkipped;
      continue;
    }
    Entry e;
    e.name = fs::path(src).filename().string();
    e.content.assign(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
    r.bytesProcessed += e.content.size();
    ++r.filesProcessed;
    entries.push_back(std::move(e));
    if (progress) {
      ProgressSnapshot s;
      s.currentFile = fs::path(src).filename().string();
      s.fileIndex = index;
      s.fileTotal = sources.size();
      s.bytesDone = r.bytesProcessed;
      progress(s);
    }
  }
  // Leave a manifest on disk so callers can see the archive appear.
  std::ofstream manifest(archivePath, std::ios::trunc);
  if (!manifest) {
    r.addError(archivePath, "Cannot create archive", true);
    return r;
  }
  for (const auto& e : entries)
    manifest << e.name << '\t' << e.content.size() << '\n';
  manifest.close();
  r.producedPaths.push_back(archivePath);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    archives_[archivePath] = std::move(entries);
  }
  r.success = r.errors.empty();
  return r;
}

} // namespace duopane
