#include <persistency/record_store_backend.hpp>
#include <persistency/record_filename.hpp>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_set>

#include <unistd.h>     // write, fsync, close, unlink
#include <fcntl.h>      // open
#include <stdlib.h>     // mkstemps

namespace fs = std::filesystem;
using trs::core::ErrorCode;
using trs::core::Result;
using trs::core::StoreErrc;

namespace {

inline std::error_code last_errno() {
    return std::error_code(errno, std::system_category());
}

ErrorCode io_error(std::string_view op, const fs::path& p, const std::error_code& ec) {
    std::string msg(op);
    msg += ' ';
    msg += p.string();
    msg += ": ";
    msg += ec.message();
    return ErrorCode(StoreErrc::kIoError, std::move(msg));
}

// Some filesystems fold case, so two spellings of one path must share a lock.
std::string lock_key_for(const std::string& path) {
    std::string key(path);
    for (char& c : key) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return key;
}

std::error_code write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_errno();
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return {};
}

// Persist the directory entry after a rename.
std::error_code fsync_dir_by_path(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return last_errno();
    std::error_code ec;
    if (::fsync(fd) != 0) ec = last_errno();
    ::close(fd);
    return ec;
}

// Staging file: closed and unlinked on scope exit unless committed.
class TempFile {
public:
    TempFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~TempFile() {
        if (fd_ >= 0) ::close(fd_);
        if (!committed_) ::unlink(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    std::error_code Close() {
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) return last_errno();
        return {};
    }
    void Commit() { committed_ = true; }

private:
    int fd_;
    std::string path_;
    bool committed_{false};
};

// Keeps a temp file name in the in-flight set until scope exit.
class InFlightMark {
public:
    InFlightMark(std::mutex& mu, std::unordered_set<std::string>& names, std::string name)
        : mu_(mu), names_(names), name_(std::move(name)) {}
    ~InFlightMark() {
        std::lock_guard<std::mutex> lk(mu_);
        names_.erase(name_);
    }
    InFlightMark(const InFlightMark&) = delete;
    InFlightMark& operator=(const InFlightMark&) = delete;

private:
    std::mutex& mu_;
    std::unordered_set<std::string>& names_;
    std::string name_;
};

} // namespace

namespace persistency {

Result<std::shared_ptr<RecordStoreBackend>>
RecordStoreBackend::Create(RecordStoreOptions options) noexcept {
    if (options.base_path.empty()) {
        options.base_path = kDefaultDirectory;
    }
    if (options.rename_max_retries < 1) {
        return ErrorCode(StoreErrc::kInvalidInput, "rename_max_retries must be at least 1");
    }

    // Later operations must not depend on the process working directory.
    std::error_code ec;
    fs::path base = fs::absolute(options.base_path, ec);
    if (ec) return io_error("resolve", options.base_path, ec);
    base = base.lexically_normal();
    if (!base.has_filename() && base != base.root_path()) {
        base = base.parent_path();
    }

    fs::create_directories(base, ec);
    if (ec) return io_error("create directory", base, ec);
    if (!fs::is_directory(base, ec)) {
        return ErrorCode(StoreErrc::kIoError, "not a directory: " + base.string());
    }

    options.base_path = base.string();
    std::shared_ptr<RecordStoreBackend> backend(new RecordStoreBackend(std::move(options), base));

    if (backend->options_.cleanup_on_start) {
        try {
            RecordStoreBackend* raw = backend.get();
            backend->cleanup_thread_ = std::thread([raw] { raw->RunStartupCleanup_(); });
        } catch (const std::exception& e) {
            TRS_LOGWARN(backend->log_, "stale temp cleanup not started for {}: {}",
                        backend->base_dir_, e.what());
        }
    }
    return backend;
}

RecordStoreBackend::RecordStoreBackend(RecordStoreOptions options, fs::path base_dir)
    : options_(std::move(options)),
      base_path_(std::move(base_dir)),
      base_dir_(base_path_.string()),
      log_(trs::log::Logger::CreateLogger("STOR")) {}

RecordStoreBackend::~RecordStoreBackend() {
    WaitForStartupCleanup();
}

void RecordStoreBackend::WaitForStartupCleanup() {
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

void RecordStoreBackend::RunStartupCleanup_() noexcept {
    try {
        const std::size_t removed = CleanupStaleTempFiles();
        if (removed > 0) {
            TRS_LOGINFO(log_, "startup cleanup removed {} stale temp file(s) from {}", removed, base_dir_);
        }
    } catch (const std::exception& e) {
        TRS_LOGERROR(log_, "stale temp cleanup aborted in {}: {}", base_dir_, e.what());
    } catch (...) {
        TRS_LOGERROR(log_, "stale temp cleanup aborted in {}: unknown exception", base_dir_);
    }
}

std::size_t RecordStoreBackend::CleanupStaleTempFiles() {
    std::error_code ec;
    fs::directory_iterator it(base_path_, ec);
    if (ec) {
        TRS_LOGWARN(log_, "stale temp cleanup skipped, cannot list {}: {}", base_dir_, ec.message());
        return 0;
    }

    // Anything newer may belong to a write that is still in flight.
    const auto cutoff = fs::file_time_type::clock::now() - options_.stale_temp_threshold;
    std::size_t removed = 0;

    for (const fs::directory_iterator end{}; it != end; ) {
        const fs::directory_entry& entry = *it;
        std::error_code entry_ec;

        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file(entry_ec) && IsTempFileName(name)) {
            const auto mtime = entry.last_write_time(entry_ec);
            // held across the check and the unlink so a save cannot register in between
            std::lock_guard<std::mutex> inflight_lock(inflight_mu_);
            if (!entry_ec && mtime <= cutoff && inflight_.count(name) == 0) {
                if (fs::remove(entry.path(), entry_ec)) {
                    ++removed;
                    TRS_LOGINFO(log_, "removed stale temp file {}", entry.path().string());
                } else if (entry_ec) {
                    TRS_LOGWARN(log_, "cannot remove stale temp file {}: {}",
                                entry.path().string(), entry_ec.message());
                }
            }
        }

        it.increment(ec);
        if (ec) {
            TRS_LOGWARN(log_, "stale temp cleanup stopped early in {}: {}", base_dir_, ec.message());
            break;
        }
    }
    return removed;
}

Result<std::string>
RecordStoreBackend::ResolveRecordPath(const std::string& part1, const std::string& part2) const noexcept {
    const std::string filename =
        MakeRecordFilename(part1, part2, options_.record_prefix, options_.extension);

    // The sanitizer already strips separators and "..". This is the second line.
    const fs::path full = (base_path_ / filename).lexically_normal();
    const fs::path rel = full.lexically_relative(base_path_);
    if (rel.empty() || rel.begin()->string() == ".." || rel.string() == ".") {
        TRS_LOGERROR(log_, "path escape blocked: key ({}, {}) -> {} resolves outside {}",
                     part1, part2, full.string(), base_dir_);
        return ErrorCode(StoreErrc::kPathEscape, full.string() + " is outside " + base_dir_);
    }
    return full.string();
}

Result<void> RecordStoreBackend::WriteRecord(const std::string& part1, const std::string& part2,
                                             const std::string& payload) noexcept {
    auto path = ResolveRecordPath(part1, part2);
    if (!path) return path.Error();

    const fs::path target(path.Value());
    try {
        return locks_.WithLock(lock_key_for(path.Value()),
                               [&] { return WriteAtomic_(target, payload); });
    } catch (const std::exception& e) {
        return ErrorCode(StoreErrc::kUnknown, std::string("record lock failed: ") + e.what());
    }
}

Result<std::string> RecordStoreBackend::ReadRecord(const std::string& part1,
                                                   const std::string& part2) const noexcept {
    auto path = ResolveRecordPath(part1, part2);
    if (!path) return path.Error();

    const fs::path file(path.Value());
    try {
        return locks_.WithLock(lock_key_for(path.Value()),
                               [&] { return ReadWhole_(file); });
    } catch (const std::exception& e) {
        return ErrorCode(StoreErrc::kUnknown, std::string("record lock failed: ") + e.what());
    }
}

Result<void> RecordStoreBackend::WriteAtomic_(const fs::path& target,
                                              const std::string& payload) noexcept {
    const fs::path dir = target.parent_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return io_error("create directory", dir, ec);

    // Same directory as the target, so the rename never crosses a filesystem.
    std::string tmpl = (dir / (std::string(kTempFilePrefix) + "XXXXXX" +
                               std::string(kTempFileSuffix))).string();
    std::string tmp_name;
    int fd = -1;
    {
        // create and register under one lock so the sweep never sees an unregistered temp
        std::lock_guard<std::mutex> lk(inflight_mu_);
        fd = ::mkstemps(tmpl.data(), static_cast<int>(kTempFileSuffix.size()));
        if (fd < 0) return io_error("create temp file in", dir, last_errno());
        try {
            tmp_name = fs::path(tmpl).filename().string();
            inflight_.insert(tmp_name);
        } catch (const std::exception& e) {
            ::close(fd);
            ::unlink(tmpl.c_str());
            return ErrorCode(StoreErrc::kUnknown, std::string("temp file bookkeeping failed: ") + e.what());
        }
    }
    // declared first so the name is released only after the temp file is gone or renamed
    InFlightMark mark(inflight_mu_, inflight_, std::move(tmp_name));
    TempFile tmp(fd, std::move(tmpl));

    if ((ec = write_all(tmp.fd(), payload))) return io_error("write", tmp.path(), ec);
    if (::fsync(tmp.fd()) != 0) return io_error("sync", tmp.path(), last_errno());
    if ((ec = tmp.Close())) return io_error("close", tmp.path(), ec);

    if ((ec = RenameWithRetry_(tmp.path(), target))) {
        return io_error("rename " + tmp.path() + " ->", target, ec);
    }
    tmp.Commit();

    if ((ec = fsync_dir_by_path(dir))) {
        TRS_LOGDEBUG(log_, "directory sync skipped for {}: {}", dir.string(), ec.message());
    }
    return {};
}

std::error_code RecordStoreBackend::RenameWithRetry_(const fs::path& from, const fs::path& to) noexcept {
    std::error_code ec;
    for (int attempt = 1; attempt <= options_.rename_max_retries; ++attempt) {
        fs::rename(from, to, ec);
        if (!ec) return ec;
        if (attempt < options_.rename_max_retries) {
            TRS_LOGDEBUG(log_, "rename attempt {}/{} failed for {}: {}",
                         attempt, options_.rename_max_retries, to.string(), ec.message());
            std::this_thread::sleep_for(options_.rename_retry_delay);
        }
    }
    return ec;
}

Result<std::string> RecordStoreBackend::ReadWhole_(const fs::path& file) const noexcept {
    std::error_code ec;
    const fs::file_status st = fs::status(file, ec);
    if (st.type() == fs::file_type::not_found) {
        return ErrorCode(StoreErrc::kNotFound, file.string());
    }
    if (ec) return io_error("stat", file, ec);
    if (!fs::is_regular_file(st)) {
        return ErrorCode(StoreErrc::kIoError, "not a regular file: " + file.string());
    }

    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) return ErrorCode(StoreErrc::kIoError, "open " + file.string());
    std::string value((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) return ErrorCode(StoreErrc::kIoError, "read " + file.string());
    return value;
}

} // namespace persistency
