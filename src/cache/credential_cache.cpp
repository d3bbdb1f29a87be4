#include "credential_cache.hpp"

#include <boost/scope_exit.hpp>

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <tuple>
#include <utility>
#include <vector>

#include "utils/logger.hpp"

static constexpr int kCacheVersion = 1;

// 按 mkstemp 模板创建只有属主可读写的新文件，返回描述符和实际路径；失败时 errno 有效
static std::optional<std::pair<int, std::filesystem::path>> createPrivateFile(const std::string& name_template) {
    std::vector<char> name(name_template.begin(), name_template.end());
    name.push_back('\0');
    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return std::nullopt;
    }
    return std::make_pair(fd, std::filesystem::path(name.data()));
}

static Status writeAll(int fd, const std::string& data) {
    const char* cursor    = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error{ErrorKind::PersistenceDegraded, std::strerror(errno)};
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

CredentialCache::CredentialCache(std::optional<std::filesystem::path> file)
    : mFilePath(std::move(file)) {
    if (!mFilePath) {
        LOG_WARNING("No writable cache location, tokens are kept in memory only");
        return;
    }

    if (std::filesystem::exists(*mFilePath) && loadFromFile()) {
        LOG_DEBUG("Loaded " + std::to_string(mRecords.size()) + " cached credential(s) from " + mFilePath->string());
        return;
    }

    // 文件不存在或已损坏：从空缓存开始，并尝试立即创建新文件
    mRecords.clear();
    auto status = saveToFile();
    if (!status) {
        LOG_WARNING("Cannot create cache file, continuing in memory only: " + status.error().message);
        mFilePath.reset();
        return;
    }
    LOG_INFO("Created new token cache file " + mFilePath->string());
}

std::optional<CredentialRecord> CredentialCache::get(const std::string& stage_id) const {
    auto it = mRecords.find(stage_id);
    if (it == mRecords.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status CredentialCache::put(const std::string& stage_id, CredentialRecord record) {
    record.stage_id    = stage_id;
    mRecords[stage_id] = std::move(record);

    if (!mFilePath) {
        return Error{ErrorKind::PersistenceDegraded, "cache is memory-only"};
    }

    auto status = saveToFile();
    if (!status) {
        LOG_WARNING("Failed to persist '" + stage_id + "' credential: " + status.error().message);
    }
    return status;
}

bool CredentialCache::loadFromFile() {
    std::ifstream ifs(*mFilePath);
    if (!ifs.is_open()) {
        LOG_WARNING("Failed to open cache file for reading: " + mFilePath->string());
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;

        std::map<std::string, CredentialRecord> records;
        for (auto& [stage_id, value] : j.at("records").items()) {
            auto record     = value.get<CredentialRecord>();
            record.stage_id = stage_id;
            records.emplace(stage_id, std::move(record));
        }
        mRecords = std::move(records);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("Cache file " + mFilePath->string() + " is corrupt, starting fresh: " + e.what());
        return false;
    }
}

Status CredentialCache::saveToFile() const {
    nlohmann::json records = nlohmann::json::object();
    for (const auto& [stage_id, record] : mRecords) {
        records[stage_id] = record;
    }
    nlohmann::json document = {{"version", kCacheVersion}, {"records", records}};

    std::error_code ec;
    if (mFilePath->has_parent_path()) {
        std::filesystem::create_directories(mFilePath->parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::PersistenceDegraded, "cannot create " + mFilePath->parent_path().string() + ": " + ec.message()};
        }
    }

    // 先写临时文件再整体替换，失败时不会破坏已有的缓存文件。
    // mkstemp 以 0600 独占创建随机名字，不会复用或跟随已存在的文件和符号链接
    int                   fd = -1;
    std::filesystem::path tmp_path;
    if (auto created = createPrivateFile(mFilePath->string() + ".XXXXXX")) {
        std::tie(fd, tmp_path) = *created;
    } else {
        return Error{ErrorKind::PersistenceDegraded,
                     "cannot create temporary file next to " + mFilePath->string() + ": " + std::strerror(errno)};
    }

    bool committed = false;
    BOOST_SCOPE_EXIT(&fd, &tmp_path, &committed) {
        if (fd >= 0) {
            ::close(fd);
        }
        if (!committed) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
        }
    }
    BOOST_SCOPE_EXIT_END

    auto status = writeAll(fd, document.dump(4));
    if (!status) {
        return Error{ErrorKind::PersistenceDegraded, "write to " + tmp_path.string() + " failed: " + status.error().message};
    }
    if (::fsync(fd) != 0) {
        return Error{ErrorKind::PersistenceDegraded, "fsync of " + tmp_path.string() + " failed: " + std::strerror(errno)};
    }
    int rc = ::close(fd);
    fd     = -1;
    if (rc != 0) {
        return Error{ErrorKind::PersistenceDegraded, "close of " + tmp_path.string() + " failed: " + std::strerror(errno)};
    }

    std::filesystem::rename(tmp_path, *mFilePath, ec);
    if (ec) {
        return Error{ErrorKind::PersistenceDegraded, "cannot replace " + mFilePath->string() + ": " + ec.message()};
    }
    committed = true;
    return {};
}

static bool isWritableDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
        return false;
    }

    // 直接尝试创建探测文件，比检查权限位更可靠；临时目录是共享的，探测文件同样用随机名字
    auto probe = createPrivateFile((dir / ".xblchat_probe.XXXXXX").string());
    if (!probe) {
        return false;
    }
    ::close(probe->first);
    std::filesystem::remove(probe->second, ec);
    return true;
}

std::optional<std::filesystem::path> resolveCacheLocation(const std::string&           file_name,
                                                          const std::string&           configured_dir,
                                                          const std::filesystem::path& app_dir) {
    std::vector<std::filesystem::path> candidates;
    if (!configured_dir.empty()) {
        candidates.emplace_back(configured_dir);
    }
    if (const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR")) {
        candidates.emplace_back(runtime_dir);
    }
    candidates.push_back(app_dir);

    std::error_code ec;
    auto            temp_dir = std::filesystem::temp_directory_path(ec);
    if (!ec) {
        candidates.push_back(temp_dir);
    }

    for (const auto& dir : candidates) {
        if (isWritableDirectory(dir)) {
            return dir / file_name;
        }
        LOG_DEBUG("Cache directory candidate not writable: " + dir.string());
    }
    return std::nullopt;
}
