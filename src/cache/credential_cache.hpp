#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "utils/result.hpp"
#include "utils/token_store.hpp"
#include "xblchat_export.hpp"

/**
 * 按阶段保存凭据记录，每次写入都把整个文档快照写到磁盘（临时文件 + rename）。
 * 磁盘不可用时退化为纯内存模式，读写仍然成功，只是返回 PersistenceDegraded。
 */
class XBLCHAT_API CredentialCache {
public:
    // file 为空表示从一开始就只用内存
    explicit CredentialCache(std::optional<std::filesystem::path> file);

    std::optional<CredentialRecord> get(const std::string& stage_id) const;

    // 只替换 stage_id 对应的一条；内存始终更新，落盘失败时返回 PersistenceDegraded
    Status put(const std::string& stage_id, CredentialRecord record);

    bool                                        isPersistent() const { return mFilePath.has_value(); }
    const std::optional<std::filesystem::path>& location() const { return mFilePath; }
    std::size_t                                 size() const { return mRecords.size(); }

private:
    bool   loadFromFile();
    Status saveToFile() const;

private:
    std::optional<std::filesystem::path>    mFilePath;
    std::map<std::string, CredentialRecord> mRecords;
};

/**
 * 按顺序挑选第一个可写目录：配置目录、$XDG_RUNTIME_DIR、程序所在目录、系统临时目录。
 * 全部不可写时返回 nullopt（仅内存缓存）。
 */
XBLCHAT_API std::optional<std::filesystem::path> resolveCacheLocation(const std::string&           file_name,
                                                                      const std::string&           configured_dir,
                                                                      const std::filesystem::path& app_dir);
