#pragma once

#include "Storage.hpp"
#include "StorageConfig.hpp"
#include <filesystem>

// Stores values as files under a base directory. Paths ending in .yaml/.yml
// use YAML, everything else pretty-printed JSON.
class FileStorage : public Storage {
public:
    explicit FileStorage(const StorageConfig& config);
    explicit FileStorage(std::filesystem::path base_dir);

    bool save(const std::string& path, const Value& value) override;
    std::optional<Value> load(const std::string& path) override;

    std::string last_error() const override { return last_error_; }

    std::filesystem::path resolve_path(const std::string& path) const;

    static bool is_yaml_path(const std::filesystem::path& path);

private:
    std::filesystem::path base_dir_;
    std::string last_error_;
};
