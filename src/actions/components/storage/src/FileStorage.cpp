#include "FileStorage.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include "ValueConverter.hpp"
#include <fstream>
#include <sstream>

FileStorage::FileStorage(const StorageConfig& config) : FileStorage(std::filesystem::path(config.dir)) {}

FileStorage::FileStorage(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {
    if (base_dir_.empty()) {
        base_dir_ = ".";
    }
}

std::filesystem::path FileStorage::resolve_path(const std::string& path) const {
    std::filesystem::path target(path);
    if (target.is_absolute()) {
        return target;
    }
    return base_dir_ / target;
}

bool FileStorage::is_yaml_path(const std::filesystem::path& path) {
    std::string ext = StringUtils::to_lower(path.extension().string());
    return ext == ".yaml" || ext == ".yml";
}

bool FileStorage::save(const std::string& path, const Value& value) {
    if (path.empty()) {
        last_error_ = "Storage path is empty";
        return false;
    }

    auto target = resolve_path(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            last_error_ = "Failed to create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(target, std::ios::trunc);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for writing: " + target.string();
        return false;
    }

    if (is_yaml_path(target)) {
        file << ValueConverter::to_yaml_string(value);
    } else {
        file << value.dump(2) << "\n";
    }

    if (!file.good()) {
        last_error_ = "Failed to write file: " + target.string();
        return false;
    }

    LogUtils::debug("Saved {} to {}", ValueUtils::type_name(value), target.string());
    return true;
}

std::optional<Value> FileStorage::load(const std::string& path) {
    if (path.empty()) {
        last_error_ = "Storage path is empty";
        return std::nullopt;
    }

    auto target = resolve_path(path);
    std::ifstream file(target);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for reading: " + target.string();
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        if (is_yaml_path(target)) {
            return ValueConverter::from_yaml(YAML::Load(buffer.str()));
        }
        return Value::parse(buffer.str());
    } catch (const YAML::Exception& e) {
        last_error_ = "Invalid YAML in " + target.string() + ": " + e.what();
    } catch (const nlohmann::json::parse_error& e) {
        last_error_ = "Invalid JSON in " + target.string() + ": " + e.what();
    }
    return std::nullopt;
}
