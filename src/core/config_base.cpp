#include "ledger_ngin/core/config_base.hpp"

#include <fstream>
#include <iomanip>

namespace ledger_ngin {

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Configuration must be a JSON object", "ConfigBase");
    }
    try {
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                std::string("Invalid configuration value: ") + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::save_to_file(const std::filesystem::path& filepath) const {
    std::error_code ec;
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create directory " +
                                        filepath.parent_path().string() + ": " + ec.message(),
                                    "ConfigBase");
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath.string(),
                                "ConfigBase");
    }
    file << std::setw(4) << to_json() << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to write config file: " + filepath.string(), "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath.string(),
                                "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Error parsing " + filepath.string() + ": " + e.what(),
                                "ConfigBase");
    }
    return load_from_json(j);
}

}  // namespace ledger_ngin
