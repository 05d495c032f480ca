// include/ledger_ngin/core/config_base.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "ledger_ngin/core/error.hpp"

namespace ledger_ngin {

/**
 * @brief JSON-backed component configuration
 *
 * Subclasses map their fields in to_json() / from_json(). Keys missing from
 * the input keep their defaults, so partial documents are valid. from_json()
 * may throw nlohmann exceptions on a wrongly typed value; load_from_json()
 * and load_from_file() turn those into results.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Apply a JSON document
     * @return CONFIGURATION_ERROR when a value has the wrong type
     */
    Result<void> load_from_json(const nlohmann::json& j);

    /**
     * @brief Write the configuration, creating missing parent directories
     */
    Result<void> save_to_file(const std::filesystem::path& filepath) const;

    /**
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR for malformed JSON, or
     * CONFIGURATION_ERROR for well-formed JSON with bad values
     */
    Result<void> load_from_file(const std::filesystem::path& filepath);
};

}  // namespace ledger_ngin
