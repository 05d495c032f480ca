// src/engine/engine_config.cpp

#include "ledger_ngin/engine/engine_config.hpp"

#include <fstream>

namespace ledger_ngin {

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["fees"] = fees.to_json();
    j["reconciler"] = reconciler.to_json();
    j["aggregator"] = aggregator.to_json();
    j["cache"] = cache.to_json();
    j["strategy_classifier"] = strategy_classifier;
    j["version"] = version;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("fees"))
        fees.from_json(j.at("fees"));
    if (j.contains("reconciler"))
        reconciler.from_json(j.at("reconciler"));
    if (j.contains("aggregator"))
        aggregator.from_json(j.at("aggregator"));
    if (j.contains("cache"))
        cache.from_json(j.at("cache"));
    if (j.contains("strategy_classifier"))
        strategy_classifier = j.at("strategy_classifier").get<std::string>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<nlohmann::json> EngineConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "EngineConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(),
            "EngineConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() +
                                              ": " + e.what(),
                                          "EngineConfigLoader");
    }
}

void EngineConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<EngineConfig> EngineConfigLoader::load(const std::filesystem::path& defaults_path,
                                              const std::filesystem::path& overrides_path) {
    auto defaults = load_json_file(defaults_path);
    if (defaults.is_error()) {
        return forward_error<EngineConfig>(*defaults.error());
    }
    nlohmann::json merged = defaults.value();

    if (!overrides_path.empty()) {
        auto overrides = load_json_file(overrides_path);
        if (overrides.is_error()) {
            return forward_error<EngineConfig>(*overrides.error());
        }
        merge_json(merged, overrides.value());
    }

    EngineConfig config;
    auto applied = config.load_from_json(merged);
    if (applied.is_error()) {
        return forward_error<EngineConfig>(*applied.error());
    }
    return config;
}

}  // namespace ledger_ngin
