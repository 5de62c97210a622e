// src/core/config_base.cpp

#include "quanttrade/core/config_base.hpp"
#include <fstream>
#include <iomanip>

namespace quanttrade {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }

    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error serialising config: ") + e.what(),
                                "ConfigBase");
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write config: " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error parsing config ") + filepath + ": " + e.what(),
                                "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Error loading config ") + filepath + ": " + e.what(),
                                "ConfigBase");
    }

    return validate();
}

}  // namespace quanttrade
