// src/core/config_base.cpp
#include "gold_rotation/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "gold_rotation/core/logger.hpp"

namespace gold_rotation {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::filesystem::path path(filepath);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create " + path.parent_path().string() + ": " +
                                        ec.message(),
                                    "ConfigBase");
        }
    }

    std::ofstream out(path);
    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write config to " + filepath,
                                "ConfigBase");
    }
    try {
        out << std::setw(4) << to_json() << '\n';
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                std::string("Cannot serialize config: ") + e.what(), "ConfigBase");
    }
    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Short write to " + filepath,
                                "ConfigBase");
    }
    DEBUG("Saved config to " << filepath);
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    try {
        from_json(nlohmann::json::parse(in));
    } catch (const EngineError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                filepath + ": " + std::string(e.what()), "ConfigBase");
    }

    auto valid = validate();
    if (valid.is_error()) {
        return forward_error<void>(*valid.error(), "ConfigBase", filepath);
    }
    return Result<void>();
}

}  // namespace gold_rotation
