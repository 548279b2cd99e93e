#include "core/json_file.h"
#include "core/jsonc.h"
#include "core/logging.h"

#include <fstream>
#include <iterator>

namespace occm {

namespace fs = std::filesystem;

std::optional<std::string> read_text_file(const fs::path& path, std::string& error_out) {
    error_out.clear();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error_out = "Cannot open " + path.string();
        core_log(spdlog::level::warn, "Failed to open {}", path.string());
        return std::nullopt;
    }

    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool write_text_file(const fs::path& path, const std::string& content, std::string& error_out, bool owner_only) {
    error_out.clear();

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error_out = "Cannot create " + path.parent_path().string() + ": " + ec.message();
            core_log(spdlog::level::err, "{}", error_out);
            return false;
        }
    }

    const fs::path temp_path = path.string() + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error_out = "Cannot write " + temp_path.string();
            core_log(spdlog::level::err, "{}", error_out);
            return false;
        }
#if !defined(_WIN32)
        if (owner_only) {
            fs::permissions(temp_path, fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
            if (ec) {
                file.close();
                error_out = "Cannot restrict permissions on " + temp_path.string() + ": " + ec.message();
                core_log(spdlog::level::err, "{}", error_out);
                fs::remove(temp_path, ec);
                return false;
            }
        }
#endif
        file << content;
        file.close();
        if (!file.good()) {
            fs::remove(temp_path, ec);
            error_out = "Write failed for " + temp_path.string();
            core_log(spdlog::level::err, "{}", error_out);
            return false;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        error_out = "Cannot replace " + path.string();
        core_log(spdlog::level::err, "{}", error_out);
        return false;
    }

    return true;
}

std::optional<nlohmann::json> read_json_file(const fs::path& path, std::string& error_out) {
    auto content = read_text_file(path, error_out);
    if (!content) {
        return std::nullopt;
    }

    std::string parse_error;
    auto parsed = parse_jsonc(*content, parse_error);
    if (!parsed) {
        error_out = "Malformed JSON in " + path.string() + ": " + parse_error;
        core_log(spdlog::level::warn, "{}", error_out);
        return std::nullopt;
    }
    return parsed;
}

bool write_json_file(const fs::path& path, const nlohmann::json& j, std::string& error_out, bool owner_only) {
    std::string text;
    try {
        text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::type_error& e) {
        error_out = e.what();
        core_log(spdlog::level::err, "Failed to serialise {}: {}", path.string(), e.what());
        return false;
    }
    text += '\n';
    if (!write_text_file(path, text, error_out, owner_only)) {
        return false;
    }
    core_log(spdlog::level::debug, "Wrote {}", path.string());
    return true;
}

}
