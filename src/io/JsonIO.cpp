#include "io/JsonIO.hpp"

#include "guard/Errors.hpp"
#include "guard/SafeFile.hpp"

#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string optional_string(const json& j, const char* key, const std::string& def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error("book config." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> optional_string_array(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error("book config." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << "book config." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

site::BookConfig parseBookConfig(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse book config: ") + e.what());
    }

    require_object(j, "book config");

    site::BookConfig cfg;
    cfg.title   = optional_string(j, "title", cfg.title);
    cfg.summary = optional_string(j, "summary", cfg.summary);
    cfg.output  = optional_string(j, "output", cfg.output);
    cfg.denied_dirs = optional_string_array(j, "denied_dirs");

    if (j.contains("indent_width")) {
        const json& w = j.at("indent_width");
        if (!w.is_number_integer() || w.get<long long>() < 1 || w.get<long long>() > 16) {
            throw std::runtime_error("book config.indent_width must be an integer in [1, 16]");
        }
        cfg.indent_width = static_cast<size_t>(w.get<long long>());
    }

    return cfg;
}

site::BookConfig loadBookConfig(const std::filesystem::path& root, const std::string& relative) {
    std::string text;
    try {
        text = guard::read_file(root, relative);
    } catch (const guard::FileNotFound&) {
        return site::BookConfig{};
    }
    return parseBookConfig(text);
}

static json diagnostics_to_json(const std::vector<markdown::Diagnostic>& skipped) {
    json arr = json::array();
    for (const auto& d : skipped) {
        arr.push_back({{"line", d.line}, {"reason", d.reason}});
    }
    return arr;
}

static const char* align_str(markdown::Align a) {
    switch (a) {
        case markdown::Align::Left: return "left";
        case markdown::Align::Center: return "center";
        case markdown::Align::Right: return "right";
        default: return "none";
    }
}

json outlineToJson(const markdown::OutlineParseResult& res) {
    json j;

    json entries = json::array();
    for (const auto& e : res.entries) {
        entries.push_back({
            {"title", e.title},
            {"path", e.path},
            {"level", e.level},
            {"line", e.line}
        });
    }
    j["entries"] = entries;
    j["skipped"] = diagnostics_to_json(res.skipped);

    return j;
}

json tablesToJson(const markdown::TableParseResult& res) {
    json j;

    json tables = json::array();
    for (const auto& t : res.tables) {
        json tj;
        tj["headers"] = t.headers;
        tj["rows"] = t.rows;

        json align = json::array();
        for (auto a : t.align) align.push_back(align_str(a));
        tj["align"] = align;

        tj["first_line"] = t.first_line + 1;
        tj["last_line"] = t.last_line + 1;
        tables.push_back(tj);
    }
    j["tables"] = tables;
    j["skipped"] = diagnostics_to_json(res.skipped);

    return j;
}

json validationToJson(const std::string& path, const guard::ProjectValidation& v) {
    json j;
    j["path"] = path;
    j["valid"] = v.valid;
    j["message"] = v.message;
    return j;
}
