#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "guard/ProjectValidator.hpp"
#include "markdown/Models.hpp"
#include "site/BookConfig.hpp"

// Throws std::runtime_error naming the offending key.
site::BookConfig parseBookConfig(const std::string& text);

// Reads `relative` under `root` through the guarded reader. A missing file
// yields the defaults; a security violation or unreadable file propagates.
site::BookConfig loadBookConfig(const std::filesystem::path& root, const std::string& relative);

nlohmann::json outlineToJson(const markdown::OutlineParseResult& res);
nlohmann::json tablesToJson(const markdown::TableParseResult& res);
nlohmann::json validationToJson(const std::string& path, const guard::ProjectValidation& v);
