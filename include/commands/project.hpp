#pragma once

#include <exception>
#include <filesystem>
#include <string>

#include "guard/ProjectValidator.hpp"
#include "site/BookConfig.hpp"

// Exit codes shared by every command.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitSecurity = 2;

struct OpenProject {
    std::filesystem::path root;   // canonical
    site::BookConfig config;
};

// Gates `root` through the project validator, loads the optional config and
// re-checks the root against the config's extra deny-list. On rejection the
// failing validation is returned and its message printed; `out` is only
// complete when the result is valid. Config errors propagate as exceptions.
guard::ProjectValidation open_project(const std::string& root, const std::string& config_rel, OpenProject& out);

// Maps exceptions thrown by a command body to "[error] ..." and an exit code.
int report_exception(const std::exception& e);
