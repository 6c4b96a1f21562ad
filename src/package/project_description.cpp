#include "package/project_description.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace fwbundle {

namespace {

bool GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

Result ProjectDescription::LoadFromFile(const std::string& path, ProjectDescription& out) {
    out = ProjectDescription{};

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Manifest, "cannot open project description: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Manifest, std::string("invalid JSON in ") + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(ErrorKind::Manifest, "project description must be JSON object: " + path);
    }

    if (!GetString(j, "project_name", out.project_name) || out.project_name.empty()) {
        out.project_name = "unknown_project";
    }
    (void)GetString(j, "project_version", out.project_version);
    return Result::Ok();
}

} // namespace fwbundle
