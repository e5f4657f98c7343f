#include "repro/profile.hpp"
#include "repro/exclusion.hpp"
#include "repro/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace repro {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// String array; non-string elements are reported and skipped
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key,
                                          std::vector<std::string>& warnings) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;
    if (!j[key].is_array()) {
        warnings.push_back("ignored non-array '" + key + "'");
        return result;
    }
    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        } else {
            warnings.push_back("ignored non-string element in '" + key + "'");
        }
    }
    return result;
}

void warn_unknown_keys(const nlohmann::json& j, const std::set<std::string>& known,
                       const std::string& scope, std::vector<std::string>& warnings) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (known.count(it.key()) == 0) {
            warnings.push_back("unknown key: " + scope + it.key());
        }
    }
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

ProfileParseResult parse_target_profile(const std::string& json_str,
                                        const std::string& source_path) {
    ProfileParseResult result;
    result.profile.source_path = source_path;
    auto& profile = result.profile;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            profile.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (profile.schema != TARGET_PROFILE_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + TARGET_PROFILE_SCHEMA;
            return result;
        }

        warn_unknown_keys(j, {"$schema", "target", "critical_files", "containers",
                              "exclusions", "signed_files", "extractors", "options"},
                          "", result.warnings);

        // "target" section
        if (j.contains("target")) {
            const auto& target = j["target"];
            if (!target.is_object()) {
                result.error = "'target' must be an object";
                return result;
            }
            profile.id = get_string(target, "id").value_or("");
            profile.build_type = get_string(target, "build_type").value_or("");
            profile.architecture = get_string(target, "architecture").value_or("");
            warn_unknown_keys(target, {"id", "build_type", "architecture"}, "target.",
                              result.warnings);
        }

        profile.critical_files = get_string_array(j, "critical_files", result.warnings);
        profile.exclusions = get_string_array(j, "exclusions", result.warnings);
        profile.signed_files = get_string_array(j, "signed_files", result.warnings);

        // "containers" section: objects or bare "path[:format]" strings
        if (j.contains("containers")) {
            if (!j["containers"].is_array()) {
                result.error = "'containers' must be an array";
                return result;
            }
            for (const auto& elem : j["containers"]) {
                if (elem.is_string()) {
                    profile.containers.push_back(parse_container_arg(elem.get<std::string>()));
                } else if (elem.is_object()) {
                    ContainerSpec spec;
                    spec.path = get_string(elem, "path").value_or("");
                    spec.format = get_string(elem, "format").value_or(
                        infer_container_format(spec.path));
                    profile.containers.push_back(spec);
                } else {
                    result.error = "container entries must be objects or strings";
                    return result;
                }
            }
        }

        // "extractors" section: format -> argv template
        if (j.contains("extractors")) {
            if (!j["extractors"].is_object()) {
                result.error = "'extractors' must be an object";
                return result;
            }
            for (auto& [name, argv] : j["extractors"].items()) {
                std::vector<std::string> tmpl;
                if (argv.is_array()) {
                    for (const auto& arg : argv) {
                        if (arg.is_string()) tmpl.push_back(arg.get<std::string>());
                    }
                }
                if (tmpl.empty() || tmpl.size() != argv.size()) {
                    result.error = "extractor '" + name + "' must be a non-empty array of strings";
                    return result;
                }
                profile.extractors[name] = tmpl;
            }
        }

        // "options" section
        if (j.contains("options")) {
            const auto& options = j["options"];
            if (!options.is_object()) {
                result.error = "'options' must be an object";
                return result;
            }
            if (options.contains("display_limit")) {
                const auto& v = options["display_limit"];
                if (!v.is_number_unsigned() || v.get<uint64_t>() == 0) {
                    result.error = "options.display_limit must be a positive integer";
                    return result;
                }
                profile.options.display_limit = v.get<size_t>();
            }
            if (options.contains("jobs")) {
                const auto& v = options["jobs"];
                if (!v.is_number_unsigned() || v.get<uint64_t>() == 0) {
                    result.error = "options.jobs must be a positive integer";
                    return result;
                }
                profile.options.jobs = v.get<unsigned>();
            }
            if (options.contains("content_check")) {
                const auto& v = options["content_check"];
                if (!v.is_boolean()) {
                    result.error = "options.content_check must be a boolean";
                    return result;
                }
                profile.options.content_check = v.get<bool>();
            }
            warn_unknown_keys(options, {"display_limit", "jobs", "content_check"}, "options.",
                              result.warnings);
        }

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    std::string invalid = validate_target_profile(profile);
    if (!invalid.empty()) {
        result.error = invalid;
        return result;
    }

    result.ok = true;
    return result;
}

ProfileParseResult load_target_profile(const std::string& path) {
    auto read = read_binary_file(path);
    if (!read.ok) {
        ProfileParseResult result;
        result.error = read.error;
        return result;
    }
    return parse_target_profile(std::string(read.data.begin(), read.data.end()), path);
}

// ============================================================================
// Validation
// ============================================================================

bool is_safe_relative_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string validate_target_profile(const TargetProfile& profile) {
    for (const auto& path : profile.critical_files) {
        if (!is_safe_relative_path(path)) {
            return "invalid critical file path: '" + path + "'";
        }
    }

    std::set<std::string> seen;
    for (const auto& container : profile.containers) {
        if (!is_safe_relative_path(container.path)) {
            return "invalid container path: '" + container.path + "'";
        }
        if (!seen.insert(container.path).second) {
            return "duplicate container path: " + container.path;
        }
        if (container.format.empty()) {
            return "cannot infer container format for " + container.path;
        }
        if (!is_known_format(container.format, profile.extractors)) {
            return "no extractor for format '" + container.format + "' (" + container.path + ")";
        }
    }

    for (const auto& pattern : profile.exclusions) {
        std::string err = validate_pattern(pattern);
        if (!err.empty()) return "invalid exclusion: " + err;
    }
    for (const auto& pattern : profile.signed_files) {
        std::string err = validate_pattern(pattern);
        if (!err.empty()) return "invalid signed file pattern: " + err;
    }

    if (profile.options.display_limit == 0) {
        return "display limit must be positive";
    }
    if (profile.options.jobs == 0) {
        return "jobs must be positive";
    }
    return "";
}

// ============================================================================
// Serialization
// ============================================================================

std::string serialize_target_profile(const TargetProfile& profile) {
    nlohmann::ordered_json j;
    j["$schema"] = profile.schema;
    j["target"] = {
        {"id", profile.id},
        {"build_type", profile.build_type},
        {"architecture", profile.architecture}
    };
    j["critical_files"] = profile.critical_files;

    j["containers"] = nlohmann::ordered_json::array();
    for (const auto& c : profile.containers) {
        j["containers"].push_back({{"path", c.path}, {"format", c.format}});
    }

    j["exclusions"] = profile.exclusions;
    j["signed_files"] = profile.signed_files;

    j["extractors"] = nlohmann::ordered_json::object();
    for (const auto& [name, argv] : profile.extractors) {
        j["extractors"][name] = argv;
    }

    j["options"] = {
        {"display_limit", profile.options.display_limit},
        {"jobs", profile.options.jobs},
        {"content_check", profile.options.content_check}
    };
    return j.dump(2);
}

// ============================================================================
// Container Arguments
// ============================================================================

std::string infer_container_format(const std::string& path) {
    if (is_tar_gz_path(path)) return "tar.gz";
    if (ends_with(path, ".zip")) return "zip";
    if (ends_with(path, ".jar")) return "jar";
    if (path == "modules" || ends_with(path, "/modules")) return "jimage";
    return "";
}

ContainerSpec parse_container_arg(const std::string& arg) {
    ContainerSpec spec;
    auto colon = arg.rfind(':');
    if (colon != std::string::npos && colon + 1 < arg.size() &&
        arg.find('/', colon) == std::string::npos) {
        spec.path = arg.substr(0, colon);
        spec.format = arg.substr(colon + 1);
    } else {
        spec.path = arg;
        spec.format = infer_container_format(arg);
    }
    return spec;
}

} // namespace repro
