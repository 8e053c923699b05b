#include "roar/application_parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "roar/errors.hpp"

namespace roar {

namespace {

constexpr std::string_view k_instance_variable{"WERF_SET_INSTANCE"};
constexpr std::string_view k_env_variable{"WERF_SET_ENV"};
constexpr std::string_view k_setter_prefix{"WERF_SET_"};
constexpr std::string_view k_values_file_prefix{"WERF_VALUES_"};
constexpr char k_instance_label[] = "instance";
constexpr char k_env_label[] = "env";
constexpr char k_repository_annotation[] = "rawRepository";
constexpr char k_path_annotation[] = "rawPath";
constexpr char k_default_path[] = ".";

struct IndexedValuesFile final {
    std::size_t index{};
    std::string path{};
};

[[noreturn]] void throw_decode_error(const std::string& detail) {
    throw ApplicationParseError("failed to decode yaml document: " + detail);
}

// --- YAML decoding ----------------------------------------------------------

bool is_present(const YAML::Node& node) {
    return node.IsDefined() && !node.IsNull();
}

YAML::Node child(const YAML::Node& mapping, const char* key) {
    if (!is_present(mapping)) {
        return YAML::Node{};
    }
    if (!mapping.IsMap()) {
        throw_decode_error(fmt::format("expected a mapping around '{}' at line {}", key, mapping.Mark().line + 1));
    }
    return mapping[key];
}

std::string scalar_field(const YAML::Node& mapping, const char* key) {
    const YAML::Node node = child(mapping, key);
    if (!is_present(node)) {
        return {};
    }
    if (!node.IsScalar()) {
        throw_decode_error(fmt::format("field '{}' at line {} must be a scalar", key, node.Mark().line + 1));
    }
    return node.Scalar();
}

std::map<std::string, std::string> string_map_field(const YAML::Node& mapping, const char* key) {
    std::map<std::string, std::string> values;
    const YAML::Node node = child(mapping, key);
    if (!is_present(node)) {
        return values;
    }
    if (!node.IsMap()) {
        throw_decode_error(fmt::format("field '{}' at line {} must be a mapping of strings", key, node.Mark().line + 1));
    }
    for (const auto& entry : node) {
        if (!entry.first.IsScalar() || (is_present(entry.second) && !entry.second.IsScalar())) {
            throw_decode_error(fmt::format("field '{}' at line {} must be a mapping of strings", key, node.Mark().line + 1));
        }
        values[entry.first.Scalar()] = is_present(entry.second) ? entry.second.Scalar() : std::string{};
    }
    return values;
}

EnvVarList env_list_field(const YAML::Node& mapping, const char* key) {
    EnvVarList variables;
    const YAML::Node node = child(mapping, key);
    if (!is_present(node)) {
        return variables;
    }
    if (!node.IsSequence()) {
        throw_decode_error(fmt::format("field '{}' at line {} must be a sequence", key, node.Mark().line + 1));
    }
    for (const auto& item : node) {
        variables.push_back(EnvVar{scalar_field(item, "name"), scalar_field(item, "value")});
    }
    return variables;
}

RawApplication decode_document(const YAML::Node& document) {
    if (!document.IsMap()) {
        throw_decode_error(fmt::format("document at line {} is not a mapping", document.Mark().line + 1));
    }

    RawApplication raw{};
    raw.api_version = scalar_field(document, "apiVersion");
    raw.kind = scalar_field(document, "kind");

    const YAML::Node metadata = child(document, "metadata");
    raw.name = scalar_field(metadata, "name");
    raw.labels = string_map_field(metadata, "labels");
    raw.annotations = string_map_field(metadata, "annotations");

    const YAML::Node source = child(child(document, "spec"), "source");
    raw.repo_url = scalar_field(source, "repoURL");
    raw.target_revision = scalar_field(source, "targetRevision");
    raw.path = scalar_field(source, "path");

    const YAML::Node plugin = child(source, "plugin");
    if (is_present(plugin)) {
        raw.plugin_env = env_list_field(plugin, "env");
    }
    return raw;
}

// --- Resolution -------------------------------------------------------------

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

/** Text after the first '='; empty when there is none. */
std::string value_after_assignment(std::string_view value) {
    const auto equals_pos = value.find('=');
    if (equals_pos == std::string_view::npos) {
        return {};
    }
    return std::string{value.substr(equals_pos + 1)};
}

std::optional<std::size_t> parse_index(std::string_view digits) {
    std::size_t index = 0;
    const char* const end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, index);
    if (digits.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return index;
}

std::string label_or_empty(const RawApplication& raw, const char* label) {
    const auto it = raw.labels.find(label);
    return it == raw.labels.end() ? std::string{} : it->second;
}

std::string merge_identity(const char* field, const std::string& from_label, const std::string& from_plugin) {
    if (!from_label.empty() && !from_plugin.empty() && from_label != from_plugin) {
        throw ApplicationParseError(fmt::format(
            "conflicting values for '{}': label is '{}', plugin.env is '{}'", field, from_label, from_plugin));
    }
    return from_label.empty() ? from_plugin : from_label;
}

SetterMap extract_setters(const EnvVarList& plugin_env, const std::string& name, spdlog::logger& logger) {
    SetterMap setters;
    for (const EnvVar& variable : plugin_env) {
        if (!starts_with(variable.name, k_setter_prefix)) {
            continue;
        }
        const auto equals_pos = variable.value.find('=');
        if (equals_pos == std::string::npos || equals_pos == 0) {
            logger.info("Application {}: {}='{}' is not a key=value override; not passed as --set",
                        name, variable.name, variable.value);
            continue;
        }
        setters[variable.value.substr(0, equals_pos)] = variable.value.substr(equals_pos + 1);
    }
    return setters;
}

}  // namespace

bool is_application(const RawApplication& raw) noexcept {
    return raw.api_version == k_application_api_version && raw.kind == k_application_kind;
}

ApplicationDescriptor resolve_application(const RawApplication& raw, spdlog::logger& logger) {
    ApplicationDescriptor app{};
    app.name = raw.name;
    app.target_revision = raw.target_revision;

    std::string instance_from_plugin;
    std::string env_from_plugin;
    std::vector<IndexedValuesFile> indexed_values;

    const EnvVarList& plugin_env = raw.plugin_env.has_value() ? *raw.plugin_env : EnvVarList{};
    for (const EnvVar& variable : plugin_env) {
        if (variable.name == k_instance_variable) {
            instance_from_plugin = value_after_assignment(variable.value);
        } else if (variable.name == k_env_variable) {
            env_from_plugin = value_after_assignment(variable.value);
        } else if (starts_with(variable.name, k_values_file_prefix)) {
            const auto index = parse_index(std::string_view{variable.name}.substr(k_values_file_prefix.size()));
            if (!index.has_value()) {
                logger.warn("Application {}: could not parse index from '{}'; skipping", raw.name, variable.name);
                continue;
            }
            indexed_values.push_back(IndexedValuesFile{*index, variable.value});
        } else {
            app.plugin_env.push_back(variable);
        }
    }

    std::stable_sort(indexed_values.begin(), indexed_values.end(),
                     [](const IndexedValuesFile& lhs, const IndexedValuesFile& rhs) { return lhs.index < rhs.index; });
    app.values_files.reserve(indexed_values.size());
    for (IndexedValuesFile& entry : indexed_values) {
        app.values_files.push_back(std::move(entry.path));
    }

    app.setters = extract_setters(plugin_env, raw.name, logger);
    app.instance = merge_identity(k_instance_label, label_or_empty(raw, k_instance_label), instance_from_plugin);
    app.env = merge_identity(k_env_label, label_or_empty(raw, k_env_label), env_from_plugin);

    const auto repository_it = raw.annotations.find(k_repository_annotation);
    if (repository_it != raw.annotations.end() && !repository_it->second.empty()) {
        app.repo_url = repository_it->second;
    } else {
        logger.warn("Application {}: missing '{}' annotation; falling back to spec.source.repoURL='{}'",
                    raw.name, k_repository_annotation, raw.repo_url);
        if (raw.repo_url.empty()) {
            throw ApplicationParseError("both 'rawRepository' annotation and 'spec.source.repoURL' are empty");
        }
        app.repo_url = raw.repo_url;
    }

    const auto path_it = raw.annotations.find(k_path_annotation);
    if (path_it != raw.annotations.end()) {
        app.path = path_it->second;
    } else {
        logger.warn("Application {}: missing '{}' annotation; falling back to spec.source.path='{}'",
                    raw.name, k_path_annotation, raw.path);
        app.path = raw.path;
        if (app.path.empty()) {
            logger.warn("Application {}: both '{}' and spec.source.path are empty; using '{}'",
                        raw.name, k_path_annotation, k_default_path);
            app.path = k_default_path;
        }
    }

    if (app.name.empty()) {
        throw ApplicationParseError("metadata.name is empty");
    }
    return app;
}

ApplicationDescriptorList parse_applications(std::string_view yaml_stream, spdlog::logger& logger) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(std::string{yaml_stream});
    } catch (const YAML::Exception& exc) {
        throw_decode_error(exc.what());
    }

    ApplicationDescriptorList applications;
    for (const YAML::Node& document : documents) {
        if (!is_present(document)) {
            continue;
        }

        RawApplication raw{};
        try {
            raw = decode_document(document);
        } catch (const YAML::Exception& exc) {
            throw_decode_error(exc.what());
        }

        if (!is_application(raw)) {
            logger.debug("Skipping {} {} '{}'", raw.api_version, raw.kind, raw.name);
            continue;
        }

        try {
            applications.push_back(resolve_application(raw, logger));
        } catch (const ApplicationParseError& exc) {
            throw ApplicationParseError(fmt::format("application '{}' is invalid: {}", raw.name, exc.what()));
        }
        logger.debug("Resolved application {}", raw.name);
    }
    return applications;
}

}  // namespace roar
