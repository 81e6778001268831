#include "cmdschema/loader/declaration_loader.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <sstream>

#include "cmdschema/errors/errors.hpp"
#include "cmdschema/log/logger.hpp"

namespace fs = std::filesystem;

namespace cmdschema::loader {

namespace {

using errors::DeclarationFormatError;

std::string scalar(const YAML::Node& node, const std::string& key,
                   const std::string& source) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return "";
    if (!value.IsScalar()) {
        throw DeclarationFormatError(source, "'" + key + "' must be a scalar");
    }
    return value.as<std::string>();
}

std::vector<std::string> string_list(const YAML::Node& node,
                                     const std::string& key,
                                     const std::string& source) {
    std::vector<std::string> out;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return out;

    if (value.IsScalar()) {
        // "a, b" is accepted as shorthand for [a, b]
        std::vector<std::string> parts;
        const std::string text = value.as<std::string>();
        boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
        for (auto& part : parts) {
            boost::algorithm::trim(part);
            if (!part.empty()) out.push_back(part);
        }
        return out;
    }
    if (!value.IsSequence()) {
        throw DeclarationFormatError(source,
                                     "'" + key + "' must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.IsScalar()) {
            throw DeclarationFormatError(
                source, "'" + key + "' must only contain strings");
        }
        out.push_back(item.as<std::string>());
    }
    return out;
}

bool is_fence(const std::string& line) {
    return boost::algorithm::trim_right_copy(line) == "---";
}

}  // namespace

std::optional<std::string> DeclarationLoader::extract_frontmatter(
    const std::string& text) {
    std::istringstream in(text);
    std::string line;
    if (!std::getline(in, line) || !is_fence(line)) {
        return std::nullopt;
    }

    std::string body;
    while (std::getline(in, line)) {
        if (is_fence(line)) {
            return body;
        }
        body += line;
        body += '\n';
    }
    return std::nullopt;  // unterminated block
}

void DeclarationLoader::append_arguments(
    const YAML::Node& list, const std::string& default_kind,
    const std::string& source, std::vector<schema::RawArgument>& out) {
    if (!list || list.IsNull()) return;
    if (!list.IsSequence()) {
        throw DeclarationFormatError(source,
                                     "argument lists must be sequences");
    }

    for (const auto& item : list) {
        if (!item.IsMap()) {
            throw DeclarationFormatError(source,
                                         "each argument must be a mapping");
        }
        schema::RawArgument arg;
        arg.name = scalar(item, "name", source);
        if (item["type"]) arg.type = scalar(item, "type", source);
        arg.kind = item["kind"] ? scalar(item, "kind", source) : default_kind;
        arg.description = scalar(item, "description", source);
        arg.choices = string_list(item, "choices", source);
        if (const YAML::Node required = item["required"]) {
            arg.required = required.as<bool>();
        }
        if (const YAML::Node variadic = item["variadic"]) {
            arg.variadic = variadic.as<bool>();
        }
        if (const YAML::Node def = item["default"]; def && !def.IsNull()) {
            if (!def.IsScalar()) {
                throw DeclarationFormatError(
                    source, "default of '" + arg.name + "' must be a scalar");
            }
            arg.default_value = def.as<std::string>();
        }
        out.push_back(std::move(arg));
    }
}

schema::RawDeclaration DeclarationLoader::from_node(
    const YAML::Node& node, const std::string& source,
    const std::string& fallback_name) {
    if (!node.IsMap()) {
        throw DeclarationFormatError(source, "declaration must be a mapping");
    }

    schema::RawDeclaration decl;
    decl.source = source;
    decl.name = scalar(node, "name", source);
    if (decl.name.empty()) decl.name = fallback_name;
    decl.description = scalar(node, "description", source);
    decl.agents = string_list(node, "agents", source);

    // Positionals first so that declaration order matches usage order
    append_arguments(node["positionals"], "positional", source,
                     decl.arguments);
    append_arguments(node["arguments"], "option", source, decl.arguments);
    append_arguments(node["options"], "option", source, decl.arguments);
    return decl;
}

schema::RawDeclaration DeclarationLoader::parse_yaml(
    const std::string& text, const std::string& source,
    const std::string& fallback_name) {
    try {
        return from_node(YAML::Load(text), source, fallback_name);
    } catch (const YAML::Exception& e) {
        throw DeclarationFormatError(source, e.what());
    }
}

schema::RawDeclaration DeclarationLoader::parse_markdown(
    const std::string& text, const std::string& source,
    const std::string& fallback_name) {
    auto frontmatter = extract_frontmatter(text);
    if (!frontmatter) {
        throw DeclarationFormatError(source, "missing YAML frontmatter");
    }
    return parse_yaml(*frontmatter, source, fallback_name);
}

AgentDeclaration DeclarationLoader::parse_agent(
    const std::string& text, const std::string& source,
    const std::string& fallback_name) {
    AgentDeclaration agent;
    agent.source = source;
    agent.name = fallback_name;

    auto frontmatter = extract_frontmatter(text);
    if (!frontmatter) return agent;

    try {
        YAML::Node node = YAML::Load(*frontmatter);
        if (!node.IsMap()) {
            throw DeclarationFormatError(source,
                                         "frontmatter must be a mapping");
        }
        std::string name = scalar(node, "name", source);
        if (!name.empty()) agent.name = name;
        agent.description = scalar(node, "description", source);
    } catch (const YAML::Exception& e) {
        throw DeclarationFormatError(source, e.what());
    }
    return agent;
}

std::string DeclarationLoader::read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw DeclarationFormatError(path.string(), "cannot open file");
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

bool DeclarationLoader::is_declaration_file(const fs::path& path) {
    const std::string ext = path.extension().string();
    return boost::algorithm::iequals(ext, ".md") ||
           boost::algorithm::iequals(ext, ".yaml") ||
           boost::algorithm::iequals(ext, ".yml");
}

schema::RawDeclaration DeclarationLoader::load_file(const fs::path& path) {
    CMDSCHEMA_LOG_DEBUG << "Loading declaration: " << path.string();

    const std::string text = read_file(path);
    // skills/<name>/SKILL.md is named after its directory
    std::string fallback = path.stem().string();
    if (path.filename() == "SKILL.md" && path.has_parent_path()) {
        fallback = path.parent_path().filename().string();
    }

    if (boost::algorithm::iequals(path.extension().string(), ".md")) {
        return parse_markdown(text, path.string(), fallback);
    }
    return parse_yaml(text, path.string(), fallback);
}

AgentDeclaration DeclarationLoader::load_agent_file(const fs::path& path) {
    CMDSCHEMA_LOG_DEBUG << "Loading agent: " << path.string();
    return parse_agent(read_file(path), path.string(), path.stem().string());
}

std::vector<fs::path> DeclarationLoader::list_declaration_files(
    const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        CMDSCHEMA_LOG_DEBUG << "Declaration directory not found: "
                            << dir.string();
        return files;
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && is_declaration_file(entry.path())) {
            files.push_back(entry.path());
        } else if (entry.is_directory()) {
            fs::path skill = entry.path() / "SKILL.md";
            if (fs::is_regular_file(skill, ec)) {
                files.push_back(skill);
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace cmdschema::loader
