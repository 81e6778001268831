#pragma once

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cmdschema/schema/schema_parser.hpp"

namespace cmdschema::loader {

struct AgentDeclaration {
    std::string name;
    std::string description;
    std::string source;
};

/**
 * @brief Turns declaration documents into raw declarations.
 *
 * Two formats are understood:
 *   - YAML documents (*.yaml, *.yml) with name, description, arguments,
 *     positionals, options and agents keys
 *   - Markdown documents (*.md) carrying the same keys in a leading
 *     "---" delimited YAML frontmatter block
 *
 * Entries under `arguments` and `options` default to kind "option", entries
 * under `positionals` to kind "positional". When a document has no `name`,
 * the fallback name (usually the file stem) is used.
 *
 * All failures are reported as errors::DeclarationFormatError.
 */
class DeclarationLoader {
public:
    static schema::RawDeclaration parse_yaml(
        const std::string& text, const std::string& source,
        const std::string& fallback_name = "");
    static schema::RawDeclaration parse_markdown(
        const std::string& text, const std::string& source,
        const std::string& fallback_name = "");

    static AgentDeclaration parse_agent(const std::string& text,
                                        const std::string& source,
                                        const std::string& fallback_name);

    // Content between the leading "---" fences, nullopt if there is none
    static std::optional<std::string> extract_frontmatter(
        const std::string& text);

    // Dispatches on the file extension
    static schema::RawDeclaration load_file(const std::filesystem::path& path);
    static AgentDeclaration load_agent_file(const std::filesystem::path& path);

    static bool is_declaration_file(const std::filesystem::path& path);

    // Declaration files directly in `dir` plus `<dir>/<sub>/SKILL.md`,
    // sorted by path. Missing directories yield an empty list.
    static std::vector<std::filesystem::path> list_declaration_files(
        const std::filesystem::path& dir);

private:
    static schema::RawDeclaration from_node(const YAML::Node& node,
                                            const std::string& source,
                                            const std::string& fallback_name);
    static void append_arguments(const YAML::Node& list,
                                 const std::string& default_kind,
                                 const std::string& source,
                                 std::vector<schema::RawArgument>& out);
    static std::string read_file(const std::filesystem::path& path);
};

}  // namespace cmdschema::loader
