#include "ChromaSettings.h"

#include <libchroma/Graphics/Palettes.h>
#include <libchroma/Platform/Log.h>
#include <libchroma/Platform/LogLevel.h>

#include <toml++/toml.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace chroma;

class chroma::ChromaSettings::Parser final {
public:
    static void update_from_table(ChromaSettings& settings, const toml::table& table)
    {
        if (const auto node = table["log_level"]) {
            const std::optional<std::string> str = node.value<std::string>();
            if (const std::optional<LogLevel> level = str ? try_parse_as_log_level(*str) : std::nullopt) {
                settings.log_level_ = *level;
            }
            else {
                log_warn("configuration: 'log_level' is not a valid log level: it will be ignored");
            }
        }

        if (const auto node = table["enable_virtual_terminal"]) {
            if (const std::optional<bool> enabled = node.value<bool>()) {
                settings.enable_virtual_terminal_ = *enabled;
            }
            else {
                log_warn("configuration: 'enable_virtual_terminal' is not a boolean: it will be ignored");
            }
        }

        if (const auto node = table["default_palette"]) {
            const std::optional<std::string> name = node.value<std::string>();
            if (name and find_palette(*name)) {
                settings.default_palette_ = *name;
            }
            else {
                log_warn("configuration: 'default_palette' does not name a known palette: it will be ignored");
            }
        }

        if (const auto node = table["swatch"]) {
            if (std::optional<std::string> swatch = node.value<std::string>()) {
                settings.swatch_ = std::move(*swatch);
            }
            else {
                log_warn("configuration: 'swatch' is not a string: it will be ignored");
            }
        }
    }
};

ChromaSettings chroma::ChromaSettings::load(const std::filesystem::path& path)
{
    ChromaSettings rv;

    if (not std::filesystem::exists(path)) {
        log_debug("%s: no configuration file found: using default settings", path.string().c_str());
        return rv;
    }

    toml::table table;
    try {
        table = toml::parse_file(path.string());
    }
    catch (const std::exception& ex) {
        log_error("%s: error parsing configuration file: %s", path.string().c_str(), ex.what());
        log_error("default settings will be used instead: you might need to fix (or delete) the configuration file");
        return rv;
    }

    Parser::update_from_table(rv, table);
    rv.source_ = path;
    return rv;
}

ChromaSettings chroma::ChromaSettings::load_default()
{
    if (const char* env = std::getenv(std::string{c_config_environment_variable}.c_str())) {
        return load(std::filesystem::path{env});
    }
    return load(std::filesystem::current_path() / c_config_filename);
}

ChromaSettings chroma::ChromaSettings::from_toml_string(std::string_view content)
{
    ChromaSettings rv;

    toml::table table;
    try {
        table = toml::parse(content);
    }
    catch (const std::exception& ex) {
        log_error("error parsing configuration: %s", ex.what());
        return rv;
    }

    Parser::update_from_table(rv, table);
    return rv;
}
