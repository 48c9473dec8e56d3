#pragma once

#include <libchroma/Platform/LogLevel.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chroma
{
    // runtime configuration for applications built on libchroma
    //
    // loaded from a TOML file (e.g. `chroma.toml`) that may contain:
    //
    //     log_level = "info"
    //     enable_virtual_terminal = true
    //     default_palette = "Catppuccin.Mocha"
    //     swatch = "  "
    //
    // any key that is missing, or has the wrong type, keeps its default value
    class ChromaSettings final {
    public:
        // the name of the configuration file that `load_default` searches for
        static constexpr std::string_view c_config_filename = "chroma.toml";

        // the environment variable that, if set, overrides `load_default`'s search
        static constexpr std::string_view c_config_environment_variable = "CHROMA_CONFIG";

        // loads settings from the file at `path`, falling back to defaults (and
        // logging why) if the file doesn't exist or cannot be parsed
        static ChromaSettings load(const std::filesystem::path& path);

        // loads settings from `$CHROMA_CONFIG`, if set, or `chroma.toml` in the current
        // working directory otherwise
        static ChromaSettings load_default();

        // parses settings from in-memory TOML content, falling back to defaults (and
        // logging why) if it cannot be parsed
        static ChromaSettings from_toml_string(std::string_view content);

        ChromaSettings() = default;

        LogLevel log_level() const { return log_level_; }
        bool enable_virtual_terminal() const { return enable_virtual_terminal_; }
        const std::string& default_palette() const { return default_palette_; }
        const std::string& swatch() const { return swatch_; }

        // returns the filesystem path of the file that the settings were loaded from, if any
        const std::optional<std::filesystem::path>& source() const { return source_; }

        class Parser;
    private:
        LogLevel log_level_ = LogLevel::DEFAULT;
        bool enable_virtual_terminal_ = true;
        std::string default_palette_ = "Basic";
        std::string swatch_ = "    ";
        std::optional<std::filesystem::path> source_;
    };
}
