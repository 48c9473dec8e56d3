#include "ChromaSettings.h"

#include <libchroma/Platform/Log.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/LogMessage.h>
#include <libchroma/Platform/LogSink.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

using namespace chroma;

namespace
{
    class LevelRecordingLogSink final : public LogSink {
    public:
        const std::vector<LogLevel>& levels() const { return levels_; }
    private:
        void impl_sink_message(const LogMessage& message) final { levels_.push_back(message.level()); }

        std::vector<LogLevel> levels_;
    };
}

TEST(ChromaSettings, default_constructed_has_expected_defaults)
{
    const ChromaSettings settings;
    ASSERT_EQ(settings.log_level(), LogLevel::info);
    ASSERT_TRUE(settings.enable_virtual_terminal());
    ASSERT_EQ(settings.default_palette(), "Basic");
    ASSERT_EQ(settings.swatch(), "    ");
    ASSERT_FALSE(settings.source().has_value());
}

TEST(ChromaSettings, from_toml_string_reads_every_key)
{
    const ChromaSettings settings = ChromaSettings::from_toml_string(R"(
        log_level = "debug"
        enable_virtual_terminal = false
        default_palette = "Catppuccin.Mocha"
        swatch = "##"
    )");

    ASSERT_EQ(settings.log_level(), LogLevel::debug);
    ASSERT_FALSE(settings.enable_virtual_terminal());
    ASSERT_EQ(settings.default_palette(), "Catppuccin.Mocha");
    ASSERT_EQ(settings.swatch(), "##");
}

TEST(ChromaSettings, from_toml_string_ignores_wrongly_typed_keys)
{
    const ChromaSettings settings = ChromaSettings::from_toml_string(R"(
        log_level = 3
        enable_virtual_terminal = "yes"
        swatch = 42
    )");

    ASSERT_EQ(settings.log_level(), LogLevel::info);
    ASSERT_TRUE(settings.enable_virtual_terminal());
    ASSERT_EQ(settings.swatch(), "    ");
}

TEST(ChromaSettings, from_toml_string_ignores_unknown_log_levels_and_palettes)
{
    const ChromaSettings settings = ChromaSettings::from_toml_string(R"(
        log_level = "verbose"
        default_palette = "Gruvbox"
    )");

    ASSERT_EQ(settings.log_level(), LogLevel::info);
    ASSERT_EQ(settings.default_palette(), "Basic");
}

TEST(ChromaSettings, from_toml_string_returns_defaults_for_unparseable_content)
{
    const ChromaSettings settings = ChromaSettings::from_toml_string("this = is = not toml [[[");
    ASSERT_EQ(settings.log_level(), LogLevel::info);
    ASSERT_EQ(settings.default_palette(), "Basic");
}

TEST(ChromaSettings, load_returns_defaults_for_nonexistent_file)
{
    const ChromaSettings settings = ChromaSettings::load(std::filesystem::temp_directory_path() / "chroma_settings_tests_does_not_exist.toml");
    ASSERT_EQ(settings.log_level(), LogLevel::info);
    ASSERT_FALSE(settings.source().has_value());
}

TEST(ChromaSettings, load_of_nonexistent_file_is_silent_at_default_log_level)
{
    const LogLevel original_level = global_get_log_level();
    global_set_log_level(LogLevel::DEFAULT);
    auto sink = std::make_shared<LevelRecordingLogSink>();
    global_default_logger()->sinks().push_back(sink);

    [[maybe_unused]] const ChromaSettings settings = ChromaSettings::load(std::filesystem::temp_directory_path() / "chroma_settings_tests_does_not_exist.toml");

    global_default_logger()->sinks().pop_back();
    global_set_log_level(original_level);
    ASSERT_TRUE(sink->levels().empty());
}

TEST(ChromaSettings, load_reads_file_and_records_source)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "chroma_settings_tests_load.toml";
    {
        std::ofstream out{path};
        out << "log_level = \"error\"\n";
        out << "default_palette = \"solarized\"\n";
    }

    const ChromaSettings settings = ChromaSettings::load(path);
    std::filesystem::remove(path);

    ASSERT_EQ(settings.log_level(), LogLevel::err);
    ASSERT_EQ(settings.default_palette(), "solarized");
    ASSERT_EQ(settings.source(), path);
}
