//=============================================================================
// Config Tests
//
// Defaults, file loading, environment and command-line overrides
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/config.h>
#include <inkwell/pen-layer.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace boost::ut;
using namespace inkwell;

namespace {

// Keeps a developer's own ~/.config/inkwell out of the tests
struct IsolatedXdg {
    std::filesystem::path dir;

    IsolatedXdg() {
        dir = std::filesystem::temp_directory_path() / "inkwell_config_test_xdg";
        std::filesystem::remove_all(dir);
        setenv("XDG_CONFIG_HOME", dir.string().c_str(), 1);
    }
    ~IsolatedXdg() {
        unsetenv("XDG_CONFIG_HOME");
        std::filesystem::remove_all(dir);
    }
};

std::string writeTempFile(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        IsolatedXdg xdg;
        auto res = Config::create();
        expect(res.has_value() >> fatal) << error_msg(res);
        auto config = *res;

        expect(config->penBatchSegments() == 2730_u);
        expect(config->penPartialUploadFloats() == 1000_u);
        expect(config->penDefaultDiameter() == 1.0_f);
        expect(config->penDefaultColor() == Color4f{0.0f, 0.0f, 1.0f, 1.0f});
        expect(config->penRenderQuality() == 1.0_f);
        expect(config->has("pen.batch-segments"));
        expect(!config->has("pen.nope"));
    };

    "file values override defaults"_test = [] {
        IsolatedXdg xdg;
        auto path = writeTempFile("inkwell_config_test.yaml",
            "pen:\n"
            "  batch-segments: 64\n"
            "  default-color: [1, 0, 0, 0.5]\n");

        auto res = Config::create(path);
        std::filesystem::remove(path);
        expect(res.has_value() >> fatal) << error_msg(res);
        auto config = *res;

        expect(config->penBatchSegments() == 64_u);
        expect(config->penDefaultColor() == Color4f{1.0f, 0.0f, 0.0f, 0.5f});
        expect(config->penPartialUploadFloats() == 1000_u) << "untouched keys keep defaults";
    };

    "missing explicit file is an error"_test = [] {
        IsolatedXdg xdg;
        auto res = Config::create("/nonexistent/inkwell/config.yaml");
        expect(!res.has_value());
    };

    "malformed file is an error"_test = [] {
        IsolatedXdg xdg;
        auto path = writeTempFile("inkwell_config_bad.yaml", "pen: [unclosed\n");
        auto res = Config::create(path);
        std::filesystem::remove(path);
        expect(!res.has_value());
    };

    "XDG config is picked up"_test = [] {
        IsolatedXdg xdg;
        std::filesystem::create_directories(xdg.dir / "inkwell");
        {
            std::ofstream out(xdg.dir / "inkwell" / "config.yaml");
            out << "pen:\n  render-quality: 2\n";
        }

        auto res = Config::create();
        expect(res.has_value() >> fatal) << error_msg(res);
        expect((*res)->penRenderQuality() == 2.0_f);
    };

    "environment overrides"_test = [] {
        IsolatedXdg xdg;
        setenv("INKWELL_PEN_DEFAULT_DIAMETER", "3", 1);
        setenv("INKWELL_PEN_DEFAULT_COLOR", "0,1,0,1", 1);

        auto res = Config::create();
        unsetenv("INKWELL_PEN_DEFAULT_DIAMETER");
        unsetenv("INKWELL_PEN_DEFAULT_COLOR");
        expect(res.has_value() >> fatal) << error_msg(res);

        expect((*res)->penDefaultDiameter() == 3.0_f);
        expect((*res)->penDefaultColor() == Color4f{0.0f, 1.0f, 0.0f, 1.0f});
    };

    "command overrides win"_test = [] {
        IsolatedXdg xdg;
        setenv("INKWELL_PEN_BATCH_SEGMENTS", "100", 1);
        auto overrides = YAML::Load("pen: {batch-segments: 12, render-quality: 0.5}");

        auto res = Config::create("", overrides);
        unsetenv("INKWELL_PEN_BATCH_SEGMENTS");
        expect(res.has_value() >> fatal) << error_msg(res);

        expect((*res)->penBatchSegments() == 12_u);
        expect((*res)->penRenderQuality() == 0.5_f);
        expect((*res)->get<uint32_t>("pen.partial-upload-floats", 0u) == 1000_u);
    };

    "wrong-sized color falls back to default"_test = [] {
        IsolatedXdg xdg;
        auto res = Config::create("", YAML::Load("pen: {default-color: [1, 1]}"));
        expect(res.has_value() >> fatal);
        expect((*res)->penDefaultColor() == DEFAULT_PEN_COLOR);
    };

    "typed get reports wrong types as missing"_test = [] {
        IsolatedXdg xdg;
        auto res = Config::create("", YAML::Load("pen: {batch-segments: lots}"));
        expect(res.has_value() >> fatal);
        expect(!(*res)->get<uint32_t>("pen.batch-segments").has_value());
        expect((*res)->penBatchSegments() == 2730_u);
    };

    "pen layer settings from config"_test = [] {
        IsolatedXdg xdg;
        auto res = Config::create("", YAML::Load(
            "pen: {batch-segments: 8, partial-upload-floats: 48, default-diameter: 2,"
            " default-color: [1, 1, 1, 1], render-quality: 1.5}"));
        expect(res.has_value() >> fatal);

        PenLayerConfig settings = PenLayerConfig::fromConfig(**res);
        expect(settings.batchSegments == 8_u);
        expect(settings.partialUploadFloats == 48_u);
        expect(settings.defaults.diameter == 2.0_f);
        expect(settings.defaults.color == Color4f{1.0f, 1.0f, 1.0f, 1.0f});
        expect(settings.renderQuality == 1.5_f);
    };
};
