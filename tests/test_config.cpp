#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "vp_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.active_provider == ProviderId::OpenAiWhisper);
        REQUIRE(cfg.language == "auto");
        REQUIRE(cfg.input_device.empty());
        REQUIRE(cfg.output.auto_paste);
        REQUIRE(cfg.history.max_entries == 100);
        REQUIRE(cfg.gpu_whisper.model_name == "ggml-medium.bin");
        REQUIRE(cfg.gpu_whisper.implementation == "gpu");
        REQUIRE(cfg.gpu_whisper.strategy == "greedy");
        REQUIRE(cfg.providers.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "active_provider": "gpu_whisper",
            "language": "de",
            "input_device": "alsa_input.usb-mic",
            "output": { "auto_paste": false },
            "history": { "max_entries": 25 },
            "gpu_whisper": {
                "library_path": "/opt/whisper/libWhisper.so",
                "model_name": "ggml-large-v3.bin",
                "implementation": "hybrid",
                "flags": 2,
                "adapter": "Radeon",
                "strategy": "beam",
                "threads": 8,
                "download_url": "https://mirror.example/whisper"
            },
            "providers": {
                "openai_whisper": { "api_key": "sk-test", "model": "whisper-1" },
                "lan_whisper": { "endpoint": "http://10.0.0.5:8080", "language": "fr" }
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.active_provider == ProviderId::GpuWhisper);
        REQUIRE(cfg.language == "de");
        REQUIRE(cfg.input_device == "alsa_input.usb-mic");
        REQUIRE_FALSE(cfg.output.auto_paste);
        REQUIRE(cfg.history.max_entries == 25);
        REQUIRE(cfg.gpu_whisper.library_path == "/opt/whisper/libWhisper.so");
        REQUIRE(cfg.gpu_whisper.model_name == "ggml-large-v3.bin");
        REQUIRE(cfg.gpu_whisper.implementation == "hybrid");
        REQUIRE(cfg.gpu_whisper.flags == 2);
        REQUIRE(cfg.gpu_whisper.adapter == "Radeon");
        REQUIRE(cfg.gpu_whisper.strategy == "beam");
        REQUIRE(cfg.gpu_whisper.threads == 8);
        REQUIRE(cfg.gpu_whisper.download_url == "https://mirror.example/whisper");

        REQUIRE(cfg.providers.size() == 2);
        auto& openai = cfg.providers.at(ProviderId::OpenAiWhisper);
        REQUIRE(openai.api_key == "sk-test");
        REQUIRE(openai.model == "whisper-1");
        REQUIRE_FALSE(openai.endpoint.has_value());
        REQUIRE(cfg.providers.at(ProviderId::LanWhisper).endpoint == "http://10.0.0.5:8080");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "language": "fr" })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.active_provider == ProviderId::OpenAiWhisper);
        REQUIRE(cfg.output.auto_paste);
        REQUIRE(cfg.history.max_entries == 100);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.active_provider == ProviderId::OpenAiWhisper);
        REQUIRE(cfg.language == "auto");
    }

    SECTION("LoadWrongTypes") {
        TmpFile f(R"({ "history": { "max_entries": "lots" } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.history.max_entries == 100);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/vp_test_nonexistent_config_file.json");
        REQUIRE(cfg.active_provider == ProviderId::OpenAiWhisper);
    }

    SECTION("UnknownProvidersIgnored") {
        auto cfg = Config::from_json(nlohmann::json::parse(R"({
            "active_provider": "carrier_pigeon",
            "providers": { "carrier_pigeon": { "api_key": "x" } }
        })"));
        REQUIRE(cfg.active_provider == ProviderId::OpenAiWhisper);
        REQUIRE(cfg.providers.empty());
    }

    SECTION("ProviderConfigLanguageFallback") {
        Config cfg;
        cfg.language = "nl";
        cfg.providers[ProviderId::LanWhisper].language = "sv";
        cfg.providers[ProviderId::OpenAiWhisper].api_key = "sk";

        REQUIRE(cfg.provider_config(ProviderId::LanWhisper).language == "sv");
        REQUIRE(cfg.provider_config(ProviderId::OpenAiWhisper).language == "nl");
        REQUIRE(cfg.provider_config(ProviderId::OpenAiWhisper).api_key == "sk");
        REQUIRE(cfg.provider_config(ProviderId::GoogleCloud).language == "nl");
    }

    SECTION("SaveAndReload") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("vp_test_config_dir_" + std::to_string(getpid()));
        auto path = (dir / "nested" / "config.json").string();

        Config cfg;
        cfg.active_provider = ProviderId::LanWhisper;
        cfg.language = "es";
        cfg.gpu_whisper.threads = 2;
        cfg.providers[ProviderId::GoogleCloud].api_key = "g-key";
        REQUIRE(cfg.save(path));

        auto back = Config::load(path);
        REQUIRE(back.active_provider == ProviderId::LanWhisper);
        REQUIRE(back.language == "es");
        REQUIRE(back.gpu_whisper.threads == 2);
        REQUIRE(back.providers.at(ProviderId::GoogleCloud).api_key == "g-key");
        REQUIRE(back.to_json() == cfg.to_json());

        std::filesystem::remove_all(dir);
    }
}

TEST_CASE("Provider identifiers", "[config]") {
    SECTION("RoundTrip") {
        for (auto id : {ProviderId::OpenAiWhisper, ProviderId::GoogleCloud,
                        ProviderId::LanWhisper, ProviderId::GpuWhisper}) {
            REQUIRE(provider_id_from_string(to_string(id)) == id);
        }
    }

    SECTION("StableNames") {
        REQUIRE(to_string(ProviderId::GpuWhisper) == "gpu_whisper");
        REQUIRE(to_string(ProviderId::LanWhisper) == "lan_whisper");
    }

    SECTION("Unknown") {
        REQUIRE_FALSE(provider_id_from_string("").has_value());
        REQUIRE_FALSE(provider_id_from_string("GPU_WHISPER").has_value());
    }

    SECTION("AutoLanguage") {
        REQUIRE(is_auto_language(std::nullopt));
        REQUIRE(is_auto_language(std::string()));
        REQUIRE(is_auto_language(std::string("auto")));
        REQUIRE_FALSE(is_auto_language(std::string("en")));
    }
}
