#include <catch2/catch_test_macros.hpp>

#include "gpu_whisper/model_store.hpp"
#include "providers/http_client.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace gpu_whisper;

namespace {

struct StoreDirs {
    fs::path root;
    fs::path store;  // the model store
    fs::path mirror; // served through file://

    StoreDirs() {
        root = fs::temp_directory_path() / ("vp_test_store_" + std::to_string(getpid()));
        store = root / "gpu-whisper";
        mirror = root / "mirror";
        fs::create_directories(mirror);
    }

    ~StoreDirs() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string mirror_url() const { return "file://" + mirror.string(); }
};

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
}

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

bool has_partial_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return false;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".download") return true;
    }
    return false;
}

} // namespace

TEST_CASE("Model catalog", "[model_store]") {
    REQUIRE(model_catalog().size() == 3);

    auto* medium = find_model("ggml-medium.bin");
    REQUIRE(medium != nullptr);
    REQUIRE(medium->name == "Medium");
    REQUIRE(medium->url.ends_with("/ggml-medium.bin"));

    REQUIRE(find_model("ggml-large-v3.bin") != nullptr);
    REQUIRE(find_model("ggml-tiny.bin") == nullptr);
    REQUIRE(find_model("") == nullptr);
}

TEST_CASE("Model store", "[model_store]") {
    http::CurlGlobal curl;
    StoreDirs dirs;

    SECTION("PathsInsideStore") {
        ModelStore store(dirs.store);
        REQUIRE(store.library_path() == dirs.store / "libWhisper.so");
        REQUIRE(store.model_path("ggml-small.bin") == dirs.store / "ggml-small.bin");
    }

    SECTION("ModelUrl") {
        auto* small = find_model("ggml-small.bin");
        REQUIRE(ModelStore(dirs.store).model_url(*small) == small->url);
        REQUIRE(ModelStore(dirs.store, "https://mirror.example/w/").model_url(*small) ==
                "https://mirror.example/w/ggml-small.bin");
    }

    SECTION("StatusReportsPresence") {
        ModelStore store(dirs.store);
        auto st = store.status();
        REQUIRE_FALSE(st.library_present);
        REQUIRE(st.models.size() == 3);
        for (auto& m : st.models) REQUIRE_FALSE(m.present);

        write_file(dirs.store / "libWhisper.so", "elf");
        write_file(dirs.store / "ggml-small.bin", "weights");

        st = store.status();
        REQUIRE(st.library_present);
        REQUIRE(st.directory == dirs.store.string());
        for (auto& m : st.models) {
            REQUIRE(m.present == (m.info.filename == "ggml-small.bin"));
        }
    }

    SECTION("UnknownModelIsConfigError") {
        ModelStore store(dirs.store, dirs.mirror_url());
        auto r = store.download_model("ggml-tiny.bin", nullptr);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Config);
        REQUIRE_FALSE(fs::exists(dirs.store));
    }

    SECTION("DownloadRenamesIntoPlace") {
        std::string weights(3 * 1024 * 1024 + 17, 'w');
        write_file(dirs.mirror / "ggml-small.bin", weights);

        ModelStore store(dirs.store, dirs.mirror_url());
        std::vector<DownloadProgress> updates;
        auto r = store.download_model("ggml-small.bin",
                                      [&](const DownloadProgress& p) { updates.push_back(p); });

        REQUIRE(r.has_value());
        REQUIRE(*r == dirs.store / "ggml-small.bin");
        REQUIRE(read_file(*r) == weights);
        REQUIRE_FALSE(has_partial_files(dirs.store));

        REQUIRE_FALSE(updates.empty());
        REQUIRE(updates.back().done);
        REQUIRE(updates.back().item == "Small");
        REQUIRE(updates.back().downloaded_bytes <= weights.size());

        auto st = store.status();
        for (auto& m : st.models) {
            REQUIRE(m.present == (m.info.filename == "ggml-small.bin"));
        }
    }

    SECTION("PresentModelIsNotFetchedAgain") {
        write_file(dirs.store / "ggml-medium.bin", "already here");
        // Nothing in the mirror: any fetch would fail.
        ModelStore store(dirs.store, dirs.mirror_url());

        int calls = 0;
        auto r = store.download_model("ggml-medium.bin", [&](const DownloadProgress&) { ++calls; });
        REQUIRE(r.has_value());
        REQUIRE(read_file(*r) == "already here");
        REQUIRE(calls == 0);
    }

    SECTION("FailedDownloadLeavesNothingBehind") {
        ModelStore store(dirs.store, dirs.mirror_url());
        auto r = store.download_model("ggml-large-v3.bin", nullptr);

        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Transcribe);
        REQUIRE_FALSE(fs::exists(dirs.store / "ggml-large-v3.bin"));
        REQUIRE_FALSE(has_partial_files(dirs.store));
    }
}
