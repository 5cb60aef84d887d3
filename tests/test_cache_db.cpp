#include <catch2/catch_test_macros.hpp>

#include "storage/cache_db.hpp"
#include "test_support.hpp"

#include <filesystem>

using test_support::TmpDir;

namespace {

EngineInstallation sample_build(const std::string& key) {
    EngineInstallation inst;
    inst.cache_key = key;
    inst.revision = "v1.7.6";
    inst.build_flags = {"-DCMAKE_BUILD_TYPE=Release", "-DGGML_CUDA=1"};
    inst.platform = "x86_64-linux";
    inst.source_dir = "/cache/builds/" + key;
    inst.binary_path = "/cache/builds/" + key + "/build/bin/whisper-cli";
    inst.binary_size = 123456;
    inst.binary_mtime = 1700000000123456789;
    return inst;
}

} // namespace

TEST_CASE("CacheDb", "[db]") {
    TmpDir dir;

    SECTION("OpenCreatesFile") {
        CacheDb db;
        REQUIRE(db.open((dir / "nested" / "cache.db").string()));
        REQUIRE(std::filesystem::exists(dir / "nested" / "cache.db"));
    }

    SECTION("BuildRoundTrip") {
        CacheDb db;
        REQUIRE(db.open((dir / "cache.db").string()));

        REQUIRE_FALSE(db.find_build("v1.7.6-abc").has_value());
        REQUIRE(db.put_build(sample_build("v1.7.6-abc")));

        auto got = db.find_build("v1.7.6-abc");
        REQUIRE(got.has_value());
        REQUIRE(got->revision == "v1.7.6");
        REQUIRE(got->build_flags == sample_build("x").build_flags);
        REQUIRE(got->platform == "x86_64-linux");
        REQUIRE(got->binary_path == "/cache/builds/v1.7.6-abc/build/bin/whisper-cli");
        REQUIRE(got->binary_size == 123456);
        REQUIRE(got->binary_mtime == 1700000000123456789);
        REQUIRE_FALSE(got->built_at.empty());
    }

    SECTION("PutReplacesAndEraseIsIdempotent") {
        CacheDb db;
        REQUIRE(db.open((dir / "cache.db").string()));

        auto inst = sample_build("k");
        REQUIRE(db.put_build(inst));
        inst.binary_size = 42;
        REQUIRE(db.put_build(inst));
        REQUIRE(db.find_build("k")->binary_size == 42);

        REQUIRE(db.erase_build("k"));
        REQUIRE_FALSE(db.find_build("k").has_value());
        REQUIRE(db.erase_build("k"));
    }

    SECTION("ModelRoundTrip") {
        CacheDb db;
        REQUIRE(db.open((dir / "cache.db").string()));

        ModelRecord rec{.model_id = "tiny.en", .path = "/m/ggml-tiny.en.bin", .size = 77,
                        .mtime = 5, .sha1 = "c78c86eb1a8faa21b369bcd33207cc90d64ae9df",
                        .source_url = "http://x/ggml-tiny.en.bin", .verified_at = {}};
        REQUIRE(db.put_model(rec));

        auto got = db.find_model("tiny.en");
        REQUIRE(got.has_value());
        REQUIRE(got->path == rec.path);
        REQUIRE(got->size == 77);
        REQUIRE(got->mtime == 5);
        REQUIRE(got->sha1 == rec.sha1);
        REQUIRE(got->source_url == rec.source_url);
        REQUIRE_FALSE(db.find_model("base.en").has_value());
    }

    SECTION("PersistsAcrossReopen") {
        {
            CacheDb db;
            REQUIRE(db.open((dir / "cache.db").string()));
            REQUIRE(db.put_build(sample_build("k")));
        }
        CacheDb db;
        REQUIRE(db.open((dir / "cache.db").string()));
        REQUIRE(db.find_build("k").has_value());
    }

    SECTION("ClosedDbRefusesWrites") {
        CacheDb db;
        REQUIRE_FALSE(db.put_build(sample_build("k")));
        REQUIRE_FALSE(db.find_build("k").has_value());
    }
}
