#include "errors.hpp"
#include "file_chunker.hpp"
#include "manifest.hpp"
#include "test_support.hpp"

using namespace ferry;

namespace {

const uint32_t CHUNK = MIN_CHUNK_SIZE;

int manifest_describes_file() {
    auto dir = ferry_test::temp_dir("ferry_manifest_build");
    std::vector<uint8_t> data = ferry_test::pattern_bytes(CHUNK * 5 + 321, 8);
    ferry_test::write_file(dir / "report.dat", data);

    Manifest manifest = build_manifest((dir / "report.dat").string(), CHUNK);
    CHECK(manifest.file_name == "report.dat");
    CHECK(manifest.file_size == data.size());
    CHECK(manifest.total_chunks == 6);
    CHECK(manifest.chunk_hashes.size() == 6);
    CHECK(manifest.file_hash == checksum::digest(data));
    CHECK(manifest.chunk_length(5) == 321);
    CHECK(manifest.chunk_offset(5) == 5 * CHUNK);
    CHECK(manifest.chunk_hashes[5] ==
          checksum::digest(std::vector<uint8_t>(data.begin() + 5 * CHUNK, data.end())));
    CHECK(manifest.session_id.size() == 32);
    validate_manifest(manifest);

    // Same content, same session.
    CHECK(build_manifest((dir / "report.dat").string(), CHUNK).session_id == manifest.session_id);
    CHECK(session_id_for("other.dat", manifest.file_size, manifest.file_hash) != manifest.session_id);
    return 0;
}

int empty_file_manifest() {
    auto dir = ferry_test::temp_dir("ferry_manifest_empty");
    ferry_test::write_file(dir / "empty", std::vector<uint8_t>());

    Manifest manifest = build_manifest((dir / "empty").string(), CHUNK);
    CHECK(manifest.total_chunks == 1);
    CHECK(manifest.chunk_hashes.size() == 1);
    CHECK(manifest.chunk_length(0) == 0);
    validate_manifest(manifest);
    return 0;
}

int save_load_and_wire() {
    auto dir = ferry_test::temp_dir("ferry_manifest_save");
    ferry_test::write_file(dir / "a.bin", ferry_test::noise_bytes(CHUNK * 2 + 1));
    Manifest manifest = build_manifest((dir / "a.bin").string(), CHUNK);

    std::string path = manifest_path_for((dir / "a.bin").string());
    CHECK(path == (dir / "a.bin").string() + ".ferry");
    save_manifest(manifest, path);
    Manifest loaded = load_manifest(path);
    CHECK(loaded.session_id == manifest.session_id);
    CHECK(loaded.chunk_hashes == manifest.chunk_hashes);

    Manifest decoded = decode_manifest(encode_manifest(manifest));
    CHECK(decoded.file_hash == manifest.file_hash);
    CHECK(decoded.total_chunks == manifest.total_chunks);

    CHECK_THROWS(decode_manifest(std::string("\x0a\xff", 2)), ProtocolViolation);
    CHECK_THROWS(load_manifest((dir / "nothing.ferry").string()), IoError);
    return 0;
}

int validation_rejects_inconsistencies() {
    auto dir = ferry_test::temp_dir("ferry_manifest_validate");
    ferry_test::write_file(dir / "v.bin", ferry_test::pattern_bytes(CHUNK * 3));
    const Manifest good = build_manifest((dir / "v.bin").string(), CHUNK);

    Manifest bad = good;
    bad.file_name = "../etc/passwd";
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);

    bad = good;
    bad.total_chunks = 4;
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);

    bad = good;
    bad.chunk_hashes.pop_back();
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);

    bad = good;
    bad.chunk_hashes[1].resize(20);
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);

    bad = good;
    bad.chunk_size = 100;
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);

    bad = good;
    bad.file_hash[0] ^= 0x01;
    CHECK_THROWS(validate_manifest(bad), ProtocolViolation);
    return 0;
}

} // namespace

int main() {
    RUN(manifest_describes_file);
    RUN(empty_file_manifest);
    RUN(save_load_and_wire);
    RUN(validation_rejects_inconsistencies);
    return 0;
}
