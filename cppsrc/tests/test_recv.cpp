#include "recv.hpp"
#include "send.hpp"
#include "link.hpp"
#include "protocol.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iterator>
#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Simple test framework
#define TEST(name) \
    void test_##name(); \
    struct test_##name##_runner { \
        test_##name##_runner() { \
            std::cout << "Running " #name "... "; \
            try { \
                test_##name(); \
                std::cout << "PASS\n"; \
            } catch (const std::exception& e) { \
                std::cout << "FAIL: " << e.what() << "\n"; \
                exit(1); \
            } \
        } \
    } test_##name##_instance; \
    void test_##name()

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static fs::path make_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
}

static std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static void push(sdrcp::Reassembler& reassembler, const std::vector<uint8_t>& bytes) {
    reassembler.push(bytes.data(), bytes.size());
}

static void push(sdrcp::Reassembler& reassembler, const std::string& text) {
    reassembler.push(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// Packetizer output for `packets` packets of source
static std::vector<uint8_t> produce_stream(const fs::path& source, size_t packet_size,
                                           size_t packets) {
    sdrcp::PacketizerOptions options;
    options.source = source;
    options.packet_size = packet_size;
    sdrcp::Packetizer packetizer(options);

    std::vector<uint8_t> stream(packet_size * packets);
    std::vector<sdrcp::LengthTag> tags;
    size_t produced = packetizer.work(stream.data(), stream.size(), tags);
    assert(produced == stream.size());
    return stream;
}

// Deterministic content without any 'F', so it never contains the magic
static std::string test_content(size_t size) {
    std::string content;
    uint32_t x = 12345;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1103515245u + 12345u;
        char c = static_cast<char>((x >> 16) & 0xFF);
        if (c == 'F') c = 'G';
        content += c;
    }
    return content;
}

static sdrcp::ReassemblerOptions options_for(const fs::path& out_dir) {
    sdrcp::ReassemblerOptions options;
    options.output_directory = out_dir;
    return options;
}

TEST(concrete_scenario) {
    fs::path out_dir = fresh_dir("test_recv_concrete");

    std::vector<uint8_t> stream = sdrcp::encode_header("a.txt", 10, 512);
    std::vector<uint8_t> data(512, 0);
    std::memcpy(data.data(), "0123456789", 10);
    stream.insert(stream.end(), data.begin(), data.end());

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, stream);

    assert(reassembler.state() == sdrcp::ReassemblyState::Done);
    assert(reassembler.bytes_written() == 10);
    assert(reassembler.final_path() == out_dir / "a.txt");
    assert(read_file(out_dir / "a.txt") == "0123456789");
    assert(!fs::exists(out_dir / "a.txt.part"));

    fs::remove_all(out_dir);
}

TEST(round_trip_packetizer) {
    fs::path src_dir = fresh_dir("test_recv_rt_src");
    fs::path out_dir = fresh_dir("test_recv_rt_out");

    std::string content = test_content(5000);
    fs::path source = make_file(src_dir / "payload.bin", content);

    // META + ceil(5000 / 64) FILE packets
    auto stream = produce_stream(source, 64, 1 + 79);

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, stream);

    assert(reassembler.done());
    assert(read_file(out_dir / "payload.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(irregular_chunks) {
    fs::path src_dir = fresh_dir("test_recv_chunks_src");
    fs::path out_dir = fresh_dir("test_recv_chunks_out");

    std::string content = test_content(1000);
    fs::path source = make_file(src_dir / "c.bin", content);
    auto stream = produce_stream(source, 128, 1 + 8);

    sdrcp::Reassembler reassembler(options_for(out_dir));
    size_t pos = 0;
    size_t step = 1;
    while (pos < stream.size()) {
        size_t n = std::min(step, stream.size() - pos);
        reassembler.push(stream.data() + pos, n);
        pos += n;
        step = step % 13 + 1;
    }

    assert(reassembler.done());
    assert(read_file(out_dir / "c.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(resync_after_garbage) {
    fs::path src_dir = fresh_dir("test_recv_resync_src");
    fs::path out_dir = fresh_dir("test_recv_resync_out");

    std::string content = test_content(300);
    fs::path source = make_file(src_dir / "r.bin", content);
    auto stream = produce_stream(source, 256, 1 + 2);

    std::string garbage = test_content(777);
    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, garbage);
    assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    push(reassembler, stream);

    assert(reassembler.done());
    assert(read_file(out_dir / "r.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(false_magic_rejected) {
    fs::path out_dir = fresh_dir("test_recv_false_magic");

    std::vector<uint8_t> stream;
    const uint8_t bad_version[16] = {'F', 'I', 'L', 'E', 2, 16, 0, 0, 5, 0, 0, 0, 0, 0, 0, 0};
    stream.insert(stream.end(), bad_version, bad_version + sizeof(bad_version));
    auto zero_size = sdrcp::encode_header("zero.bin", 0, 32);
    stream.insert(stream.end(), zero_size.begin(), zero_size.end());
    auto too_big = sdrcp::encode_header("big.bin", sdrcp::MAX_FILE_SIZE + 1, 32);
    stream.insert(stream.end(), too_big.begin(), too_big.end());

    auto real = sdrcp::encode_header("real.txt", 4, 32);
    stream.insert(stream.end(), real.begin(), real.end());
    std::string payload = "data";
    stream.insert(stream.end(), payload.begin(), payload.end());

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, stream);

    assert(reassembler.done());
    assert(reassembler.header()->file_name == "real.txt");
    assert(read_file(out_dir / "real.txt") == "data");
    assert(!fs::exists(out_dir / "zero.bin.part"));
    assert(!fs::exists(out_dir / "big.bin.part"));

    fs::remove_all(out_dir);
}

TEST(magic_at_buffer_end_waits) {
    fs::path out_dir = fresh_dir("test_recv_wait");

    auto header = sdrcp::encode_header("w.txt", 3, 64);

    sdrcp::Reassembler reassembler(options_for(out_dir));
    reassembler.push(header.data(), 20);
    assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    assert(reassembler.buffered_bytes() == 20);

    reassembler.push(header.data() + 20, header.size() - 20);
    assert(reassembler.state() == sdrcp::ReassemblyState::Recv);
    push(reassembler, std::string("xyz"));
    assert(reassembler.done());
    assert(read_file(out_dir / "w.txt") == "xyz");

    fs::remove_all(out_dir);
}

TEST(mid_stream_attach) {
    fs::path src_dir = fresh_dir("test_recv_attach_src");
    fs::path out_dir = fresh_dir("test_recv_attach_out");

    // Payload with an embedded magic that fails validation
    std::string content = test_content(100) + "FILE\x07" + test_content(195);
    fs::path source = make_file(src_dir / "m.bin", content);

    // Two full cycles: META + 5 FILE packets each
    auto stream = produce_stream(source, 64, 12);

    sdrcp::Reassembler reassembler(options_for(out_dir));

    // Attach after the first header, part way into the payload
    size_t attach = 64 + 10;
    size_t second_cycle = 6 * 64;
    reassembler.push(stream.data() + attach, second_cycle - attach);
    assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    assert(!fs::exists(out_dir / "m.bin"));
    assert(!fs::exists(out_dir / "m.bin.part"));

    reassembler.push(stream.data() + second_cycle, stream.size() - second_cycle);
    assert(reassembler.done());
    assert(read_file(out_dir / "m.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(scan_buffer_bounded) {
    fs::path out_dir = fresh_dir("test_recv_bounded");

    sdrcp::ReassemblerOptions options = options_for(out_dir);
    options.max_scan_buffer_bytes = 8192;
    options.scan_buffer_keep_bytes = 2048;
    sdrcp::Reassembler reassembler(options);

    std::string noise = test_content(1000);
    for (int i = 0; i < 100; ++i) {
        push(reassembler, noise);
        assert(reassembler.buffered_bytes() <= 8192);
        assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    }
    assert(reassembler.buffered_bytes() >= 2048);

    fs::remove_all(out_dir);
}

TEST(oversized_delivery_scanned_whole) {
    fs::path src_dir = fresh_dir("test_recv_oversized_src");
    fs::path out_dir = fresh_dir("test_recv_oversized_out");

    std::string content = test_content(20000);
    fs::path source = make_file(src_dir / "big.bin", content);

    // META plus 40 FILE packets, far above the scan buffer cap
    auto stream = produce_stream(source, 512, 41);

    sdrcp::ReassemblerOptions options = options_for(out_dir);
    options.max_scan_buffer_bytes = 8192;
    options.scan_buffer_keep_bytes = 2048;
    sdrcp::Reassembler reassembler(options);

    push(reassembler, stream);
    assert(reassembler.done());
    assert(reassembler.bytes_written() == content.size());
    assert(read_file(out_dir / "big.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(pending_header_survives_cap) {
    fs::path out_dir = fresh_dir("test_recv_pending");

    sdrcp::ReassemblerOptions options = options_for(out_dir);
    options.max_scan_buffer_bytes = 8192;
    options.scan_buffer_keep_bytes = 16;
    sdrcp::Reassembler reassembler(options);

    auto header = sdrcp::encode_header("p.txt", 4, 64);
    std::vector<uint8_t> chunk;
    std::string noise = test_content(10000);
    chunk.insert(chunk.end(), noise.begin(), noise.end());
    chunk.insert(chunk.end(), header.begin(), header.begin() + 20);

    push(reassembler, chunk);
    assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    assert(reassembler.buffered_bytes() == 20);

    reassembler.push(header.data() + 20, header.size() - 20);
    assert(reassembler.state() == sdrcp::ReassemblyState::Recv);
    push(reassembler, std::string("abcd"));
    assert(reassembler.done());
    assert(read_file(out_dir / "p.txt") == "abcd");

    fs::remove_all(out_dir);
}

TEST(collision_gets_suffix) {
    fs::path out_dir = fresh_dir("test_recv_collision");
    make_file(out_dir / "a.txt", "old");

    sdrcp::ReassemblerOptions options = options_for(out_dir);
    options.overwrite = false;
    sdrcp::Reassembler reassembler(options);

    push(reassembler, sdrcp::encode_header("a.txt", 3, 32));
    push(reassembler, std::string("new"));

    assert(reassembler.done());
    assert(reassembler.final_path() == out_dir / "a_1.txt");
    assert(read_file(out_dir / "a.txt") == "old");
    assert(read_file(out_dir / "a_1.txt") == "new");

    fs::remove_all(out_dir);
}

TEST(overwrite_replaces) {
    fs::path out_dir = fresh_dir("test_recv_overwrite");
    make_file(out_dir / "a.txt", "old contents");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header("a.txt", 3, 32));
    push(reassembler, std::string("new"));

    assert(reassembler.done());
    assert(read_file(out_dir / "a.txt") == "new");
    assert(!fs::exists(out_dir / "a_1.txt"));

    fs::remove_all(out_dir);
}

TEST(declared_directories_ignored) {
    fs::path out_dir = fresh_dir("test_recv_traversal");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header("../../evil.txt", 2, 64));
    push(reassembler, std::string("ok"));

    assert(reassembler.done());
    assert(reassembler.final_path() == out_dir / "evil.txt");
    assert(read_file(out_dir / "evil.txt") == "ok");

    fs::remove_all(out_dir);
}

TEST(embedded_nul_keeps_part_file) {
    fs::path out_dir = fresh_dir("test_recv_nul");
    make_file(out_dir / "victim.txt", "keep");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header(std::string("victim.txt\0x", 12), 10, 32));
    push(reassembler, std::string("hello"));

    assert(reassembler.state() == sdrcp::ReassemblyState::Recv);
    assert(reassembler.part_path() == out_dir / "victim.txt.part");
    assert(fs::exists(out_dir / "victim.txt.part"));
    assert(read_file(out_dir / "victim.txt") == "keep");

    push(reassembler, std::string("world"));
    assert(reassembler.done());
    assert(read_file(out_dir / "victim.txt") == "helloworld");
    assert(!fs::exists(out_dir / "victim.txt.part"));

    fs::remove_all(out_dir);
}

TEST(longest_name_is_shortened) {
    fs::path out_dir = fresh_dir("test_recv_long_name");

    std::string name(253, 'n');
    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header(name, 3, 512));
    push(reassembler, std::string("abc"));

    assert(reassembler.done());
    assert(reassembler.header()->file_name == name);
    assert(reassembler.final_path() == out_dir / std::string(250, 'n'));
    assert(read_file(reassembler.final_path()) == "abc");

    fs::remove_all(out_dir);
}

TEST(rename_failure_is_reported) {
    fs::path out_dir = fresh_dir("test_recv_rename");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header("r.txt", 4, 32));
    push(reassembler, std::string("ab"));
    fs::remove(reassembler.part_path());

    try {
        push(reassembler, std::string("cd"));
        assert(false);
    } catch (const std::runtime_error& e) {
        assert(std::string(e.what()).rfind("Cannot rename ", 0) == 0);
    }
    assert(!fs::exists(out_dir / "r.txt"));

    fs::remove_all(out_dir);
}

TEST(stop_leaves_part_file) {
    fs::path out_dir = fresh_dir("test_recv_stop");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header("a.txt", 10, 32));
    push(reassembler, std::string("01234"));
    assert(reassembler.state() == sdrcp::ReassemblyState::Recv);
    assert(reassembler.bytes_written() == 5);

    reassembler.stop();
    assert(read_file(out_dir / "a.txt.part") == "01234");
    assert(!fs::exists(out_dir / "a.txt"));

    // Later input is dropped
    push(reassembler, std::string("56789"));
    assert(reassembler.bytes_written() == 5);
    assert(!fs::exists(out_dir / "a.txt"));

    fs::remove_all(out_dir);
}

TEST(done_discards_input) {
    fs::path out_dir = fresh_dir("test_recv_done");

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, sdrcp::encode_header("d.txt", 2, 32));
    push(reassembler, std::string("hiEXTRA"));
    assert(reassembler.done());
    assert(reassembler.buffered_bytes() == 0);

    push(reassembler, sdrcp::encode_header("e.txt", 2, 32));
    push(reassembler, std::string("no"));
    assert(reassembler.done());
    assert(reassembler.bytes_written() == 2);
    assert(read_file(out_dir / "d.txt") == "hi");
    assert(!fs::exists(out_dir / "e.txt"));
    assert(!fs::exists(out_dir / "e.txt.part"));

    fs::remove_all(out_dir);
}

TEST(empty_file_never_completes) {
    fs::path src_dir = fresh_dir("test_recv_empty_src");
    fs::path out_dir = fresh_dir("test_recv_empty_out");

    fs::path source = make_file(src_dir / "empty.bin", "");
    auto stream = produce_stream(source, 32, 10);

    sdrcp::Reassembler reassembler(options_for(out_dir));
    push(reassembler, stream);
    assert(reassembler.state() == sdrcp::ReassemblyState::Scan);
    assert(!fs::exists(out_dir / "empty.bin"));

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(output_directory_created) {
    fs::path base = fresh_dir("test_recv_mkdir");
    fs::path nested = base / "one" / "two";

    sdrcp::Reassembler reassembler(options_for(nested));
    assert(fs::is_directory(nested));

    fs::remove_all(base);
}

TEST(unusable_output_directory_is_fatal) {
    fs::path base = fresh_dir("test_recv_fatal");
    fs::path blocker = make_file(base / "not_a_dir", "x");

    try {
        sdrcp::Reassembler reassembler(options_for(blocker));
        assert(false);
    } catch (const std::runtime_error& e) {
        std::string error = e.what();
        assert(error.find("not_a_dir") != std::string::npos);
    }

    fs::remove_all(base);
}

TEST(execute_recv_from_file) {
    fs::path src_dir = fresh_dir("test_recv_exec_src");
    fs::path out_dir = fresh_dir("test_recv_exec_out");

    std::string content = test_content(2000);
    fs::path source = make_file(src_dir / "x.bin", content);
    auto stream = produce_stream(source, 512, 2 * (1 + 4));

    fs::path stream_file = src_dir / "stream.bin";
    std::string prefix = test_content(123);
    make_file(stream_file, prefix + std::string(stream.begin(), stream.end()));

    sdrcp::RecvOptions options;
    options.reassembler = options_for(out_dir);
    options.chunk_size = 100;

    sdrcp::Link link = sdrcp::Link::open_file_for_read(stream_file);
    assert(sdrcp::execute_recv(options, link));
    assert(read_file(out_dir / "x.bin") == content);

    fs::remove_all(src_dir);
    fs::remove_all(out_dir);
}

TEST(execute_recv_truncated_stream) {
    fs::path out_dir = fresh_dir("test_recv_exec_short");

    auto header = sdrcp::encode_header("t.txt", 100, 32);
    std::string stream(header.begin(), header.end());
    stream += "only part";

    fs::path stream_file = "test_recv_exec_short.bin";
    make_file(stream_file, stream);

    sdrcp::RecvOptions options;
    options.reassembler = options_for(out_dir);

    sdrcp::Link link = sdrcp::Link::open_file_for_read(stream_file);
    assert(!sdrcp::execute_recv(options, link));
    assert(read_file(out_dir / "t.txt.part") == "only part");
    assert(!fs::exists(out_dir / "t.txt"));

    fs::remove(stream_file);
    fs::remove_all(out_dir);
}

int main() {
    std::cout << "Running recv module tests...\n";
    // Tests run automatically via static constructors
    std::cout << "All tests passed!\n";
    return 0;
}
