#include "../input-stream/digest_reader.hpp"
#include "../input-stream/file_reader.hpp"
#include "../input-stream/line_reader.hpp"
#include "../input-stream/memory_reader.hpp"
#include "../input-stream/merged_reader.hpp"
#include "../input-stream/tee_reader.hpp"
#include "test_util.hpp"
#include <memory>
#include <vector>

static std::unique_ptr<I_STREAM_READER> mem(const std::string& text)
{
    return std::make_unique<MemoryReader>(text);
}

static std::string as_string(const std::vector<uint8_t>& v)
{
    return std::string(v.begin(), v.end());
}

// Counts close() calls on a wrapped reader
class CloseCounter : public I_STREAM_READER {
public:
    MemoryReader inner;
    int* closes;

    CloseCounter(const std::string& text, int* counter) : inner(text), closes(counter) {}

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        return inner.read_into(buff_ptr, max_bytes);
    }
    void close() override {
        ++*closes;
        inner.close();
    }
};

static void test_tee_copies_stream()
{
    std::vector<uint8_t> content = make_content(70000, 11);
    STD_PATH copy = fs::temp_directory_path() / "input_stream_tee_copy.bin";
    fs::remove(copy);

    {
        TeeReader tee(std::make_unique<MemoryReader>(content), copy.string());
        CHECK(read_all(tee, 1000) == content);
        CHECK(tee.get_data_read() == content.size());
        CHECK(tee.is_complete());
        CHECK(!fs::exists(copy));
        CHECK(fs::exists(copy.string() + ".part"));
        tee.close();
        CHECK_THROWS(ClosedError, tee.parent().read_into(nullptr, 0));
    }

    CHECK(fs::exists(copy));
    CHECK(!fs::exists(copy.string() + ".part"));
    FileReader check(copy.string());
    CHECK(read_all(check, 4096) == content);
    check.close();
    fs::remove(copy);
}

static void test_tee_partial_stays_part()
{
    STD_PATH copy = fs::temp_directory_path() / "input_stream_tee_partial.bin";
    fs::remove(copy);
    fs::remove(copy.string() + ".part");

    TeeReader tee(std::make_unique<MemoryReader>(make_content(1000, 12)), copy.string());
    uint8_t buf[100];
    CHECK(tee.read_into(buf, sizeof(buf)) == 100);
    CHECK(!tee.is_complete());
    tee.close();
    tee.close();

    CHECK(!fs::exists(copy));
    CHECK(fs::exists(copy.string() + ".part"));
    CHECK(fs::file_size(copy.string() + ".part") == 100);
    CHECK_THROWS(ClosedError, tee.read_into(buf, sizeof(buf)));
    fs::remove(copy.string() + ".part");
}

static void test_tee_bad_copy_path()
{
    CHECK_THROWS(std::runtime_error, TeeReader(mem("x"), "/nonexistent/input_stream/copy.bin"));
}

static void test_merged_concatenates()
{
    std::vector<std::unique_ptr<I_STREAM_READER>> parts;
    parts.push_back(mem("hello "));
    parts.push_back(mem(""));
    parts.push_back(mem("merged "));
    parts.push_back(mem("world"));
    MergedReader merged(std::move(parts));

    CHECK(as_string(read_all(merged, 4)) == "hello merged world");
    CHECK(merged.get_current_index() == 4);
    uint8_t b;
    CHECK(merged.read_into(&b, 1) == 0);
    merged.close();
    CHECK_THROWS(ClosedError, merged.read_into(&b, 1));
}

static void test_merged_close_after_use()
{
    int closes_a = 0;
    int closes_b = 0;
    {
        std::vector<std::unique_ptr<I_STREAM_READER>> parts;
        parts.push_back(std::make_unique<CloseCounter>("aaa", &closes_a));
        parts.push_back(std::make_unique<CloseCounter>("bbb", &closes_b));
        MergedReader merged(std::move(parts), true);

        uint8_t buf[8];
        CHECK(merged.read_into(buf, sizeof(buf)) == 3);
        CHECK(merged.read_into(buf, sizeof(buf)) == 3);
        CHECK(closes_a == 1);
        CHECK(closes_b == 0);
    }
    // Each part is closed exactly once
    CHECK(closes_a == 1);
    CHECK(closes_b == 1);

    int closes_c = 0;
    {
        std::vector<std::unique_ptr<I_STREAM_READER>> parts;
        parts.push_back(std::make_unique<CloseCounter>("ccc", &closes_c));
        MergedReader merged(std::move(parts), false);
        read_all(merged, 2);
        CHECK(closes_c == 0);
    }
    CHECK(closes_c == 1);
}

static void test_digest_known_values()
{
    DigestReader empty(mem(""));
    CHECK(empty.hex_digest() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    uint8_t b;
    CHECK(empty.read_into(&b, 1) == 0);
    CHECK(empty.hex_digest() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    // Running digest, readable mid-stream
    DigestReader abc(mem("abcabc"));
    uint8_t buf[3];
    CHECK(abc.read_into(buf, sizeof(buf)) == 3);
    CHECK(abc.hex_digest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(abc.read_into(buf, 1) == 1);
    CHECK(abc.read_into(buf, sizeof(buf)) == 2);
    CHECK(abc.get_data_read() == 6);
    CHECK(abc.hex_digest() != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // Same bytes, different chunking
    DigestReader whole(mem("abcabc"));
    read_all(whole, 64);
    CHECK(abc.hex_digest() == whole.hex_digest());

    abc.close();
    CHECK_THROWS(ClosedError, abc.read_into(buf, 1));
}

static void test_reader_states()
{
    MemoryReader mr(std::string("0123456789"));
    uint8_t buf[4];
    CHECK(mr.read_into(buf, sizeof(buf)) == 4);
    ReaderState ms = mr.get_state();
    CHECK(ms.type == "MemoryReader");
    CHECK(ms.data_read == 4);
    CHECK(ms.get("size") == "10");
    CHECK(!ms.has("missing"));

    STD_PATH copy = fs::temp_directory_path() / "input_stream_state_copy.bin";
    fs::remove(copy);
    {
        std::vector<std::unique_ptr<I_STREAM_READER>> parts;
        parts.push_back(mem("abc"));
        parts.push_back(mem("defg"));
        auto merged = std::make_unique<MergedReader>(std::move(parts));
        TeeReader tee(std::move(merged), copy.string());
        CHECK(read_all(tee, 2).size() == 7);

        ReaderState ts = tee.get_state();
        CHECK(ts.type == "TeeReader");
        CHECK(ts.data_read == 7);
        CHECK(ts.get("copy") == copy.string());
        CHECK(ts.get("complete") == "true");
        CHECK(ts.children.size() == 1);
        if (ts.children.size() == 1) {
            const ReaderState& m = ts.children[0];
            CHECK(m.type == "MergedReader");
            CHECK(m.data_read == 7);
            CHECK(m.get("current_index") == "2");
            CHECK(m.get("close_after_use") == "true");
            CHECK(m.children.size() == 2);
            CHECK(m.children.size() == 2 && m.children[1].data_read == 4);
        }
        CHECK(ts.to_string().find("TeeReader(data_read=7, copy=") == 0);
        tee.close();
    }

    FileReader fr(copy.string(), 2);
    read_all(fr, 16);
    ReaderState fs_state = fr.get_state();
    CHECK(fs_state.type == "FileReader");
    CHECK(fs_state.data_read == 5);
    CHECK(fs_state.get("start_offset") == "2");
    CHECK(fs_state.get("size") == "7");
    CHECK(fs_state.get("open") == "true");
    fr.close();
    CHECK(fr.get_state().get("open") == "false");
    fs::remove(copy);
}

static void test_line_reader()
{
    MemoryReader src(std::string("first\nsecond line\n\nlast without newline"));
    LineReader lines(src, 3);
    std::vector<std::string> got = lines.read_lines();
    CHECK(got.size() == 4);
    CHECK(got.size() == 4 && got[0] == "first\n");
    CHECK(got.size() == 4 && got[1] == "second line\n");
    CHECK(got.size() == 4 && got[2] == "\n");
    CHECK(got.size() == 4 && got[3] == "last without newline");

    std::string line;
    CHECK(!lines.read_line(line));
    CHECK(line.empty());

    MemoryReader trailing(std::string("a\nb\n"));
    LineReader lr(trailing);
    CHECK(lr.read_lines() == (std::vector<std::string>{"a\n", "b\n"}));
}

int main()
{
    run_test("tee_copies_stream", test_tee_copies_stream);
    run_test("tee_partial_stays_part", test_tee_partial_stays_part);
    run_test("tee_bad_copy_path", test_tee_bad_copy_path);
    run_test("merged_concatenates", test_merged_concatenates);
    run_test("merged_close_after_use", test_merged_close_after_use);
    run_test("digest_known_values", test_digest_known_values);
    run_test("reader_states", test_reader_states);
    run_test("line_reader", test_line_reader);
    return test_summary();
}
