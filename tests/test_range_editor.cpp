#include <catch2/catch_test_macros.hpp>
#include "range_editor.hpp"
#include "edit_error.hpp"
#include "hash.hpp"
#include "temp_dir.hpp"
#include <filesystem>

using namespace collab;

namespace {

template <typename F>
ErrorKind error_kind(F&& f) {
    try {
        f();
    } catch (const EditError& e) {
        return e.kind();
    }
    FAIL("expected EditError");
    return ErrorKind::IOFailure;
}

EditResult read_all(const RangeEditor& ed, const std::string& path,
                    Encoding enc = Encoding::Utf8) {
    return ed.get(path, enc, GetOp{});
}

Hunk hunk(size_t start, size_t end, std::string contents,
          std::optional<std::string> range_hash = std::nullopt) {
    return Hunk{LineRange{start, end}, std::move(contents), std::move(range_hash)};
}

} // namespace

// ── Get ─────────────────────────────────────────────────────────

TEST_CASE("get: whole file with hashes and sizes", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    auto r = read_all(ed, path);
    REQUIRE(r.status == EditStatus::Read);
    REQUIRE(r.total_lines == 3);
    REQUIRE(r.file_hash == content_digest("one\ntwo\nthree\n"));
    REQUIRE(r.ranges.size() == 1);
    REQUIRE(r.ranges[0].range.start == 1);
    REQUIRE(r.ranges[0].range.end == 3);
    REQUIRE(r.ranges[0].content == "one\ntwo\nthree\n");
    REQUIRE(r.ranges[0].range_hash == r.file_hash);
    REQUIRE(r.ranges[0].content_size == 14);
}

TEST_CASE("get: repeated reads are identical", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\r\nb\nc");
    RangeEditor ed;

    GetOp op{{GetRange{1, 2}, GetRange{3, std::nullopt}}};
    auto first = ed.get(path, Encoding::Utf8, op);
    auto second = ed.get(path, Encoding::Utf8, op);
    REQUIRE(first.file_hash == second.file_hash);
    REQUIRE(first.ranges.size() == 2);
    for (size_t i = 0; i < first.ranges.size(); ++i) {
        REQUIRE(first.ranges[i].content == second.ranges[i].content);
        REQUIRE(first.ranges[i].range_hash == second.ranges[i].range_hash);
    }
    REQUIRE(first.ranges[0].content == "a\r\nb\n");
    REQUIRE(first.ranges[1].content == "c");
}

TEST_CASE("get: end past EOF is clamped", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    auto r = ed.get(path, Encoding::Utf8, GetOp{{GetRange{2, 99}}});
    REQUIRE(r.ranges[0].range.end == 3);
    REQUIRE(r.ranges[0].content == "two\nthree\n");
}

TEST_CASE("get: start bounds", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    // Empty span just past the last line is allowed
    auto r = ed.get(path, Encoding::Utf8, GetOp{{GetRange{4, std::nullopt}}});
    REQUIRE(r.ranges[0].content.empty());
    REQUIRE(r.ranges[0].range_hash == content_digest(""));

    REQUIRE(error_kind([&] { ed.get(path, Encoding::Utf8, GetOp{{GetRange{5, std::nullopt}}}); })
            == ErrorKind::OutOfRange);
    REQUIRE(error_kind([&] { ed.get(path, Encoding::Utf8, GetOp{{GetRange{0, 2}}}); })
            == ErrorKind::OutOfRange);
    REQUIRE(error_kind([&] { ed.get(path, Encoding::Utf8, GetOp{{GetRange{3, 1}}}); })
            == ErrorKind::OutOfRange);
}

TEST_CASE("get: missing, binary and undecodable files", "[range_editor]") {
    TempDir tmp;
    RangeEditor ed;
    REQUIRE(error_kind([&] { read_all(ed, tmp.file("absent.txt")); }) == ErrorKind::NotFound);

    std::string bin = tmp.file("bin.dat");
    write_file(bin, std::string("ab\0c\n", 5));
    REQUIRE(error_kind([&] { read_all(ed, bin); }) == ErrorKind::EncodingError);

    std::string latin = tmp.file("latin.txt");
    write_file(latin, "caf\xE9\n");
    REQUIRE(error_kind([&] { read_all(ed, latin); }) == ErrorKind::EncodingError);
    REQUIRE(read_all(ed, latin, Encoding::Latin1).ranges[0].content == "caf\xC3\xA9\n");
}

TEST_CASE("get: file larger than the limit is rejected", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("big.txt");
    write_file(path, "0123456789\n");
    EditorOptions opts;
    opts.max_file_size = 4;
    RangeEditor ed(opts);
    REQUIRE(error_kind([&] { read_all(ed, path); }) == ErrorKind::InvalidArgument);
}

// ── Create ──────────────────────────────────────────────────────

TEST_CASE("create: new file with parent directories", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("src/deep/new.txt");
    RangeEditor ed;

    auto r = ed.create(path, Encoding::Utf8, CreateOp{"hello\nworld\n", false, std::nullopt});
    REQUIRE(r.status == EditStatus::Created);
    REQUIRE(r.total_lines == 2);
    REQUIRE(r.file_hash == content_digest("hello\nworld\n"));
    REQUIRE(read_file(path) == "hello\nworld\n");
}

TEST_CASE("create: existing file without overwrite", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "keep\n");
    RangeEditor ed;

    REQUIRE(error_kind([&] {
        ed.create(path, Encoding::Utf8, CreateOp{"new\n", false, std::nullopt});
    }) == ErrorKind::AlreadyExists);
    REQUIRE(read_file(path) == "keep\n");
}

TEST_CASE("create: overwrite checks expected_hash", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "v1\n");
    RangeEditor ed;

    REQUIRE(error_kind([&] {
        ed.create(path, Encoding::Utf8, CreateOp{"v2\n", true, content_digest("other\n")});
    }) == ErrorKind::Conflict);
    REQUIRE(read_file(path) == "v1\n");

    auto r = ed.create(path, Encoding::Utf8, CreateOp{"v2\n", true, content_digest("v1\n")});
    REQUIRE(r.status == EditStatus::Overwritten);
    REQUIRE(read_file(path) == "v2\n");
}

TEST_CASE("create: expected_hash for a vanished file is a conflict", "[range_editor]") {
    TempDir tmp;
    RangeEditor ed;
    REQUIRE(error_kind([&] {
        ed.create(tmp.file("gone.txt"), Encoding::Utf8,
                  CreateOp{"x\n", true, content_digest("x\n")});
    }) == ErrorKind::Conflict);
    REQUIRE_FALSE(std::filesystem::exists(tmp.file("gone.txt")));
}

TEST_CASE("create: latin-1 payload is encoded", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("l1.txt");
    RangeEditor ed;
    ed.create(path, Encoding::Latin1, CreateOp{"caf\xC3\xA9\n", false, std::nullopt});
    REQUIRE(read_file(path) == "caf\xE9\n");

    REQUIRE(error_kind([&] {
        ed.create(tmp.file("euro.txt"), Encoding::Latin1,
                  CreateOp{"\xE2\x82\xAC\n", false, std::nullopt});
    }) == ErrorKind::EncodingError);
    REQUIRE_FALSE(std::filesystem::exists(tmp.file("euro.txt")));
}

// ── Append / Insert ─────────────────────────────────────────────

TEST_CASE("append: adds a terminator to an unterminated last line", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\nb");
    RangeEditor ed;

    auto r = ed.append(path, Encoding::Utf8, AppendOp{"c\n", std::nullopt});
    REQUIRE(r.status == EditStatus::Modified);
    REQUIRE(read_file(path) == "a\nb\nc\n");
    REQUIRE(r.total_lines == 3);
    REQUIRE(r.affected.size() == 1);
    REQUIRE(r.affected[0].start == 3);
    REQUIRE(r.affected[0].end == 3);
}

TEST_CASE("append: follows the file's CRLF terminators", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\r\nb");
    RangeEditor ed;

    ed.append(path, Encoding::Utf8, AppendOp{"c", std::nullopt});
    REQUIRE(read_file(path) == "a\r\nb\r\nc");
}

TEST_CASE("append: explicit LF policy", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\r\nb");
    EditorOptions opts;
    opts.line_ending = LineEndingPolicy::Lf;
    RangeEditor ed(opts);

    ed.append(path, Encoding::Utf8, AppendOp{"c\n", std::nullopt});
    REQUIRE(read_file(path) == "a\r\nb\nc\n");
}

TEST_CASE("append: missing file and stale hash", "[range_editor]") {
    TempDir tmp;
    RangeEditor ed;
    REQUIRE(error_kind([&] {
        ed.append(tmp.file("absent"), Encoding::Utf8, AppendOp{"x\n", std::nullopt});
    }) == ErrorKind::NotFound);

    std::string path = tmp.file("f.txt");
    write_file(path, "a\n");
    REQUIRE(error_kind([&] {
        ed.append(path, Encoding::Utf8, AppendOp{"x\n", content_digest("b\n")});
    }) == ErrorKind::Conflict);
    REQUIRE(read_file(path) == "a\n");
}

TEST_CASE("insert: at total + 1 matches append", "[range_editor]") {
    TempDir tmp;
    std::string a = tmp.file("a.txt");
    std::string b = tmp.file("b.txt");
    write_file(a, "one\ntwo");
    write_file(b, "one\ntwo");
    RangeEditor ed;

    auto ra = ed.append(a, Encoding::Utf8, AppendOp{"three\nfour\n", std::nullopt});
    auto rb = ed.insert(b, Encoding::Utf8, InsertOp{3, "three\nfour\n", std::nullopt});
    REQUIRE(read_file(a) == read_file(b));
    REQUIRE(ra.file_hash == rb.file_hash);
    REQUIRE(ra.total_lines == rb.total_lines);
}

TEST_CASE("insert: before the first line", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\nb\n");
    RangeEditor ed;

    auto r = ed.insert(path, Encoding::Utf8, InsertOp{1, "header", std::nullopt});
    REQUIRE(read_file(path) == "header\na\nb\n");
    REQUIRE(r.affected[0].start == 1);
    REQUIRE(r.affected[0].end == 1);
}

TEST_CASE("insert: position out of range", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\nb\n");
    RangeEditor ed;

    REQUIRE(error_kind([&] { ed.insert(path, Encoding::Utf8, InsertOp{0, "x\n", std::nullopt}); })
            == ErrorKind::OutOfRange);
    REQUIRE(error_kind([&] { ed.insert(path, Encoding::Utf8, InsertOp{4, "x\n", std::nullopt}); })
            == ErrorKind::OutOfRange);
    REQUIRE(read_file(path) == "a\nb\n");
}

TEST_CASE("insert: into an empty file", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("empty.txt");
    write_file(path, "");
    RangeEditor ed;

    ed.insert(path, Encoding::Utf8, InsertOp{1, "first\n", std::nullopt});
    REQUIRE(read_file(path) == "first\n");
}

// ── Delete ──────────────────────────────────────────────────────

TEST_CASE("delete: removes inclusive ranges", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "1\n2\n3\n4\n5\n");
    RangeEditor ed;

    DeleteOp op;
    op.ranges.push_back(DeleteRange{LineRange{4, 5}, std::nullopt});
    op.ranges.push_back(DeleteRange{LineRange{2, 2}, std::nullopt});
    auto r = ed.remove(path, Encoding::Utf8, op);
    REQUIRE(read_file(path) == "1\n3\n");
    REQUIRE(r.total_lines == 2);
}

TEST_CASE("delete: start greater than end is out of range", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    DeleteOp op;
    op.ranges.push_back(DeleteRange{LineRange{3, 2}, std::nullopt});
    REQUIRE(error_kind([&] { ed.remove(path, Encoding::Utf8, op); }) == ErrorKind::OutOfRange);

    op.ranges[0].range = LineRange{2, 4};
    REQUIRE(error_kind([&] { ed.remove(path, Encoding::Utf8, op); }) == ErrorKind::OutOfRange);
    REQUIRE(read_file(path) == "one\ntwo\nthree\n");
}

TEST_CASE("delete: range hash guards the removed lines", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    DeleteOp op;
    op.ranges.push_back(DeleteRange{LineRange{2, 2}, content_digest("TWO\n")});
    try {
        ed.remove(path, Encoding::Utf8, op);
        FAIL("expected EditError");
    } catch (const EditError& e) {
        REQUIRE(e.kind() == ErrorKind::Conflict);
        REQUIRE(e.stale_range());
    }

    op.ranges[0].range_hash = content_digest("two\n");
    ed.remove(path, Encoding::Utf8, op);
    REQUIRE(read_file(path) == "one\nthree\n");
}

// ── Patch ───────────────────────────────────────────────────────

TEST_CASE("patch: one/two/three scenario", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;
    std::string h = read_all(ed, path).file_hash;

    auto r = ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 2, "TWO\n")}, h});
    REQUIRE(r.status == EditStatus::Modified);
    REQUIRE(read_file(path) == "one\nTWO\nthree\n");
    REQUIRE(r.file_hash != h);
    REQUIRE(r.file_hash == content_digest("one\nTWO\nthree\n"));

    REQUIRE(error_kind([&] {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 2, "2\n")}, h});
    }) == ErrorKind::Conflict);
    REQUIRE(read_file(path) == "one\nTWO\nthree\n");
}

TEST_CASE("patch: identical content is a no-op", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;
    std::string h = read_all(ed, path).file_hash;

    auto r = ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 2, "two\n")}, h});
    REQUIRE(r.status == EditStatus::Unchanged);
    REQUIRE(r.file_hash == h);
    REQUIRE(read_file(path) == "one\ntwo\nthree\n");
}

TEST_CASE("patch: disjoint ranges from one read commute", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    auto read = ed.get(path, Encoding::Utf8, GetOp{{GetRange{1, 1}, GetRange{3, 3}}});
    std::string h1 = read.ranges[0].range_hash;
    std::string h3 = read.ranges[1].range_hash;
    PatchOp first{{hunk(1, 1, "ONE\n", h1)}, std::nullopt};
    PatchOp second{{hunk(3, 3, "THREE\n", h3)}, std::nullopt};

    SECTION("first then second") {
        ed.patch(path, Encoding::Utf8, first);
        ed.patch(path, Encoding::Utf8, second);
    }
    SECTION("second then first") {
        ed.patch(path, Encoding::Utf8, second);
        ed.patch(path, Encoding::Utf8, first);
    }
    REQUIRE(read_file(path) == "ONE\ntwo\nTHREE\n");
}

TEST_CASE("patch: range hash goes stale when lines shift", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    std::string h2 = ed.get(path, Encoding::Utf8, GetOp{{GetRange{2, 2}}}).ranges[0].range_hash;
    ed.insert(path, Encoding::Utf8, InsertOp{1, "zero\n", std::nullopt});

    try {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 2, "TWO\n", h2)}, std::nullopt});
        FAIL("expected EditError");
    } catch (const EditError& e) {
        REQUIRE(e.kind() == ErrorKind::Conflict);
        REQUIRE(e.stale_range());
    }
    REQUIRE(read_file(path) == "zero\none\ntwo\nthree\n");
}

TEST_CASE("patch: multiple hunks use the original numbering", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\nthree\n");
    RangeEditor ed;

    auto r = ed.patch(path, Encoding::Utf8,
                      PatchOp{{hunk(3, 3, ""), hunk(1, 1, "A\nB\n")}, std::nullopt});
    REQUIRE(read_file(path) == "A\nB\ntwo\n");
    REQUIRE(r.total_lines == 3);
    REQUIRE(r.affected.size() == 2);
    REQUIRE(r.affected[0].start == 1);
    REQUIRE(r.affected[0].end == 2);
}

TEST_CASE("patch: empty span inserts before start", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\nthree\n");
    RangeEditor ed;

    ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 1, "two\n")}, std::nullopt});
    REQUIRE(read_file(path) == "one\ntwo\nthree\n");
}

TEST_CASE("patch: unterminated payload before existing content", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "a\r\nb\r\nc\r\n");
    RangeEditor ed;

    ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 2, "B")}, std::nullopt});
    REQUIRE(read_file(path) == "a\r\nB\r\nc\r\n");
}

TEST_CASE("patch: overlapping hunks are rejected", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "1\n2\n3\n4\n");
    RangeEditor ed;

    REQUIRE(error_kind([&] {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(1, 2, "x\n"), hunk(2, 3, "y\n")}, std::nullopt});
    }) == ErrorKind::OutOfRange);
    REQUIRE(error_kind([&] {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(2, 1, "x\n"), hunk(2, 2, "y\n")}, std::nullopt});
    }) == ErrorKind::OutOfRange);
    REQUIRE(read_file(path) == "1\n2\n3\n4\n");
}

TEST_CASE("patch: both token kinds in one request", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\n");
    RangeEditor ed;
    std::string h = content_digest("one\n");

    REQUIRE(error_kind([&] {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(1, 1, "1\n", h)}, h});
    }) == ErrorKind::InvalidArgument);
}

TEST_CASE("patch: require_hash rejects untokened edits", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "one\ntwo\n");
    EditorOptions opts;
    opts.require_hash = true;
    RangeEditor ed(opts);

    REQUIRE(error_kind([&] {
        ed.patch(path, Encoding::Utf8, PatchOp{{hunk(1, 1, "1\n")}, std::nullopt});
    }) == ErrorKind::InvalidArgument);

    ed.patch(path, Encoding::Utf8,
             PatchOp{{hunk(1, 1, "1\n", content_digest("one\n"))}, std::nullopt});
    REQUIRE(read_file(path) == "1\ntwo\n");
}

TEST_CASE("patch: latin-1 file keeps its encoding", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    write_file(path, "caf\xE9\nna\xEFve\n");
    RangeEditor ed;

    ed.patch(path, Encoding::Latin1, PatchOp{{hunk(1, 1, "th\xC3\xA9\n")}, std::nullopt});
    REQUIRE(read_file(path) == "th\xE9\nna\xEFve\n");
}

// ── apply ───────────────────────────────────────────────────────

TEST_CASE("apply: dispatches on the operation kind", "[range_editor]") {
    TempDir tmp;
    std::string path = tmp.file("f.txt");
    RangeEditor ed;

    EditRequest create{path, Encoding::Utf8, CreateOp{"x\n", false, std::nullopt}};
    REQUIRE(ed.apply(create).status == EditStatus::Created);

    EditRequest append{path, Encoding::Utf8, AppendOp{"y\n", std::nullopt}};
    REQUIRE(ed.apply(append).status == EditStatus::Modified);

    EditRequest get{path, Encoding::Utf8, GetOp{}};
    auto r = ed.apply(get);
    REQUIRE(r.status == EditStatus::Read);
    REQUIRE(r.ranges[0].content == "x\ny\n");
}

// ── Symbolic links ──────────────────────────────────────────────

TEST_CASE("symlinked files are neither read nor replaced", "[range_editor]") {
    TempDir tmp;
    std::string real = tmp.file("real.txt");
    std::string link = tmp.file("link.txt");
    write_file(real, "one\ntwo\n");
    std::filesystem::create_symlink(real, link);
    RangeEditor ed;

    REQUIRE(error_kind([&] { read_all(ed, link); }) == ErrorKind::InvalidArgument);
    REQUIRE(error_kind([&] {
        ed.patch(link, Encoding::Utf8,
                 PatchOp{{hunk(1, 1, "ONE\n")}, content_digest("one\ntwo\n")});
    }) == ErrorKind::InvalidArgument);
    REQUIRE(error_kind([&] {
        ed.create(link, Encoding::Utf8, CreateOp{"replaced\n", true, std::nullopt});
    }) == ErrorKind::InvalidArgument);

    REQUIRE(std::filesystem::is_symlink(std::filesystem::symlink_status(link)));
    REQUIRE(read_file(real) == "one\ntwo\n");
}
