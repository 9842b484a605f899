#include <splice/fs/file_io.h>

#include <splice/core/testing.h>

using namespace splicer;

TEST_CASE("file contents", "[fs][file_io]")
{
    auto dir = std::filesystem::temp_directory_path() / "splice_file_io_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    auto path = dir / "document.yaml";
    dump_string_to_file(path, "kind: ConfigMap\nname: demo\n");
    REQUIRE(read_file_contents(path) == "kind: ConfigMap\nname: demo\n");

    // Dumping overwrites.
    dump_string_to_file(path, "x");
    REQUIRE(read_file_contents(path) == "x");

    // Empty files are fine too.
    dump_string_to_file(path, "");
    REQUIRE(read_file_contents(path) == "");

    std::filesystem::remove_all(dir);
}

TEST_CASE("file open errors", "[fs][file_io]")
{
    auto path = std::filesystem::temp_directory_path()
                / "splice_file_io_test_missing" / "nothing.yaml";
    try
    {
        read_file_contents(path);
        FAIL("no exception thrown");
    }
    catch (open_file_error& e)
    {
        REQUIRE((get_required_error_info<file_path_info>(e) == path));
    }
}
