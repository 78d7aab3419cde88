#include <catch2/catch.hpp>
#include "tools/file_read.hpp"
#include "tools/file_write.hpp"
#include "tools/shell.hpp"
#include "mock_provider.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace soulwire;

// Helper: write a file directly for setup
static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

// Helper: read a file directly for verification
static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Temp working dir plus the ToolContext that points at it
struct ToolFixture {
    std::string dir = make_temp_dir();
    InterruptToken token;
    ToolContext ctx{"call-1", "turn-1", dir, token};

    ~ToolFixture() { std::filesystem::remove_all(dir); }
};

// ═══ FileReadTool ════════════════════════════════════════════════

TEST_CASE("FileReadTool: reads existing file as numbered lines", "[tools]") {
    ToolFixture f;
    REQUIRE_FALSE(f.dir.empty());
    auto file = f.dir + "/test.txt";
    write_file(file, "hello world\nsecond line\n");

    FileReadTool tool;
    auto result = tool.execute(R"({"path":")" + file + R"("})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output ==
            "     1\thello world\n"
            "     2\tsecond line\n"
            "[Read lines 1-2 of " + file + "]");
}

TEST_CASE("FileReadTool: relative paths use the working directory", "[tools]") {
    ToolFixture f;
    write_file(f.dir + "/notes.md", "# notes");

    FileReadTool tool;
    auto result = tool.execute(R"({"path":"notes.md"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output.find("     1\t# notes\n") == 0);
    REQUIRE(result.output.find("of " + f.dir + "/notes.md]") != std::string::npos);
}

TEST_CASE("FileReadTool: line window and continuation hint", "[tools]") {
    ToolFixture f;
    write_file(f.dir + "/five.txt", "a\nb\nc\nd\ne\n");

    FileReadTool tool;
    auto result = tool.execute(R"({"path":"five.txt","line_offset":2,"n_lines":2})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output ==
            "     2\tb\n"
            "     3\tc\n"
            "[Read lines 2-3 of " + f.dir + "/five.txt; more lines follow, "
            "continue with line_offset=4]");

    // A window that reaches the last line has no hint
    result = tool.execute(R"({"path":"five.txt","line_offset":4,"n_lines":2})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output.find("more lines follow") == std::string::npos);
    REQUIRE(result.output.find("[Read lines 4-5 of") != std::string::npos);
}

TEST_CASE("FileReadTool: offset past the end and empty files", "[tools]") {
    ToolFixture f;
    write_file(f.dir + "/two.txt", "a\nb\n");
    write_file(f.dir + "/empty.txt", "");

    FileReadTool tool;
    auto result = tool.execute(R"({"path":"two.txt","line_offset":9})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "[" + f.dir + "/two.txt has 2 lines; nothing at line_offset=9]");

    result = tool.execute(R"({"path":"empty.txt"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "[" + f.dir + "/empty.txt is empty]");
}

TEST_CASE("FileReadTool: rejects bad line arguments", "[tools]") {
    ToolFixture f;
    write_file(f.dir + "/a.txt", "a\n");
    FileReadTool tool;

    auto result = tool.execute(R"({"path":"a.txt","line_offset":0})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Parameter line_offset must be a positive integer");

    result = tool.execute(R"({"path":"a.txt","n_lines":"ten"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Parameter n_lines must be a positive integer");
}

TEST_CASE("FileReadTool: missing path parameter", "[tools]") {
    ToolFixture f;
    FileReadTool tool;
    auto result = tool.execute(R"({})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Missing required parameter: path");
}

TEST_CASE("FileReadTool: nonexistent file and directories", "[tools]") {
    ToolFixture f;
    FileReadTool tool;
    auto result = tool.execute(R"({"path":"nope.txt"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "File not found: " + f.dir + "/nope.txt");

    std::filesystem::create_directory(f.dir + "/sub");
    result = tool.execute(R"({"path":"sub"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Not a regular file: " + f.dir + "/sub");
}

TEST_CASE("FileReadTool: rejects directory traversal", "[tools]") {
    ToolFixture f;
    FileReadTool tool;
    auto result = tool.execute(R"({"path":"../etc/passwd"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Path must not contain '..'");
}

TEST_CASE("FileReadTool: bad arguments", "[tools]") {
    ToolFixture f;
    FileReadTool tool;
    auto result = tool.execute("not json", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("Failed to parse arguments") == 0);

    result = tool.execute("[1,2]", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Arguments must be a JSON object");
}

TEST_CASE("FileReadTool: caps long lines and line count", "[tools]") {
    ToolFixture f;
    std::string many;
    for (int i = 0; i < 1500; i++) many += "line\n";
    write_file(f.dir + "/many.txt", many);
    write_file(f.dir + "/wide.txt", std::string(3000, 'x') + "\n");

    FileReadTool tool;
    auto result = tool.execute(R"({"path":"many.txt","n_lines":5000})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output.find("[Read lines 1-1000 of") != std::string::npos);
    REQUIRE(result.output.find("continue with line_offset=1001]") != std::string::npos);

    result = tool.execute(R"({"path":"wide.txt"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output.size() < 3000);
    REQUIRE(result.output.find("x [line truncated]\n") != std::string::npos);
}

TEST_CASE("FileReadTool: stops when interrupted", "[tools][interrupt]") {
    ToolFixture f;
    write_file(f.dir + "/a.txt", "a\nb\n");
    f.token.set();

    FileReadTool tool;
    auto result = tool.execute(R"({"path":"a.txt"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Interrupted while reading " + f.dir + "/a.txt");
}

TEST_CASE("FileReadTool: runs without approval, in parallel", "[tools]") {
    FileReadTool tool;
    REQUIRE(tool.tool_name() == "file_read");
    REQUIRE(tool.approval_policy() == ApprovalPolicy::Never);
    REQUIRE(tool.parallel_safe());
    auto params = nlohmann::json::parse(tool.parameters_json());
    REQUIRE(params["required"][0] == "path");
}

// ═══ FileWriteTool ═══════════════════════════════════════════════

TEST_CASE("FileWriteTool: writes new file", "[tools]") {
    ToolFixture f;
    FileWriteTool tool;
    auto result = tool.execute(R"({"path":"out.txt","content":"data"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "Wrote 4 bytes to " + f.dir + "/out.txt");
    REQUIRE(read_file(f.dir + "/out.txt") == "data");
}

TEST_CASE("FileWriteTool: creates parent directories and overwrites", "[tools]") {
    ToolFixture f;
    FileWriteTool tool;
    REQUIRE(tool.execute(R"({"path":"a/b/c.txt","content":"one"})", f.ctx).success);
    auto result = tool.execute(R"({"path":"a/b/c.txt","content":"two"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "Overwrote 3 bytes to " + f.dir + "/a/b/c.txt");
    REQUIRE(read_file(f.dir + "/a/b/c.txt") == "two");
}

TEST_CASE("FileWriteTool: append mode", "[tools]") {
    ToolFixture f;
    FileWriteTool tool;
    REQUIRE(tool.execute(R"({"path":"log.txt","content":"one\n"})", f.ctx).success);
    auto result = tool.execute(R"({"path":"log.txt","content":"two\n","mode":"append"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "Appended 4 bytes to " + f.dir + "/log.txt");
    REQUIRE(read_file(f.dir + "/log.txt") == "one\ntwo\n");

    result = tool.execute(R"({"path":"log.txt","content":"x","mode":"prepend"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Parameter mode must be \"overwrite\" or \"append\"");
}

TEST_CASE("FileWriteTool: refuses directories and cancelled turns", "[tools][interrupt]") {
    ToolFixture f;
    FileWriteTool tool;
    std::filesystem::create_directory(f.dir + "/sub");
    auto result = tool.execute(R"({"path":"sub","content":"x"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Not a regular file: " + f.dir + "/sub");

    f.token.set();
    result = tool.execute(R"({"path":"late.txt","content":"x"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Interrupted before writing " + f.dir + "/late.txt");
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/late.txt"));
}

TEST_CASE("FileWriteTool: missing content parameter", "[tools]") {
    ToolFixture f;
    FileWriteTool tool;
    auto result = tool.execute(R"({"path":"x.txt"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Missing required parameter: content");
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/x.txt"));
}

TEST_CASE("FileWriteTool: rejects directory traversal", "[tools]") {
    ToolFixture f;
    FileWriteTool tool;
    auto result = tool.execute(R"({"path":"../escape.txt","content":"x"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Path must not contain '..'");
}

TEST_CASE("FileWriteTool: asks for approval", "[tools]") {
    FileWriteTool tool;
    REQUIRE(tool.approval_policy() == ApprovalPolicy::Session);
    REQUIRE_FALSE(tool.parallel_safe());
}

// ═══ ShellTool ═══════════════════════════════════════════════════

TEST_CASE("ShellTool: runs a command", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto result = tool.execute(R"({"command":"echo hello"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "hello\n");
}

TEST_CASE("ShellTool: runs in the working directory", "[tools][shell]") {
    ToolFixture f;
    write_file(f.dir + "/marker.txt", "here");
    ShellTool tool;
    auto result = tool.execute(R"({"command":"cat marker.txt"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "here");
}

TEST_CASE("ShellTool: captures stderr", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto result = tool.execute(R"({"command":"echo oops >&2"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "oops\n");
}

TEST_CASE("ShellTool: non-zero exit is a failure", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto result = tool.execute(R"({"command":"echo partial; exit 3"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "partial\n\n[exit code 3]");
}

TEST_CASE("ShellTool: no stdin", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto result = tool.execute(R"({"command":"cat; echo done"})", f.ctx);
    REQUIRE(result.success);
    REQUIRE(result.output == "done\n");
}

TEST_CASE("ShellTool: timeout kills the command", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto start = std::chrono::steady_clock::now();
    auto result = tool.execute(R"({"command":"sleep 30","timeout":1})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("[timed out after 1s]") != std::string::npos);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

TEST_CASE("ShellTool: interrupt stops the command", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    std::thread interrupter([&f]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        f.token.set();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = tool.execute(R"({"command":"sleep 30"})", f.ctx);
    interrupter.join();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("[interrupted]") != std::string::npos);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

TEST_CASE("ShellTool: missing command parameter", "[tools][shell]") {
    ToolFixture f;
    ShellTool tool;
    auto result = tool.execute(R"({"cmd":"ls"})", f.ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Missing required parameter: command");
}

TEST_CASE("ShellTool: asks for approval", "[tools][shell]") {
    ShellTool tool;
    REQUIRE(tool.tool_name() == "shell");
    REQUIRE(tool.approval_policy() == ApprovalPolicy::Session);
    REQUIRE_FALSE(tool.parallel_safe());
}
