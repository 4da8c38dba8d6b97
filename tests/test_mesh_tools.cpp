/**
 * Tests for the mesh radio tools.
 * Asserts:
 * - list_mesh_nodes runs "<client> nodes" and formats the JSON node list.
 * - send_mesh_message passes the text and optional destination as arguments.
 * - The monitor worker is paused around each command and resumed afterwards.
 * - A missing client or a failing command becomes an error result.
 *
 * Run from build dir: ./test_mesh_tools
 * Requires /bin/sh.
 */

#include "logger.h"
#include "process.h"
#include "tool_registry.h"
#include "tools/mesh_tools.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace optidex;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    fs::path dir = fs::temp_directory_path() / ("optidex_mesh_test_" + std::to_string(getpid()));
    fs::create_directories(dir);
    const fs::path client = dir / "mesh_client.sh";
    const fs::path sent = dir / "sent.txt";
    {
        std::ofstream out(client);
        out << "case \"$1\" in\n"
            << "  nodes) echo 'Connecting to radio...'; "
            << "echo '[{\"longName\": \"Base Camp\", \"shortName\": \"BC\", \"snr\": 6.5, \"batteryLevel\": 87}]' ;;\n"
            << "  send) shift; printf '%s|' \"$@\" > '" << sent.string() << "' ;;\n"
            << "  *) exit 3 ;;\n"
            << "esac\n";
    }

    MeshConfig mesh;
    mesh.command = "/bin/sh";
    mesh.script = client.string();
    mesh.timeout_ms = 5000;
    mesh.port_release_ms = 0;

    PosixProcessLauncher launcher;
    int pauses = 0;
    int resumes = 0;
    MeshToolContext ctx{mesh, launcher,
                        [&pauses]() { ++pauses; return true; },
                        [&resumes]() { ++resumes; }};

    ToolRegistry registry;
    register_mesh_tools(registry, ctx);
    ASSERT(registry.size() == 2);
    ASSERT(registry.has_tool("list_mesh_nodes"));
    ASSERT(registry.has_tool("send_mesh_message"));

    // --- node list ---
    ToolResult r = registry.execute("list_mesh_nodes", "{}");
    ASSERT(r.success);
    ASSERT(contains(r.content, "- Base Camp (BC): SNR 6.5, Bat 87%, Last Heard Never"));
    ASSERT(!contains(r.content, "Connecting"));
    ASSERT(pauses == 1);
    ASSERT(resumes == 1);

    // --- node formatting ---
    auto formatted = format_mesh_nodes(R"([{"longName": "Hill", "shortName": "H1", "snr": -3,
                                            "batteryLevel": 40, "lastHeard": 1000}])", 1000 + 600);
    ASSERT(formatted.is_ok());
    ASSERT(formatted.is_ok() && formatted.value() == "- Hill (H1): SNR -3, Bat 40%, Last Heard 10m ago");
    auto empty = format_mesh_nodes("[]", 0);
    ASSERT(empty.is_ok() && contains(empty.value(), "No nodes found"));
    ASSERT(format_mesh_nodes("{\"nodes\": 1}", 0).is_error());

    // --- send ---
    r = registry.execute("send_mesh_message", R"({"message": "dinner is ready", "destination": "BC"})");
    ASSERT(r.success);
    ASSERT(r.content == "Message sent to BC: \"dinner is ready\"");
    ASSERT(read_file(sent) == "dinner is ready|--dest|BC|");
    ASSERT(pauses == 2 && resumes == 2);

    r = registry.execute("send_mesh_message", R"({"message": "hello all"})");
    ASSERT(r.success);
    ASSERT(contains(r.content, "everyone"));
    ASSERT(read_file(sent) == "hello all|");

    ASSERT(!registry.execute("send_mesh_message", "{}").success);
    ASSERT(!registry.execute("send_mesh_message", R"({"message": "   "})").success);
    ASSERT(pauses == 3);   // validation failures never touch the radio

    // --- monitor not running: nothing to resume ---
    int quiet_resumes = 0;
    MeshToolContext idle_ctx{mesh, launcher, []() { return false; }, [&quiet_resumes]() { ++quiet_resumes; }};
    SendMeshMessageTool idle_tool(idle_ctx);
    ASSERT(idle_tool.execute(R"({"message": "ping"})", 1).success);
    ASSERT(quiet_resumes == 0);

    // --- failures ---
    MeshConfig missing = mesh;
    missing.script = (dir / "nope.sh").string();
    int missing_pauses = 0;
    MeshToolContext missing_ctx{missing, launcher, [&missing_pauses]() { ++missing_pauses; return true; }, nullptr};
    ListMeshNodesTool missing_tool(missing_ctx);
    ASSERT(!missing_tool.execute("{}", 1).success);
    ASSERT(missing_pauses == 0);

    {
        std::ofstream out(client);
        out << "echo 'no radio attached' >&2\nexit 1\n";
    }
    r = registry.execute("list_mesh_nodes", "{}");
    ASSERT(!r.success);
    ASSERT(resumes == pauses);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All mesh tool tests passed.\n";
    return 0;
}
