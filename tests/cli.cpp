#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file << contents;
    file.close();
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

bool check(bool condition, const std::string& label, const CommandResult& result) {
    if (!condition) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    }
    return condition;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("MESHCAST_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "MESHCAST_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        const auto version = run_cli(executable, "--version");
        if (!check(version.exit_code == 0 && expect_contains(version.output, "meshcast 0.1.0"), "--version", version)) {
            return 1;
        }

        const auto help = run_cli(executable, "--help");
        if (!check(help.exit_code == 0 && expect_contains(help.output, "simulate-file"), "--help", help)) {
            return 1;
        }

        const auto defaults = run_cli(executable, "--quiet defaults");
        if (!check(defaults.exit_code == 0 && expect_contains(defaults.output, "\"max_subchunk_size\":56320") &&
                       expect_contains(defaults.output, "\"relay_frame_offset\":100000"),
                   "defaults",
                   defaults)) {
            return 1;
        }

        const auto fragment = run_cli(executable, "--quiet fragment 133120 7");
        if (!check(fragment.exit_code == 0 && expect_contains(fragment.output, "frame 7: 3 part(s)") &&
                       expect_contains(fragment.output, "tag=70300 part=0 total=3 offset=0 length=56320") &&
                       expect_contains(fragment.output, "tag=70302 part=2 total=3 offset=112640 length=20480"),
                   "fragment",
                   fragment)) {
            return 1;
        }

        const auto too_large = run_cli(executable, "--quiet fragment 6000000 1");
        if (!check(too_large.exit_code == 1 && expect_contains(too_large.output, "[E_PAYLOAD_TOO_LARGE]") &&
                       expect_contains(too_large.output, "Hint: "),
                   "oversize fragment",
                   too_large)) {
            return 1;
        }

        const auto bad_frame = run_cli(executable, "--quiet fragment 10 -3");
        if (!check(bad_frame.exit_code == 1 && expect_contains(bad_frame.output, "[E_INVALID_FRAME]"),
                   "negative frame",
                   bad_frame)) {
            return 1;
        }

        const auto unknown = run_cli(executable, "transmogrify");
        if (!check(unknown.exit_code == 1 && expect_contains(unknown.output, "[E_UNKNOWN_COMMAND]") &&
                       expect_contains(unknown.output, "Hint: Run 'meshcast --help'"),
                   "unknown command",
                   unknown)) {
            return 1;
        }

        const auto orphan_profile = run_cli(executable, "--profile lan defaults");
        if (!check(orphan_profile.exit_code == 1 && expect_contains(orphan_profile.output, "[E_CONFIG_PROFILE]"),
                   "--profile without --config",
                   orphan_profile)) {
            return 1;
        }

        const auto config_path = write_temp_file("meshcast_cli_config.json",
                                                 R"JSON({
  "display_name": "cli-test",
  "profiles": {
    "base": {"offer_retry_limit": 3},
    "lan": {"extends": "base", "file_chunk_size": 4096}
  }
})JSON");
        const auto profiled = run_cli(executable, "--quiet --config \"" + config_path.string() + "\" --profile lan defaults");
        if (!check(profiled.exit_code == 0 && expect_contains(profiled.output, "\"display_name\":\"cli-test\"") &&
                       expect_contains(profiled.output, "\"file_chunk_size\":4096") &&
                       expect_contains(profiled.output, "\"offer_retry_limit\":3"),
                   "profile config",
                   profiled)) {
            std::filesystem::remove(config_path);
            return 1;
        }

        const auto missing_profile =
            run_cli(executable, "--config \"" + config_path.string() + "\" --profile wan defaults");
        std::filesystem::remove(config_path);
        if (!check(missing_profile.exit_code == 1 && expect_contains(missing_profile.output, "[E_CONFIG_PROFILE]") &&
                       expect_contains(missing_profile.output, "Available profiles: base, lan"),
                   "missing profile",
                   missing_profile)) {
            return 1;
        }

        const auto bad_key_path = write_temp_file("meshcast_cli_bad_key.json", R"({"chunk_size": 10})");
        const auto bad_key = run_cli(executable, "--config \"" + bad_key_path.string() + "\" defaults");
        std::filesystem::remove(bad_key_path);
        if (!check(bad_key.exit_code == 1 && expect_contains(bad_key.output, "[E_CONFIG_KEY]"), "unknown key", bad_key)) {
            return 1;
        }

        const auto missing_source = run_cli(executable, "--quiet simulate-file /nonexistent/meshcast/clip.mp4");
        if (!check(missing_source.exit_code == 1 && expect_contains(missing_source.output, "[E_SOURCE_NOT_FOUND]"),
                   "missing source",
                   missing_source)) {
            return 1;
        }

        const auto bad_viewers = run_cli(executable, "--quiet simulate-file clip.mp4 --viewers 0");
        if (!check(bad_viewers.exit_code == 1 && expect_contains(bad_viewers.output, "[E_INVALID_VIEWERS]"),
                   "invalid viewers",
                   bad_viewers)) {
            return 1;
        }

        std::string contents;
        contents.reserve(200 * 1024);
        for (std::size_t i = 0; i < 200 * 1024; ++i) {
            contents.push_back(static_cast<char>('a' + (i % 26)));
        }
        const auto source_path = write_temp_file("meshcast_cli_clip.mp4", contents);
        const auto out_path = std::filesystem::temp_directory_path() / "meshcast_cli_clip_out.mp4";
        const auto simulated = run_cli(executable,
                                       "--quiet simulate-file \"" + source_path.string() +
                                           "\" --viewers 2 --interval 5 --timeout 30 --out \"" +
                                           out_path.string() + "\"");
        const bool simulated_ok = simulated.exit_code == 0 && expect_contains(simulated.output, "4 chunks") &&
                                  expect_contains(simulated.output, "viewer-1: 4/4 chunks (100.0%)") &&
                                  expect_contains(simulated.output, "viewer-2: 4/4 chunks (100.0%)") &&
                                  expect_contains(simulated.output, "All 2 viewer(s) completed") &&
                                  read_file(out_path) == contents;
        std::filesystem::remove(source_path);
        std::filesystem::remove(out_path);
        if (!check(simulated_ok, "simulate-file", simulated)) {
            return 1;
        }

        const auto live = run_cli(executable, "--quiet simulate-live --viewers 2 --frames 3 --timeout 10");
        if (!check(live.exit_code == 0 && expect_contains(live.output, "connected=2/2 media-frames=6"), "simulate-live", live)) {
            return 1;
        }

        const auto revoked = run_cli(executable, "--quiet simulate-live --viewers 1 --revoke-tracks --timeout 1");
        if (!check(revoked.exit_code == 0 && expect_contains(revoked.output, "connected=0/1") &&
                       expect_contains(revoked.output, "Offer requests were ignored"),
                   "simulate-live --revoke-tracks",
                   revoked)) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "CLI test failed: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
